#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hrvrng {

// Error taxonomy shared by the entropy and biometric paths
enum class ErrorKind {
    Ok = 0,
    SourceUnavailable,      // hardware/network absent or misconfigured
    MalformedResponse,      // remote API returned unparsable data
    DeviceConnectFailed,    // BLE attempts exhausted
    ParseError              // malformed BLE payload
};

// Stable code string (HRVRNG_E1xx) for logs and bridges
const char* errorCode(ErrorKind k);
const char* errorName(ErrorKind k);

// Result of a single entropy source request
struct ByteResult {
    std::vector<uint8_t> bytes;
    ErrorKind error = ErrorKind::Ok;
    std::string message;

    bool ok() const { return error == ErrorKind::Ok; }

    static ByteResult success(std::vector<uint8_t> b) {
        ByteResult r; r.bytes = std::move(b); return r;
    }
    static ByteResult failure(ErrorKind k, std::string msg) {
        ByteResult r; r.error = k; r.message = std::move(msg); return r;
    }
};

enum class Mode { Baseline, Experiment };
const char* modeName(Mode m);

// Bit order used when unpacking byte blocks into bits
enum class BitOrder { MsbFirst, LsbFirst };

enum class EventKind { Intention, HighCoherence, User };
const char* eventKindName(EventKind k);

// One parsed BLE heart-rate notification, augmented with coherence
struct HrvSample {
    double timestamp = 0.0;              // seconds since epoch
    std::string deviceId;                // BLE address
    int heartRateBpm = 0;
    std::vector<float> rrIntervalsMs;    // RR values carried by this notification
    float coherence = 0.0f;              // 0..1
    float rmssdMs = 0.0f;                // RMSSD over the device RR buffer (0 if unavailable)
    std::optional<std::string> error;    // set only on synthetic failure samples

    bool isError() const { return error.has_value(); }
};

struct Marker {
    double timestamp = 0.0;
    size_t bitIndex = 0;                                  // experiment bit count at append time
    EventKind kind = EventKind::User;
    std::optional<std::vector<HrvSample>> coherence;      // biometric snapshot, if any
    std::optional<std::string> meta;
};

struct SessionStats {
    double mean = 0.5;
    double zScore = 0.0;
    size_t count = 0;        // total bits in the active buffer
    size_t window = 0;       // bits actually used for mean/z
    size_t markerCount = 0;
    Mode mode = Mode::Experiment;
};

struct BaselineComparison {
    double baselineMean = 0.0;
    double experimentMean = 0.0;
    double effectPercent = 0.0;   // (exp - base) / 0.5 * 100
    size_t baselineBits = 0;
    size_t experimentBits = 0;
};

struct CorrelatedSample {
    HrvSample sample;
    size_t bitIndex = 0;
};

struct DeviceInfo {
    std::string name;
    std::string address;
    int signalStrength = 0;  // RSSI dBm
};

enum class ConnectionStatus { Disconnected, Connecting, Connected, Failed };
const char* connectionStatusName(ConnectionStatus s);

// ------------------------------
// Options
// ------------------------------

struct SdrOptions {
    double sampleRate = 2.4e6;        // samples/s
    double centerFreq = 100e6;        // Hz
    bool   autoGain = true;
    int    gainTenthsDb = 0;          // used when autoGain is false
    int    deviceIndex = 0;
    size_t samplesPerHash = 65536;    // complex samples per raw block
    int    maxCycles = 16;            // whitening cycles before giving up
    int    failureThreshold = 3;      // consecutive failures before cool-down
    double backoffBaseSec = 5.0;
    double backoffMaxSec = 300.0;
};

struct OnlineOptions {
    std::string host = "qrng.anu.edu.au";
    std::string port = "443";
    std::string path = "/API/jsonI.php";
    size_t maxChunk = 1024;
    double timeoutSec = 5.0;
    int    chunkDelayMs = 50;
};

struct CollectorOptions {
    size_t capacity = 100000;         // per buffer
    int    cadenceMs = 10;            // one bit per tick
    double stopTimeoutSec = 1.0;
    size_t statsWindow = 1000;
    size_t minStatsBits = 10;
    size_t minComparisonBits = 100;
    int    providerRetryMs = 500;     // continuous source pause after error
    BitOrder bitOrder = BitOrder::MsbFirst;
};

struct MonitorOptions {
    double scanTimeoutSec = 10.0;
    int    maxRetries = 3;
    int    flakyMaxRetries = 6;
    double retryBaseDelaySec = 1.0;
    double retryMaxDelaySec = 16.0;
    double pollIntervalSec = 1.0;
    size_t rrCapacity = 120;          // ~2 minutes of beats
    size_t outputCapacity = 1024;
    double coherenceK = 50.0;         // RMSSD normalization (ms)
    size_t coherenceMinSamples = 10;
    std::vector<std::string> namePatterns {
        "Polar", "H808S", "H10", "H9", "OH1",
        "Garmin", "HRM-Dual", "HRM-Pro", "HRM-Run",
        "Wahoo", "TICKR", "TICKR X",
        "Suunto", "Smart Sensor",
        "Zephyr", "HxM",
        "RHYTHM", "Scosche",
        "HRM", "Heart Rate"
    };
    std::vector<std::string> flakyPatterns { "H808S" };
};

struct SessionOptions {
    CollectorOptions collector {};
    MonitorOptions monitor {};
    SdrOptions sdr {};
    OnlineOptions online {};
    bool useSdr = true;
    bool useOnline = true;
    size_t hrvSnapshotCapacity = 10000;
    double autoMarkThreshold = 0.8;
    size_t seedBytes = 48;
};

// Participant assignment for group sessions
struct Participant {
    std::string name;
    std::string role = "participant";   // participant | facilitator | observer
};

struct SessionMetadata {
    std::string sessionName;
    std::string intention;
    double startedAt = 0.0;
    std::map<std::string, Participant> participants;   // keyed by device address
};

// Unpack bytes into 0/1 values in the given bit order
std::vector<uint8_t> unpackBits(const uint8_t* data, size_t n, BitOrder order);

// Wall-clock seconds since epoch
double nowSeconds();

} // namespace hrvrng
