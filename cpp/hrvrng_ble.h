// BLE heart-rate parsing, RR coherence and per-device connection monitors
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "hrvrng_core.h"
#include "hrvrng_ring.h"

namespace hrvrng {

constexpr const char* kHeartRateServiceUuid = "0000180d-0000-1000-8000-00805f9b34fb";
constexpr const char* kHeartRateMeasurementUuid = "00002a37-0000-1000-8000-00805f9b34fb";

// Decoded Heart Rate Measurement characteristic (0x2A37)
struct HeartRateMeasurement {
    int heartRateBpm = 0;
    std::vector<float> rrIntervalsMs;
    bool contactSupported = false;
    bool contactDetected = false;
    bool energyPresent = false;
    int energyExpendedKj = 0;
};

// Returns false on a truncated payload and sets err_code (stable code).
// A trailing odd byte in the RR region is ignored.
bool parseHeartRateMeasurement(const uint8_t* data, size_t len,
                               HeartRateMeasurement& out,
                               const char** err_code = nullptr);

// 1 / (1 + RMSSD / k) clamped to [0, 1]; 0 with fewer than minSamples values.
// rmssdOut receives RMSSD when enough data exists, 0 otherwise.
float computeCoherence(const std::vector<float>& rr, double k = 50.0,
                       size_t minSamples = 10, float* rmssdOut = nullptr);

// Time-domain RR measures
struct RRSummary {
    size_t count = 0;
    double bpm = 0.0;
    double sdnn = 0.0;
    double rmssd = 0.0;
    double pnn50 = 0.0;
};
RRSummary summarizeRR(const std::vector<float>& rr);

// Case-insensitive substring match against any pattern
bool matchesDevicePattern(const std::string& name, const std::vector<std::string>& patterns);

// Lower layer delivering advertisements and notification payloads.
// Calls may block; implementations must be safe to call from several
// monitor threads for distinct addresses.
class BleTransport {
public:
    using NotifyHandler = std::function<void(const uint8_t* data, size_t len)>;

    virtual ~BleTransport() = default;
    virtual std::vector<DeviceInfo> discover(double timeoutSec) = 0;
    virtual bool connect(const std::string& address, std::string* err) = 0;
    virtual bool subscribe(const std::string& address, const std::string& characteristic,
                           NotifyHandler handler, std::string* err) = 0;
    virtual bool isConnected(const std::string& address) = 0;
    virtual void disconnect(const std::string& address) = 0;
    // Radio stack reset used between attempts on flaky straps
    virtual bool resetAdapter(std::string* err) = 0;
};

// One monitor thread per device, all feeding a single bounded output channel.
// Disconnected -> Connecting -> Connected -> (Disconnected | Failed)
// A dropped link is retried with backoff like a failed connect; the attempt
// counter resets only once a link has stayed up for a full poll interval.
class BiometricDeviceMonitor {
public:
    explicit BiometricDeviceMonitor(BleTransport& transport, const MonitorOptions& opt = {});
    ~BiometricDeviceMonitor();
    BiometricDeviceMonitor(const BiometricDeviceMonitor&) = delete;
    BiometricDeviceMonitor& operator=(const BiometricDeviceMonitor&) = delete;

    // Known heart-rate straps only, strongest signal first
    std::vector<DeviceInfo> scan();
    std::vector<DeviceInfo> scan(double timeoutSec);

    // Starts a monitor per address not already active; returns how many started
    size_t connect(const std::vector<std::string>& addresses);
    void disconnect(const std::string& address);
    void disconnectAll();

    // Drains the output channel, synthetic error samples included
    std::vector<HrvSample> getRecentSamples();

    std::vector<std::string> activeAddresses() const;
    ConnectionStatus status(const std::string& address) const;
    int attempts(const std::string& address) const;
    std::vector<float> rrBuffer(const std::string& address) const;
    bool isFlaky(const std::string& address) const;

    const MonitorOptions& options() const { return opt_; }

private:
    struct DeviceConnection {
        DeviceConnection(std::string addr, bool flakyDevice, size_t rrCapacity)
            : address(std::move(addr)), flaky(flakyDevice), rr(rrCapacity) {}

        const std::string address;
        const bool flaky;
        std::atomic<ConnectionStatus> status {ConnectionStatus::Disconnected};
        std::atomic<int> attempt {0};
        BoundedRing<float> rr;
        std::atomic<bool> stop {false};
        std::mutex waitM;
        std::condition_variable waitCv;
        std::mutex joinM;   // serializes joins from disconnect() and disconnectAll()
        std::thread worker;
    };

    void runDevice(std::shared_ptr<DeviceConnection> dev);
    void onNotification(DeviceConnection& dev, const uint8_t* data, size_t len);
    // true if stop was requested during the wait
    bool sleepOrStop(DeviceConnection& dev, double seconds);
    double backoffDelay(int attempt) const;
    void retire(const std::string& address);
    static void requestStop(DeviceConnection& dev);
    static void joinWorker(DeviceConnection& dev);

    BleTransport& transport_;
    MonitorOptions opt_ {};
    BoundedRing<HrvSample> output_;

    mutable std::mutex m_;
    std::map<std::string, std::shared_ptr<DeviceConnection>> known_;
    std::set<std::string> active_;
    std::map<std::string, std::string> names_;   // address -> advertised name
};

} // namespace hrvrng
