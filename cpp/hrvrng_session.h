// Experiment session: the single context object wiring sources, generator,
// collector, recorder and device monitor together
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "hrvrng_ble.h"
#include "hrvrng_correlation.h"
#include "hrvrng_drbg.h"
#include "hrvrng_entropy.h"
#include "hrvrng_export.h"
#include "hrvrng_sdr.h"
#include "hrvrng_stream.h"

namespace hrvrng {

// Result of one poll of the device monitor
struct PumpResult {
    std::vector<HrvSample> samples;     // non-error samples, recorded
    std::vector<HrvSample> failures;    // synthetic connect-failure samples
    double averageCoherence = 0.0;
    size_t deviceCount = 0;
    bool autoMarked = false;
};

class ExperimentSession {
public:
    // radio == nullptr with useSdr selects the librtlsdr radio
    ExperimentSession(BleTransport& ble, const SessionOptions& opt = {},
                      std::unique_ptr<IqRadio> radio = nullptr, HttpGet get = httpsGet);
    ~ExperimentSession();
    ExperimentSession(const ExperimentSession&) = delete;
    ExperimentSession& operator=(const ExperimentSession&) = delete;

    // Seeds the DRBG from the entropy chain
    bool seedGenerator();
    bool seedGenerator(size_t nbytes);

    bool start(Mode mode = Mode::Experiment) { return collector_.start(mode); }
    // Continuous whitened SDR blocks instead of per-tick draws; false without a radio.
    // blockBytes is clamped to what one whitening call can produce.
    bool startSpectralStream(Mode mode = Mode::Experiment, size_t blockBytes = 256);
    bool stop() { return collector_.stop(); }

    // Drains the monitor, records samples, auto-marks high coherence
    PumpResult pump();
    // Intention marker with the latest sample per device; false unless running an experiment
    bool markIntention(std::optional<std::string> meta = std::nullopt);

    // Session metadata (group sessions)
    void setSessionInfo(const std::string& name, const std::string& intention);
    // role: participant | facilitator | observer; anything else is std::invalid_argument
    void addParticipant(const std::string& address, const std::string& name,
                        const std::string& role = "participant");
    SessionMetadata metadata() const;

    // Point-in-time copy of everything exportable
    SessionExport exportSnapshot(bool includeBits = false) const;

    BitStreamCollector& collector() { return collector_; }
    const BitStreamCollector& collector() const { return collector_; }
    BiometricDeviceMonitor& monitor() { return monitor_; }
    CorrelationRecorder& recorder() { return recorder_; }
    HmacDrbg& drbg() { return drbg_; }
    EntropySourceChain& chain() { return chain_; }
    const SessionOptions& options() const { return opt_; }

private:
    SessionOptions opt_ {};
    SecureFallbackSource fallback_;
    SpectralEntropyExtractor* spectral_ {nullptr};   // owned by chain_
    EntropySourceChain chain_;
    HmacDrbg drbg_;
    BitStreamCollector collector_;
    CorrelationRecorder recorder_;
    BiometricDeviceMonitor monitor_;

    mutable std::mutex m_;
    SessionMetadata meta_;
    std::map<std::string, HrvSample> latest_;   // per device
};

} // namespace hrvrng
