// Live bit collection with rolling statistics, markers and baseline comparison
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "hrvrng_core.h"
#include "hrvrng_ring.h"

namespace hrvrng {

class HmacDrbg;
class SecureFallbackSource;

// Blocking producer of byte blocks for continuous ingestion
using BlockProvider = std::function<ByteResult()>;

struct CollectorSnapshot {
    std::vector<uint8_t> experimentBits;
    std::vector<uint8_t> baselineBits;
    std::vector<Marker> markers;
    Mode mode = Mode::Experiment;
};

// Idle -> Running(mode) -> Idle. One producer task at a time: either the
// per-tick generator loop or the continuous block ingestion loop.
class BitStreamCollector {
public:
    BitStreamCollector(HmacDrbg& drbg, SecureFallbackSource& fallback, const CollectorOptions& opt = {});
    ~BitStreamCollector();
    BitStreamCollector(const BitStreamCollector&) = delete;
    BitStreamCollector& operator=(const BitStreamCollector&) = delete;

    // Starts the per-tick producer; while running only switches mode
    bool start(Mode mode = Mode::Experiment);
    // Continuous ingestion of provider() blocks; false if already running
    bool startContinuousSource(BlockProvider provider, Mode mode = Mode::Experiment);
    // Signals the producer and waits up to stopTimeoutSec; true if it exited
    bool stop();

    bool running() const { return running_.load(); }
    void setMode(Mode m) { mode_.store(m); }
    Mode mode() const { return mode_.load(); }

    void markEvent(EventKind kind,
                   std::optional<std::vector<HrvSample>> coherence = std::nullopt,
                   std::optional<std::string> meta = std::nullopt);

    SessionStats getStats() const { return getStats(opt_.statsWindow); }
    SessionStats getStats(size_t window) const;
    std::optional<BaselineComparison> getBaselineComparison() const;

    // Values other than 0/1 are skipped; returns the number appended
    size_t importBaselineBits(const std::vector<int>& bits);
    // Unpacked with the configured bit order
    size_t importBaselineBytes(const std::vector<uint8_t>& raw);

    size_t experimentCount() const { return experiment_.size(); }
    size_t baselineCount() const { return baseline_.size(); }
    std::vector<Marker> markers() const;
    size_t markerCount() const;
    CollectorSnapshot snapshot() const;
    // Drops bits and markers; ignored while running
    bool clear();

    const CollectorOptions& options() const { return opt_; }

private:
    void runTicks();
    void runContinuous(BlockProvider provider);
    void appendBit(uint8_t bit);
    uint8_t drawBit();
    // Waits on the stop condition; true if stop was requested
    bool waitFor(std::chrono::milliseconds d);
    bool reapPrevious();
    void launch(std::function<void()> body);

    HmacDrbg& drbg_;
    SecureFallbackSource& fallback_;
    CollectorOptions opt_ {};

    BoundedRing<uint8_t> experiment_;
    BoundedRing<uint8_t> baseline_;

    mutable std::mutex markersM_;
    std::vector<Marker> markers_;

    std::atomic<Mode> mode_ {Mode::Experiment};
    std::atomic<bool> running_ {false};
    std::mutex runM_;
    std::condition_variable runCv_;
    std::mutex lifecycleM_;
    std::thread worker_;
    std::future<void> workerDone_;
};

} // namespace hrvrng

// Plain C bridge (symbols have C linkage; still compiled as C++)
extern "C" {
    typedef struct hrv_stats_c {
        double mean;
        double z_score;
        unsigned long count;
        unsigned long marker_count;
        int mode;   // 0 baseline, 1 experiment
    } hrv_stats_c;

    void* hrv_collector_create(unsigned long capacity);
    int   hrv_collector_seed(void* h, const unsigned char* material, unsigned long n);
    int   hrv_collector_start(void* h, int mode);
    int   hrv_collector_stop(void* h);
    void  hrv_collector_mark(void* h, int kind);
    int   hrv_collector_stats(void* h, hrv_stats_c* out);
    void  hrv_collector_destroy(void* h);
}
