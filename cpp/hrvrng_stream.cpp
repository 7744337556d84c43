#include "hrvrng_stream.h"

#include <cmath>
#include <exception>
#include <memory>
#include <stdexcept>

#include "hrvrng_drbg.h"
#include "hrvrng_entropy.h"

#define LOG_TAG "HrvStream"
#include "hrvrng_log.h"

namespace hrvrng {

// helpers (local)
static inline double meanBits(const std::vector<uint8_t>& v) {
    if (v.empty()) return 0.0;
    size_t ones = 0;
    for (uint8_t b : v) ones += b;
    return static_cast<double>(ones) / static_cast<double>(v.size());
}

BitStreamCollector::BitStreamCollector(HmacDrbg& drbg, SecureFallbackSource& fallback, const CollectorOptions& opt)
    : drbg_(drbg), fallback_(fallback), opt_(opt),
      experiment_(opt.capacity), baseline_(opt.capacity) {
    if (opt_.cadenceMs < 0) opt_.cadenceMs = 0;
    if (opt_.stopTimeoutSec <= 0.0) opt_.stopTimeoutSec = 1.0;
    if (opt_.providerRetryMs < 1) opt_.providerRetryMs = 1;
}

BitStreamCollector::~BitStreamCollector() {
    {
        std::lock_guard<std::mutex> g(runM_);
        running_.store(false);
    }
    runCv_.notify_all();
    // never detach: an in-flight provider call is allowed to finish
    if (worker_.joinable()) worker_.join();
}

// ------------------------------
// Lifecycle
// ------------------------------

void BitStreamCollector::launch(std::function<void()> body) {
    std::promise<void> done;
    workerDone_ = done.get_future();
    worker_ = std::thread([this, body = std::move(body), done = std::move(done)]() mutable {
        try {
            body();
        } catch (const std::exception& e) {
            LOGE("producer stopped on exception: %s", e.what());
            running_.store(false);
        }
        done.set_value();
    });
}

bool BitStreamCollector::reapPrevious() {
    if (!worker_.joinable()) return true;
    if (workerDone_.valid()) {
        const auto timeout = std::chrono::duration<double>(opt_.stopTimeoutSec);
        if (workerDone_.wait_for(timeout) != std::future_status::ready) return false;
    }
    worker_.join();
    return true;
}

bool BitStreamCollector::start(Mode mode) {
    std::lock_guard<std::mutex> lk(lifecycleM_);
    if (running_.load()) {
        mode_.store(mode);
        LOGI("mode switched to %s", modeName(mode));
        return true;
    }
    if (!reapPrevious()) {
        LOGE("previous producer has not exited, refusing to start");
        return false;
    }
    mode_.store(mode);
    running_.store(true);
    launch([this] { runTicks(); });
    LOGI("collector started (%s, %d ms cadence, %s)", modeName(mode), opt_.cadenceMs,
         drbg_.seeded() ? "drbg" : "software");
    return true;
}

bool BitStreamCollector::startContinuousSource(BlockProvider provider, Mode mode) {
    if (!provider) throw std::invalid_argument("startContinuousSource: empty provider");
    std::lock_guard<std::mutex> lk(lifecycleM_);
    if (running_.load()) {
        LOGW("continuous source requested while running");
        return false;
    }
    if (!reapPrevious()) {
        LOGE("previous producer has not exited, refusing to start");
        return false;
    }
    mode_.store(mode);
    running_.store(true);
    launch([this, p = std::move(provider)]() mutable { runContinuous(std::move(p)); });
    LOGI("continuous source started (%s)", modeName(mode));
    return true;
}

bool BitStreamCollector::stop() {
    std::lock_guard<std::mutex> lk(lifecycleM_);
    {
        std::lock_guard<std::mutex> g(runM_);
        running_.store(false);
    }
    runCv_.notify_all();
    if (!worker_.joinable()) return true;
    const auto timeout = std::chrono::duration<double>(opt_.stopTimeoutSec);
    if (workerDone_.valid() && workerDone_.wait_for(timeout) != std::future_status::ready) {
        LOGW("producer did not exit within %.2fs; will join later", opt_.stopTimeoutSec);
        return false;
    }
    worker_.join();
    LOGI("collector stopped (experiment=%zu baseline=%zu)", experiment_.size(), baseline_.size());
    return true;
}

bool BitStreamCollector::waitFor(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(runM_);
    return runCv_.wait_for(lk, d, [this] { return !running_.load(); });
}

// ------------------------------
// Producers
// ------------------------------

uint8_t BitStreamCollector::drawBit() {
    if (drbg_.seeded()) return static_cast<uint8_t>(drbg_.getBits(1));
    return fallback_.bit();
}

void BitStreamCollector::appendBit(uint8_t bit) {
    if (mode_.load() == Mode::Baseline) baseline_.push(bit);
    else experiment_.push(bit);
}

void BitStreamCollector::runTicks() {
    const auto cadence = std::chrono::milliseconds(opt_.cadenceMs);
    while (running_.load()) {
        appendBit(drawBit());
        if (waitFor(cadence)) break;
    }
}

void BitStreamCollector::runContinuous(BlockProvider provider) {
    const auto retry = std::chrono::milliseconds(opt_.providerRetryMs);
    while (running_.load()) {
        ByteResult r = provider();
        // a block that arrives after stop() is dropped
        if (!running_.load()) break;
        if (!r.ok() || r.bytes.empty()) {
            LOGW("provider error %s: %s; retrying in %d ms", errorCode(r.error),
                 r.ok() ? "empty block" : r.message.c_str(), opt_.providerRetryMs);
            if (waitFor(retry)) break;
            continue;
        }
        std::vector<uint8_t> bits = unpackBits(r.bytes.data(), r.bytes.size(), opt_.bitOrder);
        // one mode per block
        BoundedRing<uint8_t>& dst = (mode_.load() == Mode::Baseline) ? baseline_ : experiment_;
        dst.pushRange(bits.begin(), bits.end());
        LOGD("ingested %zu bits", bits.size());
    }
}

// ------------------------------
// Markers & stats
// ------------------------------

void BitStreamCollector::markEvent(EventKind kind,
                                   std::optional<std::vector<HrvSample>> coherence,
                                   std::optional<std::string> meta) {
    Marker m;
    m.timestamp = nowSeconds();
    m.bitIndex = experiment_.size();
    m.kind = kind;
    m.coherence = std::move(coherence);
    m.meta = std::move(meta);
    std::lock_guard<std::mutex> lock(markersM_);
    markers_.push_back(std::move(m));
}

std::vector<Marker> BitStreamCollector::markers() const {
    std::lock_guard<std::mutex> lock(markersM_);
    return markers_;
}

size_t BitStreamCollector::markerCount() const {
    std::lock_guard<std::mutex> lock(markersM_);
    return markers_.size();
}

SessionStats BitStreamCollector::getStats(size_t window) const {
    SessionStats s;
    s.mode = mode_.load();
    s.markerCount = markerCount();
    const BoundedRing<uint8_t>& buf = (s.mode == Mode::Baseline) ? baseline_ : experiment_;
    std::vector<uint8_t> recent = (window == 0) ? buf.snapshot() : buf.tail(window);
    s.count = buf.size();
    s.window = recent.size();
    if (s.count < opt_.minStatsBits || recent.empty()) {
        // neutral placeholder until the buffer holds enough bits
        s.mean = 0.5;
        s.zScore = 0.0;
        return s;
    }
    const double n = static_cast<double>(recent.size());
    s.mean = meanBits(recent);
    s.zScore = (s.mean - 0.5) / (0.5 / std::sqrt(n));
    return s;
}

std::optional<BaselineComparison> BitStreamCollector::getBaselineComparison() const {
    std::vector<uint8_t> base = baseline_.snapshot();
    std::vector<uint8_t> exp = experiment_.snapshot();
    if (base.size() < opt_.minComparisonBits || exp.size() < opt_.minComparisonBits) return std::nullopt;
    BaselineComparison c;
    c.baselineMean = meanBits(base);
    c.experimentMean = meanBits(exp);
    c.effectPercent = (c.experimentMean - c.baselineMean) / 0.5 * 100.0;
    c.baselineBits = base.size();
    c.experimentBits = exp.size();
    return c;
}

size_t BitStreamCollector::importBaselineBits(const std::vector<int>& bits) {
    std::vector<uint8_t> valid;
    valid.reserve(bits.size());
    size_t skipped = 0;
    for (int b : bits) {
        if (b == 0 || b == 1) valid.push_back(static_cast<uint8_t>(b));
        else ++skipped;
    }
    if (skipped) LOGW("baseline import skipped %zu invalid values", skipped);
    baseline_.pushRange(valid.begin(), valid.end());
    return valid.size();
}

size_t BitStreamCollector::importBaselineBytes(const std::vector<uint8_t>& raw) {
    std::vector<uint8_t> bits = unpackBits(raw.data(), raw.size(), opt_.bitOrder);
    baseline_.pushRange(bits.begin(), bits.end());
    return bits.size();
}

CollectorSnapshot BitStreamCollector::snapshot() const {
    CollectorSnapshot s;
    s.mode = mode_.load();
    s.experimentBits = experiment_.snapshot();
    s.baselineBits = baseline_.snapshot();
    s.markers = markers();
    return s;
}

bool BitStreamCollector::clear() {
    std::lock_guard<std::mutex> lk(lifecycleM_);
    if (running_.load()) return false;
    experiment_.clear();
    baseline_.clear();
    std::lock_guard<std::mutex> lock(markersM_);
    markers_.clear();
    return true;
}

} // namespace hrvrng

// Plain C bridge
struct _hrv_collector_handle {
    hrvrng::SecureFallbackSource fallback;
    hrvrng::HmacDrbg drbg;
    std::unique_ptr<hrvrng::BitStreamCollector> p;
};

void* hrv_collector_create(unsigned long capacity) {
    auto* h = new _hrv_collector_handle();
    hrvrng::CollectorOptions o;
    if (capacity > 0) o.capacity = static_cast<size_t>(capacity);
    h->p.reset(new hrvrng::BitStreamCollector(h->drbg, h->fallback, o));
    return h;
}

int hrv_collector_seed(void* h, const unsigned char* material, unsigned long n) {
    if (!h || (!material && n > 0)) return 0;
    auto* S = reinterpret_cast<_hrv_collector_handle*>(h);
    S->drbg.seed(std::vector<uint8_t>(material, material + n));
    return 1;
}

int hrv_collector_start(void* h, int mode) {
    if (!h) return 0; auto* S = reinterpret_cast<_hrv_collector_handle*>(h);
    return S->p->start(mode == 0 ? hrvrng::Mode::Baseline : hrvrng::Mode::Experiment) ? 1 : 0;
}

int hrv_collector_stop(void* h) {
    if (!h) return 0; auto* S = reinterpret_cast<_hrv_collector_handle*>(h); return S->p->stop() ? 1 : 0;
}

void hrv_collector_mark(void* h, int kind) {
    if (!h) return; auto* S = reinterpret_cast<_hrv_collector_handle*>(h);
    hrvrng::EventKind k = (kind == 1 ? hrvrng::EventKind::HighCoherence
                         : (kind == 0 ? hrvrng::EventKind::Intention : hrvrng::EventKind::User));
    S->p->markEvent(k);
}

int hrv_collector_stats(void* h, hrv_stats_c* out) {
    if (!h || !out) return 0; auto* S = reinterpret_cast<_hrv_collector_handle*>(h);
    hrvrng::SessionStats s = S->p->getStats();
    out->mean = s.mean;
    out->z_score = s.zScore;
    out->count = static_cast<unsigned long>(s.count);
    out->marker_count = static_cast<unsigned long>(s.markerCount);
    out->mode = (s.mode == hrvrng::Mode::Baseline ? 0 : 1);
    return 1;
}

void hrv_collector_destroy(void* h) {
    if (!h) return; auto* S = reinterpret_cast<_hrv_collector_handle*>(h); delete S;
}
