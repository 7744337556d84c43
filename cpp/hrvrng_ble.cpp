#include "hrvrng_ble.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <numeric>
#include <stdexcept>

#define LOG_TAG "HrvBle"
#include "hrvrng_log.h"

namespace hrvrng {

namespace {

inline uint16_t readLe16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double s = std::accumulate(v.begin(), v.end(), 0.0);
    return s / static_cast<double>(v.size());
}

double sd(const std::vector<double>& v) {
    if (v.size() <= 1) return 0.0;
    double m = mean(v);
    double acc = 0.0;
    for (double x : v) {
        double d = x - m;
        acc += d * d;
    }
    return std::sqrt(acc / static_cast<double>(v.size() - 1));
}

double rmssdOf(const std::vector<float>& rr) {
    double sumsq = 0.0;
    for (size_t i = 1; i < rr.size(); ++i) {
        double d = static_cast<double>(rr[i]) - static_cast<double>(rr[i - 1]);
        sumsq += d * d;
    }
    return std::sqrt(sumsq / static_cast<double>(rr.size() - 1));
}

std::string lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

// ------------------------------
// Parsing and HRV measures
// ------------------------------

bool parseHeartRateMeasurement(const uint8_t* data, size_t len,
                               HeartRateMeasurement& out,
                               const char** err_code) {
    const char* code = errorCode(ErrorKind::ParseError);
    if (!data || len < 2) {
        if (err_code) *err_code = code;
        return false;
    }
    HeartRateMeasurement m;
    const uint8_t flags = data[0];
    size_t off = 1;
    if (flags & 0x01) {
        if (len < 3) {
            if (err_code) *err_code = code;
            return false;
        }
        m.heartRateBpm = readLe16(data + 1);
        off = 3;
    } else {
        m.heartRateBpm = data[1];
        off = 2;
    }
    m.contactSupported = (flags & 0x04) != 0;
    m.contactDetected = (flags & 0x02) != 0;
    if (flags & 0x08) {
        if (len < off + 2) {
            if (err_code) *err_code = code;
            return false;
        }
        m.energyPresent = true;
        m.energyExpendedKj = readLe16(data + off);
        off += 2;
    }
    if (flags & 0x10) {
        // 1/1024 s units
        while (off + 1 < len) {
            const uint16_t raw = readLe16(data + off);
            m.rrIntervalsMs.push_back(static_cast<float>(raw * 1000.0 / 1024.0));
            off += 2;
        }
    }
    out = std::move(m);
    return true;
}

float computeCoherence(const std::vector<float>& rr, double k, size_t minSamples, float* rmssdOut) {
    if (!(k > 0.0)) throw std::invalid_argument("coherence constant k must be > 0");
    if (rmssdOut) *rmssdOut = 0.0f;
    if (rr.size() < std::max<size_t>(minSamples, 2)) return 0.0f;
    const double rmssd = rmssdOf(rr);
    if (rmssdOut) *rmssdOut = static_cast<float>(rmssd);
    double c = 1.0 / (1.0 + rmssd / k);
    c = std::min(1.0, std::max(0.0, c));
    return static_cast<float>(c);
}

RRSummary summarizeRR(const std::vector<float>& rr) {
    RRSummary s;
    std::vector<double> ibi(rr.begin(), rr.end());
    s.count = ibi.size();
    if (ibi.empty()) return s;
    const double meanIbi = mean(ibi);
    if (meanIbi > 0.0) s.bpm = 60000.0 / meanIbi;
    s.sdnn = sd(ibi);
    if (ibi.size() >= 2) {
        int over50 = 0;
        for (size_t i = 1; i < ibi.size(); ++i) {
            if (std::fabs(ibi[i] - ibi[i - 1]) > 50.0) ++over50;
        }
        s.rmssd = rmssdOf(rr);
        s.pnn50 = 100.0 * over50 / static_cast<double>(ibi.size() - 1);
    }
    return s;
}

bool matchesDevicePattern(const std::string& name, const std::vector<std::string>& patterns) {
    if (name.empty()) return false;
    const std::string n = lower(name);
    for (const auto& p : patterns) {
        if (!p.empty() && n.find(lower(p)) != std::string::npos) return true;
    }
    return false;
}

// ------------------------------
// BiometricDeviceMonitor
// ------------------------------

BiometricDeviceMonitor::BiometricDeviceMonitor(BleTransport& transport, const MonitorOptions& opt)
    : transport_(transport), opt_(opt), output_(opt.outputCapacity) {
    if (opt_.maxRetries < 1) opt_.maxRetries = 1;
    if (opt_.flakyMaxRetries < opt_.maxRetries) opt_.flakyMaxRetries = opt_.maxRetries;
}

BiometricDeviceMonitor::~BiometricDeviceMonitor() {
    disconnectAll();
}

std::vector<DeviceInfo> BiometricDeviceMonitor::scan() {
    return scan(opt_.scanTimeoutSec);
}

std::vector<DeviceInfo> BiometricDeviceMonitor::scan(double timeoutSec) {
    std::vector<DeviceInfo> found = transport_.discover(timeoutSec);
    std::vector<DeviceInfo> hr;
    for (auto& d : found) {
        if (matchesDevicePattern(d.name, opt_.namePatterns)) hr.push_back(d);
    }
    std::stable_sort(hr.begin(), hr.end(), [](const DeviceInfo& a, const DeviceInfo& b) {
        return a.signalStrength > b.signalStrength;
    });
    {
        std::lock_guard<std::mutex> lock(m_);
        for (const auto& d : hr) names_[d.address] = d.name;
    }
    LOGI("scan: %zu advertisements, %zu heart-rate devices", found.size(), hr.size());
    return hr;
}

bool BiometricDeviceMonitor::isFlaky(const std::string& address) const {
    std::lock_guard<std::mutex> lock(m_);
    auto it = names_.find(address);
    const std::string& name = (it != names_.end()) ? it->second : address;
    return matchesDevicePattern(name, opt_.flakyPatterns);
}

size_t BiometricDeviceMonitor::connect(const std::vector<std::string>& addresses) {
    size_t started = 0;
    for (const auto& addr : addresses) {
        if (addr.empty()) continue;
        const bool flaky = isFlaky(addr);
        std::lock_guard<std::mutex> lock(m_);
        if (active_.count(addr)) continue;
        auto prev = known_.find(addr);
        if (prev != known_.end()) {
            // already out of the active set, so its thread no longer needs m_
            joinWorker(*prev->second);
        }
        auto dev = std::make_shared<DeviceConnection>(addr, flaky, opt_.rrCapacity);
        dev->status.store(ConnectionStatus::Connecting);
        known_[addr] = dev;
        active_.insert(addr);
        dev->worker = std::thread(&BiometricDeviceMonitor::runDevice, this, dev);
        ++started;
    }
    return started;
}

void BiometricDeviceMonitor::requestStop(DeviceConnection& dev) {
    {
        std::lock_guard<std::mutex> g(dev.waitM);
        dev.stop.store(true);
    }
    dev.waitCv.notify_all();
}

void BiometricDeviceMonitor::joinWorker(DeviceConnection& dev) {
    std::lock_guard<std::mutex> g(dev.joinM);
    if (dev.worker.joinable()) dev.worker.join();
}

void BiometricDeviceMonitor::disconnect(const std::string& address) {
    std::shared_ptr<DeviceConnection> dev;
    {
        std::lock_guard<std::mutex> lock(m_);
        auto it = known_.find(address);
        if (it == known_.end()) return;
        dev = it->second;
    }
    requestStop(*dev);
    joinWorker(*dev);
}

void BiometricDeviceMonitor::disconnectAll() {
    std::vector<std::shared_ptr<DeviceConnection>> all;
    {
        std::lock_guard<std::mutex> lock(m_);
        for (auto& kv : known_) all.push_back(kv.second);
    }
    for (auto& dev : all) requestStop(*dev);
    for (auto& dev : all) joinWorker(*dev);
}

std::vector<HrvSample> BiometricDeviceMonitor::getRecentSamples() {
    return output_.drain();
}

std::vector<std::string> BiometricDeviceMonitor::activeAddresses() const {
    std::lock_guard<std::mutex> lock(m_);
    return std::vector<std::string>(active_.begin(), active_.end());
}

ConnectionStatus BiometricDeviceMonitor::status(const std::string& address) const {
    std::lock_guard<std::mutex> lock(m_);
    auto it = known_.find(address);
    return it == known_.end() ? ConnectionStatus::Disconnected : it->second->status.load();
}

int BiometricDeviceMonitor::attempts(const std::string& address) const {
    std::lock_guard<std::mutex> lock(m_);
    auto it = known_.find(address);
    return it == known_.end() ? 0 : it->second->attempt.load();
}

std::vector<float> BiometricDeviceMonitor::rrBuffer(const std::string& address) const {
    std::lock_guard<std::mutex> lock(m_);
    auto it = known_.find(address);
    return it == known_.end() ? std::vector<float>{} : it->second->rr.snapshot();
}

double BiometricDeviceMonitor::backoffDelay(int attempt) const {
    double d = opt_.retryBaseDelaySec * std::pow(2.0, std::max(0, attempt - 1));
    return std::min(d, opt_.retryMaxDelaySec);
}

bool BiometricDeviceMonitor::sleepOrStop(DeviceConnection& dev, double seconds) {
    std::unique_lock<std::mutex> lk(dev.waitM);
    const auto d = std::chrono::duration<double>(std::max(0.0, seconds));
    return dev.waitCv.wait_for(lk, d, [&dev] { return dev.stop.load(); });
}

void BiometricDeviceMonitor::retire(const std::string& address) {
    std::lock_guard<std::mutex> lock(m_);
    active_.erase(address);
}

void BiometricDeviceMonitor::onNotification(DeviceConnection& dev, const uint8_t* data, size_t len) {
    HeartRateMeasurement hr;
    const char* code = nullptr;
    if (!parseHeartRateMeasurement(data, len, hr, &code)) {
        LOGW("%s: dropped malformed payload (%zu bytes, %s)", dev.address.c_str(), len, code);
        return;
    }
    dev.rr.pushRange(hr.rrIntervalsMs.begin(), hr.rrIntervalsMs.end());

    HrvSample s;
    s.timestamp = nowSeconds();
    s.deviceId = dev.address;
    s.heartRateBpm = hr.heartRateBpm;
    s.rrIntervalsMs = std::move(hr.rrIntervalsMs);
    s.coherence = computeCoherence(dev.rr.snapshot(), opt_.coherenceK, opt_.coherenceMinSamples, &s.rmssdMs);
    LOGD("%s: hr=%d rr=%zu coherence=%.3f", dev.address.c_str(), s.heartRateBpm,
         s.rrIntervalsMs.size(), s.coherence);
    output_.push(std::move(s));
}

void BiometricDeviceMonitor::runDevice(std::shared_ptr<DeviceConnection> dev) {
    const std::string& addr = dev->address;
    const int maxAttempts = dev->flaky ? opt_.flakyMaxRetries : opt_.maxRetries;
    std::weak_ptr<DeviceConnection> weak = dev;
    BleTransport::NotifyHandler handler = [this, weak](const uint8_t* data, size_t len) {
        if (auto d = weak.lock()) {
            if (!d->stop.load()) onNotification(*d, data, len);
        }
    };

    bool exhausted = false;
    std::string lastErr;
    while (!dev->stop.load()) {
        const int attempt = ++dev->attempt;
        dev->status.store(ConnectionStatus::Connecting);
        LOGI("%s: connecting (attempt %d/%d%s)", addr.c_str(), attempt, maxAttempts,
             dev->flaky ? ", flaky" : "");

        std::string err;
        bool ok = transport_.connect(addr, &err);
        if (ok) ok = transport_.subscribe(addr, kHeartRateMeasurementUuid, handler, &err);

        if (ok) {
            dev->status.store(ConnectionStatus::Connected);
            LOGI("%s: connected", addr.c_str());
            int polls = 0;
            while (!dev->stop.load() && transport_.isConnected(addr)) {
                // the link survived a full poll interval
                if (polls++ == 1) dev->attempt.store(0);
                if (sleepOrStop(*dev, opt_.pollIntervalSec)) break;
            }
            if (dev->stop.load()) break;
            LOGW("%s: connection lost", addr.c_str());
            err = "connection lost";
        }

        // a lost link counts against the same budget as a failed connect
        const int failedAttempt = dev->attempt.load();
        lastErr = err.empty() ? "connect failed" : err;
        LOGW("%s: attempt %d failed: %s", addr.c_str(), failedAttempt, lastErr.c_str());
        transport_.disconnect(addr);
        if (failedAttempt >= maxAttempts) {
            exhausted = true;
            break;
        }
        if (dev->flaky) {
            std::string rerr;
            if (!transport_.resetAdapter(&rerr)) LOGW("adapter reset failed: %s", rerr.c_str());
        }
        if (sleepOrStop(*dev, backoffDelay(failedAttempt))) break;
    }

    if (exhausted) {
        dev->status.store(ConnectionStatus::Failed);
        HrvSample s;
        s.timestamp = nowSeconds();
        s.deviceId = addr;
        s.heartRateBpm = 0;
        s.coherence = 0.0f;
        s.error = std::string(errorCode(ErrorKind::DeviceConnectFailed)) + ": " + lastErr;
        output_.push(std::move(s));
        LOGE("%s: giving up after %d attempts", addr.c_str(), maxAttempts);
    } else {
        transport_.disconnect(addr);
        dev->status.store(ConnectionStatus::Disconnected);
        LOGI("%s: disconnected", addr.c_str());
    }
    // last touch of m_ by this thread
    retire(addr);
}

} // namespace hrvrng
