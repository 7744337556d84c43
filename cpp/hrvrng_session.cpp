#include "hrvrng_session.h"

#include <set>
#include <stdexcept>

#define LOG_TAG "HrvSession"
#include "hrvrng_log.h"

namespace hrvrng {

static std::unique_ptr<EntropySource> makeSpectral(const SessionOptions& opt, std::unique_ptr<IqRadio> radio) {
    if (!opt.useSdr) return nullptr;
    if (!radio) radio.reset(new RtlSdrRadio());
    return std::unique_ptr<EntropySource>(new SpectralEntropyExtractor(std::move(radio), opt.sdr));
}

static std::unique_ptr<EntropySource> makeOnline(const SessionOptions& opt, HttpGet get) {
    if (!opt.useOnline || !get) return nullptr;
    return std::unique_ptr<EntropySource>(new OnlineEntropyFetcher(opt.online, std::move(get)));
}

ExperimentSession::ExperimentSession(BleTransport& ble, const SessionOptions& opt,
                                     std::unique_ptr<IqRadio> radio, HttpGet get)
    : opt_(opt),
      chain_(makeSpectral(opt, std::move(radio)), makeOnline(opt, std::move(get)), fallback_),
      collector_(drbg_, fallback_, opt.collector),
      recorder_(collector_, opt.hrvSnapshotCapacity),
      monitor_(ble, opt.monitor) {
    spectral_ = dynamic_cast<SpectralEntropyExtractor*>(chain_.spectral());
    std::lock_guard<std::mutex> lock(m_);
    meta_.startedAt = nowSeconds();
}

ExperimentSession::~ExperimentSession() {
    monitor_.disconnectAll();
    if (!collector_.stop()) LOGW("collector producer still running at shutdown");
}

bool ExperimentSession::seedGenerator() {
    return seedGenerator(opt_.seedBytes);
}

bool ExperimentSession::seedGenerator(size_t nbytes) {
    if (nbytes == 0) throw std::invalid_argument("seedGenerator: nbytes must be > 0");
    ByteResult r = chain_.fetch(nbytes);
    if (!r.ok() || r.bytes.size() != nbytes) {
        LOGE("seed fetch failed: %s %s", errorCode(r.error), r.message.c_str());
        return false;
    }
    drbg_.seed(r.bytes);
    LOGI("generator seeded with %zu bytes from %s (%s)", nbytes, chain_.lastSource().c_str(),
         drbg_.seedFingerprint().c_str());
    return true;
}

bool ExperimentSession::startSpectralStream(Mode mode, size_t blockBytes) {
    if (!spectral_) {
        LOGW("spectral stream requested without an SDR source");
        return false;
    }
    if (blockBytes == 0) throw std::invalid_argument("startSpectralStream: blockBytes must be > 0");
    if (blockBytes > spectral_->maxWhitenBytes()) {
        LOGW("spectral block of %zu bytes exceeds the %d-cycle budget, using %zu", blockBytes,
             opt_.sdr.maxCycles, spectral_->maxWhitenBytes());
        blockBytes = spectral_->maxWhitenBytes();
    }
    SpectralEntropyExtractor* sdr = spectral_;
    return collector_.startContinuousSource([sdr, blockBytes]() { return sdr->whiten(blockBytes); }, mode);
}

PumpResult ExperimentSession::pump() {
    PumpResult out;
    std::vector<HrvSample> drained = monitor_.getRecentSamples();
    std::set<std::string> devices;
    double sum = 0.0;
    for (auto& s : drained) {
        if (s.isError()) {
            LOGW("device %s failed: %s", s.deviceId.c_str(), s.error->c_str());
            out.failures.push_back(std::move(s));
            continue;
        }
        sum += s.coherence;
        devices.insert(s.deviceId);
        out.samples.push_back(std::move(s));
    }
    if (out.samples.empty()) return out;

    recorder_.recordAll(out.samples);
    out.averageCoherence = sum / static_cast<double>(out.samples.size());
    out.deviceCount = devices.size();
    {
        std::lock_guard<std::mutex> lock(m_);
        for (const auto& s : out.samples) latest_[s.deviceId] = s;
    }
    if (collector_.running() && collector_.mode() == Mode::Experiment
        && out.averageCoherence > opt_.autoMarkThreshold) {
        collector_.markEvent(EventKind::HighCoherence, out.samples);
        out.autoMarked = true;
        LOGI("high coherence %.3f across %zu device(s)", out.averageCoherence, out.deviceCount);
    }
    return out;
}

bool ExperimentSession::markIntention(std::optional<std::string> meta) {
    if (!collector_.running() || collector_.mode() != Mode::Experiment) return false;
    std::vector<HrvSample> recent;
    {
        std::lock_guard<std::mutex> lock(m_);
        for (const auto& kv : latest_) recent.push_back(kv.second);
    }
    if (recent.empty()) collector_.markEvent(EventKind::Intention, std::nullopt, std::move(meta));
    else collector_.markEvent(EventKind::Intention, std::move(recent), std::move(meta));
    return true;
}

void ExperimentSession::setSessionInfo(const std::string& name, const std::string& intention) {
    std::lock_guard<std::mutex> lock(m_);
    meta_.sessionName = name;
    meta_.intention = intention;
}

void ExperimentSession::addParticipant(const std::string& address, const std::string& name,
                                       const std::string& role) {
    if (address.empty()) throw std::invalid_argument("participant address is empty");
    if (role != "participant" && role != "facilitator" && role != "observer") {
        throw std::invalid_argument("unknown participant role: " + role);
    }
    std::lock_guard<std::mutex> lock(m_);
    Participant p;
    p.name = name.empty() ? address : name;
    p.role = role;
    meta_.participants[address] = p;
}

SessionMetadata ExperimentSession::metadata() const {
    std::lock_guard<std::mutex> lock(m_);
    return meta_;
}

SessionExport ExperimentSession::exportSnapshot(bool includeBits) const {
    SessionExport e;
    e.exportedAt = nowSeconds();
    e.metadata = metadata();
    CollectorSnapshot snap = collector_.snapshot();
    e.mode = snap.mode;
    e.stats = collector_.getStats();
    e.comparison = collector_.getBaselineComparison();
    e.markers = std::move(snap.markers);
    e.hrvSnapshots = recorder_.snapshots();
    e.seedFingerprint = drbg_.seedFingerprint();
    e.entropySource = chain_.lastSource();
    e.experimentCount = snap.experimentBits.size();
    e.baselineCount = snap.baselineBits.size();
    e.includeBits = includeBits;
    if (includeBits) {
        e.experimentBits = std::move(snap.experimentBits);
        e.baselineBits = std::move(snap.baselineBits);
    }
    return e;
}

} // namespace hrvrng
