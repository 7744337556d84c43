#include "hrvrng_sdr.h"

#include <algorithm>
#include <cmath>
#include <rtl-sdr.h>

#include "hrvrng_drbg.h"

#define LOG_TAG "HrvSdr"
#include "hrvrng_log.h"

namespace hrvrng {

// ------------------------------
// RtlSdrRadio
// ------------------------------

RtlSdrRadio::~RtlSdrRadio() { close(); }

bool RtlSdrRadio::present() {
    return rtlsdr_get_device_count() > 0;
}

static bool setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
    return false;
}

bool RtlSdrRadio::open(const SdrOptions& opt, std::string* err) {
    close();
    const uint32_t count = rtlsdr_get_device_count();
    if (opt.deviceIndex < 0 || static_cast<uint32_t>(opt.deviceIndex) >= count) {
        return setErr(err, "no rtl-sdr device at index " + std::to_string(opt.deviceIndex));
    }
    int r = rtlsdr_open(&dev_, static_cast<uint32_t>(opt.deviceIndex));
    if (r < 0 || !dev_) {
        dev_ = nullptr;
        return setErr(err, "rtlsdr_open failed (" + std::to_string(r) + ")");
    }
    if (rtlsdr_set_sample_rate(dev_, static_cast<uint32_t>(opt.sampleRate)) < 0) {
        close(); return setErr(err, "set_sample_rate failed");
    }
    if (rtlsdr_set_center_freq(dev_, static_cast<uint32_t>(opt.centerFreq)) < 0) {
        close(); return setErr(err, "set_center_freq failed");
    }
    if (opt.autoGain) {
        r = rtlsdr_set_tuner_gain_mode(dev_, 0);
    } else {
        r = rtlsdr_set_tuner_gain_mode(dev_, 1);
        if (r >= 0) r = rtlsdr_set_tuner_gain(dev_, opt.gainTenthsDb);
    }
    if (r < 0) { close(); return setErr(err, "gain setup failed"); }
    if (rtlsdr_reset_buffer(dev_) < 0) { close(); return setErr(err, "reset_buffer failed"); }
    return true;
}

bool RtlSdrRadio::read(size_t n, std::vector<std::complex<float>>& out, std::string* err) {
    out.clear();
    if (!dev_) return setErr(err, "device not open");
    // read_sync wants whole USB packets
    const size_t want = 2 * n;
    const size_t len = ((want + 511) / 512) * 512;
    std::vector<uint8_t> buf(len);
    size_t got = 0;
    while (got < want) {
        int nRead = 0;
        int r = rtlsdr_read_sync(dev_, buf.data() + got, static_cast<int>(len - got), &nRead);
        if (r < 0) return setErr(err, "read_sync failed (" + std::to_string(r) + ")");
        if (nRead <= 0) return setErr(err, "read_sync returned no data");
        got += static_cast<size_t>(nRead);
    }
    out.reserve(n);
    for (size_t k = 0; k < n; ++k) {
        float i = (static_cast<float>(buf[2 * k]) - 127.5f) / 127.5f;
        float q = (static_cast<float>(buf[2 * k + 1]) - 127.5f) / 127.5f;
        out.emplace_back(i, q);
    }
    return true;
}

void RtlSdrRadio::close() {
    if (dev_) {
        rtlsdr_close(dev_);
        dev_ = nullptr;
    }
}

// ------------------------------
// LSB extraction
// ------------------------------

static inline int8_t quantize(float v) {
    float s = std::round(v * 127.0f);
    s = std::max(-128.0f, std::min(127.0f, s));
    return static_cast<int8_t>(s);
}

std::vector<uint8_t> extractLsbBytes(const std::vector<std::complex<float>>& iq) {
    const size_t nbits = iq.size() * 2;
    std::vector<uint8_t> out((nbits + 7) / 8, 0);
    size_t bit = 0;
    auto put = [&](uint8_t b) {
        if (b) out[bit / 8] |= static_cast<uint8_t>(0x80u >> (bit % 8));
        ++bit;
    };
    for (const auto& s : iq) {
        put(static_cast<uint8_t>(quantize(s.real())) & 1u);
        put(static_cast<uint8_t>(quantize(s.imag())) & 1u);
    }
    return out;
}

// ------------------------------
// SpectralEntropyExtractor
// ------------------------------

SpectralEntropyExtractor::SpectralEntropyExtractor(std::unique_ptr<IqRadio> radio, const SdrOptions& opt)
    : radio_(std::move(radio)), opt_(opt) {
    if (opt_.maxCycles < 1) opt_.maxCycles = 1;
    if (opt_.failureThreshold < 1) opt_.failureThreshold = 1;
    if (opt_.samplesPerHash == 0) opt_.samplesPerHash = 65536;
}

bool SpectralEntropyExtractor::coolingDown() const {
    std::lock_guard<std::mutex> lock(m_);
    return consecutiveFailures_ >= opt_.failureThreshold && Clock::now() < cooldownUntil_;
}

int SpectralEntropyExtractor::consecutiveFailures() const {
    std::lock_guard<std::mutex> lock(m_);
    return consecutiveFailures_;
}

bool SpectralEntropyExtractor::available() {
    if (!radio_ || coolingDown()) return false;
    std::lock_guard<std::mutex> lock(radioM_);
    return radio_->present();
}

void SpectralEntropyExtractor::recordFailure() {
    std::lock_guard<std::mutex> lock(m_);
    ++consecutiveFailures_;
    if (consecutiveFailures_ >= opt_.failureThreshold) {
        const int over = consecutiveFailures_ - opt_.failureThreshold;
        double backoff = opt_.backoffBaseSec * std::pow(2.0, std::min(over, 16));
        backoff = std::min(backoff, opt_.backoffMaxSec);
        cooldownUntil_ = Clock::now() + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(backoff));
        LOGW("%d consecutive radio failures, cooling down for %.1fs", consecutiveFailures_, backoff);
    }
}

void SpectralEntropyExtractor::recordSuccess() {
    std::lock_guard<std::mutex> lock(m_);
    consecutiveFailures_ = 0;
}

ByteResult SpectralEntropyExtractor::collectRaw() {
    if (!radio_) return ByteResult::failure(ErrorKind::SourceUnavailable, "no radio");
    if (coolingDown()) return ByteResult::failure(ErrorKind::SourceUnavailable, "radio cooling down");

    std::lock_guard<std::mutex> lock(radioM_);
    std::string err;
    if (!radio_->open(opt_, &err)) {
        recordFailure();
        return ByteResult::failure(ErrorKind::SourceUnavailable, "open: " + err);
    }
    std::vector<std::complex<float>> iq;
    const bool ok = radio_->read(opt_.samplesPerHash, iq, &err);
    radio_->close();
    if (!ok || iq.empty()) {
        recordFailure();
        return ByteResult::failure(ErrorKind::SourceUnavailable, "read: " + (err.empty() ? std::string("no samples") : err));
    }
    recordSuccess();
    return ByteResult::success(extractLsbBytes(iq));
}

static void putBE(std::vector<uint8_t>& v, uint64_t x, int bytes) {
    for (int i = bytes - 1; i >= 0; --i) v.push_back(static_cast<uint8_t>((x >> (8 * i)) & 0xFFu));
}

size_t SpectralEntropyExtractor::maxWhitenBytes() const {
    // the last cycle may run past maxCycles to finish a request
    return static_cast<size_t>(opt_.maxCycles + 1) * Digest().size();
}

ByteResult SpectralEntropyExtractor::whiten(size_t n) {
    if (n == 0) return ByteResult::success({});
    if (n > maxWhitenBytes()) {
        return ByteResult::failure(ErrorKind::SourceUnavailable,
                                   "sdr cannot produce " + std::to_string(n) + " bytes in " +
                                   std::to_string(opt_.maxCycles) + " cycles (max " +
                                   std::to_string(maxWhitenBytes()) + ")");
    }
    std::vector<uint8_t> out;
    out.reserve(n + 32);
    int cycles = 0;
    while (out.size() < n) {
        ByteResult raw = collectRaw();
        if (!raw.ok()) return raw;

        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        std::vector<uint8_t> block;
        block.reserve(12 + raw.bytes.size());
        putBE(block, static_cast<uint64_t>(ms), 8);
        uint32_t ctr;
        {
            std::lock_guard<std::mutex> lock(m_);
            ctr = counter_++;
        }
        putBE(block, ctr, 4);
        block.insert(block.end(), raw.bytes.begin(), raw.bytes.end());

        const Digest d = sha256(block.data(), block.size());
        out.insert(out.end(), d.begin(), d.end());
        ++cycles;
        if (cycles > opt_.maxCycles && out.size() < n) {
            return ByteResult::failure(ErrorKind::SourceUnavailable,
                                       "sdr could not produce " + std::to_string(n) + " bytes in " +
                                       std::to_string(cycles) + " cycles");
        }
    }
    out.resize(n);
    LOGD("whitened %zu bytes in %d cycles", n, cycles);
    return ByteResult::success(std::move(out));
}

} // namespace hrvrng
