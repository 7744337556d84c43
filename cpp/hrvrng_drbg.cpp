#include "hrvrng_drbg.h"

#include <stdexcept>
#include <mbedtls/md.h>

#include "hrvrng_entropy.h"

#define LOG_TAG "HrvDrbg"
#include "hrvrng_log.h"

namespace hrvrng {

// ------------------------------
// Digest helpers (mbedTLS md API)
// ------------------------------

static const mbedtls_md_info_t* sha256Info() {
    const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (!info) throw std::runtime_error("mbedtls: SHA-256 not available");
    return info;
}

Digest sha256(const uint8_t* data, size_t n) {
    Digest out {};
    if (mbedtls_md(sha256Info(), data, n, out.data()) != 0) {
        throw std::runtime_error("mbedtls: sha256 failed");
    }
    return out;
}

Digest hmacSha256(const uint8_t* key, size_t keyLen, const uint8_t* data, size_t n) {
    Digest out {};
    if (mbedtls_md_hmac(sha256Info(), key, keyLen, data, n, out.data()) != 0) {
        throw std::runtime_error("mbedtls: hmac failed");
    }
    return out;
}

std::string toHex(const uint8_t* data, size_t n) {
    static const char* hex = "0123456789abcdef";
    std::string s;
    s.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        s.push_back(hex[data[i] >> 4]);
        s.push_back(hex[data[i] & 0x0F]);
    }
    return s;
}

// ------------------------------
// HmacDrbg
// ------------------------------

// K = HMAC(K, V || sep || data); V = HMAC(K, V), for sep = 0x00 then 0x01
void HmacDrbg::update(State& s, const uint8_t* data, size_t n, bool alwaysTwoPasses) {
    std::vector<uint8_t> buf;
    buf.reserve(s.V.size() + 1 + n);
    for (uint8_t sep = 0x00; sep <= 0x01; ++sep) {
        buf.assign(s.V.begin(), s.V.end());
        buf.push_back(sep);
        if (n > 0) buf.insert(buf.end(), data, data + n);
        s.K = hmacSha256(s.K.data(), s.K.size(), buf.data(), buf.size());
        s.V = hmacSha256(s.K.data(), s.K.size(), s.V.data(), s.V.size());
        if (!alwaysTwoPasses && n == 0) break;
    }
}

void HmacDrbg::seed(const std::vector<uint8_t>& material) {
    State fresh;
    fresh.K.fill(0x00);
    fresh.V.fill(0x01);
    update(fresh, material.data(), material.size(), true);
    const Digest fp = sha256(material.data(), material.size());

    std::lock_guard<std::mutex> lock(m_);
    state_ = fresh;
    seeded_ = true;
    fingerprint_ = toHex(fp.data(), fp.size());
    generates_ = 0;
}

void HmacDrbg::reseed(const std::vector<uint8_t>& material) {
    std::lock_guard<std::mutex> lock(m_);
    if (!seeded_) {
        state_.K.fill(0x00);
        state_.V.fill(0x01);
    }
    State next = state_;
    update(next, material.data(), material.size(), true);
    state_ = next;
    seeded_ = true;
    generates_ = 0;
}

bool HmacDrbg::seedFromSource(EntropySource& src, size_t nbytes) {
    ByteResult r = src.fetch(nbytes);
    if (!r.ok() || r.bytes.size() < nbytes) {
        LOGW("seed source %s failed: %s %s", src.name(), errorCode(r.error), r.message.c_str());
        return false;
    }
    seed(r.bytes);
    LOGI("seeded from %s (%zu bytes)", src.name(), nbytes);
    return true;
}

bool HmacDrbg::seeded() const {
    std::lock_guard<std::mutex> lock(m_);
    return seeded_;
}

std::vector<uint8_t> HmacDrbg::generate(size_t nbytes) {
    std::vector<uint8_t> out;
    out.reserve(nbytes + 32);
    std::lock_guard<std::mutex> lock(m_);
    if (!seeded_) throw std::logic_error("HmacDrbg: generate before seed");
    State s = state_;
    while (out.size() < nbytes) {
        s.V = hmacSha256(s.K.data(), s.K.size(), s.V.data(), s.V.size());
        out.insert(out.end(), s.V.begin(), s.V.end());
    }
    out.resize(nbytes);
    update(s, nullptr, 0, false);
    state_ = s;
    ++generates_;
    return out;
}

uint32_t HmacDrbg::getBits(int n) {
    if (n < 0 || n > 32) throw std::invalid_argument("getBits: n must be in [0, 32]");
    if (n == 0) return 0;
    std::vector<uint8_t> b = generate(4);
    uint32_t v = (static_cast<uint32_t>(b[0]) << 24) | (static_cast<uint32_t>(b[1]) << 16) |
                 (static_cast<uint32_t>(b[2]) << 8) | static_cast<uint32_t>(b[3]);
    if (n == 32) return v;
    return v & ((1u << n) - 1u);
}

std::string HmacDrbg::seedFingerprint() const {
    std::lock_guard<std::mutex> lock(m_);
    return fingerprint_;
}

uint64_t HmacDrbg::generateCount() const {
    std::lock_guard<std::mutex> lock(m_);
    return generates_;
}

} // namespace hrvrng
