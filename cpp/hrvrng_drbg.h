// HMAC-SHA-256 deterministic random bit generator
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace hrvrng {

class EntropySource;

using Digest = std::array<uint8_t, 32>;

// mbedTLS md wrappers; throw std::runtime_error on library failure
Digest sha256(const uint8_t* data, size_t n);
Digest hmacSha256(const uint8_t* key, size_t keyLen, const uint8_t* data, size_t n);
std::string toHex(const uint8_t* data, size_t n);

// K/V construction per NIST SP 800-90A (HMAC_DRBG, SHA-256).
// All state changes happen under one mutex; a draw sees either the old or the new state.
class HmacDrbg {
public:
    HmacDrbg() = default;

    // Reset K/V and absorb material
    void seed(const std::vector<uint8_t>& material);
    // Mix additional material into the current state
    void reseed(const std::vector<uint8_t>& material);
    // Pull nbytes from src and seed(); returns false if the source failed
    bool seedFromSource(EntropySource& src, size_t nbytes = 48);

    bool seeded() const;
    std::vector<uint8_t> generate(size_t nbytes);
    // Low n bits (n <= 32) of a 4-byte big-endian draw
    uint32_t getBits(int n);

    // Hex SHA-256 of the last seed material ("" if never seeded)
    std::string seedFingerprint() const;
    uint64_t generateCount() const;

private:
    struct State {
        Digest K;
        Digest V;
    };
    static void update(State& s, const uint8_t* data, size_t n, bool alwaysTwoPasses);

    mutable std::mutex m_;
    State state_ {};
    bool seeded_ {false};
    std::string fingerprint_;
    uint64_t generates_ {0};
};

} // namespace hrvrng
