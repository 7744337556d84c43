// SDR IQ sampling with LSB extraction and SHA-256 whitening
#pragma once

#include <chrono>
#include <complex>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "hrvrng_core.h"
#include "hrvrng_entropy.h"

struct rtlsdr_dev;

namespace hrvrng {

// Lower layer delivering complex IQ samples normalized to [-1, 1]
class IqRadio {
public:
    virtual ~IqRadio() = default;
    virtual bool present() = 0;
    virtual bool open(const SdrOptions& opt, std::string* err) = 0;
    virtual bool read(size_t n, std::vector<std::complex<float>>& out, std::string* err) = 0;
    virtual void close() = 0;
};

// librtlsdr backed radio
class RtlSdrRadio : public IqRadio {
public:
    RtlSdrRadio() = default;
    ~RtlSdrRadio() override;
    RtlSdrRadio(const RtlSdrRadio&) = delete;
    RtlSdrRadio& operator=(const RtlSdrRadio&) = delete;

    bool present() override;
    bool open(const SdrOptions& opt, std::string* err) override;
    bool read(size_t n, std::vector<std::complex<float>>& out, std::string* err) override;
    void close() override;

private:
    rtlsdr_dev* dev_ {nullptr};
};

// Quantize to int8, take I/Q LSBs interleaved, pack MSB-first, zero-pad
std::vector<uint8_t> extractLsbBytes(const std::vector<std::complex<float>>& iq);

class SpectralEntropyExtractor : public EntropySource {
public:
    using Clock = std::chrono::steady_clock;

    explicit SpectralEntropyExtractor(std::unique_ptr<IqRadio> radio, const SdrOptions& opt = {});

    const char* name() const override { return "sdr"; }
    // False while cooling down or when no device is attached
    bool available() override;
    ByteResult fetch(size_t n) override { return whiten(n); }

    // One raw block of packed LSBs; fails fast during the backoff window
    ByteResult collectRaw();
    // Exactly n whitened bytes; n above maxWhitenBytes() fails without touching the radio
    ByteResult whiten(size_t n);
    size_t maxWhitenBytes() const;

    bool coolingDown() const;
    int consecutiveFailures() const;
    const SdrOptions& options() const { return opt_; }

private:
    void recordFailure();
    void recordSuccess();

    std::unique_ptr<IqRadio> radio_;
    SdrOptions opt_ {};
    std::mutex radioM_;              // serializes hardware access
    mutable std::mutex m_;
    int consecutiveFailures_ {0};
    Clock::time_point cooldownUntil_ {};
    uint32_t counter_ {0};
};

} // namespace hrvrng
