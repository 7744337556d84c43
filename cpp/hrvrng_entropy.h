// Entropy sources and the fixed-priority fallback chain
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "hrvrng_core.h"

namespace hrvrng {

class EntropySource {
public:
    virtual ~EntropySource() = default;
    virtual const char* name() const = 0;
    // Cheap check; false means fetch() would fail without trying hardware/network
    virtual bool available() = 0;
    virtual ByteResult fetch(size_t n) = 0;
};

// Platform CSPRNG (getrandom, then /dev/urandom). Never returns short.
class SecureFallbackSource : public EntropySource {
public:
    const char* name() const override { return "software"; }
    bool available() override { return true; }
    ByteResult fetch(size_t n) override { return ByteResult::success(bytes(n)); }

    // Throws std::system_error only if both OS facilities fail
    std::vector<uint8_t> bytes(size_t n);
    uint8_t bit() { return static_cast<uint8_t>(bytes(1)[0] & 1u); }
};

struct HttpResponse {
    int status = 0;
    std::string body;
    ErrorKind error = ErrorKind::Ok;
    std::string message;
};

// GET host:port target with a per-request timeout (seconds)
using HttpGet = std::function<HttpResponse(const std::string& host, const std::string& port,
                                           const std::string& target, double timeoutSec)>;

// Default transport: HTTPS via Boost.Beast
HttpResponse httpsGet(const std::string& host, const std::string& port,
                      const std::string& target, double timeoutSec);

// Remote quantum RNG (ANU QRNG JSON API), fetched in bounded chunks
class OnlineEntropyFetcher : public EntropySource {
public:
    explicit OnlineEntropyFetcher(const OnlineOptions& opt = {}, HttpGet get = httpsGet);

    const char* name() const override { return "online"; }
    bool available() override { return static_cast<bool>(get_); }
    ByteResult fetch(size_t n) override;

    const OnlineOptions& options() const { return opt_; }

    // Validates one response body and returns its byte values
    static ByteResult parseResponse(const std::string& body);

private:
    std::string buildTarget(size_t length) const;

    OnlineOptions opt_ {};
    HttpGet get_;
};

// spectral -> online -> software; fetch(n) always yields n bytes
class EntropySourceChain : public EntropySource {
public:
    EntropySourceChain(std::unique_ptr<EntropySource> spectral,
                       std::unique_ptr<EntropySource> online,
                       SecureFallbackSource& fallback);

    const char* name() const override { return "chain"; }
    bool available() override { return true; }
    ByteResult fetch(size_t n) override;

    // Name of the source that satisfied the most recent non-empty request
    std::string lastSource() const;

    EntropySource* spectral() { return spectral_.get(); }
    EntropySource* online() { return online_.get(); }

private:
    bool accept(const ByteResult& r, size_t n, const char* source);
    void setLast(const char* source);

    std::unique_ptr<EntropySource> spectral_;
    std::unique_ptr<EntropySource> online_;
    SecureFallbackSource& fallback_;
    mutable std::mutex lastM_;
    std::string last_;
};

} // namespace hrvrng
