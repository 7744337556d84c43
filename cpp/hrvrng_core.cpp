#include "hrvrng_core.h"

#include <chrono>

namespace hrvrng {

const char* errorCode(ErrorKind k) {
    switch (k) {
        case ErrorKind::Ok:                  return "HRVRNG_E000";
        case ErrorKind::SourceUnavailable:   return "HRVRNG_E101";
        case ErrorKind::MalformedResponse:   return "HRVRNG_E102";
        case ErrorKind::DeviceConnectFailed: return "HRVRNG_E111";
        case ErrorKind::ParseError:          return "HRVRNG_E121";
    }
    return "HRVRNG_E199";
}

const char* errorName(ErrorKind k) {
    switch (k) {
        case ErrorKind::Ok:                  return "ok";
        case ErrorKind::SourceUnavailable:   return "source_unavailable";
        case ErrorKind::MalformedResponse:   return "malformed_response";
        case ErrorKind::DeviceConnectFailed: return "device_connect_failed";
        case ErrorKind::ParseError:          return "parse_error";
    }
    return "unknown";
}

const char* modeName(Mode m) {
    return m == Mode::Baseline ? "baseline" : "experiment";
}

const char* eventKindName(EventKind k) {
    switch (k) {
        case EventKind::Intention:     return "intention";
        case EventKind::HighCoherence: return "high_coherence";
        case EventKind::User:          return "user";
    }
    return "user";
}

const char* connectionStatusName(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Failed:       return "failed";
    }
    return "disconnected";
}

std::vector<uint8_t> unpackBits(const uint8_t* data, size_t n, BitOrder order) {
    std::vector<uint8_t> bits;
    if (!data || n == 0) return bits;
    bits.reserve(n * 8);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t b = data[i];
        for (int k = 0; k < 8; ++k) {
            int shift = (order == BitOrder::MsbFirst) ? (7 - k) : k;
            bits.push_back(static_cast<uint8_t>((b >> shift) & 1u));
        }
    }
    return bits;
}

double nowSeconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

} // namespace hrvrng
