// Session export document (point-in-time copy, serialized as JSON)
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "hrvrng_core.h"

namespace hrvrng {

struct SessionExport {
    double exportedAt = 0.0;
    SessionMetadata metadata;
    Mode mode = Mode::Experiment;
    SessionStats stats;
    std::optional<BaselineComparison> comparison;
    std::vector<Marker> markers;
    std::vector<CorrelatedSample> hrvSnapshots;
    std::string seedFingerprint;
    std::string entropySource;
    size_t experimentCount = 0;
    size_t baselineCount = 0;
    bool includeBits = false;
    std::vector<uint8_t> experimentBits;
    std::vector<uint8_t> baselineBits;
};

std::string toJson(const HrvSample& s);
std::string toJson(const Marker& m);
std::string toJson(const SessionExport& e);

// JSON string literal with escaping
std::string jsonQuote(const std::string& s);

} // namespace hrvrng
