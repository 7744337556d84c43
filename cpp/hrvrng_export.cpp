#include "hrvrng_export.h"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace hrvrng {

std::string jsonQuote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back('"');
    return out;
}

// non-finite values are not representable in JSON
static void num(std::ostringstream& os, double v) {
    if (std::isfinite(v)) os << v;
    else os << "null";
}

std::string toJson(const HrvSample& s) {
    std::ostringstream os;
    os << std::setprecision(15);
    os << "{\"timestamp\":"; num(os, s.timestamp);
    os << ",\"device\":" << jsonQuote(s.deviceId);
    os << ",\"hr\":" << s.heartRateBpm;
    os << ",\"rrIntervalsMs\":[";
    for (size_t i = 0; i < s.rrIntervalsMs.size(); ++i) { if (i) os << ","; num(os, s.rrIntervalsMs[i]); }
    os << "]";
    os << ",\"coherence\":"; num(os, s.coherence);
    os << ",\"rmssdMs\":"; num(os, s.rmssdMs);
    if (s.error) os << ",\"error\":" << jsonQuote(*s.error);
    os << "}";
    return os.str();
}

std::string toJson(const Marker& m) {
    std::ostringstream os;
    os << std::setprecision(15);
    os << "{\"timestamp\":"; num(os, m.timestamp);
    os << ",\"bitIndex\":" << m.bitIndex;
    os << ",\"event\":" << jsonQuote(eventKindName(m.kind));
    os << ",\"coherence\":";
    if (m.coherence) {
        os << "[";
        for (size_t i = 0; i < m.coherence->size(); ++i) { if (i) os << ","; os << toJson((*m.coherence)[i]); }
        os << "]";
    } else {
        os << "null";
    }
    os << ",\"meta\":" << (m.meta ? jsonQuote(*m.meta) : std::string("null"));
    os << "}";
    return os.str();
}

std::string toJson(const SessionExport& e) {
    std::ostringstream os;
    os << std::setprecision(15);
    auto bits = [&](const char* k, const std::vector<uint8_t>& v) {
        os << "\"" << k << "\":[";
        for (size_t i = 0; i < v.size(); ++i) { if (i) os << ","; os << static_cast<int>(v[i]); }
        os << "]";
    };
    auto kv = [&](const char* k, double v) { os << "\"" << k << "\":"; num(os, v); };

    os << "{";
    kv("exportedAt", e.exportedAt); os << ",";
    // metadata
    os << "\"session\":{";
    os << "\"name\":" << jsonQuote(e.metadata.sessionName) << ",";
    os << "\"intention\":" << jsonQuote(e.metadata.intention) << ",";
    kv("startedAt", e.metadata.startedAt); os << ",";
    os << "\"participants\":[";
    bool first = true;
    for (const auto& kvp : e.metadata.participants) {
        if (!first) os << ",";
        first = false;
        os << "{\"address\":" << jsonQuote(kvp.first)
           << ",\"name\":" << jsonQuote(kvp.second.name)
           << ",\"role\":" << jsonQuote(kvp.second.role) << "}";
    }
    os << "]},";
    os << "\"mode\":" << jsonQuote(modeName(e.mode)) << ",";
    // stats
    os << "\"stats\":{";
    kv("mean", e.stats.mean); os << ","; kv("zScore", e.stats.zScore); os << ",";
    os << "\"count\":" << e.stats.count << ",\"window\":" << e.stats.window
       << ",\"markerCount\":" << e.stats.markerCount << ",\"mode\":" << jsonQuote(modeName(e.stats.mode));
    os << "},";
    os << "\"baselineComparison\":";
    if (e.comparison) {
        os << "{";
        kv("baselineMean", e.comparison->baselineMean); os << ",";
        kv("experimentMean", e.comparison->experimentMean); os << ",";
        kv("effectPercent", e.comparison->effectPercent); os << ",";
        os << "\"baselineBits\":" << e.comparison->baselineBits
           << ",\"experimentBits\":" << e.comparison->experimentBits << "}";
    } else {
        os << "null";
    }
    os << ",";
    os << "\"seedFingerprint\":" << jsonQuote(e.seedFingerprint) << ",";
    os << "\"entropySource\":" << jsonQuote(e.entropySource) << ",";
    os << "\"experimentCount\":" << e.experimentCount << ",\"baselineCount\":" << e.baselineCount << ",";
    // markers & snapshots
    os << "\"markers\":[";
    for (size_t i = 0; i < e.markers.size(); ++i) { if (i) os << ","; os << toJson(e.markers[i]); }
    os << "],";
    os << "\"hrvSnapshots\":[";
    for (size_t i = 0; i < e.hrvSnapshots.size(); ++i) {
        if (i) os << ",";
        os << "{\"bitIndex\":" << e.hrvSnapshots[i].bitIndex << ",\"sample\":" << toJson(e.hrvSnapshots[i].sample) << "}";
    }
    os << "]";
    if (e.includeBits) {
        os << ",";
        bits("experimentBits", e.experimentBits); os << ",";
        bits("baselineBits", e.baselineBits);
    }
    os << "}";
    return os.str();
}

} // namespace hrvrng
