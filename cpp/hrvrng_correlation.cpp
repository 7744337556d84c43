#include "hrvrng_correlation.h"

#include "hrvrng_stream.h"

namespace hrvrng {

CorrelationRecorder::CorrelationRecorder(const BitStreamCollector& collector, size_t capacity)
    : collector_(collector), snapshots_(capacity) {}

CorrelatedSample CorrelationRecorder::record(const HrvSample& sample) {
    CorrelatedSample c;
    c.sample = sample;
    c.bitIndex = collector_.experimentCount();
    snapshots_.push(c);
    return c;
}

size_t CorrelationRecorder::recordAll(const std::vector<HrvSample>& samples) {
    size_t n = 0;
    for (const auto& s : samples) {
        if (s.isError()) continue;
        record(s);
        ++n;
    }
    return n;
}

} // namespace hrvrng
