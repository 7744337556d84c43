#pragma once

#include <cstddef>
#include <vector>
#include "hrvrng_core.h"
#include "hrvrng_ring.h"

namespace hrvrng {

class BitStreamCollector;

// Tags biometric samples with the experiment bit position at observation time.
// Append-only; entries are never modified and never feed back into bit production.
class CorrelationRecorder {
public:
    explicit CorrelationRecorder(const BitStreamCollector& collector, size_t capacity = 10000);

    CorrelatedSample record(const HrvSample& sample);
    // Error samples are skipped; returns the number recorded
    size_t recordAll(const std::vector<HrvSample>& samples);

    std::vector<CorrelatedSample> snapshots() const { return snapshots_.snapshot(); }
    std::vector<CorrelatedSample> recent(size_t n) const { return snapshots_.tail(n); }
    size_t size() const { return snapshots_.size(); }
    void clear() { snapshots_.clear(); }

private:
    const BitStreamCollector& collector_;
    BoundedRing<CorrelatedSample> snapshots_;
};

} // namespace hrvrng
