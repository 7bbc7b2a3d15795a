#pragma once

#include "bars/Bar.h"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace mtfcast {
namespace alignment {

// One row of the as-of join. Slots are keyed by timeframe in milliseconds;
// an empty optional means no bar of that timeframe had closed yet.
struct AlignedFeatureVector {
    int64_t reference_timestamp_ms = 0;
    std::map<int64_t, std::optional<bars::Bar>> slots;

    bool IsComplete() const;
    const bars::Bar* Get(int64_t timeframe_ms) const;
};

// Per-timeframe bar streams, each sorted by period start.
using TimeframeStreams = std::map<int64_t, std::vector<bars::Bar>>;

class TemporalAligner {
public:
    // Backward-only join of every stream onto the reference timestamps. For each
    // timestamp and timeframe the latest complete bar with period_end <= timestamp
    // is selected. One forward-moving cursor per stream, so the cost is linear.
    // Throws UnsortedInputError, and LeakageViolationError if verification fails.
    static std::vector<AlignedFeatureVector> Align(const std::vector<int64_t>& referenceTimestamps,
                                                   const TimeframeStreams& streams);

    // Period ends of the complete bars of the reference stream.
    static std::vector<int64_t> ReferenceClock(const std::vector<bars::Bar>& referenceBars);

    static void VerifyNoLookahead(const std::vector<AlignedFeatureVector>& rows);
};

} // namespace alignment
} // namespace mtfcast
