#pragma once

#include "bars/Bar.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace mtfcast {
namespace bars {

struct ResampleOptions {
    // Emit windows that had not elapsed at the cutoff, flagged incomplete.
    bool allow_partial = false;
    // Defaults to the period end of the latest source bar.
    std::optional<int64_t> cutoff_ms;
};

// Stateless conversion of 1-minute bars into epoch-aligned higher-timeframe bars.
// Empty windows are omitted, so the output is sparse.
class Resampler {
public:
    // Throws InvalidTimeframeError, UnsortedInputError or MalformedBarError.
    static std::vector<Bar> Resample(const std::vector<Bar>& minuteBars,
                                     int64_t timeframe_ms,
                                     const ResampleOptions& options = {});

    // Same output as Resample. The input is split on window boundaries and the chunks
    // are resampled on up to `workers` threads.
    static std::vector<Bar> ResampleParallel(const std::vector<Bar>& minuteBars,
                                             int64_t timeframe_ms,
                                             const ResampleOptions& options,
                                             size_t workers);

    // Checks the 1-minute input contract. Throws on the first violation.
    static void ValidateSource(const std::vector<Bar>& minuteBars);

    // The epoch-aligned window holding `timestamp_ms`.
    static ResampleWindow WindowFor(int64_t timestamp_ms, int64_t timeframe_ms);

private:
    static int64_t ResolveCutoff(const std::vector<Bar>& minuteBars, const ResampleOptions& options);

    // Aggregates minuteBars[begin, end) without validation.
    static void ResampleRange(const std::vector<Bar>& minuteBars,
                              size_t begin,
                              size_t end,
                              int64_t timeframe_ms,
                              int64_t cutoff_ms,
                              bool allow_partial,
                              std::vector<Bar>& out);
};

} // namespace bars
} // namespace mtfcast
