#pragma once

#include <cstdint>
#include <string>

namespace mtfcast {
namespace bars {

// OHLCV summary of [period_start_ms, period_start_ms + timeframe_ms).
struct Bar {
    std::string symbol;
    int64_t timeframe_ms = 0;
    int64_t period_start_ms = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    // Set only on derived bars whose window had not elapsed at the cutoff.
    bool incomplete = false;

    int64_t period_end_ms() const { return period_start_ms + timeframe_ms; }

    bool operator==(const Bar& other) const {
        return symbol == other.symbol
            && timeframe_ms == other.timeframe_ms
            && period_start_ms == other.period_start_ms
            && open == other.open
            && high == other.high
            && low == other.low
            && close == other.close
            && volume == other.volume
            && incomplete == other.incomplete;
    }
    bool operator!=(const Bar& other) const { return !(*this == other); }
};

// Half-open grouping window used by the resampler.
struct ResampleWindow {
    int64_t timeframe_ms = 0;
    int64_t period_start_ms = 0;
    int64_t period_end_ms = 0;

    bool Contains(int64_t timestamp_ms) const {
        return timestamp_ms >= period_start_ms && timestamp_ms < period_end_ms;
    }
};

} // namespace bars
} // namespace mtfcast
