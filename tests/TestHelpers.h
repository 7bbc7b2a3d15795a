#pragma once

#include "TimeUtils.h"
#include "bars/Bar.h"

#include <cstdint>
#include <string>
#include <vector>

namespace mtfcast {
namespace testing {

// 2024-01-01T00:00:00Z
constexpr int64_t kDay0 = 1704067200000LL;

inline bars::Bar MinuteBar(int64_t start_ms, double open, double high, double low, double close,
                           double volume = 1.0, const std::string& symbol = "EURUSD") {
    bars::Bar bar;
    bar.symbol = symbol;
    bar.timeframe_ms = kMinuteMs;
    bar.period_start_ms = start_ms;
    bar.open = open;
    bar.high = high;
    bar.low = low;
    bar.close = close;
    bar.volume = volume;
    return bar;
}

// A bar at `start_ms` whose close is `price`; the range is +-0.5.
inline bars::Bar FlatBar(int64_t start_ms, double price, double volume = 1.0) {
    return MinuteBar(start_ms, price, price + 0.5, price - 0.5, price, volume);
}

// `count` consecutive minutes from `start_ms` with a close that rises by `slope` per minute.
inline std::vector<bars::Bar> MinuteSeries(int64_t start_ms, int count, double base = 100.0, double slope = 0.01) {
    std::vector<bars::Bar> out;
    out.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        const double open = base + slope * i;
        const double close = open + slope * 0.5;
        out.push_back(MinuteBar(start_ms + i * kMinuteMs, open, close + 0.02, open - 0.02, close, 10.0 + (i % 7)));
    }
    return out;
}

} // namespace testing
} // namespace mtfcast
