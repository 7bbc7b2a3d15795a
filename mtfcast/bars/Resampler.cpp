#include "bars/Resampler.h"

#include "Errors.h"
#include "TaskExecutor.h"
#include "TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace mtfcast {
namespace bars {

namespace {

std::string DescribeBar(const Bar& bar, size_t index) {
    std::ostringstream oss;
    oss << "bar #" << index << " (" << bar.symbol << " @ " << FormatIsoMillis(bar.period_start_ms) << ")";
    return oss.str();
}

} // namespace

ResampleWindow Resampler::WindowFor(int64_t timestamp_ms, int64_t timeframe_ms) {
    ResampleWindow window;
    window.timeframe_ms = timeframe_ms;
    window.period_start_ms = AlignToTimeframe(timestamp_ms, timeframe_ms);
    window.period_end_ms = window.period_start_ms + timeframe_ms;
    return window;
}

void Resampler::ValidateSource(const std::vector<Bar>& minuteBars) {
    for (size_t i = 0; i < minuteBars.size(); ++i) {
        const Bar& bar = minuteBars[i];
        if (bar.timeframe_ms != kMinuteMs) {
            throw MalformedBarError(DescribeBar(bar, i) + " is not a 1-minute bar (timeframe "
                                    + std::to_string(bar.timeframe_ms) + " ms)");
        }
        if (AlignToTimeframe(bar.period_start_ms, kMinuteMs) != bar.period_start_ms) {
            throw MalformedBarError(DescribeBar(bar, i) + " is not aligned to the minute");
        }
        if (!std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low)
            || !std::isfinite(bar.close) || !std::isfinite(bar.volume)) {
            throw MalformedBarError(DescribeBar(bar, i) + " has a non-finite field");
        }
        if (bar.high < std::max({bar.open, bar.close, bar.low})
            || bar.low > std::min({bar.open, bar.close, bar.high})) {
            throw MalformedBarError(DescribeBar(bar, i) + " violates high/low ordering");
        }
        if (bar.volume < 0.0) {
            throw MalformedBarError(DescribeBar(bar, i) + " has negative volume");
        }
        if (i > 0) {
            const Bar& prev = minuteBars[i - 1];
            if (bar.symbol != prev.symbol) {
                throw MalformedBarError(DescribeBar(bar, i) + " mixes symbol '" + bar.symbol
                                        + "' into a '" + prev.symbol + "' series");
            }
            if (bar.period_start_ms <= prev.period_start_ms) {
                throw UnsortedInputError(DescribeBar(bar, i) + " does not follow "
                                         + FormatIsoMillis(prev.period_start_ms));
            }
        }
    }
}

int64_t Resampler::ResolveCutoff(const std::vector<Bar>& minuteBars, const ResampleOptions& options) {
    if (options.cutoff_ms) {
        return *options.cutoff_ms;
    }
    return minuteBars.empty() ? 0 : minuteBars.back().period_end_ms();
}

void Resampler::ResampleRange(const std::vector<Bar>& minuteBars,
                              size_t begin,
                              size_t end,
                              int64_t timeframe_ms,
                              int64_t cutoff_ms,
                              bool allow_partial,
                              std::vector<Bar>& out) {
    bool open = false;
    ResampleWindow window;
    Bar current;

    auto flush = [&]() {
        if (!open) {
            return;
        }
        if (current.period_end_ms() > cutoff_ms) {
            if (!allow_partial) {
                return;
            }
            current.incomplete = true;
        }
        out.push_back(current);
    };

    for (size_t i = begin; i < end; ++i) {
        const Bar& src = minuteBars[i];
        if (src.period_start_ms >= cutoff_ms) {
            break;
        }
        if (!open || !window.Contains(src.period_start_ms)) {
            flush();
            window = WindowFor(src.period_start_ms, timeframe_ms);
            current = Bar{};
            current.symbol = src.symbol;
            current.timeframe_ms = window.timeframe_ms;
            current.period_start_ms = window.period_start_ms;
            current.open = src.open;
            current.high = src.high;
            current.low = src.low;
            current.close = src.close;
            current.volume = src.volume;
            open = true;
            continue;
        }
        current.high = std::max(current.high, src.high);
        current.low = std::min(current.low, src.low);
        current.close = src.close;
        current.volume += src.volume;
    }
    flush();
}

std::vector<Bar> Resampler::Resample(const std::vector<Bar>& minuteBars,
                                     int64_t timeframe_ms,
                                     const ResampleOptions& options) {
    ValidateTimeframe(timeframe_ms);
    ValidateSource(minuteBars);

    std::vector<Bar> out;
    if (minuteBars.empty()) {
        return out;
    }
    out.reserve(minuteBars.size() / static_cast<size_t>(timeframe_ms / kMinuteMs) + 1);
    ResampleRange(minuteBars, 0, minuteBars.size(), timeframe_ms,
                  ResolveCutoff(minuteBars, options), options.allow_partial, out);
    return out;
}

std::vector<Bar> Resampler::ResampleParallel(const std::vector<Bar>& minuteBars,
                                             int64_t timeframe_ms,
                                             const ResampleOptions& options,
                                             size_t workers) {
    if (workers <= 1 || minuteBars.size() < 2 * workers) {
        return Resample(minuteBars, timeframe_ms, options);
    }
    ValidateTimeframe(timeframe_ms);
    ValidateSource(minuteBars);
    const int64_t cutoff = ResolveCutoff(minuteBars, options);

    // Chunk boundaries sit where a new window starts, so no window spans two chunks.
    std::vector<size_t> bounds{0};
    const size_t target = minuteBars.size() / workers;
    for (size_t k = 1; k < workers; ++k) {
        size_t idx = std::max(k * target, bounds.back() + 1);
        while (idx < minuteBars.size()
               && WindowFor(minuteBars[idx - 1].period_start_ms, timeframe_ms)
                      .Contains(minuteBars[idx].period_start_ms)) {
            ++idx;
        }
        if (idx >= minuteBars.size()) {
            break;
        }
        bounds.push_back(idx);
    }
    bounds.push_back(minuteBars.size());

    const size_t chunkCount = bounds.size() - 1;
    std::vector<std::vector<Bar>> partials(chunkCount);
    TaskExecutor executor(static_cast<int>(workers));
    executor.ExecuteParallel(chunkCount, [&](size_t chunk) {
        ResampleRange(minuteBars, bounds[chunk], bounds[chunk + 1], timeframe_ms,
                      cutoff, options.allow_partial, partials[chunk]);
    });

    std::vector<Bar> out;
    for (auto& part : partials) {
        out.insert(out.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    return out;
}

} // namespace bars
} // namespace mtfcast
