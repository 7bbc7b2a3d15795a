#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace mtfcast {

constexpr int64_t kMinuteMs = 60LL * 1000LL;
constexpr int64_t kHourMs = 60LL * kMinuteMs;
constexpr int64_t kDayMs = 24LL * kHourMs;

// Floor division that stays correct for negative timestamps.
inline int64_t FloorDiv(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

// Start of the epoch-aligned window of size timeframe_ms that contains timestamp_ms.
inline int64_t AlignToTimeframe(int64_t timestamp_ms, int64_t timeframe_ms) {
    return FloorDiv(timestamp_ms, timeframe_ms) * timeframe_ms;
}

// Accepts "1m", "15m", "1h", "4h", "1d". A bare integer means minutes.
// Throws InvalidTimeframeError.
int64_t ParseTimeframe(const std::string& text);

// Inverse of ParseTimeframe using the largest whole unit ("60m" -> "1h").
std::string FormatTimeframe(int64_t timeframe_ms);

// Throws InvalidTimeframeError unless timeframe_ms is a positive whole number of minutes.
void ValidateTimeframe(int64_t timeframe_ms);

time_t ToUtcTimeT(std::tm* tm);

// "YYYY-MM-DDTHH:MM:SS[.fff][Z]" or "YYYY-MM-DD HH:MM:SS" -> epoch millis (UTC).
std::optional<int64_t> ParseIsoToMillis(const std::string& text);

// "YYYY-MM-DDTHH:MM:SS.fffZ".
std::string FormatIsoMillis(int64_t timestamp_ms);

} // namespace mtfcast
