#include "TimeUtils.h"

#include "Errors.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace mtfcast {

int64_t ParseTimeframe(const std::string& text) {
    std::string trimmed;
    for (char ch : text) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            trimmed.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    if (trimmed.empty()) {
        throw InvalidTimeframeError("empty timeframe");
    }

    size_t digits = 0;
    while (digits < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[digits]))) {
        ++digits;
    }
    if (digits == 0 || digits > 9) {
        throw InvalidTimeframeError("cannot parse timeframe '" + text + "'");
    }

    const int64_t count = std::stoll(trimmed.substr(0, digits));
    const std::string unit = trimmed.substr(digits);
    int64_t unitMs = 0;
    if (unit.empty() || unit == "m" || unit == "min") {
        unitMs = kMinuteMs;
    } else if (unit == "h") {
        unitMs = kHourMs;
    } else if (unit == "d") {
        unitMs = kDayMs;
    } else {
        throw InvalidTimeframeError("unknown timeframe unit in '" + text + "'");
    }

    const int64_t timeframe = count * unitMs;
    ValidateTimeframe(timeframe);
    return timeframe;
}

std::string FormatTimeframe(int64_t timeframe_ms) {
    if (timeframe_ms > 0 && timeframe_ms % kDayMs == 0) {
        return std::to_string(timeframe_ms / kDayMs) + "d";
    }
    if (timeframe_ms > 0 && timeframe_ms % kHourMs == 0) {
        return std::to_string(timeframe_ms / kHourMs) + "h";
    }
    if (timeframe_ms > 0 && timeframe_ms % kMinuteMs == 0) {
        return std::to_string(timeframe_ms / kMinuteMs) + "m";
    }
    return std::to_string(timeframe_ms) + "ms";
}

void ValidateTimeframe(int64_t timeframe_ms) {
    if (timeframe_ms <= 0 || timeframe_ms % kMinuteMs != 0) {
        throw InvalidTimeframeError("timeframe must be a positive multiple of one minute, got "
                                    + std::to_string(timeframe_ms) + " ms");
    }
}

time_t ToUtcTimeT(std::tm* tm) {
#if defined(_WIN32)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

std::optional<int64_t> ParseIsoToMillis(const std::string& text) {
    if (text.size() < 19) {
        return std::nullopt;
    }
    auto ParseInt = [&](size_t pos, size_t len) -> std::optional<int> {
        if (pos + len > text.size()) return std::nullopt;
        int value = 0;
        for (size_t i = 0; i < len; ++i) {
            char ch = text[pos + i];
            if (ch < '0' || ch > '9') {
                return std::nullopt;
            }
            value = value * 10 + (ch - '0');
        }
        return value;
    };

    if (text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ')) {
        return std::nullopt;
    }
    auto year = ParseInt(0, 4);
    auto month = ParseInt(5, 2);
    auto day = ParseInt(8, 2);
    auto hour = ParseInt(11, 2);
    auto minute = ParseInt(14, 2);
    auto second = ParseInt(17, 2);
    if (!year || !month || !day || !hour || !minute || !second) {
        return std::nullopt;
    }
    if (*month < 1 || *month > 12 || *day < 1 || *day > 31 || *hour > 23 || *minute > 59 || *second > 60) {
        return std::nullopt;
    }

    int64_t fractionMillis = 0;
    if (text.size() > 19 && text[19] == '.') {
        size_t fracEnd = 20;
        while (fracEnd < text.size() && std::isdigit(static_cast<unsigned char>(text[fracEnd]))) {
            ++fracEnd;
        }
        std::string fraction = text.substr(20, fracEnd - 20);
        while (fraction.size() < 3) fraction.push_back('0');
        if (fraction.size() > 3) fraction.resize(3);
        fractionMillis = std::stoi(fraction);
    }

    std::tm tm = {};
    tm.tm_year = *year - 1900;
    tm.tm_mon = *month - 1;
    tm.tm_mday = *day;
    tm.tm_hour = *hour;
    tm.tm_min = *minute;
    tm.tm_sec = *second;
    time_t seconds = ToUtcTimeT(&tm);
    if (seconds == static_cast<time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(seconds) * 1000LL + fractionMillis;
}

std::string FormatIsoMillis(int64_t timestamp_ms) {
    const int64_t seconds = FloorDiv(timestamp_ms, 1000);
    const int64_t millis = timestamp_ms - seconds * 1000;
    time_t asTimeT = static_cast<time_t>(seconds);
    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &asTimeT);
#else
    gmtime_r(&asTimeT, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << (tm_buf.tm_year + 1900) << "-"
        << std::setw(2) << (tm_buf.tm_mon + 1) << "-" << std::setw(2) << tm_buf.tm_mday << "T"
        << std::setw(2) << tm_buf.tm_hour << ":" << std::setw(2) << tm_buf.tm_min << ":"
        << std::setw(2) << tm_buf.tm_sec << "." << std::setw(3) << millis << "Z";
    return oss.str();
}

} // namespace mtfcast
