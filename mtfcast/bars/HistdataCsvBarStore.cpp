#include "bars/HistdataCsvBarStore.h"

#include "SimpleLogger.h"
#include "TimeUtils.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace mtfcast {
namespace bars {

namespace {

std::string Trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

// Generic ASCII rows are ';'-separated; MetaTrader exports use ','.
std::vector<std::string> SplitRow(const std::string& line) {
    const char delimiter = line.find(';') != std::string::npos ? ';' : ',';
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, delimiter)) {
        fields.push_back(Trim(field));
    }
    return fields;
}

bool AllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char ch) { return std::isdigit(ch); });
}

int ToInt(const std::string& text, size_t pos, size_t len) {
    return std::stoi(text.substr(pos, len));
}

std::optional<int64_t> ToMillis(int year, int month, int day, int hour, int minute, int second) {
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    time_t seconds = ToUtcTimeT(&tm);
    if (seconds == static_cast<time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(seconds) * 1000LL;
}

// The three Histdata layouts: "YYYYMMDD HHMMSS", "YYYY.MM.DD HH:MM", "YYYYMMDDHHMMSS".
std::optional<int64_t> ParseHistdataDatetime(const std::string& text) {
    if (text.size() == 15 && text[8] == ' ' && AllDigits(text.substr(0, 8)) && AllDigits(text.substr(9, 6))) {
        return ToMillis(ToInt(text, 0, 4), ToInt(text, 4, 2), ToInt(text, 6, 2),
                        ToInt(text, 9, 2), ToInt(text, 11, 2), ToInt(text, 13, 2));
    }
    if (text.size() == 16 && text[4] == '.' && text[7] == '.' && text[10] == ' ' && text[13] == ':'
        && AllDigits(text.substr(0, 4)) && AllDigits(text.substr(5, 2)) && AllDigits(text.substr(8, 2))
        && AllDigits(text.substr(11, 2)) && AllDigits(text.substr(14, 2))) {
        return ToMillis(ToInt(text, 0, 4), ToInt(text, 5, 2), ToInt(text, 8, 2),
                        ToInt(text, 11, 2), ToInt(text, 14, 2), 0);
    }
    if (text.size() == 14 && AllDigits(text)) {
        return ToMillis(ToInt(text, 0, 4), ToInt(text, 4, 2), ToInt(text, 6, 2),
                        ToInt(text, 8, 2), ToInt(text, 10, 2), ToInt(text, 12, 2));
    }
    return std::nullopt;
}

std::optional<double> ParseDouble(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

HistdataCsvBarStore::HistdataCsvBarStore(HistdataOptions options)
    : m_options(std::move(options)) {
}

void HistdataCsvBarStore::RegisterFile(const std::string& symbol, const std::string& path) {
    m_registered[symbol].push_back(path);
}

std::optional<std::pair<int64_t, size_t>> HistdataCsvBarStore::ParseRowTimestamp(
    const std::vector<std::string>& fields) const {
    if (fields.empty()) {
        return std::nullopt;
    }
    const int64_t offsetMs = static_cast<int64_t>(m_options.utc_offset_minutes) * kMinuteMs;
    if (auto ts = ParseHistdataDatetime(fields[0])) {
        return std::make_pair(*ts + offsetMs, static_cast<size_t>(1));
    }
    // Date and time in separate columns.
    if (fields.size() > 1) {
        if (auto ts = ParseHistdataDatetime(fields[0] + " " + fields[1])) {
            return std::make_pair(*ts + offsetMs, static_cast<size_t>(2));
        }
    }
    return std::nullopt;
}

arrow::Result<std::vector<Bar>> HistdataCsvBarStore::ReadFile(const std::string& symbol,
                                                              const std::string& path) const {
    std::ifstream in(path);
    if (!in) {
        return arrow::Status::IOError("Cannot open Histdata file: ", path);
    }

    std::vector<Bar> bars;
    std::string line;
    size_t lineNumber = 0;
    size_t skipped = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (Trim(line).empty()) {
            continue;
        }
        auto fields = SplitRow(line);
        auto stamp = ParseRowTimestamp(fields);
        if (!stamp) {
            SimpleLogger::Warn("Skipping row " + std::to_string(lineNumber) + " of " + path
                               + " due to unparsed datetime: " + line);
            ++skipped;
            continue;
        }
        const size_t first = stamp->second;
        if (fields.size() < first + 4) {
            SimpleLogger::Warn("Skipping malformed row " + std::to_string(lineNumber) + " of " + path
                               + " (expected at least " + std::to_string(first + 4) + " columns, got "
                               + std::to_string(fields.size()) + ")");
            ++skipped;
            continue;
        }
        auto open = ParseDouble(fields[first]);
        auto high = ParseDouble(fields[first + 1]);
        auto low = ParseDouble(fields[first + 2]);
        auto close = ParseDouble(fields[first + 3]);
        std::optional<double> volume = 0.0;
        if (fields.size() > first + 4) {
            volume = ParseDouble(fields[first + 4]);
        }
        if (!open || !high || !low || !close || !volume) {
            SimpleLogger::Warn("Skipping row " + std::to_string(lineNumber) + " of " + path
                               + " with a non-numeric price: " + line);
            ++skipped;
            continue;
        }

        Bar bar;
        bar.symbol = symbol;
        bar.timeframe_ms = kMinuteMs;
        bar.period_start_ms = stamp->first;
        bar.open = *open;
        bar.high = *high;
        bar.low = *low;
        bar.close = *close;
        bar.volume = *volume;
        bars.push_back(std::move(bar));
    }

    if (skipped > 0) {
        SimpleLogger::Info("Histdata " + path + ": " + std::to_string(bars.size()) + " rows read, "
                           + std::to_string(skipped) + " skipped");
    }
    return bars;
}

std::vector<std::filesystem::path> HistdataCsvBarStore::FilesFor(const std::string& symbol) const {
    std::vector<std::filesystem::path> files;
    auto registered = m_registered.find(symbol);
    if (registered != m_registered.end()) {
        files.insert(files.end(), registered->second.begin(), registered->second.end());
    }
    if (!m_options.directory.empty()) {
        std::error_code ec;
        const std::string needle = ToUpper(symbol);
        for (const auto& entry : std::filesystem::directory_iterator(m_options.directory, ec)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            const auto name = entry.path().filename().string();
            if (ToUpper(entry.path().extension().string()) == ".CSV"
                && ToUpper(name).find(needle) != std::string::npos) {
                files.push_back(entry.path());
            }
        }
        if (ec) {
            SimpleLogger::Warn("Cannot scan Histdata directory " + m_options.directory + ": " + ec.message());
        }
    }
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    return files;
}

arrow::Result<std::vector<Bar>> HistdataCsvBarStore::Query(const std::string& symbol,
                                                           int64_t start_ms,
                                                           int64_t end_ms) {
    std::vector<Bar> selected;
    for (const auto& path : FilesFor(symbol)) {
        ARROW_ASSIGN_OR_RAISE(auto fileBars, ReadFile(symbol, path.string()));
        for (auto& bar : fileBars) {
            if (bar.period_start_ms >= start_ms && bar.period_start_ms < end_ms) {
                selected.push_back(std::move(bar));
            }
        }
    }

    std::stable_sort(selected.begin(), selected.end(),
                     [](const Bar& a, const Bar& b) { return a.period_start_ms < b.period_start_ms; });
    for (size_t i = 1; i < selected.size(); ++i) {
        if (selected[i].period_start_ms == selected[i - 1].period_start_ms) {
            return arrow::Status::Invalid("Duplicate Histdata bar for ", symbol, " at ",
                                          FormatIsoMillis(selected[i].period_start_ms));
        }
    }
    return selected;
}

} // namespace bars
} // namespace mtfcast
