#include "RunConfigSerializer.h"

#include "Errors.h"
#include "TimeUtils.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace mtfcast {
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

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

void AppendKeyValue(std::ostringstream& oss, const std::string& key, const std::string& value) {
    if (value.empty()) {
        return;
    }
    oss << key << '=' << value << '\n';
}

void AppendBool(std::ostringstream& oss, const std::string& key, bool value) {
    oss << key << '=' << (value ? "true" : "false") << '\n';
}

template <typename T>
void AppendNumeric(std::ostringstream& oss, const std::string& key, T value,
                   int precision = std::numeric_limits<double>::max_digits10) {
    oss << key << '=';
    if (std::is_integral<T>::value) {
        oss << value;
    } else {
        // General form with enough digits to read back the same double.
        const auto previous = oss.precision(precision);
        oss << value;
        oss.precision(previous);
    }
    oss << '\n';
}

std::string NormalizeKey(const std::string& key) {
    std::string lowered = ToLower(key);
    lowered.erase(std::remove_if(lowered.begin(), lowered.end(), [](char ch) {
        return ch == ' ' || ch == '_' || ch == '-';
    }), lowered.end());
    return lowered;
}

bool ParseBoolValue(const std::string& value, bool* out) {
    std::string lower = ToLower(value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "y") {
        *out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "n") {
        *out = false;
        return true;
    }
    return false;
}

template <typename T>
bool ParseIntegral(const std::string& value, T* out) {
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != value.size()) {
            return false;
        }
        if (parsed < static_cast<long long>(std::numeric_limits<T>::min())
            || parsed > static_cast<long long>(std::numeric_limits<T>::max())) {
            return false;
        }
        *out = static_cast<T>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

template <typename T>
bool ParseFloating(const std::string& value, T* out) {
    try {
        size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used != value.size()) {
            return false;
        }
        *out = static_cast<T>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// "0" or a timeframe-style duration.
bool ParseDuration(const std::string& value, int64_t* out) {
    if (value == "0") {
        *out = 0;
        return true;
    }
    try {
        *out = ParseTimeframe(value);
        return true;
    } catch (const InvalidTimeframeError&) {
        return false;
    }
}

std::string FormatDuration(int64_t ms) {
    return ms == 0 ? std::string("0") : FormatTimeframe(ms);
}

bool ParseTimeframeList(const std::string& value, std::vector<int64_t>* out) {
    std::vector<int64_t> parsed;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = Trim(item);
        if (trimmed.empty()) {
            continue;
        }
        try {
            parsed.push_back(ParseTimeframe(trimmed));
        } catch (const InvalidTimeframeError&) {
            return false;
        }
    }
    std::sort(parsed.begin(), parsed.end());
    parsed.erase(std::unique(parsed.begin(), parsed.end()), parsed.end());
    *out = std::move(parsed);
    return !out->empty();
}

bool ParseTimestamp(const std::string& value, int64_t* out) {
    if (auto millis = ParseIsoToMillis(value)) {
        *out = *millis;
        return true;
    }
    // Date only.
    if (value.size() == 10) {
        if (auto millis = ParseIsoToMillis(value + "T00:00:00")) {
            *out = *millis;
            return true;
        }
    }
    return ParseIntegral(value, out);
}

} // namespace

std::string RunConfigSerializer::Serialize(const RunConfig& config) {
    std::ostringstream oss;
    oss << "# mtfcast RunConfig v1\n";

    oss << "[RUN]\n";
    AppendKeyValue(oss, "name", config.run_name);
    AppendKeyValue(oss, "symbol", config.symbol);
    AppendKeyValue(oss, "model", config.model_type);
    AppendNumeric(oss, "ridge_alpha", config.ridge_alpha);
    AppendNumeric(oss, "horizon_bars", config.horizon_bars);
    AppendKeyValue(oss, "output", config.output_path);
    AppendKeyValue(oss, "predictions_csv", config.predictions_csv_path);
    oss << '\n';

    oss << "[BARS]\n";
    std::string timeframes;
    for (int64_t tf : config.timeframes_ms) {
        if (!timeframes.empty()) {
            timeframes += ",";
        }
        timeframes += FormatTimeframe(tf);
    }
    AppendKeyValue(oss, "timeframes", timeframes);
    if (config.reference_timeframe_ms > 0) {
        AppendKeyValue(oss, "reference_timeframe", FormatTimeframe(config.reference_timeframe_ms));
    }
    AppendBool(oss, "allow_partial_bars", config.allow_partial_bars);
    AppendNumeric(oss, "resample_workers", config.resample_workers);
    AppendKeyValue(oss, "range_start", FormatIsoMillis(config.range_start_ms));
    AppendKeyValue(oss, "range_end", FormatIsoMillis(config.range_end_ms));
    oss << '\n';

    oss << "[WALKFORWARD]\n";
    AppendKeyValue(oss, "policy", simulation::FoldPolicyName(config.fold_policy));
    AppendKeyValue(oss, "train_window", FormatDuration(config.train_window_ms));
    AppendKeyValue(oss, "eval_window", FormatDuration(config.eval_window_ms));
    AppendKeyValue(oss, "step", FormatDuration(config.step_ms));
    AppendKeyValue(oss, "gap", FormatDuration(config.gap_ms));
    AppendNumeric(oss, "max_folds", config.max_folds);
    AppendKeyValue(oss, "fold_mode", simulation::FoldModeName(config.fold_mode));
    AppendNumeric(oss, "max_parallel_folds", config.max_parallel_folds);
    AppendNumeric(oss, "fold_timeout_ms", config.fold_timeout_ms);
    oss << '\n';

    const auto& store = config.store;
    oss << "[STORE]\n";
    AppendKeyValue(oss, "kind", StoreKindName(store.kind));
    AppendKeyValue(oss, "rest_url", store.questdb.rest_url);
    AppendKeyValue(oss, "table", store.questdb.table);
    AppendNumeric(oss, "connect_timeout_ms", store.questdb.connect_timeout_ms);
    AppendNumeric(oss, "rest_timeout_ms", store.questdb.rest_timeout_ms);
    AppendKeyValue(oss, "histdata_directory", store.histdata_directory);
    AppendNumeric(oss, "utc_offset_minutes", store.histdata_utc_offset_minutes);
    AppendNumeric(oss, "retry_attempts", store.retry.max_attempts);
    AppendNumeric(oss, "retry_backoff_ms", store.retry.initial_backoff_ms);
    oss << '\n';

    return oss.str();
}

bool RunConfigSerializer::ApplySetting(const std::string& rawKey, const std::string& value,
                                       RunConfig* config, std::string* error) {
    if (!config) {
        if (error) *error = "RunConfig pointer is null.";
        return false;
    }
    const std::string key = NormalizeKey(rawKey);
    auto fail = [&](const std::string& what) {
        if (error) *error = "Invalid value for '" + rawKey + "': '" + value + "'" + (what.empty() ? "" : " (" + what + ")");
        return false;
    };

    RunConfig& c = *config;
    if (key == "name" || key == "run" || key == "runname") { c.run_name = value; return true; }
    if (key == "symbol") { c.symbol = value; return true; }
    if (key == "model" || key == "modeltype") { c.model_type = value; return true; }
    if (key == "ridgealpha" || key == "alpha") {
        return ParseFloating(value, &c.ridge_alpha) || fail("expected a number");
    }
    if (key == "horizonbars" || key == "horizon") {
        return ParseIntegral(value, &c.horizon_bars) || fail("expected an integer");
    }
    if (key == "output" || key == "outputpath") { c.output_path = value; return true; }
    if (key == "predictionscsv") { c.predictions_csv_path = value; return true; }

    if (key == "timeframes") {
        return ParseTimeframeList(value, &c.timeframes_ms) || fail("expected e.g. 1m,5m,1h");
    }
    if (key == "referencetimeframe") {
        return ParseDuration(value, &c.reference_timeframe_ms) || fail("expected a timeframe");
    }
    if (key == "allowpartialbars") {
        return ParseBoolValue(value, &c.allow_partial_bars) || fail("expected true/false");
    }
    if (key == "resampleworkers") {
        return ParseIntegral(value, &c.resample_workers) || fail("expected an integer");
    }
    if (key == "rangestart" || key == "start") {
        return ParseTimestamp(value, &c.range_start_ms) || fail("expected an ISO-8601 timestamp");
    }
    if (key == "rangeend" || key == "end") {
        return ParseTimestamp(value, &c.range_end_ms) || fail("expected an ISO-8601 timestamp");
    }

    if (key == "policy" || key == "foldpolicy") {
        std::string lower = ToLower(value);
        if (lower == "rolling") { c.fold_policy = simulation::FoldPolicy::Rolling; return true; }
        if (lower == "expanding") { c.fold_policy = simulation::FoldPolicy::Expanding; return true; }
        return fail("expected rolling or expanding");
    }
    if (key == "trainwindow") return ParseDuration(value, &c.train_window_ms) || fail("expected a duration");
    if (key == "evalwindow") return ParseDuration(value, &c.eval_window_ms) || fail("expected a duration");
    if (key == "step") return ParseDuration(value, &c.step_ms) || fail("expected a duration");
    if (key == "gap") return ParseDuration(value, &c.gap_ms) || fail("expected a duration");
    if (key == "maxfolds") return ParseIntegral(value, &c.max_folds) || fail("expected an integer");
    if (key == "foldmode") {
        std::string lower = ToLower(value);
        if (lower == "independent") { c.fold_mode = simulation::FoldMode::Independent; return true; }
        if (lower == "incremental") { c.fold_mode = simulation::FoldMode::Incremental; return true; }
        return fail("expected independent or incremental");
    }
    if (key == "maxparallelfolds") return ParseIntegral(value, &c.max_parallel_folds) || fail("expected an integer");
    if (key == "foldtimeoutms") return ParseIntegral(value, &c.fold_timeout_ms) || fail("expected milliseconds");

    auto& store = c.store;
    if (key == "kind" || key == "store") {
        std::string lower = ToLower(value);
        if (lower == "questdb") { store.kind = StoreKind::QuestDb; return true; }
        if (lower == "histdata") { store.kind = StoreKind::Histdata; return true; }
        return fail("expected questdb or histdata");
    }
    if (key == "resturl") { store.questdb.rest_url = value; return true; }
    if (key == "table") { store.questdb.table = value; return true; }
    if (key == "connecttimeoutms") return ParseIntegral(value, &store.questdb.connect_timeout_ms) || fail("expected milliseconds");
    if (key == "resttimeoutms") return ParseIntegral(value, &store.questdb.rest_timeout_ms) || fail("expected milliseconds");
    if (key == "histdatadirectory") { store.histdata_directory = value; return true; }
    if (key == "utcoffsetminutes") return ParseIntegral(value, &store.histdata_utc_offset_minutes) || fail("expected an integer");
    if (key == "retryattempts") return ParseIntegral(value, &store.retry.max_attempts) || fail("expected an integer");
    if (key == "retrybackoffms") return ParseIntegral(value, &store.retry.initial_backoff_ms) || fail("expected milliseconds");

    if (error) *error = "Unknown setting '" + rawKey + "'";
    return false;
}

bool RunConfigSerializer::Deserialize(const std::string& text, RunConfig* config, std::string* error) {
    if (!config) {
        if (error) *error = "RunConfig pointer is null.";
        return false;
    }

    RunConfig result = *config;
    std::istringstream stream(text);
    std::string rawLine;
    int lineNumber = 0;
    while (std::getline(stream, rawLine)) {
        ++lineNumber;
        std::string line = Trim(rawLine);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        // Section tags only group keys; every key is unique across sections.
        if (line.front() == '[' && line.back() == ']') {
            std::string tag = ToLower(line.substr(1, line.size() - 2));
            if (tag != "run" && tag != "bars" && tag != "walkforward" && tag != "store") {
                if (error) *error = "Line " + std::to_string(lineNumber) + ": unknown section [" + tag + "]";
                return false;
            }
            continue;
        }

        size_t delimiter = line.find_first_of(":=");
        if (delimiter == std::string::npos) {
            if (error) *error = "Line " + std::to_string(lineNumber) + ": expected key=value";
            return false;
        }
        std::string key = Trim(line.substr(0, delimiter));
        std::string value = Trim(line.substr(delimiter + 1));

        std::string settingError;
        if (!ApplySetting(key, value, &result, &settingError)) {
            if (error) *error = "Line " + std::to_string(lineNumber) + ": " + settingError;
            return false;
        }
    }

    *config = std::move(result);
    return true;
}

RunConfig RunConfigSerializer::LoadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    RunConfig config;
    std::string error;
    if (!Deserialize(buffer.str(), &config, &error)) {
        throw ConfigError(path + ": " + error);
    }
    return config;
}

bool RunConfigSerializer::LooksLikeSerializedConfig(const std::string& text) {
    std::string lower = ToLower(text);
    return lower.find("[walkforward]") != std::string::npos
        || lower.find("mtfcast runconfig") != std::string::npos;
}

} // namespace mtfcast
