#include "questdb/QuestDbBarStore.h"

#include "SimpleLogger.h"
#include "TimeUtils.h"

#include <arrow/array.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <arrow/table.h>
#include <arrow/type.h>

#include <curl/curl.h>

#include <rapidjson/document.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <thread>

namespace mtfcast {
namespace questdb {
namespace {

std::string GetEnvOrEmpty(const char* key) {
    const char* value = std::getenv(key);
    return value ? std::string(value) : std::string();
}

void OverrideTimeout(const char* key, long& target) {
    std::string text = GetEnvOrEmpty(key);
    if (text.empty()) {
        return;
    }
    try {
        target = std::max<long>(1000, std::stol(text));
    } catch (const std::exception&) {
        SimpleLogger::Warn(std::string("Ignoring non-numeric ") + key + "=" + text);
    }
}

std::string EscapeSqlLiteral(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            escaped.push_back('\'');
        }
        escaped.push_back(ch);
    }
    escaped.push_back('\'');
    return escaped;
}

struct CurlFileContext {
    std::ofstream* stream = nullptr;
    bool errored = false;
    std::string sniff;
    size_t sniff_limit = 4096;
};

size_t CurlWriteToFile(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    if (total == 0) {
        return 0;
    }
    auto* ctx = static_cast<CurlFileContext*>(userp);
    if (!ctx || !ctx->stream || !ctx->stream->good()) {
        return 0;
    }
    ctx->stream->write(static_cast<const char*>(contents), static_cast<std::streamsize>(total));
    if (!ctx->stream->good()) {
        ctx->errored = true;
        return 0;
    }
    if (ctx->sniff.size() < ctx->sniff_limit) {
        const size_t remaining = ctx->sniff_limit - ctx->sniff.size();
        ctx->sniff.append(static_cast<const char*>(contents), std::min(total, remaining));
    }
    return total;
}

std::optional<int64_t> TimestampCellToMillis(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch) || ch == '-'; })) {
        try {
            int64_t value = std::stoll(text);
            // QuestDB designated timestamps are microseconds.
            if (std::llabs(value) > 100'000'000'000'000LL) {
                value /= 1000;
            }
            return value;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return ParseIsoToMillis(text);
}

} // namespace

ConnectionOptions ApplyEnvironmentOverrides(ConnectionOptions options) {
    if (std::string rest = GetEnvOrEmpty("MTFCAST_QUESTDB_REST"); !rest.empty()) {
        options.rest_url = rest;
    }
    if (std::string table = GetEnvOrEmpty("MTFCAST_QUESTDB_TABLE"); !table.empty()) {
        options.table = table;
    }
    OverrideTimeout("MTFCAST_QUESTDB_CONNECT_TIMEOUT_MS", options.connect_timeout_ms);
    OverrideTimeout("MTFCAST_QUESTDB_REST_TIMEOUT_MS", options.rest_timeout_ms);
    return options;
}

QuestDbBarStore::QuestDbBarStore(ConnectionOptions options)
    : m_options(ApplyEnvironmentOverrides(std::move(options))) {
    while (!m_options.rest_url.empty() && m_options.rest_url.back() == '/') {
        m_options.rest_url.pop_back();
    }
}

std::string QuestDbBarStore::BuildSql(const std::string& symbol, int64_t start_ms, int64_t end_ms) const {
    const auto& o = m_options;
    return "SELECT " + o.timestamp_column + ", " + o.open_column + ", " + o.high_column + ", "
         + o.low_column + ", " + o.close_column + ", " + o.volume_column
         + " FROM \"" + o.table + "\""
         + " WHERE " + o.symbol_column + " = " + EscapeSqlLiteral(symbol)
         + " AND " + o.timestamp_column + " >= '" + FormatIsoMillis(start_ms) + "'"
         + " AND " + o.timestamp_column + " < '" + FormatIsoMillis(end_ms) + "'"
         + " ORDER BY " + o.timestamp_column;
}

std::string QuestDbBarStore::ExtractErrorMessage(std::string_view body) {
    rapidjson::Document document;
    document.Parse(body.data(), body.size());
    if (!document.HasParseError() && document.IsObject() && document.HasMember("error") && document["error"].IsString()) {
        return document["error"].GetString();
    }
    return std::string(body.substr(0, std::min<size_t>(512, body.size())));
}

std::filesystem::path QuestDbBarStore::TempExportPath() {
    static std::atomic<uint64_t> sequence{0};
    std::ostringstream name;
    name << "mtfcast_questdb_" << std::chrono::steady_clock::now().time_since_epoch().count()
         << '_' << std::this_thread::get_id() << '_' << sequence.fetch_add(1) << ".csv";
    return std::filesystem::temp_directory_path() / name.str();
}

arrow::Result<std::vector<bars::Bar>> QuestDbBarStore::Query(const std::string& symbol,
                                                             int64_t start_ms,
                                                             int64_t end_ms) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return arrow::Status::IOError("Failed to initialize CURL for QuestDB fetch.");
    }

    const std::string query = BuildSql(symbol, start_ms, end_ms);
    std::unique_ptr<char, decltype(&curl_free)> encodedQuery(
        curl_easy_escape(curl, query.c_str(), static_cast<int>(query.size())), &curl_free);
    if (!encodedQuery) {
        curl_easy_cleanup(curl);
        return arrow::Status::IOError("Failed to encode QuestDB query.");
    }

    std::string url = m_options.rest_url + "/exp?query=";
    url += encodedQuery.get();
    url += "&fmt=csv";

    std::filesystem::path tempFile = TempExportPath();

    std::ofstream out(tempFile, std::ios::binary);
    if (!out) {
        curl_easy_cleanup(curl);
        return arrow::Status::IOError("Failed to create temp file for QuestDB import.");
    }

    CurlFileContext ctx;
    ctx.stream = &out;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlWriteToFile);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, m_options.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, m_options.rest_timeout_ms);

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    }
    curl_easy_cleanup(curl);
    out.close();

    auto cleanupTemp = [&]() {
        std::error_code ec;
        std::filesystem::remove(tempFile, ec);
    };

    if (ctx.errored) {
        cleanupTemp();
        return arrow::Status::IOError("QuestDB fetch failed: could not write response.");
    }
    if (res != CURLE_OK) {
        cleanupTemp();
        return arrow::Status::IOError(std::string("QuestDB fetch failed: ") + curl_easy_strerror(res));
    }

    std::string_view peek(ctx.sniff);
    while (!peek.empty() && std::isspace(static_cast<unsigned char>(peek.front()))) {
        peek.remove_prefix(1);
    }
    if (httpCode >= 400 || (!peek.empty() && peek.front() == '{')) {
        std::string message = "QuestDB HTTP " + std::to_string(httpCode);
        if (!peek.empty()) {
            message += " - " + ExtractErrorMessage(peek);
        }
        cleanupTemp();
        // A rejected query will be rejected again.
        if (httpCode == 400) {
            return arrow::Status::Invalid(message);
        }
        return arrow::Status::IOError(message);
    }

    auto parsed = ParseExportFile(tempFile.string(), symbol);
    cleanupTemp();
    if (parsed.ok()) {
        SimpleLogger::Debug("QuestDB returned " + std::to_string(parsed->size()) + " bars for " + symbol);
    }
    return parsed;
}

arrow::Result<std::vector<bars::Bar>> QuestDbBarStore::ParseExportFile(const std::string& path,
                                                                       const std::string& symbol) const {
    std::error_code sizeEc;
    auto fileSize = std::filesystem::file_size(path, sizeEc);
    if (sizeEc) {
        return arrow::Status::IOError("Cannot stat QuestDB export ", path, ": ", sizeEc.message());
    }
    if (fileSize == 0) {
        return std::vector<bars::Bar>{};
    }

    ARROW_ASSIGN_OR_RAISE(auto input, arrow::io::ReadableFile::Open(path));

    arrow::csv::ReadOptions read_options = arrow::csv::ReadOptions::Defaults();
    read_options.use_threads = false;

    arrow::csv::ParseOptions parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.delimiter = ',';

    const auto& o = m_options;
    arrow::csv::ConvertOptions convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.include_columns = {o.timestamp_column, o.open_column, o.high_column,
                                       o.low_column, o.close_column, o.volume_column};
    convert_options.include_missing_columns = true;
    convert_options.column_types[o.timestamp_column] = arrow::utf8();
    for (const auto& name : {o.open_column, o.high_column, o.low_column, o.close_column, o.volume_column}) {
        convert_options.column_types[name] = arrow::float64();
    }

    ARROW_ASSIGN_OR_RAISE(auto reader, arrow::csv::TableReader::Make(
        arrow::io::default_io_context(), input, read_options, parse_options, convert_options));
    ARROW_ASSIGN_OR_RAISE(auto table, reader->Read());
    ARROW_ASSIGN_OR_RAISE(table, table->CombineChunks());

    std::vector<bars::Bar> result;
    if (table->num_rows() == 0) {
        return result;
    }

    auto column = [&](const std::string& name) { return table->GetColumnByName(name)->chunk(0); };
    auto timestamps = std::static_pointer_cast<arrow::StringArray>(column(o.timestamp_column));
    auto opens = std::static_pointer_cast<arrow::DoubleArray>(column(o.open_column));
    auto highs = std::static_pointer_cast<arrow::DoubleArray>(column(o.high_column));
    auto lows = std::static_pointer_cast<arrow::DoubleArray>(column(o.low_column));
    auto closes = std::static_pointer_cast<arrow::DoubleArray>(column(o.close_column));
    auto volumes = std::static_pointer_cast<arrow::DoubleArray>(column(o.volume_column));

    result.reserve(static_cast<size_t>(table->num_rows()));
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        if (timestamps->IsNull(i) || opens->IsNull(i) || highs->IsNull(i) || lows->IsNull(i) || closes->IsNull(i)) {
            return arrow::Status::Invalid("QuestDB export row ", i, " has a missing value");
        }
        auto millis = TimestampCellToMillis(timestamps->GetString(i));
        if (!millis) {
            return arrow::Status::Invalid("QuestDB export row ", i, " has an unreadable timestamp '",
                                          timestamps->GetString(i), "'");
        }
        bars::Bar bar;
        bar.symbol = symbol;
        bar.timeframe_ms = kMinuteMs;
        bar.period_start_ms = *millis;
        bar.open = opens->Value(i);
        bar.high = highs->Value(i);
        bar.low = lows->Value(i);
        bar.close = closes->Value(i);
        bar.volume = volumes->IsNull(i) ? 0.0 : volumes->Value(i);
        result.push_back(std::move(bar));
    }
    return result;
}

} // namespace questdb
} // namespace mtfcast
