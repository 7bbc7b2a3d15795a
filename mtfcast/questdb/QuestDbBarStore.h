#pragma once

#include "bars/IBarStoreClient.h"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mtfcast {
namespace questdb {

struct ConnectionOptions {
    std::string rest_url = "http://localhost:9000";
    long connect_timeout_ms = 5000;
    long rest_timeout_ms = 60000;

    // Table of 1-minute bars and its columns.
    std::string table = "ohlcv_1m";
    std::string symbol_column = "symbol";
    std::string timestamp_column = "timestamp";
    std::string open_column = "open";
    std::string high_column = "high";
    std::string low_column = "low";
    std::string close_column = "close";
    std::string volume_column = "volume";
};

// Applies MTFCAST_QUESTDB_REST, MTFCAST_QUESTDB_CONNECT_TIMEOUT_MS,
// MTFCAST_QUESTDB_REST_TIMEOUT_MS and MTFCAST_QUESTDB_TABLE on top of `options`.
ConnectionOptions ApplyEnvironmentOverrides(ConnectionOptions options);

// 1-minute bars fetched through the QuestDB REST /exp endpoint as CSV.
class QuestDbBarStore : public bars::IBarStoreClient {
public:
    explicit QuestDbBarStore(ConnectionOptions options = ConnectionOptions());

    arrow::Result<std::vector<bars::Bar>> Query(const std::string& symbol,
                                                int64_t start_ms,
                                                int64_t end_ms) override;

    std::string Describe() const override { return "questdb:" + m_options.rest_url + "/" + m_options.table; }

    const ConnectionOptions& GetOptions() const { return m_options; }

    std::string BuildSql(const std::string& symbol, int64_t start_ms, int64_t end_ms) const;

    // Parses an /exp CSV export into bars, in file order.
    arrow::Result<std::vector<bars::Bar>> ParseExportFile(const std::string& path,
                                                          const std::string& symbol) const;

    // Unique per call, also across threads querying at the same time.
    static std::filesystem::path TempExportPath();

    // Message for a JSON error body such as {"query": ..., "error": "...", "position": 0}.
    static std::string ExtractErrorMessage(std::string_view body);

private:
    ConnectionOptions m_options;
};

} // namespace questdb
} // namespace mtfcast
