#pragma once

#include "bars/IBarStoreClient.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mtfcast {
namespace bars {

struct HistdataOptions {
    // Scanned for *.csv files whose name contains the symbol, e.g. DAT_ASCII_EURUSD_M1_2023.csv.
    std::string directory;
    // Added to the file's wall-clock time to obtain UTC.
    int utc_offset_minutes = 0;
};

// Reads Histdata.com ASCII 1-minute exports: ';'-separated rows of
// datetime;open;high;low;close[;volume]. Unreadable rows are skipped with a warning.
class HistdataCsvBarStore : public IBarStoreClient {
public:
    explicit HistdataCsvBarStore(HistdataOptions options);

    // Adds a file for a symbol in addition to the directory scan.
    void RegisterFile(const std::string& symbol, const std::string& path);

    arrow::Result<std::vector<Bar>> Query(const std::string& symbol,
                                          int64_t start_ms,
                                          int64_t end_ms) override;

    std::string Describe() const override { return "histdata:" + m_options.directory; }

    // Parses one file. Rows are returned in file order.
    arrow::Result<std::vector<Bar>> ReadFile(const std::string& symbol, const std::string& path) const;

    // Millis since epoch for the datetime columns of a row, and the index of the open column.
    std::optional<std::pair<int64_t, size_t>> ParseRowTimestamp(const std::vector<std::string>& fields) const;

private:
    std::vector<std::filesystem::path> FilesFor(const std::string& symbol) const;

    HistdataOptions m_options;
    std::map<std::string, std::vector<std::string>> m_registered;
};

} // namespace bars
} // namespace mtfcast
