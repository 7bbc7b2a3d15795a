#pragma once

#include "bars/IBarStoreClient.h"

#include <map>
#include <mutex>

namespace mtfcast {
namespace bars {

// Store backed by per-symbol vectors. Used by tests and by callers that already hold bars.
class InMemoryBarStore : public IBarStoreClient {
public:
    // Appends bars for their symbol. They must extend the existing series in strictly
    // increasing order; nothing is sorted on the caller's behalf.
    arrow::Status AddBars(const std::vector<Bar>& bars);

    arrow::Result<std::vector<Bar>> Query(const std::string& symbol,
                                          int64_t start_ms,
                                          int64_t end_ms) override;

    std::string Describe() const override { return "in-memory"; }

    size_t GetBarCount(const std::string& symbol) const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::vector<Bar>> m_series;
};

} // namespace bars
} // namespace mtfcast
