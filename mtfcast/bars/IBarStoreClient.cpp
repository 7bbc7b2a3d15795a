#include "bars/IBarStoreClient.h"

#include "TimeUtils.h"

namespace mtfcast {
namespace bars {

arrow::Status ValidateQueryResult(const std::vector<Bar>& result,
                                  const std::string& symbol,
                                  int64_t start_ms,
                                  int64_t end_ms) {
    for (size_t i = 0; i < result.size(); ++i) {
        const Bar& bar = result[i];
        if (bar.symbol != symbol) {
            return arrow::Status::Invalid("store returned symbol '", bar.symbol, "' for query '", symbol, "'");
        }
        if (bar.period_start_ms < start_ms || bar.period_start_ms >= end_ms) {
            return arrow::Status::Invalid("store returned bar at ", FormatIsoMillis(bar.period_start_ms),
                                          " outside [", FormatIsoMillis(start_ms), ", ", FormatIsoMillis(end_ms), ")");
        }
        if (i > 0 && bar.period_start_ms == result[i - 1].period_start_ms) {
            return arrow::Status::Invalid("store returned duplicate bar at ", FormatIsoMillis(bar.period_start_ms));
        }
        if (i > 0 && bar.period_start_ms < result[i - 1].period_start_ms) {
            return arrow::Status::Invalid("store returned unsorted bars at index ", i);
        }
    }
    return arrow::Status::OK();
}

} // namespace bars
} // namespace mtfcast
