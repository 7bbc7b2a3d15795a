#pragma once

#include "bars/Bar.h"

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <string>
#include <vector>

namespace mtfcast {
namespace bars {

// Boundary to a store of 1-minute bars.
class IBarStoreClient {
public:
    virtual ~IBarStoreClient() = default;

    // Bars with period_start in [start_ms, end_ms), strictly increasing, no duplicates.
    // Missing minutes are simply absent.
    virtual arrow::Result<std::vector<Bar>> Query(const std::string& symbol,
                                                  int64_t start_ms,
                                                  int64_t end_ms) = 0;

    virtual std::string Describe() const = 0;
};

// Invalid status when a query result breaks the contract above.
arrow::Status ValidateQueryResult(const std::vector<Bar>& result,
                                  const std::string& symbol,
                                  int64_t start_ms,
                                  int64_t end_ms);

} // namespace bars
} // namespace mtfcast
