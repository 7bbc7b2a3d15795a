#pragma once

#include "bars/IBarStoreClient.h"

#include <chrono>
#include <functional>
#include <memory>

namespace mtfcast {
namespace bars {

struct RetryPolicy {
    int max_attempts = 3;
    long initial_backoff_ms = 200;
    double backoff_multiplier = 2.0;
    long max_backoff_ms = 5000;
};

// Retries a wrapped store with bounded exponential backoff. Contract violations
// (Invalid status) are returned at once; only transient failures are retried.
class RetryingBarStore : public IBarStoreClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryingBarStore(std::shared_ptr<IBarStoreClient> inner, RetryPolicy policy = RetryPolicy());

    arrow::Result<std::vector<Bar>> Query(const std::string& symbol,
                                          int64_t start_ms,
                                          int64_t end_ms) override;

    std::string Describe() const override;

    // Replaces std::this_thread::sleep_for, mainly for tests.
    void SetSleeper(Sleeper sleeper) { m_sleeper = std::move(sleeper); }

    int GetLastAttemptCount() const { return m_lastAttempts; }

private:
    std::shared_ptr<IBarStoreClient> m_inner;
    RetryPolicy m_policy;
    Sleeper m_sleeper;
    int m_lastAttempts = 0;
};

} // namespace bars
} // namespace mtfcast
