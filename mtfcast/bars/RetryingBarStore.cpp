#include "bars/RetryingBarStore.h"

#include "SimpleLogger.h"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace mtfcast {
namespace bars {

RetryingBarStore::RetryingBarStore(std::shared_ptr<IBarStoreClient> inner, RetryPolicy policy)
    : m_inner(std::move(inner))
    , m_policy(policy)
    , m_sleeper([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
    if (!m_inner) {
        throw std::invalid_argument("RetryingBarStore needs a store to wrap");
    }
    if (m_policy.max_attempts < 1) {
        throw std::invalid_argument("RetryPolicy::max_attempts must be at least 1");
    }
}

std::string RetryingBarStore::Describe() const {
    return m_inner->Describe() + " (retry x" + std::to_string(m_policy.max_attempts) + ")";
}

arrow::Result<std::vector<Bar>> RetryingBarStore::Query(const std::string& symbol,
                                                        int64_t start_ms,
                                                        int64_t end_ms) {
    long backoff = m_policy.initial_backoff_ms;
    arrow::Status lastStatus;
    m_lastAttempts = 0;

    for (int attempt = 1; attempt <= m_policy.max_attempts; ++attempt) {
        m_lastAttempts = attempt;
        auto result = m_inner->Query(symbol, start_ms, end_ms);
        if (result.ok()) {
            auto status = ValidateQueryResult(*result, symbol, start_ms, end_ms);
            if (!status.ok()) {
                return status;
            }
            return result;
        }

        lastStatus = result.status();
        if (lastStatus.IsInvalid()) {
            return lastStatus;
        }
        if (attempt == m_policy.max_attempts) {
            break;
        }

        SimpleLogger::Warn("Store query for " + symbol + " failed (attempt " + std::to_string(attempt) + "/"
                           + std::to_string(m_policy.max_attempts) + "): " + lastStatus.ToString()
                           + "; retrying in " + std::to_string(backoff) + " ms");
        m_sleeper(std::chrono::milliseconds(backoff));
        backoff = std::min<long>(m_policy.max_backoff_ms,
                                 static_cast<long>(static_cast<double>(backoff) * m_policy.backoff_multiplier));
    }

    return lastStatus.WithMessage("after ", m_lastAttempts, " attempts: ", lastStatus.message());
}

} // namespace bars
} // namespace mtfcast
