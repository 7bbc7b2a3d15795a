#include "bars/InMemoryBarStore.h"

#include <algorithm>

namespace mtfcast {
namespace bars {

arrow::Status InMemoryBarStore::AddBars(const std::vector<Bar>& bars) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // Checked in full first so a rejected batch leaves every series untouched.
    std::map<std::string, int64_t> tails;
    for (const auto& bar : bars) {
        auto tail = tails.find(bar.symbol);
        if (tail == tails.end()) {
            auto it = m_series.find(bar.symbol);
            if (it != m_series.end() && !it->second.empty()) {
                tail = tails.emplace(bar.symbol, it->second.back().period_start_ms).first;
            }
        }
        if (tail != tails.end() && bar.period_start_ms <= tail->second) {
            return arrow::Status::Invalid("bar for ", bar.symbol, " at ", bar.period_start_ms,
                                          " does not follow ", tail->second);
        }
        tails[bar.symbol] = bar.period_start_ms;
    }
    for (const auto& bar : bars) {
        m_series[bar.symbol].push_back(bar);
    }
    return arrow::Status::OK();
}

arrow::Result<std::vector<Bar>> InMemoryBarStore::Query(const std::string& symbol,
                                                        int64_t start_ms,
                                                        int64_t end_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_series.find(symbol);
    if (it == m_series.end()) {
        return std::vector<Bar>{};
    }
    const auto& series = it->second;
    auto byStart = [](const Bar& bar, int64_t ts) { return bar.period_start_ms < ts; };
    auto first = std::lower_bound(series.begin(), series.end(), start_ms, byStart);
    auto last = std::lower_bound(first, series.end(), end_ms, byStart);
    return std::vector<Bar>(first, last);
}

size_t InMemoryBarStore::GetBarCount(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_series.find(symbol);
    return it == m_series.end() ? 0 : it->second.size();
}

} // namespace bars
} // namespace mtfcast
