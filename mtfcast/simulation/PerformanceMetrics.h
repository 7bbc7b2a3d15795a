#pragma once

#include "simulation/SimulationTypes.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mtfcast {
namespace simulation {

struct BacktestRun;

namespace metrics {

// One row of the metric table. No fold index means the run aggregate; no value means N/A.
struct MetricResult {
    std::optional<int> fold_index;
    std::string metric_name;
    std::optional<double> value;

    bool IsAggregate() const { return !fold_index.has_value(); }
};

// Regression and directional metrics over prediction records
class PerformanceMetrics {
public:
    struct RegressionMetrics {
        std::optional<double> mse;
        std::optional<double> rmse;
        std::optional<double> mae;
        std::optional<double> mape;                  // Percent, zero actuals skipped
        std::optional<double> directional_accuracy;  // Fraction in [0, 1]
        int num_predictions = 0;
        int mape_samples = 0;

        std::map<std::string, std::optional<double>> ToMap() const {
            return {
                {"mae", mae},
                {"rmse", rmse},
                {"mape", mape},
                {"directional_accuracy", directional_accuracy}
            };
        }
    };

    static RegressionMetrics Calculate(const std::vector<PredictionRecord>& records);

    // Individual metric calculations. Empty input yields N/A.
    static std::optional<double> CalculateMSE(const std::vector<double>& predictions, const std::vector<double>& actuals);
    static std::optional<double> CalculateMAE(const std::vector<double>& predictions, const std::vector<double>& actuals);
    static std::optional<double> CalculateMAPE(const std::vector<double>& predictions,
                                               const std::vector<double>& actuals,
                                               int* used_samples = nullptr);

    // Fraction of rows where sign(prediction - previous) == sign(actual - previous).
    static std::optional<double> CalculateDirectionalAccuracy(const std::vector<double>& predictions,
                                                              const std::vector<double>& actuals,
                                                              const std::vector<double>& previous);
};

// Performance tracking over folds
class PerformanceTracker {
public:
    void AddFoldMetrics(int fold_number, const PerformanceMetrics::RegressionMetrics& metrics);

    // Unweighted mean over folds; a metric that is N/A in a fold is left out of its mean.
    std::map<std::string, std::optional<double>> GetAverageMetrics() const;

    std::vector<double> GetMetricHistory(const std::string& metric_name) const;

    // Compares the mean of the last window with the window before it.
    bool IsPerformanceDegrading(const std::string& metric_name, int window_size = 5) const;

    size_t GetFoldCount() const { return m_fold_metrics.size(); }

private:
    std::map<int, PerformanceMetrics::RegressionMetrics> m_fold_metrics;
};

// Per-fold rows for successful folds in fold order, followed by the aggregate rows.
std::vector<MetricResult> AggregateRun(const BacktestRun& run, PerformanceTracker* tracker = nullptr);

} // namespace metrics
} // namespace simulation
} // namespace mtfcast
