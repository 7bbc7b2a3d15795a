#include "simulation/PerformanceMetrics.h"

#include "simulation/BacktestRunner.h"

#include <cmath>

namespace mtfcast {
namespace simulation {
namespace metrics {

namespace {

const char* kMetricOrder[] = {"mae", "rmse", "mape", "directional_accuracy"};

int Sign(double value) {
    return (value > 0.0) - (value < 0.0);
}

} // namespace

PerformanceMetrics::RegressionMetrics PerformanceMetrics::Calculate(const std::vector<PredictionRecord>& records) {
    std::vector<double> predictions;
    std::vector<double> actuals;
    std::vector<double> previous;
    predictions.reserve(records.size());
    actuals.reserve(records.size());
    previous.reserve(records.size());
    for (const auto& record : records) {
        predictions.push_back(record.predicted_value);
        actuals.push_back(record.actual_value);
        previous.push_back(record.previous_actual);
    }

    RegressionMetrics metrics;
    metrics.num_predictions = static_cast<int>(records.size());
    metrics.mse = CalculateMSE(predictions, actuals);
    if (metrics.mse) {
        metrics.rmse = std::sqrt(*metrics.mse);
    }
    metrics.mae = CalculateMAE(predictions, actuals);
    metrics.mape = CalculateMAPE(predictions, actuals, &metrics.mape_samples);
    metrics.directional_accuracy = CalculateDirectionalAccuracy(predictions, actuals, previous);
    return metrics;
}

std::optional<double> PerformanceMetrics::CalculateMSE(const std::vector<double>& predictions,
                                                       const std::vector<double>& actuals) {
    if (predictions.empty() || predictions.size() != actuals.size()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (size_t i = 0; i < predictions.size(); ++i) {
        double diff = predictions[i] - actuals[i];
        sum += diff * diff;
    }
    return sum / predictions.size();
}

std::optional<double> PerformanceMetrics::CalculateMAE(const std::vector<double>& predictions,
                                                       const std::vector<double>& actuals) {
    if (predictions.empty() || predictions.size() != actuals.size()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (size_t i = 0; i < predictions.size(); ++i) {
        sum += std::abs(predictions[i] - actuals[i]);
    }
    return sum / predictions.size();
}

std::optional<double> PerformanceMetrics::CalculateMAPE(const std::vector<double>& predictions,
                                                        const std::vector<double>& actuals,
                                                        int* used_samples) {
    double sum_pct_error = 0.0;
    int valid_count = 0;

    for (size_t i = 0; i < predictions.size() && i < actuals.size(); ++i) {
        if (std::abs(actuals[i]) > 1e-10) {  // Avoid division by zero
            sum_pct_error += std::abs((actuals[i] - predictions[i]) / actuals[i]);
            valid_count++;
        }
    }

    if (used_samples) {
        *used_samples = valid_count;
    }
    if (valid_count == 0) {
        return std::nullopt;
    }
    return (sum_pct_error / valid_count) * 100.0;
}

std::optional<double> PerformanceMetrics::CalculateDirectionalAccuracy(const std::vector<double>& predictions,
                                                                       const std::vector<double>& actuals,
                                                                       const std::vector<double>& previous) {
    if (predictions.empty() || predictions.size() != actuals.size() || predictions.size() != previous.size()) {
        return std::nullopt;
    }
    int correct = 0;
    for (size_t i = 0; i < predictions.size(); ++i) {
        if (Sign(predictions[i] - previous[i]) == Sign(actuals[i] - previous[i])) {
            correct++;
        }
    }
    return static_cast<double>(correct) / predictions.size();
}

void PerformanceTracker::AddFoldMetrics(int fold_number, const PerformanceMetrics::RegressionMetrics& metrics) {
    m_fold_metrics[fold_number] = metrics;
}

std::map<std::string, std::optional<double>> PerformanceTracker::GetAverageMetrics() const {
    std::map<std::string, std::optional<double>> averages;
    for (const char* name : kMetricOrder) {
        auto history = GetMetricHistory(name);
        if (history.empty()) {
            averages[name] = std::nullopt;
            continue;
        }
        double sum = 0.0;
        for (double value : history) {
            sum += value;
        }
        averages[name] = sum / history.size();
    }
    return averages;
}

std::vector<double> PerformanceTracker::GetMetricHistory(const std::string& metric_name) const {
    std::vector<double> history;
    for (const auto& [fold, metrics] : m_fold_metrics) {
        auto values = metrics.ToMap();
        auto it = values.find(metric_name);
        if (it != values.end() && it->second) {
            history.push_back(*it->second);
        }
    }
    return history;
}

bool PerformanceTracker::IsPerformanceDegrading(const std::string& metric_name, int window_size) const {
    auto history = GetMetricHistory(metric_name);

    if (window_size <= 0 || history.size() < static_cast<size_t>(window_size) * 2) {
        return false;  // Not enough data
    }

    double recent_avg = 0.0;
    double previous_avg = 0.0;

    size_t start_recent = history.size() - window_size;
    size_t start_previous = start_recent - window_size;

    for (int i = 0; i < window_size; ++i) {
        recent_avg += history[start_recent + i];
        previous_avg += history[start_previous + i];
    }

    recent_avg /= window_size;
    previous_avg /= window_size;

    // Error metrics degrade upwards, accuracy downwards
    if (metric_name == "rmse" || metric_name == "mae" || metric_name == "mape") {
        return recent_avg > previous_avg * 1.1;
    }
    return recent_avg < previous_avg * 0.9;
}

std::vector<MetricResult> AggregateRun(const BacktestRun& run, PerformanceTracker* tracker) {
    PerformanceTracker localTracker;
    PerformanceTracker& active = tracker ? *tracker : localTracker;

    std::vector<MetricResult> results;
    for (const auto& fold : run.foldResults) {
        if (!fold.Succeeded()) {
            continue;
        }
        auto metrics = PerformanceMetrics::Calculate(fold.predictions);
        active.AddFoldMetrics(fold.fold.fold_index, metrics);
        auto values = metrics.ToMap();
        for (const char* name : kMetricOrder) {
            results.push_back(MetricResult{fold.fold.fold_index, name, values[name]});
        }
    }

    auto averages = active.GetAverageMetrics();
    for (const char* name : kMetricOrder) {
        results.push_back(MetricResult{std::nullopt, name, averages[name]});
    }
    return results;
}

} // namespace metrics
} // namespace simulation
} // namespace mtfcast
