#include "simulation/BacktestRunner.h"
#include "simulation/PerformanceMetrics.h"

#include <gtest/gtest.h>

#include <cmath>

using namespace mtfcast::simulation;
using namespace mtfcast::simulation::metrics;

namespace {

PredictionRecord Record(int fold, double predicted, double actual, double previous) {
    PredictionRecord record;
    record.fold_index = fold;
    record.predicted_value = predicted;
    record.actual_value = actual;
    record.previous_actual = previous;
    return record;
}

FoldResult Fold(int index, FoldStatus status, std::vector<PredictionRecord> predictions) {
    FoldResult result;
    result.fold.fold_index = index;
    result.status = status;
    result.predictions = std::move(predictions);
    return result;
}

std::optional<double> Find(const std::vector<MetricResult>& results, std::optional<int> fold, const std::string& name) {
    for (const auto& r : results) {
        if (r.fold_index == fold && r.metric_name == name) {
            return r.value;
        }
    }
    ADD_FAILURE() << "metric " << name << " not found";
    return std::nullopt;
}

} // namespace

TEST(PerformanceMetricsTest, BasicErrors) {
    std::vector<PredictionRecord> records{
        Record(0, 11.0, 10.0, 9.0),
        Record(0, 18.0, 20.0, 19.0),
    };
    auto m = PerformanceMetrics::Calculate(records);
    EXPECT_EQ(m.num_predictions, 2);
    ASSERT_TRUE(m.mae && m.rmse && m.mape && m.directional_accuracy);
    EXPECT_DOUBLE_EQ(*m.mae, 1.5);
    EXPECT_DOUBLE_EQ(*m.mse, 2.5);
    EXPECT_DOUBLE_EQ(*m.rmse, std::sqrt(2.5));
    EXPECT_DOUBLE_EQ(*m.mape, 10.0);
    EXPECT_EQ(m.mape_samples, 2);
    // Up/up and down/up.
    EXPECT_DOUBLE_EQ(*m.directional_accuracy, 0.5);
}

TEST(PerformanceMetricsTest, MapeSkipsZeroActuals) {
    int used = -1;
    auto mape = PerformanceMetrics::CalculateMAPE({1.0, 5.0, 3.0}, {0.0, 4.0, 0.0}, &used);
    ASSERT_TRUE(mape.has_value());
    EXPECT_DOUBLE_EQ(*mape, 25.0);
    EXPECT_EQ(used, 1);

    auto none = PerformanceMetrics::CalculateMAPE({1.0, 2.0}, {0.0, 0.0}, &used);
    EXPECT_FALSE(none.has_value());
    EXPECT_EQ(used, 0);
}

TEST(PerformanceMetricsTest, EmptyInputIsNotAvailable) {
    auto m = PerformanceMetrics::Calculate({});
    EXPECT_FALSE(m.mae.has_value());
    EXPECT_FALSE(m.rmse.has_value());
    EXPECT_FALSE(m.mape.has_value());
    EXPECT_FALSE(m.directional_accuracy.has_value());
}

TEST(PerformanceMetricsTest, DirectionalAccuracyUsesPreviousActual) {
    // Flat prediction and flat actual count as agreeing.
    auto da = PerformanceMetrics::CalculateDirectionalAccuracy({5.0, 6.0, 4.0, 5.0}, {5.0, 7.0, 7.0, 4.0}, {5.0, 5.0, 5.0, 5.0});
    ASSERT_TRUE(da.has_value());
    EXPECT_DOUBLE_EQ(*da, 0.5);
}

TEST(PerformanceMetricsTest, AggregateSkipsFailedFolds) {
    BacktestRun run;
    run.foldResults.push_back(Fold(0, FoldStatus::Ok, {Record(0, 11.0, 10.0, 9.0)}));
    run.foldResults.push_back(Fold(1, FoldStatus::Failed, {Record(1, 1000.0, 10.0, 9.0)}));
    run.foldResults.push_back(Fold(2, FoldStatus::Ok, {Record(2, 7.0, 10.0, 9.0), Record(2, 9.0, 10.0, 9.0)}));
    run.foldResults.push_back(Fold(3, FoldStatus::Cancelled, {}));

    PerformanceTracker tracker;
    auto results = AggregateRun(run, &tracker);

    // Two successful folds x four metrics, then four aggregate rows.
    ASSERT_EQ(results.size(), 12u);
    EXPECT_EQ(results[0].fold_index, 0);
    EXPECT_EQ(results[0].metric_name, "mae");
    EXPECT_EQ(results[3].metric_name, "directional_accuracy");
    EXPECT_EQ(results[4].fold_index, 2);
    EXPECT_TRUE(results[8].IsAggregate());

    EXPECT_DOUBLE_EQ(*Find(results, 0, "mae"), 1.0);
    EXPECT_DOUBLE_EQ(*Find(results, 2, "mae"), 2.0);
    // Unweighted over folds, not over predictions.
    EXPECT_DOUBLE_EQ(*Find(results, std::nullopt, "mae"), 1.5);
    EXPECT_DOUBLE_EQ(*Find(results, 0, "directional_accuracy"), 1.0);
    EXPECT_DOUBLE_EQ(*Find(results, 2, "directional_accuracy"), 0.0);
    EXPECT_DOUBLE_EQ(*Find(results, std::nullopt, "directional_accuracy"), 0.5);
    EXPECT_EQ(tracker.GetFoldCount(), 2u);
}

TEST(PerformanceMetricsTest, AggregateMapeIgnoresFoldsWithoutValue) {
    BacktestRun run;
    run.foldResults.push_back(Fold(0, FoldStatus::Ok, {Record(0, 1.0, 0.0, 1.0)}));
    run.foldResults.push_back(Fold(1, FoldStatus::Ok, {Record(1, 11.0, 10.0, 9.0)}));

    auto results = AggregateRun(run);
    EXPECT_FALSE(Find(results, 0, "mape").has_value());
    EXPECT_DOUBLE_EQ(*Find(results, 1, "mape"), 10.0);
    EXPECT_DOUBLE_EQ(*Find(results, std::nullopt, "mape"), 10.0);
}

TEST(PerformanceMetricsTest, AggregateOfNoSuccessfulFoldsIsNotAvailable) {
    BacktestRun run;
    run.foldResults.push_back(Fold(0, FoldStatus::Failed, {}));
    auto results = AggregateRun(run);
    ASSERT_EQ(results.size(), 4u);
    for (const auto& r : results) {
        EXPECT_TRUE(r.IsAggregate());
        EXPECT_FALSE(r.value.has_value());
    }
}

TEST(PerformanceTrackerTest, DetectsDegradation) {
    PerformanceTracker tracker;
    for (int fold = 0; fold < 10; ++fold) {
        PerformanceMetrics::RegressionMetrics m;
        m.mae = fold < 5 ? 1.0 : 2.0;
        m.directional_accuracy = 0.6;
        tracker.AddFoldMetrics(fold, m);
    }
    EXPECT_TRUE(tracker.IsPerformanceDegrading("mae", 5));
    EXPECT_FALSE(tracker.IsPerformanceDegrading("directional_accuracy", 5));
    EXPECT_FALSE(tracker.IsPerformanceDegrading("mae", 6));
    EXPECT_EQ(tracker.GetMetricHistory("mae").size(), 10u);
    EXPECT_TRUE(tracker.GetMetricHistory("rmse").empty());
}
