#include "BacktestPipeline.h"
#include "Errors.h"
#include "RunArtifactWriter.h"
#include "SimpleLogger.h"
#include "TestHelpers.h"
#include "bars/InMemoryBarStore.h"

#include <gtest/gtest.h>
#include <json/json.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace mtfcast;
using namespace mtfcast::testing;

namespace {

class FailingStore : public bars::IBarStoreClient {
public:
    arrow::Result<std::vector<bars::Bar>> Query(const std::string&, int64_t, int64_t) override {
        ++calls;
        return arrow::Status::IOError("connection refused");
    }
    std::string Describe() const override { return "failing"; }

    int calls = 0;
};

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        SimpleLogger::SetMinLevel(LogLevel::Warn);
        m_store = std::make_shared<bars::InMemoryBarStore>();
        ASSERT_TRUE(m_store->AddBars(MinuteSeries(kDay0, 4 * 1440)).ok());
    }

    void TearDown() override {
        SimpleLogger::SetMinLevel(LogLevel::Info);
    }

    static RunConfig Config(const std::string& model) {
        RunConfig config;
        config.run_name = "pipeline-test";
        config.symbol = "EURUSD";
        config.timeframes_ms = {5 * kMinuteMs, kHourMs};
        config.range_start_ms = kDay0;
        config.range_end_ms = kDay0 + 4 * kDayMs;
        config.train_window_ms = 2 * kDayMs;
        config.eval_window_ms = 12 * kHourMs;
        config.step_ms = 12 * kHourMs;
        config.model_type = model;
        config.store.retry.max_attempts = 1;
        return config;
    }

    std::shared_ptr<bars::InMemoryBarStore> m_store;
};

const simulation::metrics::MetricResult* FindMetric(const PipelineResult& result,
                                                    std::optional<int> fold,
                                                    const std::string& name) {
    for (const auto& metric : result.metrics) {
        if (metric.fold_index == fold && metric.metric_name == name) {
            return &metric;
        }
    }
    return nullptr;
}

} // namespace

TEST_F(PipelineTest, NaiveModelRunsEveryFold) {
    BacktestPipeline pipeline(Config("naive"), m_store);
    PipelineResult result = pipeline.Execute();

    EXPECT_EQ(result.source_bar_count, 4u * 1440u);
    EXPECT_EQ(result.reference_timeframe_ms, 5 * kMinuteMs);
    EXPECT_EQ(result.resampled_bar_counts.at(5 * kMinuteMs), 4u * 288u);
    EXPECT_EQ(result.resampled_bar_counts.at(kHourMs), 4u * 24u);
    EXPECT_EQ(result.aligned_row_count, 4u * 288u);
    EXPECT_EQ(result.feature_names.size(), 11u);
    EXPECT_GT(result.dataset_row_count, 0u);
    EXPECT_LT(result.dataset_row_count, result.aligned_row_count);

    ASSERT_EQ(result.folds.size(), 4u);
    ASSERT_EQ(result.run.foldResults.size(), 4u);
    EXPECT_TRUE(result.run.completed);
    EXPECT_EQ(result.run.model_type, "naive");

    for (size_t i = 0; i < result.run.foldResults.size(); ++i) {
        const auto& fold = result.run.foldResults[i];
        EXPECT_TRUE(fold.Succeeded()) << fold.failure_reason;
        EXPECT_EQ(fold.fold.fold_index, static_cast<int>(i));
        EXPECT_GT(fold.n_train_samples, 0);
        EXPECT_GT(fold.n_test_samples, 0);
        for (const auto& prediction : fold.predictions) {
            EXPECT_TRUE(fold.fold.eval_range.Contains(prediction.timestamp_ms));
            EXPECT_GT(prediction.target_timestamp_ms, prediction.timestamp_ms);
            EXPECT_DOUBLE_EQ(prediction.predicted_value, prediction.previous_actual);
        }
    }

    // The close climbs 0.05 per 5m bar, so persistence misses by exactly that.
    for (int fold = 0; fold < 4; ++fold) {
        const auto* mae = FindMetric(result, fold, "mae");
        ASSERT_NE(mae, nullptr);
        ASSERT_TRUE(mae->value.has_value());
        EXPECT_NEAR(*mae->value, 0.05, 1e-9);
        const auto* direction = FindMetric(result, fold, "directional_accuracy");
        ASSERT_NE(direction, nullptr);
        EXPECT_DOUBLE_EQ(direction->value.value_or(-1.0), 0.0);
    }
    const auto* aggregateRmse = FindMetric(result, std::nullopt, "rmse");
    ASSERT_NE(aggregateRmse, nullptr);
    EXPECT_NEAR(aggregateRmse->value.value_or(-1.0), 0.05, 1e-9);
    EXPECT_TRUE(result.degrading_metrics.empty());
}

TEST_F(PipelineTest, LinearModelProducesFiniteMetrics) {
    RunConfig config = Config("linear");
    config.fold_policy = simulation::FoldPolicy::Expanding;
    config.max_parallel_folds = 2;
    BacktestPipeline pipeline(config, m_store);

    std::vector<int> reported;
    pipeline.SetFoldCallback([&](const simulation::FoldResult& fold) { reported.push_back(fold.fold.fold_index); });
    PipelineResult result = pipeline.Execute();

    ASSERT_EQ(result.run.foldResults.size(), 4u);
    EXPECT_EQ(result.run.CountWithStatus(simulation::FoldStatus::Ok), 4);
    EXPECT_EQ(reported.size(), 4u);
    EXPECT_EQ(result.run.model_type, "linear");
    for (const auto& fold : result.run.foldResults) {
        EXPECT_EQ(fold.fold.train_range.start_ms, kDay0);
    }
    for (const char* name : {"mae", "rmse", "mape", "directional_accuracy"}) {
        const auto* aggregate = FindMetric(result, std::nullopt, name);
        ASSERT_NE(aggregate, nullptr) << name;
        ASSERT_TRUE(aggregate->value.has_value()) << name;
        EXPECT_TRUE(std::isfinite(*aggregate->value)) << name;
    }
}

TEST_F(PipelineTest, UnknownModelIsAConfigError) {
    BacktestPipeline pipeline(Config("xgboost"), m_store);
    EXPECT_THROW(pipeline.Execute(), ConfigError);
}

TEST_F(PipelineTest, InvalidConfigIsRejectedAtConstruction) {
    RunConfig config = Config("naive");
    config.timeframes_ms = {5 * kMinuteMs};
    config.reference_timeframe_ms = kHourMs;
    EXPECT_THROW({ BacktestPipeline pipeline(config, m_store); }, ConfigError);
    EXPECT_THROW({ BacktestPipeline pipeline(Config("naive"), nullptr); }, ConfigError);
}

TEST_F(PipelineTest, EmptyStoreIsInsufficientRange) {
    RunConfig config = Config("naive");
    config.symbol = "GBPUSD";
    BacktestPipeline pipeline(config, m_store);
    EXPECT_THROW(pipeline.Execute(), InsufficientRangeError);
}

TEST_F(PipelineTest, FoldLayoutLargerThanRangeFailsBeforeQuerying) {
    RunConfig config = Config("naive");
    config.train_window_ms = 5 * kDayMs;
    auto failing = std::make_shared<FailingStore>();
    BacktestPipeline pipeline(config, failing);
    EXPECT_THROW(pipeline.Execute(), InsufficientRangeError);
    EXPECT_EQ(failing->calls, 0);
}

TEST_F(PipelineTest, StoreFailureIsAStoreQueryError) {
    auto failing = std::make_shared<FailingStore>();
    BacktestPipeline pipeline(Config("naive"), failing);
    try {
        pipeline.Execute();
        FAIL() << "expected StoreQueryError";
    } catch (const StoreQueryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::StoreQueryFailure);
        EXPECT_NE(std::string(e.what()).find("connection refused"), std::string::npos);
    }
    EXPECT_EQ(failing->calls, 1);
}

TEST_F(PipelineTest, ArtifactsDescribeTheRun) {
    BacktestPipeline pipeline(Config("naive"), m_store);
    PipelineResult result = pipeline.Execute();

    const std::string json = RunArtifactToJson(result);
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(json);
    ASSERT_TRUE(Json::parseFromStream(builder, stream, &root, &errors)) << errors;

    EXPECT_EQ(root["version"].asInt(), 1);
    EXPECT_EQ(root["config"]["symbol"].asString(), "EURUSD");
    EXPECT_EQ(root["config"]["reference_timeframe"].asString(), "5m");
    EXPECT_EQ(root["config"]["timeframes"].size(), 2u);
    EXPECT_EQ(root["data"]["resampled_bars"]["1h"].asUInt64(), 96u);
    EXPECT_EQ(root["model"].asString(), "naive");
    EXPECT_TRUE(root["completed"].asBool());
    ASSERT_EQ(root["folds"].size(), 4u);
    EXPECT_EQ(root["folds"][0]["status"].asString(), "ok");
    EXPECT_EQ(root["folds"][0]["train"]["start"].asString(), "2024-01-01T00:00:00.000Z");
    EXPECT_EQ(root["folds"][0]["eval"]["start_ms"].asInt64(), kDay0 + 2 * kDayMs);
    ASSERT_EQ(root["metrics"].size(), result.metrics.size());
    EXPECT_EQ(root["metrics"][0]["fold"].asInt(), 0);
    EXPECT_EQ(root["metrics"][root["metrics"].size() - 1]["fold"].asString(), "aggregate");
    EXPECT_EQ(root["predictions"].size(), result.run.AllPredictions().size());

    const std::string csv = PredictionsToCsv(result.run.AllPredictions());
    std::istringstream lines(csv);
    std::string header;
    std::getline(lines, header);
    EXPECT_EQ(header, "fold,timestamp_ms,target_timestamp_ms,predicted,actual,previous_actual");
    size_t rows = 0;
    for (std::string line; std::getline(lines, line);) {
        ++rows;
    }
    EXPECT_EQ(rows, result.run.AllPredictions().size());
}

TEST_F(PipelineTest, ArtifactsAreWrittenToNestedDirectories) {
    BacktestPipeline pipeline(Config("naive"), m_store);
    PipelineResult result = pipeline.Execute();

    const auto dir = std::filesystem::temp_directory_path()
                   / ("mtfcast_pipeline_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    const auto jsonPath = dir / "nested" / "run.json";
    const auto csvPath = dir / "nested" / "predictions.csv";

    std::string error;
    ASSERT_TRUE(WriteRunArtifact(result, jsonPath, &error)) << error;
    ASSERT_TRUE(WritePredictionsCsv(result, csvPath, &error)) << error;

    std::ifstream jsonIn(jsonPath);
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    ASSERT_TRUE(Json::parseFromStream(builder, jsonIn, &root, &errors)) << errors;
    EXPECT_EQ(root["config"]["run_name"].asString(), "pipeline-test");
    EXPECT_GT(std::filesystem::file_size(csvPath), 0u);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
