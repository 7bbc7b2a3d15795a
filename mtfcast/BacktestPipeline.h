#pragma once

#include "RunConfig.h"
#include "alignment/TemporalAligner.h"
#include "bars/IBarStoreClient.h"
#include "simulation/BacktestRunner.h"
#include "simulation/PerformanceMetrics.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mtfcast {

// Everything a finished run produced.
struct PipelineResult {
    RunConfig config;
    int64_t reference_timeframe_ms = 0;

    size_t source_bar_count = 0;
    std::map<int64_t, size_t> resampled_bar_counts;
    size_t aligned_row_count = 0;
    size_t dataset_row_count = 0;
    std::vector<std::string> feature_names;

    std::vector<simulation::FoldSpec> folds;
    simulation::BacktestRun run;
    std::vector<simulation::metrics::MetricResult> metrics;
    std::vector<std::string> degrading_metrics;
};

// Store -> resample -> align -> dataset -> folds -> runner -> metrics for one RunConfig.
class BacktestPipeline {
public:
    using ModelCreator = simulation::BacktestRunner::ModelCreator;

    // Validates the config (ConfigError) and builds the configured store.
    explicit BacktestPipeline(RunConfig config);

    // Uses `store` instead of the configured one. It is still wrapped in the retry policy.
    BacktestPipeline(RunConfig config, std::shared_ptr<bars::IBarStoreClient> store);

    // Replaces the ModelFactory lookup of config.model_type.
    void SetModelCreator(ModelCreator creator) { m_creator = std::move(creator); }

    void SetProgressCallback(simulation::BacktestRunner::ProgressCallback cb) { m_progressCallback = std::move(cb); }
    void SetFoldCallback(simulation::BacktestRunner::FoldCallback cb) { m_foldCallback = std::move(cb); }

    // Throws StoreQueryError, ConfigError, InsufficientRangeError, LeakageViolationError and
    // the resampler's input errors. Fold failures are reported in the result.
    PipelineResult Execute();

    bars::IBarStoreClient& GetStore() { return *m_store; }

    static std::shared_ptr<bars::IBarStoreClient> CreateStore(const StoreSettings& settings);

private:
    std::vector<bars::Bar> LoadMinuteBars();
    alignment::TimeframeStreams ResampleAll(const std::vector<bars::Bar>& minuteBars) const;
    ModelCreator ResolveModelCreator() const;

    RunConfig m_config;
    std::shared_ptr<bars::RetryingBarStore> m_store;
    ModelCreator m_creator;
    simulation::BacktestRunner::ProgressCallback m_progressCallback;
    simulation::BacktestRunner::FoldCallback m_foldCallback;
};

} // namespace mtfcast
