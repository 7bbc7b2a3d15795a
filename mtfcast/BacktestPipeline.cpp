#include "BacktestPipeline.h"

#include "Errors.h"
#include "SimpleLogger.h"
#include "TaskExecutor.h"
#include "TimeUtils.h"
#include "alignment/DatasetBuilder.h"
#include "bars/HistdataCsvBarStore.h"
#include "bars/Resampler.h"
#include "bars/RetryingBarStore.h"
#include "questdb/QuestDbBarStore.h"
#include "simulation/FoldPlanner.h"

#include <algorithm>
#include <sstream>

namespace mtfcast {

BacktestPipeline::BacktestPipeline(RunConfig config)
    : BacktestPipeline(config, CreateStore(config.store)) {
}

BacktestPipeline::BacktestPipeline(RunConfig config, std::shared_ptr<bars::IBarStoreClient> store)
    : m_config(std::move(config)) {
    ValidateRunConfig(m_config);
    if (!store) {
        throw ConfigError("no bar store");
    }
    m_store = std::make_shared<bars::RetryingBarStore>(std::move(store), m_config.store.retry);
}

std::shared_ptr<bars::IBarStoreClient> BacktestPipeline::CreateStore(const StoreSettings& settings) {
    switch (settings.kind) {
        case StoreKind::QuestDb:
            return std::make_shared<questdb::QuestDbBarStore>(settings.questdb);
        case StoreKind::Histdata: {
            bars::HistdataOptions options;
            options.directory = settings.histdata_directory;
            options.utc_offset_minutes = settings.histdata_utc_offset_minutes;
            return std::make_shared<bars::HistdataCsvBarStore>(options);
        }
    }
    throw ConfigError("unknown store kind");
}

std::vector<bars::Bar> BacktestPipeline::LoadMinuteBars() {
    SimpleLogger::Info("Querying " + m_store->Describe() + " for " + m_config.symbol + " ["
                       + FormatIsoMillis(m_config.range_start_ms) + ", "
                       + FormatIsoMillis(m_config.range_end_ms) + ")");

    auto result = m_store->Query(m_config.symbol, m_config.range_start_ms, m_config.range_end_ms);
    if (!result.ok()) {
        throw StoreQueryError(result.status().ToString());
    }
    std::vector<bars::Bar> minuteBars = std::move(result).ValueOrDie();
    SimpleLogger::Info("Loaded " + std::to_string(minuteBars.size()) + " 1m bars in "
                       + std::to_string(m_store->GetLastAttemptCount()) + " attempt(s)");
    return minuteBars;
}

alignment::TimeframeStreams BacktestPipeline::ResampleAll(const std::vector<bars::Bar>& minuteBars) const {
    bars::Resampler::ValidateSource(minuteBars);

    bars::ResampleOptions options;
    options.allow_partial = m_config.allow_partial_bars;
    options.cutoff_ms = m_config.range_end_ms;

    const auto& timeframes = m_config.timeframes_ms;
    std::vector<std::vector<bars::Bar>> outputs(timeframes.size());

    TaskExecutor executor(static_cast<int>(std::min<size_t>(timeframes.size(), 8)));
    executor.ExecuteParallel(timeframes.size(), [&](size_t i) {
        outputs[i] = bars::Resampler::ResampleParallel(minuteBars, timeframes[i], options,
                                                       static_cast<size_t>(m_config.resample_workers));
    });

    alignment::TimeframeStreams streams;
    for (size_t i = 0; i < timeframes.size(); ++i) {
        SimpleLogger::Debug("Resampled " + FormatTimeframe(timeframes[i]) + ": "
                            + std::to_string(outputs[i].size()) + " bars");
        streams[timeframes[i]] = std::move(outputs[i]);
    }
    return streams;
}

BacktestPipeline::ModelCreator BacktestPipeline::ResolveModelCreator() const {
    if (m_creator) {
        return m_creator;
    }
    simulation::InitializeModels();
    if (!simulation::ModelFactory::IsModelAvailable(m_config.model_type)) {
        std::ostringstream available;
        for (const auto& name : simulation::ModelFactory::GetAllModels()) {
            available << ' ' << name;
        }
        throw ConfigError("unknown model '" + m_config.model_type + "'; available:" + available.str());
    }
    simulation::ModelParameters params;
    params.ridge_alpha = m_config.ridge_alpha;
    std::string type = m_config.model_type;
    return [type, params]() {
        return simulation::ModelFactory::CreateModel(type, params);
    };
}

PipelineResult BacktestPipeline::Execute() {
    PipelineResult result;
    result.config = m_config;
    result.reference_timeframe_ms = ResolveReferenceTimeframe(m_config);

    ModelCreator creator = ResolveModelCreator();

    // Fold layout only depends on the config, so a bad layout fails before any I/O.
    simulation::FoldPlanConfig planConfig;
    planConfig.policy = m_config.fold_policy;
    planConfig.train_window = m_config.train_window_ms;
    planConfig.eval_window = m_config.eval_window_ms;
    planConfig.step = m_config.step_ms;
    planConfig.gap = m_config.gap_ms;
    planConfig.max_folds = m_config.max_folds;
    simulation::TimeRange total{m_config.range_start_ms, m_config.range_end_ms};
    result.folds = simulation::FoldPlanner::PlanFolds(total, planConfig);
    SimpleLogger::Info("Planned " + std::to_string(result.folds.size()) + " "
                       + simulation::FoldPolicyName(m_config.fold_policy) + " folds");

    std::vector<bars::Bar> minuteBars = LoadMinuteBars();
    result.source_bar_count = minuteBars.size();
    if (minuteBars.empty()) {
        throw InsufficientRangeError("store returned no bars for " + m_config.symbol);
    }

    alignment::TimeframeStreams streams = ResampleAll(minuteBars);
    for (const auto& [tf, stream] : streams) {
        result.resampled_bar_counts[tf] = stream.size();
    }

    std::vector<int64_t> clock = alignment::TemporalAligner::ReferenceClock(streams.at(result.reference_timeframe_ms));
    std::vector<alignment::AlignedFeatureVector> aligned = alignment::TemporalAligner::Align(clock, streams);
    result.aligned_row_count = aligned.size();

    simulation::Dataset dataset = alignment::DatasetBuilder::BuildDataset(
        aligned, result.reference_timeframe_ms, m_config.timeframes_ms, m_config.horizon_bars);
    result.dataset_row_count = dataset.rows.size();
    result.feature_names = dataset.feature_names;
    SimpleLogger::Info("Dataset: " + std::to_string(dataset.rows.size()) + " rows x "
                       + std::to_string(dataset.feature_names.size()) + " features");

    simulation::RunnerConfig runnerConfig;
    runnerConfig.fold_mode = m_config.fold_mode;
    runnerConfig.max_parallel_folds = m_config.max_parallel_folds;
    runnerConfig.fold_timeout_ms = m_config.fold_timeout_ms;

    simulation::BacktestRunner runner(creator, runnerConfig);
    if (m_progressCallback) runner.SetProgressCallback(m_progressCallback);
    if (m_foldCallback) runner.SetFoldCallback(m_foldCallback);
    result.run = runner.Run(dataset, result.folds);
    if (result.run.model_type.empty()) {
        result.run.model_type = m_config.model_type;
    }

    simulation::metrics::PerformanceTracker tracker;
    result.metrics = simulation::metrics::AggregateRun(result.run, &tracker);
    for (const char* name : {"mae", "rmse", "mape", "directional_accuracy"}) {
        if (tracker.IsPerformanceDegrading(name)) {
            result.degrading_metrics.push_back(name);
            SimpleLogger::Warn(std::string("Performance degrading over recent folds: ") + name);
        }
    }
    return result;
}

} // namespace mtfcast
