#include "RunConfig.h"

#include "Errors.h"
#include "TimeUtils.h"

#include <algorithm>

namespace mtfcast {

const char* StoreKindName(StoreKind kind) {
    switch (kind) {
        case StoreKind::QuestDb: return "questdb";
        case StoreKind::Histdata: return "histdata";
    }
    return "questdb";
}

int64_t ResolveReferenceTimeframe(const RunConfig& config) {
    if (config.reference_timeframe_ms > 0) {
        return config.reference_timeframe_ms;
    }
    if (config.timeframes_ms.empty()) {
        return 0;
    }
    return *std::min_element(config.timeframes_ms.begin(), config.timeframes_ms.end());
}

void ValidateRunConfig(const RunConfig& config) {
    if (config.symbol.empty()) {
        throw ConfigError("symbol is required");
    }
    if (config.timeframes_ms.empty()) {
        throw ConfigError("at least one timeframe is required");
    }
    for (int64_t tf : config.timeframes_ms) {
        try {
            ValidateTimeframe(tf);
        } catch (const InvalidTimeframeError& e) {
            throw ConfigError(std::string("timeframes: ") + e.what());
        }
    }
    const int64_t reference = ResolveReferenceTimeframe(config);
    if (std::find(config.timeframes_ms.begin(), config.timeframes_ms.end(), reference) == config.timeframes_ms.end()) {
        throw ConfigError("reference_timeframe " + FormatTimeframe(reference) + " is not one of the timeframes");
    }
    if (config.range_end_ms <= config.range_start_ms) {
        throw ConfigError("range_end must be after range_start");
    }
    if (config.train_window_ms <= 0 || config.eval_window_ms <= 0 || config.step_ms <= 0) {
        throw ConfigError("train_window, eval_window and step must be positive");
    }
    if (config.gap_ms < 0) {
        throw ConfigError("gap must not be negative");
    }
    if (config.max_folds < 0) {
        throw ConfigError("max_folds must not be negative");
    }
    if (config.max_parallel_folds < 1) {
        throw ConfigError("max_parallel_folds must be at least 1");
    }
    if (config.fold_mode == simulation::FoldMode::Incremental && config.max_parallel_folds != 1) {
        throw ConfigError("fold_mode=incremental cannot run folds in parallel; set max_parallel_folds=1");
    }
    if (config.fold_timeout_ms < 0) {
        throw ConfigError("fold_timeout_ms must not be negative");
    }
    if (config.horizon_bars < 1) {
        throw ConfigError("horizon_bars must be at least 1");
    }
    if (config.resample_workers < 1) {
        throw ConfigError("resample_workers must be at least 1");
    }
    if (config.model_type.empty()) {
        throw ConfigError("model is required");
    }
    if (config.ridge_alpha < 0.0) {
        throw ConfigError("ridge_alpha must not be negative");
    }
    if (config.store.kind == StoreKind::Histdata && config.store.histdata_directory.empty()) {
        throw ConfigError("store kind histdata needs histdata_directory");
    }
    if (config.store.retry.max_attempts < 1) {
        throw ConfigError("retry_attempts must be at least 1");
    }
}

} // namespace mtfcast
