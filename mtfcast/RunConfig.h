#pragma once

#include "bars/RetryingBarStore.h"
#include "questdb/QuestDbBarStore.h"
#include "simulation/SimulationTypes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace mtfcast {

enum class StoreKind {
    QuestDb,
    Histdata
};

struct StoreSettings {
    StoreKind kind = StoreKind::QuestDb;
    questdb::ConnectionOptions questdb;
    std::string histdata_directory;
    int histdata_utc_offset_minutes = 0;
    bars::RetryPolicy retry;
};

// Everything one backtest run needs. Durations and timestamps are milliseconds.
struct RunConfig {
    std::string run_name;
    std::string symbol;

    std::vector<int64_t> timeframes_ms;
    int64_t reference_timeframe_ms = 0;  // 0 = finest configured timeframe
    bool allow_partial_bars = false;
    int resample_workers = 1;

    int64_t range_start_ms = 0;
    int64_t range_end_ms = 0;

    simulation::FoldPolicy fold_policy = simulation::FoldPolicy::Rolling;
    int64_t train_window_ms = 0;
    int64_t eval_window_ms = 0;
    int64_t step_ms = 0;
    int64_t gap_ms = 0;
    int max_folds = 0;

    simulation::FoldMode fold_mode = simulation::FoldMode::Independent;
    int max_parallel_folds = 1;
    int64_t fold_timeout_ms = 0;

    int horizon_bars = 1;
    std::string model_type = "linear";
    double ridge_alpha = 1.0;

    StoreSettings store;

    std::string output_path;           // JSON artifact, empty = none
    std::string predictions_csv_path;  // empty = none
};

// Throws ConfigError describing the first inconsistent setting.
void ValidateRunConfig(const RunConfig& config);

// The configured reference timeframe, or the finest timeframe when unset.
int64_t ResolveReferenceTimeframe(const RunConfig& config);

const char* StoreKindName(StoreKind kind);

} // namespace mtfcast
