#pragma once

#include "simulation/ITrainableModel.h"
#include "simulation/SimulationTypes.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mtfcast {
namespace simulation {

struct RunnerConfig {
    FoldMode fold_mode = FoldMode::Independent;
    int max_parallel_folds = 1;
    int64_t fold_timeout_ms = 0;  // 0 = no timeout
};

// Every fold of one run, ordered by fold index.
struct BacktestRun {
    std::string model_type;
    std::vector<FoldResult> foldResults;

    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point endTime;
    bool completed = false;

    int CountWithStatus(FoldStatus status) const;
    // Predictions of the successful folds, in fold order.
    std::vector<PredictionRecord> AllPredictions() const;
};

/**
 * Walk-forward runner.
 *
 * For every fold the training rows are those whose timestamp lies in the train range
 * and whose target is observable by the train range end; the evaluation rows are those
 * whose timestamp lies in the eval range. The model is fitted on the former and asked
 * to predict the latter.
 *
 * Independent mode asks the creator for a fresh model per fold and runs up to
 * max_parallel_folds folds at once. Incremental mode reuses one model and runs folds
 * strictly in order. Fit/predict failures, exceptions and timeouts are recorded on the
 * fold and never stop the run.
 */
class BacktestRunner {
public:
    using ModelCreator = std::function<std::unique_ptr<ITrainableModel>()>;
    using ProgressCallback = std::function<void(int current, int total)>;
    using FoldCallback = std::function<void(const FoldResult&)>;

    // Throws ConfigError for an inconsistent configuration.
    BacktestRunner(ModelCreator creator, const RunnerConfig& config);
    ~BacktestRunner();

    // Blocks until every fold has finished or been cancelled, including stragglers.
    // Throws LeakageViolationError if a fold layout or dataset row would leak.
    BacktestRun Run(const Dataset& dataset, const std::vector<FoldSpec>& folds);

    // Folds that have not started yet are recorded as cancelled.
    void Stop() { m_shouldStop.store(true); }
    bool IsRunning() const { return m_isRunning.load(); }

    void SetProgressCallback(ProgressCallback cb) { m_progressCallback = std::move(cb); }
    void SetFoldCallback(FoldCallback cb) { m_foldCallback = std::move(cb); }

    const RunnerConfig& GetConfig() const { return m_config; }

    static void SelectRows(const Dataset& dataset,
                           const FoldSpec& fold,
                           std::vector<size_t>& trainRows,
                           std::vector<size_t>& evalRows);

private:
    FoldResult ProcessSingleFold(const std::shared_ptr<ITrainableModel>& model,
                                 const Dataset& dataset,
                                 const FoldSpec& fold,
                                 bool joinOnTimeout);

    void ValidateFoldLayout(const Dataset& dataset, const std::vector<FoldSpec>& folds) const;
    void NotifyFoldFinished(const FoldResult& result, int total);
    void JoinStragglers();

    ModelCreator m_creator;
    RunnerConfig m_config;

    std::atomic<bool> m_isRunning;
    std::atomic<bool> m_shouldStop;

    // Fit/predict threads abandoned after a timeout, joined at the end of Run.
    std::mutex m_stragglerMutex;
    std::vector<std::thread> m_stragglers;

    std::mutex m_callbackMutex;
    int m_finishedFolds = 0;
    ProgressCallback m_progressCallback;
    FoldCallback m_foldCallback;
};

} // namespace simulation
} // namespace mtfcast
