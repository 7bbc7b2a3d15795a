#include "simulation/BacktestRunner.h"

#include "Errors.h"
#include "SimpleLogger.h"
#include "TaskExecutor.h"
#include "TimeUtils.h"
#include "alignment/DatasetBuilder.h"

#include <algorithm>
#include <cmath>
#include <future>
#include <sstream>

namespace mtfcast {
namespace simulation {

namespace {

// Inputs and outputs of one fit/predict call, shared with a worker that may outlive the fold.
struct FoldWork {
    FeatureMatrix X_train;
    std::vector<double> y_train;
    FeatureMatrix X_test;
    PredictionResult prediction;
    std::exception_ptr error;
};

void FitAndPredict(ITrainableModel& model, FoldWork& work, const CancellationToken& token) {
    TrainingResult training = model.Fit(work.X_train, work.y_train, token);
    if (!training.success) {
        throw FoldExecutionError("fit failed: " + training.error_message);
    }
    if (token.IsCancelled()) {
        return;
    }
    work.prediction = model.Predict(work.X_test, token);
    if (!work.prediction.success) {
        throw FoldExecutionError("predict failed: " + work.prediction.error_message);
    }
}

std::string DescribeFold(const FoldSpec& fold) {
    std::ostringstream oss;
    oss << "fold " << fold.fold_index
        << " train [" << FormatIsoMillis(fold.train_range.start_ms) << ", " << FormatIsoMillis(fold.train_range.end_ms)
        << ") eval [" << FormatIsoMillis(fold.eval_range.start_ms) << ", " << FormatIsoMillis(fold.eval_range.end_ms) << ")";
    return oss.str();
}

} // namespace

int BacktestRun::CountWithStatus(FoldStatus status) const {
    return static_cast<int>(std::count_if(foldResults.begin(), foldResults.end(),
                                          [status](const FoldResult& r) { return r.status == status; }));
}

std::vector<PredictionRecord> BacktestRun::AllPredictions() const {
    std::vector<PredictionRecord> all;
    for (const auto& fold : foldResults) {
        if (fold.Succeeded()) {
            all.insert(all.end(), fold.predictions.begin(), fold.predictions.end());
        }
    }
    return all;
}

BacktestRunner::BacktestRunner(ModelCreator creator, const RunnerConfig& config)
    : m_creator(std::move(creator))
    , m_config(config)
    , m_isRunning(false)
    , m_shouldStop(false) {
    if (!m_creator) {
        throw ConfigError("backtest runner needs a model creator");
    }
    if (m_config.max_parallel_folds < 1) {
        throw ConfigError("max_parallel_folds must be at least 1");
    }
    if (m_config.fold_mode == FoldMode::Incremental && m_config.max_parallel_folds != 1) {
        throw ConfigError("incremental fold mode requires max_parallel_folds = 1");
    }
    if (m_config.fold_timeout_ms < 0) {
        throw ConfigError("fold_timeout_ms must not be negative");
    }
}

BacktestRunner::~BacktestRunner() {
    JoinStragglers();
}

void BacktestRunner::SelectRows(const Dataset& dataset,
                                const FoldSpec& fold,
                                std::vector<size_t>& trainRows,
                                std::vector<size_t>& evalRows) {
    trainRows.clear();
    evalRows.clear();
    const auto& rows = dataset.rows;
    auto byTimestamp = [](const DatasetRow& row, int64_t ts) { return row.timestamp_ms < ts; };

    auto trainBegin = std::lower_bound(rows.begin(), rows.end(), fold.train_range.start_ms, byTimestamp);
    auto trainEnd = std::lower_bound(trainBegin, rows.end(), fold.train_range.end_ms, byTimestamp);
    for (auto it = trainBegin; it != trainEnd; ++it) {
        // Purge rows whose target is only revealed after training ends.
        if (it->target_timestamp_ms <= fold.train_range.end_ms) {
            trainRows.push_back(static_cast<size_t>(it - rows.begin()));
        }
    }

    auto evalBegin = std::lower_bound(rows.begin(), rows.end(), fold.eval_range.start_ms, byTimestamp);
    auto evalEnd = std::lower_bound(evalBegin, rows.end(), fold.eval_range.end_ms, byTimestamp);
    for (auto it = evalBegin; it != evalEnd; ++it) {
        evalRows.push_back(static_cast<size_t>(it - rows.begin()));
    }
}

void BacktestRunner::ValidateFoldLayout(const Dataset& dataset, const std::vector<FoldSpec>& folds) const {
    for (size_t i = 1; i < dataset.rows.size(); ++i) {
        if (dataset.rows[i].timestamp_ms < dataset.rows[i - 1].timestamp_ms) {
            throw UnsortedInputError("dataset rows are not ordered by timestamp at index " + std::to_string(i));
        }
    }
    for (const auto& row : dataset.rows) {
        if (row.target_timestamp_ms <= row.timestamp_ms) {
            throw LeakageViolationError("row at " + FormatIsoMillis(row.timestamp_ms)
                                        + " has a target observable at or before its features");
        }
        if (row.features.size() != dataset.feature_names.size()) {
            throw std::invalid_argument("dataset row at " + FormatIsoMillis(row.timestamp_ms)
                                        + " has the wrong feature count");
        }
    }
    for (size_t i = 0; i < folds.size(); ++i) {
        const FoldSpec& fold = folds[i];
        if (fold.train_range.end_ms > fold.eval_range.start_ms) {
            throw LeakageViolationError(DescribeFold(fold) + " trains past the start of its evaluation");
        }
        if (i > 0 && fold.eval_range.start_ms <= folds[i - 1].eval_range.start_ms) {
            throw LeakageViolationError(DescribeFold(fold) + " does not advance past the previous fold");
        }
    }
}

BacktestRun BacktestRunner::Run(const Dataset& dataset, const std::vector<FoldSpec>& folds) {
    ValidateFoldLayout(dataset, folds);

    BacktestRun run;
    run.startTime = std::chrono::system_clock::now();
    run.foldResults.resize(folds.size());

    m_isRunning.store(true);
    m_shouldStop.store(false);
    m_finishedFolds = 0;
    const int totalFolds = static_cast<int>(folds.size());

    SimpleLogger::Info("Starting backtest: " + std::to_string(totalFolds) + " folds, mode "
                       + FoldModeName(m_config.fold_mode) + ", max parallel "
                       + std::to_string(m_config.max_parallel_folds)
                       + (m_config.fold_timeout_ms > 0 ? ", timeout " + std::to_string(m_config.fold_timeout_ms) + " ms" : ""));

    auto cancelledResult = [](const FoldSpec& fold, const std::string& reason) {
        FoldResult result;
        result.fold = fold;
        result.status = FoldStatus::Cancelled;
        result.failure_reason = reason;
        return result;
    };

    if (m_config.fold_mode == FoldMode::Incremental) {
        std::shared_ptr<ITrainableModel> model;
        std::string creationError = "model creator returned no model";
        try {
            model = m_creator();
        } catch (const std::exception& e) {
            creationError = std::string("model creation failed: ") + e.what();
        }
        if (model) {
            run.model_type = model->GetModelType();
            if (!model->GetCapabilities().supports_online_learning) {
                SimpleLogger::Warn("Model " + run.model_type
                                   + " does not declare online learning; each fold refits the shared instance");
            }
        }
        for (size_t i = 0; i < folds.size(); ++i) {
            if (m_shouldStop.load()) {
                run.foldResults[i] = cancelledResult(folds[i], "run stopped before fold started");
            } else if (!model) {
                run.foldResults[i].fold = folds[i];
                run.foldResults[i].status = FoldStatus::Failed;
                run.foldResults[i].failure_reason = creationError;
            } else {
                // The shared model must be idle before the next fold touches it.
                run.foldResults[i] = ProcessSingleFold(model, dataset, folds[i], true);
            }
            NotifyFoldFinished(run.foldResults[i], totalFolds);
        }
    } else {
        std::mutex typeMutex;
        TaskExecutor executor(m_config.max_parallel_folds);
        executor.ExecuteParallel(folds.size(), [&](size_t i) {
            FoldResult result;
            if (m_shouldStop.load()) {
                result = cancelledResult(folds[i], "run stopped before fold started");
            } else {
                std::shared_ptr<ITrainableModel> model;
                std::string creationError;
                try {
                    model = m_creator();
                } catch (const std::exception& e) {
                    creationError = e.what();
                }
                if (!model) {
                    result.fold = folds[i];
                    result.status = FoldStatus::Failed;
                    result.failure_reason = creationError.empty()
                        ? std::string("model creator returned no model")
                        : "model creation failed: " + creationError;
                } else {
                    {
                        std::lock_guard<std::mutex> lock(typeMutex);
                        if (run.model_type.empty()) {
                            run.model_type = model->GetModelType();
                        }
                    }
                    result = ProcessSingleFold(model, dataset, folds[i], false);
                }
            }
            run.foldResults[i] = std::move(result);
            NotifyFoldFinished(run.foldResults[i], totalFolds);
        });
    }

    // Barrier: nothing is aggregated while a fit/predict thread is still alive.
    JoinStragglers();

    run.endTime = std::chrono::system_clock::now();
    run.completed = !m_shouldStop.load();
    m_isRunning.store(false);

    SimpleLogger::Info("Backtest finished: " + std::to_string(run.CountWithStatus(FoldStatus::Ok)) + " ok, "
                       + std::to_string(run.CountWithStatus(FoldStatus::Failed)) + " failed, "
                       + std::to_string(run.CountWithStatus(FoldStatus::Cancelled)) + " cancelled");
    return run;
}

FoldResult BacktestRunner::ProcessSingleFold(const std::shared_ptr<ITrainableModel>& model,
                                             const Dataset& dataset,
                                             const FoldSpec& fold,
                                             bool joinOnTimeout) {
    const auto started = std::chrono::steady_clock::now();
    FoldResult result;
    result.fold = fold;

    std::vector<size_t> trainRows;
    std::vector<size_t> evalRows;
    SelectRows(dataset, fold, trainRows, evalRows);
    result.n_train_samples = static_cast<int>(trainRows.size());
    result.n_test_samples = static_cast<int>(evalRows.size());

    auto finish = [&](FoldStatus status, const std::string& reason) {
        result.status = status;
        result.failure_reason = reason;
        result.elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        if (status != FoldStatus::Ok) {
            result.predictions.clear();
            SimpleLogger::Warn("Error in fold " + std::to_string(fold.fold_index) + ": " + reason);
        }
        return result;
    };

    if (trainRows.empty()) {
        return finish(FoldStatus::Failed, "no training rows");
    }
    if (evalRows.empty()) {
        return finish(FoldStatus::Failed, "no evaluation rows");
    }

    auto work = std::make_shared<FoldWork>();
    work->X_train = alignment::DatasetBuilder::ToFeatureMatrix(dataset, trainRows);
    work->X_test = alignment::DatasetBuilder::ToFeatureMatrix(dataset, evalRows);
    work->y_train.reserve(trainRows.size());
    for (size_t idx : trainRows) {
        work->y_train.push_back(dataset.rows[idx].target);
    }

    CancellationToken token;
    if (m_config.fold_timeout_ms <= 0) {
        try {
            FitAndPredict(*model, *work, token);
        } catch (const std::exception& e) {
            return finish(FoldStatus::Failed, e.what());
        } catch (...) {
            return finish(FoldStatus::Failed, "model threw a non-standard exception");
        }
    } else {
        std::promise<void> donePromise;
        std::future<void> done = donePromise.get_future();
        std::thread worker([model, work, token, donePromise = std::move(donePromise)]() mutable {
            try {
                FitAndPredict(*model, *work, token);
            } catch (...) {
                work->error = std::current_exception();
            }
            donePromise.set_value();
        });

        if (done.wait_for(std::chrono::milliseconds(m_config.fold_timeout_ms)) == std::future_status::timeout) {
            token.Cancel();
            if (joinOnTimeout) {
                worker.join();
            } else {
                std::lock_guard<std::mutex> lock(m_stragglerMutex);
                m_stragglers.push_back(std::move(worker));
            }
            return finish(FoldStatus::Cancelled,
                          "timed out after " + std::to_string(m_config.fold_timeout_ms) + " ms");
        }
        worker.join();
        if (work->error) {
            try {
                std::rethrow_exception(work->error);
            } catch (const std::exception& e) {
                return finish(FoldStatus::Failed, e.what());
            } catch (...) {
                return finish(FoldStatus::Failed, "model threw a non-standard exception");
            }
        }
    }

    const auto& predictions = work->prediction.predictions;
    if (predictions.size() != evalRows.size()) {
        return finish(FoldStatus::Failed, "model returned " + std::to_string(predictions.size())
                                          + " predictions for " + std::to_string(evalRows.size()) + " rows");
    }

    result.predictions.reserve(evalRows.size());
    for (size_t k = 0; k < evalRows.size(); ++k) {
        if (!std::isfinite(predictions[k])) {
            return finish(FoldStatus::Failed, "model returned a non-finite prediction");
        }
        const DatasetRow& row = dataset.rows[evalRows[k]];
        PredictionRecord record;
        record.fold_index = fold.fold_index;
        record.timestamp_ms = row.timestamp_ms;
        record.target_timestamp_ms = row.target_timestamp_ms;
        record.predicted_value = predictions[k];
        record.actual_value = row.target;
        record.previous_actual = row.previous_actual;
        result.predictions.push_back(record);
    }
    return finish(FoldStatus::Ok, "");
}

void BacktestRunner::NotifyFoldFinished(const FoldResult& result, int total) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    ++m_finishedFolds;
    if (m_progressCallback) {
        m_progressCallback(m_finishedFolds, total);
    }
    if (m_foldCallback) {
        m_foldCallback(result);
    }
}

void BacktestRunner::JoinStragglers() {
    std::vector<std::thread> stragglers;
    {
        std::lock_guard<std::mutex> lock(m_stragglerMutex);
        stragglers.swap(m_stragglers);
    }
    for (auto& thread : stragglers) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace simulation
} // namespace mtfcast
