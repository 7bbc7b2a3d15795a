#include "RunArtifactWriter.h"

#include "TimeUtils.h"

#include <json/json.h>

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace mtfcast {
namespace {

std::string SerializeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

Json::Value RangeToJson(const simulation::TimeRange& range) {
    Json::Value value(Json::objectValue);
    value["start_ms"] = static_cast<Json::Int64>(range.start_ms);
    value["end_ms"] = static_cast<Json::Int64>(range.end_ms);
    value["start"] = FormatIsoMillis(range.start_ms);
    value["end"] = FormatIsoMillis(range.end_ms);
    return value;
}

Json::Value ConfigToJson(const PipelineResult& result) {
    const RunConfig& config = result.config;
    Json::Value value(Json::objectValue);
    value["run_name"] = config.run_name;
    value["symbol"] = config.symbol;
    Json::Value timeframes(Json::arrayValue);
    for (int64_t tf : config.timeframes_ms) {
        timeframes.append(FormatTimeframe(tf));
    }
    value["timeframes"] = timeframes;
    value["reference_timeframe"] = FormatTimeframe(result.reference_timeframe_ms);
    value["allow_partial_bars"] = config.allow_partial_bars;
    value["range"] = RangeToJson({config.range_start_ms, config.range_end_ms});
    value["fold_policy"] = simulation::FoldPolicyName(config.fold_policy);
    value["train_window_ms"] = static_cast<Json::Int64>(config.train_window_ms);
    value["eval_window_ms"] = static_cast<Json::Int64>(config.eval_window_ms);
    value["step_ms"] = static_cast<Json::Int64>(config.step_ms);
    value["gap_ms"] = static_cast<Json::Int64>(config.gap_ms);
    value["max_folds"] = config.max_folds;
    value["fold_mode"] = simulation::FoldModeName(config.fold_mode);
    value["max_parallel_folds"] = config.max_parallel_folds;
    value["fold_timeout_ms"] = static_cast<Json::Int64>(config.fold_timeout_ms);
    value["horizon_bars"] = config.horizon_bars;
    value["model"] = config.model_type;
    value["ridge_alpha"] = config.ridge_alpha;
    value["store"] = StoreKindName(config.store.kind);
    return value;
}

Json::Value PredictionToJson(const simulation::PredictionRecord& record) {
    Json::Value value(Json::objectValue);
    value["fold"] = record.fold_index;
    value["timestamp_ms"] = static_cast<Json::Int64>(record.timestamp_ms);
    value["target_timestamp_ms"] = static_cast<Json::Int64>(record.target_timestamp_ms);
    value["predicted"] = record.predicted_value;
    value["actual"] = record.actual_value;
    value["previous_actual"] = record.previous_actual;
    return value;
}

bool WriteText(const std::filesystem::path& path, const std::string& text, std::string* error) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            if (error) {
                *error = "Unable to create directory '" + path.parent_path().string() + "': " + ec.message();
            }
            return false;
        }
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        if (error) {
            *error = "Unable to open '" + path.string() + "' for writing.";
        }
        return false;
    }
    out << text;
    out.close();
    if (!out) {
        if (error) {
            *error = "Failed writing '" + path.string() + "'.";
        }
        return false;
    }
    return true;
}

} // namespace

std::string RunArtifactToJson(const PipelineResult& result) {
    Json::Value root(Json::objectValue);
    root["version"] = 1;
    root["config"] = ConfigToJson(result);

    Json::Value data(Json::objectValue);
    data["source_bars"] = static_cast<Json::UInt64>(result.source_bar_count);
    Json::Value resampled(Json::objectValue);
    for (const auto& [tf, count] : result.resampled_bar_counts) {
        resampled[FormatTimeframe(tf)] = static_cast<Json::UInt64>(count);
    }
    data["resampled_bars"] = resampled;
    data["aligned_rows"] = static_cast<Json::UInt64>(result.aligned_row_count);
    data["dataset_rows"] = static_cast<Json::UInt64>(result.dataset_row_count);
    Json::Value features(Json::arrayValue);
    for (const auto& name : result.feature_names) {
        features.append(name);
    }
    data["features"] = features;
    root["data"] = data;

    const auto& run = result.run;
    root["model"] = run.model_type;
    root["completed"] = run.completed;

    Json::Value folds(Json::arrayValue);
    for (const auto& fold : run.foldResults) {
        Json::Value entry(Json::objectValue);
        entry["fold"] = fold.fold.fold_index;
        entry["status"] = simulation::FoldStatusName(fold.status);
        if (!fold.failure_reason.empty()) {
            entry["reason"] = fold.failure_reason;
        }
        entry["train"] = RangeToJson(fold.fold.train_range);
        entry["eval"] = RangeToJson(fold.fold.eval_range);
        entry["n_train"] = fold.n_train_samples;
        entry["n_test"] = fold.n_test_samples;
        entry["elapsed_ms"] = fold.elapsed_ms;
        folds.append(entry);
    }
    root["folds"] = folds;

    Json::Value metrics(Json::arrayValue);
    for (const auto& metric : result.metrics) {
        Json::Value entry(Json::objectValue);
        entry["fold"] = metric.fold_index ? Json::Value(*metric.fold_index) : Json::Value("aggregate");
        entry["metric"] = metric.metric_name;
        entry["value"] = metric.value ? Json::Value(*metric.value) : Json::Value(Json::nullValue);
        metrics.append(entry);
    }
    root["metrics"] = metrics;

    Json::Value degrading(Json::arrayValue);
    for (const auto& name : result.degrading_metrics) {
        degrading.append(name);
    }
    root["degrading_metrics"] = degrading;

    Json::Value predictions(Json::arrayValue);
    for (const auto& record : run.AllPredictions()) {
        predictions.append(PredictionToJson(record));
    }
    root["predictions"] = predictions;

    return SerializeJson(root);
}

std::string PredictionsToCsv(const std::vector<simulation::PredictionRecord>& predictions) {
    std::ostringstream oss;
    oss << "fold,timestamp_ms,target_timestamp_ms,predicted,actual,previous_actual\n";
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& record : predictions) {
        oss << record.fold_index << ','
            << record.timestamp_ms << ','
            << record.target_timestamp_ms << ','
            << record.predicted_value << ','
            << record.actual_value << ','
            << record.previous_actual << '\n';
    }
    return oss.str();
}

bool WriteRunArtifact(const PipelineResult& result, const std::filesystem::path& path, std::string* error) {
    return WriteText(path, RunArtifactToJson(result), error);
}

bool WritePredictionsCsv(const PipelineResult& result, const std::filesystem::path& path, std::string* error) {
    return WriteText(path, PredictionsToCsv(result.run.AllPredictions()), error);
}

} // namespace mtfcast
