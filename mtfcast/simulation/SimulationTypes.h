#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mtfcast {
namespace simulation {

// Half-open [start_ms, end_ms).
struct TimeRange {
    int64_t start_ms = 0;
    int64_t end_ms = 0;

    int64_t Length() const { return end_ms - start_ms; }
    bool Contains(int64_t timestamp_ms) const {
        return timestamp_ms >= start_ms && timestamp_ms < end_ms;
    }
    bool operator==(const TimeRange& other) const {
        return start_ms == other.start_ms && end_ms == other.end_ms;
    }
};

struct FoldSpec {
    int fold_index = 0;
    TimeRange train_range;
    TimeRange eval_range;
};

enum class FoldPolicy {
    Rolling,    // Fixed-length train window that slides by `step`
    Expanding   // Train window anchored at the range start, grows by `step`
};

enum class FoldMode {
    Independent,  // Fresh model per fold, folds may run concurrently
    Incremental   // One model carried across folds, strictly in fold order
};

enum class FoldStatus {
    Ok,
    Failed,
    Cancelled
};

const char* FoldPolicyName(FoldPolicy policy);
const char* FoldModeName(FoldMode mode);
const char* FoldStatusName(FoldStatus status);

// Row-major feature block handed to a model.
struct FeatureMatrix {
    int num_rows = 0;
    int num_features = 0;
    std::vector<double> values;
    std::vector<std::string> feature_names;

    double At(int row, int col) const { return values[static_cast<size_t>(row) * num_features + col]; }
};

// One model row built from an aligned vector.
struct DatasetRow {
    int64_t timestamp_ms = 0;         // reference timestamp the features are known at
    int64_t target_timestamp_ms = 0;  // when the target becomes observable
    std::vector<double> features;
    double target = 0.0;
    double previous_actual = 0.0;
};

struct Dataset {
    std::vector<std::string> feature_names;
    std::vector<DatasetRow> rows;
};

struct PredictionRecord {
    int fold_index = 0;
    int64_t timestamp_ms = 0;
    int64_t target_timestamp_ms = 0;
    double predicted_value = 0.0;
    double actual_value = 0.0;
    double previous_actual = 0.0;
};

// Result from a single fold in walk-forward validation
struct FoldResult {
    FoldSpec fold;
    FoldStatus status = FoldStatus::Ok;
    std::string failure_reason;

    int n_train_samples = 0;
    int n_test_samples = 0;
    double elapsed_ms = 0.0;

    std::vector<PredictionRecord> predictions;

    bool Succeeded() const { return status == FoldStatus::Ok; }
};

// Model prediction result
struct PredictionResult {
    std::vector<double> predictions;
    bool success = false;
    std::string error_message;
};

// Model training result
struct TrainingResult {
    bool success = false;
    bool model_learned = false;
    std::string error_message;
};

// Shared cancellation flag. Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() const { m_flag->store(true); }
    bool IsCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace simulation
} // namespace mtfcast
