#include "alignment/DatasetBuilder.h"

#include "SimpleLogger.h"
#include "TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mtfcast {
namespace alignment {

namespace {

double SafeRatio(double numerator, double denominator) {
    if (denominator == 0.0 || !std::isfinite(denominator)) {
        return 0.0;
    }
    return numerator / denominator;
}

// value / base - 1, or 0 when base is zero.
double RelativeChange(double value, double base) {
    return base == 0.0 ? 0.0 : value / base - 1.0;
}

std::vector<int64_t> SortedUnique(std::vector<int64_t> timeframes) {
    std::sort(timeframes.begin(), timeframes.end());
    timeframes.erase(std::unique(timeframes.begin(), timeframes.end()), timeframes.end());
    return timeframes;
}

} // namespace

std::vector<std::string> DatasetBuilder::FeatureNames(const std::vector<int64_t>& timeframes_ms) {
    std::vector<std::string> names{"ref_close"};
    for (int64_t tf : SortedUnique(timeframes_ms)) {
        const std::string prefix = FormatTimeframe(tf);
        names.push_back(prefix + "_rel_close");
        names.push_back(prefix + "_return");
        names.push_back(prefix + "_range");
        names.push_back(prefix + "_log_volume");
        names.push_back(prefix + "_staleness_min");
    }
    return names;
}

simulation::Dataset DatasetBuilder::BuildDataset(const std::vector<AlignedFeatureVector>& aligned,
                                                 int64_t reference_timeframe_ms,
                                                 const std::vector<int64_t>& timeframes_ms,
                                                 int horizon_bars) {
    if (horizon_bars < 1) {
        throw std::invalid_argument("horizon_bars must be at least 1");
    }
    const std::vector<int64_t> timeframes = SortedUnique(timeframes_ms);
    if (!std::binary_search(timeframes.begin(), timeframes.end(), reference_timeframe_ms)) {
        throw std::invalid_argument("reference timeframe " + FormatTimeframe(reference_timeframe_ms)
                                    + " is not among the configured timeframes");
    }

    simulation::Dataset dataset;
    dataset.feature_names = FeatureNames(timeframes);

    size_t droppedIncomplete = 0;
    const size_t horizon = static_cast<size_t>(horizon_bars);
    for (size_t i = 0; i + horizon < aligned.size(); ++i) {
        const AlignedFeatureVector& row = aligned[i];
        if (!row.IsComplete()) {
            ++droppedIncomplete;
            continue;
        }
        const bars::Bar* reference = row.Get(reference_timeframe_ms);
        const bars::Bar* future = aligned[i + horizon].Get(reference_timeframe_ms);
        if (!reference || !future) {
            continue;
        }

        simulation::DatasetRow out;
        out.timestamp_ms = row.reference_timestamp_ms;
        out.target_timestamp_ms = future->period_end_ms();
        out.target = future->close;
        out.previous_actual = reference->close;
        out.features.reserve(dataset.feature_names.size());
        out.features.push_back(reference->close);

        for (int64_t tf : timeframes) {
            const bars::Bar* bar = row.Get(tf);
            if (!bar) {
                break;
            }
            out.features.push_back(RelativeChange(bar->close, reference->close));
            out.features.push_back(RelativeChange(bar->close, bar->open));
            out.features.push_back(SafeRatio(bar->high - bar->low, bar->close));
            out.features.push_back(std::log1p(bar->volume));
            out.features.push_back(static_cast<double>(row.reference_timestamp_ms - bar->period_end_ms())
                                   / static_cast<double>(kMinuteMs));
        }
        if (out.features.size() != dataset.feature_names.size()) {
            ++droppedIncomplete;
            continue;
        }
        dataset.rows.push_back(std::move(out));
    }

    if (droppedIncomplete > 0) {
        SimpleLogger::Debug("Dataset: dropped " + std::to_string(droppedIncomplete)
                            + " rows with absent timeframe slots");
    }
    return dataset;
}

simulation::FeatureMatrix DatasetBuilder::ToFeatureMatrix(const simulation::Dataset& dataset,
                                                          const std::vector<size_t>& rowIndices) {
    simulation::FeatureMatrix matrix;
    matrix.num_rows = static_cast<int>(rowIndices.size());
    matrix.num_features = static_cast<int>(dataset.feature_names.size());
    matrix.feature_names = dataset.feature_names;
    matrix.values.reserve(rowIndices.size() * dataset.feature_names.size());
    for (size_t idx : rowIndices) {
        const auto& features = dataset.rows[idx].features;
        matrix.values.insert(matrix.values.end(), features.begin(), features.end());
    }
    return matrix;
}

} // namespace alignment
} // namespace mtfcast
