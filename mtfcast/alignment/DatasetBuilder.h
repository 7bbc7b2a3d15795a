#pragma once

#include "alignment/TemporalAligner.h"
#include "simulation/SimulationTypes.h"

#include <cstdint>
#include <vector>

namespace mtfcast {
namespace alignment {

// Turns aligned vectors into model rows.
//
// Per timeframe (ascending) the row carries five features derived from the joined bar:
//   <tf>_rel_close      close / reference close - 1
//   <tf>_return         close / open - 1
//   <tf>_range          (high - low) / close
//   <tf>_log_volume     log1p(volume)
//   <tf>_staleness_min  minutes between the bar's close and the reference timestamp
// preceded by ref_close, the reference bar's close.
//
// The target is the reference close `horizon_bars` rows later; its period end is the
// target timestamp. Rows with an absent slot or no target are dropped.
class DatasetBuilder {
public:
    static simulation::Dataset BuildDataset(const std::vector<AlignedFeatureVector>& aligned,
                                            int64_t reference_timeframe_ms,
                                            const std::vector<int64_t>& timeframes_ms,
                                            int horizon_bars);

    static std::vector<std::string> FeatureNames(const std::vector<int64_t>& timeframes_ms);

    // Copies the rows into the row-major layout models consume.
    static simulation::FeatureMatrix ToFeatureMatrix(const simulation::Dataset& dataset,
                                                     const std::vector<size_t>& rowIndices);
};

} // namespace alignment
} // namespace mtfcast
