#pragma once

#include "simulation/SimulationTypes.h"

#include <cstdint>
#include <vector>

namespace mtfcast {
namespace simulation {

// Walk-forward fold layout. All lengths are in milliseconds.
struct FoldPlanConfig {
    FoldPolicy policy = FoldPolicy::Rolling;
    int64_t train_window = 0;
    int64_t eval_window = 0;
    int64_t step = 0;
    int64_t gap = 0;        // Embargo between train end and eval start
    int max_folds = 0;      // 0 = unlimited
};

class FoldPlanner {
public:
    // Pure function of its inputs. Folds whose eval range would pass total.end_ms are
    // not emitted. Throws std::invalid_argument for non-positive lengths or a negative
    // gap, and InsufficientRangeError when not even one fold fits.
    static std::vector<FoldSpec> PlanFolds(const TimeRange& total, const FoldPlanConfig& config);
};

} // namespace simulation
} // namespace mtfcast
