#include "simulation/FoldPlanner.h"

#include "Errors.h"

#include <stdexcept>

namespace mtfcast {
namespace simulation {

std::vector<FoldSpec> FoldPlanner::PlanFolds(const TimeRange& total, const FoldPlanConfig& config) {
    if (config.train_window <= 0 || config.eval_window <= 0 || config.step <= 0) {
        throw std::invalid_argument("train_window, eval_window and step must be positive");
    }
    if (config.gap < 0) {
        throw std::invalid_argument("gap must not be negative");
    }
    if (config.max_folds < 0) {
        throw std::invalid_argument("max_folds must not be negative");
    }

    std::vector<FoldSpec> folds;
    for (int64_t i = 0;; ++i) {
        if (config.max_folds > 0 && static_cast<int64_t>(folds.size()) >= config.max_folds) {
            break;
        }
        FoldSpec fold;
        fold.fold_index = static_cast<int>(i);
        if (config.policy == FoldPolicy::Rolling) {
            fold.train_range.start_ms = total.start_ms + i * config.step;
            fold.train_range.end_ms = fold.train_range.start_ms + config.train_window;
        } else {
            fold.train_range.start_ms = total.start_ms;
            fold.train_range.end_ms = total.start_ms + config.train_window + i * config.step;
        }
        fold.eval_range.start_ms = fold.train_range.end_ms + config.gap;
        fold.eval_range.end_ms = fold.eval_range.start_ms + config.eval_window;

        // Trailing partial folds are dropped, never truncated.
        if (fold.eval_range.end_ms > total.end_ms) {
            break;
        }
        folds.push_back(fold);
    }

    if (folds.empty()) {
        throw InsufficientRangeError("range of " + std::to_string(total.Length())
                                     + " ms cannot hold one fold of train "
                                     + std::to_string(config.train_window) + " + gap "
                                     + std::to_string(config.gap) + " + eval "
                                     + std::to_string(config.eval_window));
    }
    return folds;
}

} // namespace simulation
} // namespace mtfcast
