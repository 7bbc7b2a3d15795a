#include "Errors.h"
#include "simulation/FoldPlanner.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace mtfcast;
using namespace mtfcast::simulation;

namespace {

FoldPlanConfig Config(FoldPolicy policy, int64_t train, int64_t eval, int64_t step, int64_t gap = 0, int maxFolds = 0) {
    FoldPlanConfig config;
    config.policy = policy;
    config.train_window = train;
    config.eval_window = eval;
    config.step = step;
    config.gap = gap;
    config.max_folds = maxFolds;
    return config;
}

void ExpectWellFormed(const std::vector<FoldSpec>& folds, const TimeRange& total) {
    for (size_t i = 0; i < folds.size(); ++i) {
        EXPECT_EQ(folds[i].fold_index, static_cast<int>(i));
        EXPECT_LE(folds[i].train_range.end_ms, folds[i].eval_range.start_ms);
        EXPECT_LE(folds[i].eval_range.end_ms, total.end_ms);
        EXPECT_GE(folds[i].train_range.start_ms, total.start_ms);
        if (i > 0) {
            EXPECT_GT(folds[i].eval_range.start_ms, folds[i - 1].eval_range.start_ms);
        }
    }
}

} // namespace

TEST(FoldPlannerTest, RollingThreeFolds) {
    TimeRange total{0, 160};
    auto folds = FoldPlanner::PlanFolds(total, Config(FoldPolicy::Rolling, 100, 20, 20));
    ASSERT_EQ(folds.size(), 3u);
    EXPECT_EQ(folds[0].train_range, (TimeRange{0, 100}));
    EXPECT_EQ(folds[0].eval_range, (TimeRange{100, 120}));
    EXPECT_EQ(folds[1].train_range, (TimeRange{20, 120}));
    EXPECT_EQ(folds[1].eval_range, (TimeRange{120, 140}));
    EXPECT_EQ(folds[2].train_range, (TimeRange{40, 140}));
    EXPECT_EQ(folds[2].eval_range, (TimeRange{140, 160}));
    ExpectWellFormed(folds, total);
}

TEST(FoldPlannerTest, ExpandingKeepsAnchoredStart) {
    TimeRange total{1000, 1160};
    auto folds = FoldPlanner::PlanFolds(total, Config(FoldPolicy::Expanding, 100, 20, 20));
    ASSERT_EQ(folds.size(), 3u);
    for (size_t i = 0; i < folds.size(); ++i) {
        EXPECT_EQ(folds[i].train_range.start_ms, 1000);
        EXPECT_EQ(folds[i].train_range.Length(), 100 + 20 * static_cast<int64_t>(i));
    }
    EXPECT_EQ(folds[2].eval_range, (TimeRange{1140, 1160}));
    ExpectWellFormed(folds, total);
}

TEST(FoldPlannerTest, GapEmbargoesEvaluation) {
    TimeRange total{0, 200};
    auto folds = FoldPlanner::PlanFolds(total, Config(FoldPolicy::Rolling, 100, 20, 20, 10));
    ASSERT_EQ(folds.size(), 4u);
    for (const auto& fold : folds) {
        EXPECT_EQ(fold.eval_range.start_ms - fold.train_range.end_ms, 10);
    }
    ExpectWellFormed(folds, total);
}

TEST(FoldPlannerTest, TrailingPartialFoldDropped) {
    TimeRange total{0, 175};
    auto folds = FoldPlanner::PlanFolds(total, Config(FoldPolicy::Rolling, 100, 20, 20));
    ASSERT_EQ(folds.size(), 3u);
    EXPECT_EQ(folds.back().eval_range.end_ms, 160);
}

TEST(FoldPlannerTest, MaxFoldsCapsSequence) {
    TimeRange total{0, 1000};
    auto folds = FoldPlanner::PlanFolds(total, Config(FoldPolicy::Rolling, 100, 20, 20, 0, 5));
    EXPECT_EQ(folds.size(), 5u);
}

TEST(FoldPlannerTest, StepSmallerThanEvalStillAdvances) {
    TimeRange total{0, 150};
    auto folds = FoldPlanner::PlanFolds(total, Config(FoldPolicy::Rolling, 100, 30, 5));
    ASSERT_EQ(folds.size(), 5u);
    ExpectWellFormed(folds, total);
}

TEST(FoldPlannerTest, InsufficientRange) {
    EXPECT_THROW(FoldPlanner::PlanFolds({0, 110}, Config(FoldPolicy::Rolling, 100, 20, 20)), InsufficientRangeError);
    EXPECT_THROW(FoldPlanner::PlanFolds({0, 125}, Config(FoldPolicy::Rolling, 100, 20, 20, 10)), InsufficientRangeError);
    EXPECT_NO_THROW(FoldPlanner::PlanFolds({0, 120}, Config(FoldPolicy::Rolling, 100, 20, 20)));
}

TEST(FoldPlannerTest, RejectsNonPositiveLengths) {
    EXPECT_THROW(FoldPlanner::PlanFolds({0, 1000}, Config(FoldPolicy::Rolling, 0, 20, 20)), std::invalid_argument);
    EXPECT_THROW(FoldPlanner::PlanFolds({0, 1000}, Config(FoldPolicy::Rolling, 100, 0, 20)), std::invalid_argument);
    EXPECT_THROW(FoldPlanner::PlanFolds({0, 1000}, Config(FoldPolicy::Rolling, 100, 20, 0)), std::invalid_argument);
    EXPECT_THROW(FoldPlanner::PlanFolds({0, 1000}, Config(FoldPolicy::Rolling, 100, 20, -5)), std::invalid_argument);
    EXPECT_THROW(FoldPlanner::PlanFolds({0, 1000}, Config(FoldPolicy::Rolling, 100, 20, 20, -1)), std::invalid_argument);
}

TEST(FoldPlannerTest, SameInputSamePlan) {
    auto config = Config(FoldPolicy::Expanding, 300, 50, 25, 5);
    auto a = FoldPlanner::PlanFolds({0, 2000}, config);
    auto b = FoldPlanner::PlanFolds({0, 2000}, config);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].train_range, b[i].train_range);
        EXPECT_EQ(a[i].eval_range, b[i].eval_range);
    }
}
