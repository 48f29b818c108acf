///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "strategy.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <limits>


///////////////////////////
///      FIXTURES       ///
///////////////////////////
class StrategyTest : public QuietTest {};


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_F(StrategyTest, DefaultPhasesSplitTheBudget) {
    std::vector<Phase> phases = defaultPhases(25);
    ASSERT_EQ(phases.size(), 3u);
    EXPECT_EQ(phases[0].name, "exploration");
    EXPECT_EQ(phases[0].generations, 10);
    EXPECT_EQ(phases[1].generations, 10);
    EXPECT_EQ(phases[2].generations, 5);

    // Exploration favours crossover, exploitation favours annealing.
    EXPECT_GT(phases[0].weights.crossover, phases[2].weights.crossover);
    EXPECT_GT(phases[2].weights.annealing, phases[0].weights.annealing);
}

TEST_F(StrategyTest, TinyBudgetStillGivesEveryPhaseAGeneration) {
    for (int budget : {-4, 0, 1, 2, 3}) {
        std::vector<Phase> phases = defaultPhases(budget);
        ASSERT_EQ(phases.size(), 3u);
        for (const Phase& p : phases) EXPECT_GE(p.generations, 1);
    }
}

TEST_F(StrategyTest, SanitizeDropsBadPhasesAndNormalizes) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<Phase> input = {
            {"ok", 4, {2.0, 1.0, 1.0, 0.0}},
            {"no generations", 0, {1.0, 0.0, 0.0, 0.0}},
            {"negative", 3, {1.0, -0.5, 0.0, 0.0}},
            {"nan", 3, {nan, 1.0, 0.0, 0.0}},
            {"all zero", 3, {0.0, 0.0, 0.0, 0.0}},
    };

    std::vector<Phase> clean = sanitizePhases(input);
    ASSERT_EQ(clean.size(), 1u);
    EXPECT_EQ(clean[0].name, "ok");
    EXPECT_DOUBLE_EQ(clean[0].weights.crossover, 0.5);
    EXPECT_DOUBLE_EQ(clean[0].weights.move, 0.25);
    EXPECT_DOUBLE_EQ(clean[0].weights.swap, 0.25);
    EXPECT_DOUBLE_EQ(clean[0].weights.annealing, 0.0);

    EXPECT_TRUE(sanitizePhases({}).empty());
}

TEST_F(StrategyTest, StreakCountsTheCurrentGeneration) {
    StagnationTracker tracker(3, 2);
    tracker.record(500.0);
    EXPECT_EQ(tracker.streak(), 1);
    tracker.record(500.0);
    EXPECT_FALSE(tracker.shouldExit());
    tracker.record(500.0);
    EXPECT_EQ(tracker.streak(), 3);
    EXPECT_TRUE(tracker.shouldExit());

    tracker.record(510.0);
    EXPECT_EQ(tracker.streak(), 1);
    EXPECT_FALSE(tracker.shouldExit());
}

TEST_F(StrategyTest, InterventionNeedsStreakAndGenerationPastTheLimit) {
    StagnationTracker tracker(10, 2);
    tracker.record(100.0);
    tracker.record(100.0);
    EXPECT_FALSE(tracker.shouldIntervene(1));
    tracker.record(100.0);
    EXPECT_FALSE(tracker.shouldIntervene(2));
    tracker.record(100.0);
    EXPECT_TRUE(tracker.shouldIntervene(3));

    tracker.markAttempted();
    EXPECT_EQ(tracker.streak(), 4);
    for (int gen = 4; gen < 9; ++gen) {
        tracker.record(100.0);
        EXPECT_FALSE(tracker.shouldIntervene(gen));
    }

    tracker.reset();
    for (int gen = 0; gen < 4; ++gen) tracker.record(100.0);
    EXPECT_TRUE(tracker.shouldIntervene(3));
}

TEST_F(StrategyTest, FailedAttemptKeepsTheStreakTowardsExit) {
    StagnationTracker tracker(4, 1);
    tracker.record(700.0);
    tracker.record(700.0);
    ASSERT_TRUE(tracker.shouldIntervene(2));
    tracker.markAttempted();
    tracker.record(700.0);
    tracker.record(700.0);
    EXPECT_TRUE(tracker.shouldExit());

    tracker.resetStreak();
    EXPECT_EQ(tracker.streak(), 0);
    EXPECT_FALSE(tracker.shouldExit());
    tracker.record(700.0);
    EXPECT_EQ(tracker.streak(), 1);
}

TEST_F(StrategyTest, StreakCarriesIntoTheNextPhase) {
    StagnationTracker tracker(3, 1);
    for (int gen = 0; gen < 3; ++gen) tracker.record(250.0);
    ASSERT_TRUE(tracker.shouldExit());
    tracker.markAttempted();

    tracker.startPhase();
    tracker.record(250.0);
    EXPECT_EQ(tracker.streak(), 4);
    EXPECT_TRUE(tracker.shouldExit());
    EXPECT_TRUE(tracker.shouldIntervene(2));
}
