///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "fitness.hpp"
#include "problem_context.hpp"
#include "test_fixtures.hpp"
#include <cmath>
#include <gtest/gtest.h>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(FitnessHelpersTest, CountGapsBetweenFirstAndLastSlot) {
    EXPECT_EQ(countGaps({}), 0);
    EXPECT_EQ(countGaps({false, false, false}), 0);
    EXPECT_EQ(countGaps({true, false, true}), 1);
    EXPECT_EQ(countGaps({false, true, true, false}), 0);
    EXPECT_EQ(countGaps({true, false, false, true, false, true}), 3);
}

TEST(FitnessHelpersTest, WorkloadStdDevIsPopulationDeviation) {
    EXPECT_DOUBLE_EQ(workloadStdDev({}), 0.0);
    EXPECT_DOUBLE_EQ(workloadStdDev({5}), 0.0);
    EXPECT_DOUBLE_EQ(workloadStdDev({2, 4}), 1.0);
    EXPECT_DOUBLE_EQ(workloadStdDev({3, 3, 3}), 0.0);
}

TEST(FitnessHelpersTest, CombineScoreStaysWithinBounds) {
    ConstraintWeights w;
    EXPECT_DOUBLE_EQ(combineScore(w, 0, 0, 0.0, 0), kMaxScore);
    EXPECT_DOUBLE_EQ(combineScore(w, 1, 2, 1.5, 1), 1000.0 - 10.0 - 10.0 - 3.0 - 3.0);
    EXPECT_DOUBLE_EQ(combineScore(w, 500, 0, 0.0, 0), 0.0);
}

TEST(FitnessEvaluatorTest, EmptyTimetableIsPerfectButUnplaced) {
    ProblemInstance inst = makeTinyInstance();
    ProblemContext ctx(inst);
    FitnessEvaluator fitness(ctx, inst.weights);

    TimetableMetrics m = fitness.evaluate(ctx.emptyGrid());
    EXPECT_DOUBLE_EQ(m.score, kMaxScore);
    EXPECT_EQ(m.unplacedSessions, 2);
    EXPECT_EQ(m.hardConflicts, 0);
}

TEST(FitnessEvaluatorTest, CountsStudentGaps) {
    ProblemInstance inst = makeTinyInstance();
    ProblemContext ctx(inst);
    FitnessEvaluator fitness(ctx, inst.weights);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(1, 1, {1}, 1, 1, 0, 0));
    grid.put(0, makeAssignment(2, 2, {2}, 1, 1, 0, 2));

    TimetableMetrics m = fitness.evaluate(grid);
    EXPECT_EQ(m.studentGaps, 1);
    EXPECT_EQ(m.facultyGaps, 0);
    EXPECT_DOUBLE_EQ(m.facultyWorkloadStdDev, 0.0);
    EXPECT_EQ(m.unplacedSessions, 0);
    EXPECT_DOUBLE_EQ(m.score, 990.0);
    EXPECT_DOUBLE_EQ(fitness.score(grid), m.score);
}

TEST(FitnessEvaluatorTest, CountsFacultyGapsAndWorkloadAcrossBatches) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    FitnessEvaluator fitness(ctx, inst.weights);
    TimetableGrid grid = ctx.emptyGrid();
    // Ada teaches slot 0 for B10 and slot 3 for B20 on Monday.
    grid.put(0, makeAssignment(1, 1, {1}, 1, 10, 0, 0));
    grid.put(1, makeAssignment(2, 1, {1}, 1, 20, 0, 3));

    TimetableMetrics m = fitness.evaluate(grid);
    EXPECT_EQ(m.studentGaps, 0);
    EXPECT_EQ(m.facultyGaps, 2);
    // Loads {2, 0, 0}: mean 2/3.
    EXPECT_NEAR(m.facultyWorkloadStdDev, std::sqrt(8.0 / 9.0), 1e-9);
    EXPECT_EQ(m.unplacedSessions, 3);
}

TEST(FitnessEvaluatorTest, CountsPreferenceViolations) {
    ProblemInstance inst = makeTinyInstance();
    inst.faculty[0].preferredSlots = DaySlotMap{{0, {1}}};
    ProblemContext ctx(inst);
    FitnessEvaluator fitness(ctx, inst.weights);

    EXPECT_TRUE(fitness.violatesPreference(1, 0, 0));
    EXPECT_FALSE(fitness.violatesPreference(1, 0, 1));
    EXPECT_TRUE(fitness.violatesPreference(1, 2, 1));
    EXPECT_FALSE(fitness.violatesPreference(2, 0, 0));

    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(1, 1, {1}, 1, 1, 3, 0));
    TimetableMetrics m = fitness.evaluate(grid);
    EXPECT_EQ(m.preferenceViolations, 1);
}

TEST(FitnessEvaluatorTest, HardConflictsAreCountedButNotScored) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    FitnessEvaluator fitness(ctx, inst.weights);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(1, 1, {1}, 1, 10, 0, 0));
    grid.put(1, makeAssignment(2, 1, {1}, 1, 20, 0, 0));

    TimetableMetrics m = fitness.evaluate(grid);
    EXPECT_EQ(m.hardConflicts, 2);
    EXPECT_DOUBLE_EQ(m.score, fitness.score(grid));
}

TEST(FitnessEvaluatorTest, WeightsScaleThePenalty) {
    ProblemInstance inst = makeTinyInstance();
    ProblemContext ctx(inst);
    ConstraintWeights heavy;
    heavy.studentGap = 100.0;
    FitnessEvaluator fitness(ctx, heavy);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(1, 1, {1}, 1, 1, 1, 0));
    grid.put(0, makeAssignment(2, 2, {2}, 1, 1, 1, 3));

    EXPECT_DOUBLE_EQ(fitness.score(grid), 800.0);
}

TEST(CpuPopulationEvaluatorTest, MatchesSingleEvaluations) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    FitnessEvaluator fitness(ctx, inst.weights);

    std::vector<Candidate> population;
    for (int k = 0; k < 6; ++k) {
        TimetableGrid grid = ctx.emptyGrid();
        grid.put(0, makeAssignment(1, 1, {1}, 1, 10, 0, 0));
        grid.put(1, makeAssignment(2, 1, {1}, 2, 20, k % 5, k % 4));
        population.push_back({grid, TimetableMetrics()});
    }

    CpuPopulationEvaluator evaluator(fitness, 4);
    evaluator.evaluate(population);
    for (const Candidate& c : population) {
        TimetableMetrics expected = fitness.evaluate(c.timetable);
        EXPECT_DOUBLE_EQ(c.metrics.score, expected.score);
        EXPECT_EQ(c.metrics.hardConflicts, expected.hardConflicts);
        EXPECT_EQ(c.metrics.unplacedSessions, expected.unplacedSessions);
    }
}
