///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "fitness.hpp"
#include "population.hpp"
#include "problem_context.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <random>
#include <set>


///////////////////////////
///      FIXTURES       ///
///////////////////////////
class PopulationTest : public QuietTest {};


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_F(PopulationTest, PlacesEveryRequiredSessionOfTheTinyInstance) {
    ProblemInstance inst = makeTinyInstance();
    ProblemContext ctx(inst);
    PopulationInitializer init(ctx, 1);
    FitnessEvaluator fitness(ctx, inst.weights);

    for (const TimetableGrid& grid : init.initialize(8, 17)) {
        EXPECT_EQ(grid.size(), 2);
        TimetableMetrics m = fitness.evaluate(grid);
        EXPECT_EQ(m.unplacedSessions, 0);
        EXPECT_EQ(m.hardConflicts, 0);
    }
}

TEST_F(PopulationTest, IndividualsRespectHardConstraints) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    PopulationInitializer init(ctx, 2);

    for (const TimetableGrid& grid : init.initialize(10, 5)) {
        EXPECT_TRUE(detectConflicts(ctx, grid).empty());
        std::set<int> ids;
        for (const ClassAssignment& a : grid.assignments()) {
            EXPECT_TRUE(ids.insert(a.id).second);
            EXPECT_GE((int)a.facultyIds.size(), ctx.subject(a.subjectId)->requiredFacultyCount());
        }
    }
}

TEST_F(PopulationTest, PinnedSessionIsInEveryIndividual) {
    ProblemInstance inst = makeTinyInstance();
    inst.pinnedAssignments.push_back({1, "Friday algebra", 1, 1, 1, 1, {4}, {1}, 1});
    ProblemContext ctx(inst);
    PopulationInitializer init(ctx, 1);

    for (const TimetableGrid& grid : init.initialize(12, 99)) {
        const ClassAssignment* pin = grid.at(0, 4, 1);
        ASSERT_NE(pin, nullptr);
        EXPECT_TRUE(pin->pinned);
        EXPECT_EQ(pin->subjectId, 1);
        // The pin already covers the algebra hour; only databases is added.
        EXPECT_EQ(grid.size(), 2);
    }
}

TEST_F(PopulationTest, PopulationDoesNotDependOnThreadCount) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);

    std::vector<TimetableGrid> serial = PopulationInitializer(ctx, 1).initialize(9, 2024);
    std::vector<TimetableGrid> parallel = PopulationInitializer(ctx, 4).initialize(9, 2024);
    ASSERT_EQ(serial.size(), parallel.size());
    for (size_t i = 0; i < serial.size(); ++i) EXPECT_TRUE(serial[i].sameContent(parallel[i]));
}

TEST_F(PopulationTest, BaselineBecomesFirstIndividualWithPins) {
    ProblemInstance inst = makeTinyInstance();
    inst.pinnedAssignments.push_back({1, "Pin", 1, 1, 1, 1, {2}, {0}, 1});
    ProblemContext ctx(inst);
    PopulationInitializer init(ctx, 1);

    TimetableGrid baseline = ctx.emptyGrid();
    baseline.put(0, makeAssignment(1, 2, {2}, 1, 1, 3, 3));

    std::vector<TimetableGrid> population = init.initialize(4, 1, &baseline);
    ASSERT_EQ(population.size(), 4u);
    ASSERT_NE(population[0].at(0, 3, 3), nullptr);
    EXPECT_EQ(population[0].at(0, 3, 3)->subjectId, 2);
    ASSERT_NE(population[0].at(0, 2, 0), nullptr);
    EXPECT_TRUE(population[0].at(0, 2, 0)->pinned);
    EXPECT_EQ(population[0].size(), 2);
}

TEST_F(PopulationTest, ImpossibleSessionsAreLeftForRepair) {
    ProblemInstance inst = makeTinyInstance();
    inst.subjects[1].hoursPerWeek = 30;  // more than the 20 cells of the week
    ProblemContext ctx(inst);
    PopulationInitializer init(ctx, 1);
    std::mt19937 rng(8);

    TimetableGrid grid = init.buildIndividual(rng);
    EXPECT_LE(grid.size(), 20);
    EXPECT_TRUE(detectConflicts(ctx, grid).empty());
}

TEST_F(PopulationTest, EmptyPopulationRequest) {
    ProblemInstance inst = makeTinyInstance();
    ProblemContext ctx(inst);
    EXPECT_TRUE(PopulationInitializer(ctx, 1).initialize(0, 1).empty());
}
