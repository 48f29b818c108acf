///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "problem_context.hpp"
#include "test_fixtures.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <random>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

int countType(const std::vector<Conflict>& conflicts, ConflictType type) {
    return (int)std::count_if(conflicts.begin(), conflicts.end(),
                              [type](const Conflict& c) { return c.type == type; });
}

} // namespace


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(AvailabilityOracleTest, BatchFreeRespectsOccupancyAndWorkingDays) {
    ProblemInstance inst = makeTinyInstance();
    inst.geometry.workingDays = {0, 2};
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(5, 1, {1}, 1, 1, 0, 1));
    AvailabilityOracle oracle(ctx, grid);

    EXPECT_TRUE(oracle.batchFree(1, 0, 0));
    EXPECT_FALSE(oracle.batchFree(1, 0, 1));
    EXPECT_TRUE(oracle.batchFree(1, 0, 1, 5));
    EXPECT_FALSE(oracle.batchFree(1, 1, 0));   // not a working day
    EXPECT_FALSE(oracle.batchFree(1, 3, 0));   // outside the grid
    EXPECT_FALSE(oracle.batchFree(42, 0, 0));  // unknown batch
}

TEST(AvailabilityOracleTest, AvailabilityRecordLimitsTeachingSlots) {
    ProblemInstance inst = makeTinyInstance();
    inst.facultyAvailability.push_back({1, DaySlotMap{{0, {0, 1}}}});
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    AvailabilityOracle oracle(ctx, grid);

    EXPECT_TRUE(oracle.facultyAvailable(1, 0, 1));
    EXPECT_FALSE(oracle.facultyAvailable(1, 0, 2));
    EXPECT_FALSE(oracle.facultyAvailable(1, 1, 0));
    EXPECT_TRUE(oracle.facultyAvailable(2, 3, 3));
    EXPECT_FALSE(oracle.facultyFree(1, 1, 0));
}

TEST(AvailabilityOracleTest, FacultyFreeSeesEveryBatch) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(1, 1, {1}, 1, 10, 2, 2));
    AvailabilityOracle oracle(ctx, grid);

    EXPECT_FALSE(oracle.facultyFree(1, 2, 2));
    EXPECT_TRUE(oracle.facultyFree(1, 2, 2, 1));
    EXPECT_TRUE(oracle.facultyFree(1, 2, 3));
    EXPECT_FALSE(oracle.facultyFree(99, 0, 0));
}

TEST(AvailabilityOracleTest, RoomMustMatchTypeCapacityAndRestriction) {
    ProblemInstance inst = makeSharedInstance();
    inst.rooms.push_back({4, "Tiny", 20, RoomType::LECTURE_HALL});
    inst.batches[1].allocatedRoomIds = {2};
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    AvailabilityOracle oracle(ctx, grid);

    EXPECT_TRUE(oracle.roomSuitable(1, 10, 1));
    EXPECT_FALSE(oracle.roomSuitable(3, 10, 1));  // lab for theory
    EXPECT_TRUE(oracle.roomSuitable(3, 10, 3));
    EXPECT_FALSE(oracle.roomSuitable(4, 10, 1));  // too small
    EXPECT_FALSE(oracle.roomSuitable(1, 20, 1));  // outside the restriction
    EXPECT_TRUE(oracle.roomSuitable(2, 20, 1));
}

TEST(AvailabilityOracleTest, RoomFreeChecksBookings) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(1, makeAssignment(8, 1, {1}, 1, 20, 0, 0));
    AvailabilityOracle oracle(ctx, grid);

    EXPECT_FALSE(oracle.roomFree(1, 0, 0, 10, 1));
    EXPECT_TRUE(oracle.roomFree(1, 0, 0, 10, 1, 8));
    EXPECT_TRUE(oracle.roomFree(2, 0, 0, 10, 1));
}

TEST(AvailabilityOracleTest, PracticalNeedsTwoFreeFaculty) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    AvailabilityOracle oracle(ctx, grid);

    auto staff = oracle.selectFaculty(10, 3, 1, 1);
    ASSERT_TRUE(staff.has_value());
    EXPECT_EQ(*staff, (std::vector<int>{2, 3}));

    // Curie is already teaching batch 20 at (1, 1).
    grid.put(1, makeAssignment(4, 1, {3}, 2, 20, 1, 1));
    EXPECT_FALSE(oracle.selectFaculty(10, 3, 1, 1).has_value());
}

TEST(AvailabilityOracleTest, SelectRoomOnlyReturnsFreeSuitableRooms) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(1, makeAssignment(4, 1, {1}, 1, 20, 0, 0));
    AvailabilityOracle oracle(ctx, grid);
    std::mt19937 rng(3);

    for (int i = 0; i < 20; ++i) {
        auto room = oracle.selectRoom(10, 1, 0, 0, rng);
        ASSERT_TRUE(room.has_value());
        EXPECT_EQ(*room, 2);
    }
    grid.put(0, makeAssignment(5, 1, {1}, 2, 10, 0, 0));
    EXPECT_FALSE(oracle.selectRoom(10, 1, 0, 0, rng).has_value());
}

TEST(DrawPlacementTest, ProducesFeasibleSessionOnEmptyGrid) {
    ProblemInstance inst = makeTinyInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    std::mt19937 rng(11);

    auto a = drawPlacement(ctx, grid, 1, 2, rng);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->id, 0);
    EXPECT_EQ(a->subjectId, 2);
    EXPECT_EQ(a->facultyIds, (std::vector<int>{2}));
    EXPECT_EQ(a->roomId, 1);
    EXPECT_EQ(a->batchId, 1);
    EXPECT_TRUE(ctx.isWorkingDay(a->day));
    EXPECT_GE(a->slot, 0);
    EXPECT_LT(a->slot, 4);
    EXPECT_FALSE(a->pinned);
}

TEST(DrawPlacementTest, FailsWithoutQualifiedFaculty) {
    ProblemInstance inst = makeTinyInstance();
    inst.faculty[1].subjectIds.clear();
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    std::mt19937 rng(5);

    for (int i = 0; i < 10; ++i) EXPECT_FALSE(drawPlacement(ctx, grid, 1, 2, rng).has_value());
}

TEST(DetectConflictsTest, CleanTimetableHasNoConflicts) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(1, 1, {1}, 1, 10, 0, 0));
    grid.put(1, makeAssignment(2, 1, {1}, 1, 20, 0, 1));
    grid.put(0, makeAssignment(3, 3, {2, 3}, 3, 10, 0, 1));

    EXPECT_TRUE(detectConflicts(ctx, grid).empty());
}

TEST(DetectConflictsTest, ReportsSharedRoomAndFaculty) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(1, 1, {1}, 1, 10, 2, 2));
    grid.put(1, makeAssignment(2, 1, {1}, 1, 20, 2, 2));

    std::vector<Conflict> conflicts = detectConflicts(ctx, grid);
    EXPECT_EQ(countType(conflicts, ConflictType::ROOM), 1);
    EXPECT_EQ(countType(conflicts, ConflictType::FACULTY), 1);
    EXPECT_EQ(countType(conflicts, ConflictType::BATCH), 0);
    for (const Conflict& c : conflicts) {
        EXPECT_EQ(c.involvedIds, (std::vector<int>{1, 2}));
        EXPECT_FALSE(c.description.empty());
    }
}

TEST(DetectConflictsTest, ReportsRoomTooSmall) {
    ProblemInstance inst = makeTinyInstance();
    inst.rooms[0].capacity = 20;
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(1, 1, {1}, 1, 1, 0, 0));

    std::vector<Conflict> conflicts = detectConflicts(ctx, grid);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].type, ConflictType::CAPACITY);
    EXPECT_EQ(toString(conflicts[0].type), "CAPACITY");
}

TEST(DetectConflictsTest, ReportsBatchClashFromMisfiledCell) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(1, 1, {1}, 1, 10, 0, 0));
    // Filed under batch 20's row but attended by batch 10.
    grid.put(1, makeAssignment(2, 3, {2, 3}, 3, 10, 0, 0));

    std::vector<Conflict> conflicts = detectConflicts(ctx, grid);
    EXPECT_EQ(countType(conflicts, ConflictType::BATCH), 1);
}
