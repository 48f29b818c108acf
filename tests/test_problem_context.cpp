///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "problem_context.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <stdexcept>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(ProblemContextTest, ResolvesIdsToEntities) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);

    EXPECT_EQ(ctx.batchIndex(20), 1);
    EXPECT_EQ(ctx.batchIndex(99), -1);
    EXPECT_EQ(ctx.facultyIndex(3), 2);
    ASSERT_NE(ctx.subject(3), nullptr);
    EXPECT_EQ(ctx.subject(3)->code, "CL1");
    EXPECT_EQ(ctx.room(42), nullptr);
    EXPECT_EQ(ctx.availabilityFor(1), nullptr);
}

TEST(ProblemContextTest, BuildsRequirementsPerBatchAndSubject) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);

    EXPECT_EQ(ctx.requirements().size(), 3u);
    EXPECT_EQ(ctx.totalSessions(), 5);
    EXPECT_EQ(ctx.requiredSessions(0, 1), 2);
    EXPECT_EQ(ctx.requiredSessions(0, 3), 1);
    EXPECT_EQ(ctx.requiredSessions(1, 3), 0);
    EXPECT_EQ(ctx.requiredSessions(5, 1), 0);
}

TEST(ProblemContextTest, SubjectListedTwiceIsOneRequirement) {
    ProblemInstance inst = makeTinyInstance();
    inst.batches[0].subjectIds = {1, 1, 2};
    ProblemContext ctx(inst);

    EXPECT_EQ(ctx.requirements().size(), 2u);
    EXPECT_EQ(ctx.totalSessions(), 2);
}

TEST(ProblemContextTest, FacultyCandidatesPreferAllocation) {
    ProblemInstance inst = makeSharedInstance();
    inst.faculty[1].subjectIds = {1, 3};
    inst.facultyAllocations.push_back({20, 1, {2}});
    ProblemContext ctx(inst);

    EXPECT_EQ(ctx.facultyCandidates(20, 1), (std::vector<int>{2}));
    EXPECT_EQ(ctx.facultyCandidates(10, 1), (std::vector<int>{1, 2}));
    EXPECT_TRUE(ctx.facultyCandidates(99, 1).empty());
}

TEST(ProblemContextTest, EmptyAllocationFallsBackToQualifiedFaculty) {
    ProblemInstance inst = makeSharedInstance();
    inst.facultyAllocations.push_back({10, 3, {}});
    ProblemContext ctx(inst);

    EXPECT_EQ(ctx.facultyCandidates(10, 3), (std::vector<int>{2, 3}));
}

TEST(ProblemContextTest, RejectsDuplicateIds) {
    ProblemInstance inst = makeSharedInstance();
    inst.rooms.push_back({1, "Copy", 10, RoomType::LECTURE_HALL});
    EXPECT_THROW(ProblemContext ctx(inst), std::invalid_argument);
}

TEST(ProblemContextTest, RejectsUnknownReferences) {
    ProblemInstance badSubject = makeTinyInstance();
    badSubject.batches[0].subjectIds.push_back(77);
    EXPECT_THROW(ProblemContext ctx(badSubject), std::invalid_argument);

    ProblemInstance badRoom = makeTinyInstance();
    badRoom.batches[0].allocatedRoomIds = {9};
    EXPECT_THROW(ProblemContext ctx(badRoom), std::invalid_argument);

    ProblemInstance badAvailability = makeTinyInstance();
    badAvailability.facultyAvailability.push_back({5, {}});
    EXPECT_THROW(ProblemContext ctx(badAvailability), std::invalid_argument);

    ProblemInstance badAllocation = makeTinyInstance();
    badAllocation.facultyAllocations.push_back({1, 1, {8}});
    EXPECT_THROW(ProblemContext ctx(badAllocation), std::invalid_argument);
}

TEST(ProblemContextTest, RejectsInvalidGeometry) {
    ProblemInstance noDays = makeTinyInstance();
    noDays.geometry.workingDays.clear();
    EXPECT_THROW(ProblemContext ctx(noDays), std::invalid_argument);

    ProblemInstance noSlots = makeTinyInstance();
    noSlots.geometry.slotsPerDay = 0;
    EXPECT_THROW(ProblemContext ctx(noSlots), std::invalid_argument);

    ProblemInstance badDay = makeTinyInstance();
    badDay.geometry.workingDays = {0, 7};
    EXPECT_THROW(ProblemContext ctx(badDay), std::invalid_argument);
}

TEST(ProblemContextTest, RejectsPinOutsideTheWeek) {
    ProblemInstance inst = makeTinyInstance();
    inst.geometry.workingDays = {0, 1, 2};
    inst.pinnedAssignments.push_back({1, "Pin", 1, 1, 1, 1, {4}, {0}, 1});
    EXPECT_THROW(ProblemContext ctx(inst), std::invalid_argument);

    ProblemInstance badSlot = makeTinyInstance();
    badSlot.pinnedAssignments.push_back({1, "Pin", 1, 1, 1, 1, {0}, {4}, 1});
    EXPECT_THROW(ProblemContext ctx(badSlot), std::invalid_argument);
}

TEST(ProblemContextTest, ExpandsPinsAndCutsThemAtTheEndOfTheDay) {
    ProblemInstance inst = makeTinyInstance();
    inst.pinnedAssignments.push_back({1, "Double", 1, 1, 1, 1, {0, 2}, {3}, 2});
    ProblemContext ctx(inst);

    const auto& pins = ctx.pinnedPlacements();
    ASSERT_EQ(pins.size(), 2u);
    for (const ClassAssignment& p : pins) {
        EXPECT_TRUE(p.pinned);
        EXPECT_EQ(p.slot, 3);
        EXPECT_EQ(p.facultyIds, (std::vector<int>{1}));
    }
    EXPECT_EQ(pins[0].day, 0);
    EXPECT_EQ(pins[1].day, 2);
}

TEST(ProblemContextTest, EmptyGridMatchesGeometry) {
    ProblemInstance inst = makeTinyInstance();
    inst.geometry.workingDays = {1, 3};
    ProblemContext ctx(inst);

    TimetableGrid grid = ctx.emptyGrid();
    EXPECT_EQ(grid.numBatches(), 1);
    EXPECT_EQ(grid.numDays(), 4);
    EXPECT_EQ(grid.slotsPerDay(), 4);
    EXPECT_TRUE(ctx.isWorkingDay(3));
    EXPECT_FALSE(ctx.isWorkingDay(2));
}

TEST(ProblemContextTest, ValidateGridChecksShapeAndPlacement) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);

    TimetableGrid good = ctx.emptyGrid();
    good.put(0, makeAssignment(1, 1, {1}, 1, 10, 0, 0));
    EXPECT_NO_THROW(ctx.validateGrid(good));

    EXPECT_THROW(ctx.validateGrid(TimetableGrid(1, 5, 4)), std::invalid_argument);

    TimetableGrid wrongRow = ctx.emptyGrid();
    wrongRow.put(1, makeAssignment(1, 1, {1}, 1, 10, 0, 0));
    EXPECT_THROW(ctx.validateGrid(wrongRow), std::invalid_argument);

    TimetableGrid unknownRoom = ctx.emptyGrid();
    unknownRoom.put(0, makeAssignment(1, 1, {1}, 9, 10, 0, 0));
    EXPECT_THROW(ctx.validateGrid(unknownRoom), std::invalid_argument);

    TimetableGrid duplicateId = ctx.emptyGrid();
    duplicateId.put(0, makeAssignment(1, 1, {1}, 1, 10, 0, 0));
    duplicateId.put(1, makeAssignment(1, 1, {1}, 2, 20, 0, 1));
    EXPECT_THROW(ctx.validateGrid(duplicateId), std::invalid_argument);
}
