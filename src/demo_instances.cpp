///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include <algorithm>
#include <string>


///////////////////////////
///     DEMO: SMALL     ///
///////////////////////////
static ProblemInstance makeDemoSmall() {
    ProblemInstance inst;
    inst.geometry.workingDays = {0, 1, 2, 3, 4};
    inst.geometry.slotsPerDay = 6;

    inst.rooms.push_back({0, "A101", 60, RoomType::LECTURE_HALL});
    inst.rooms.push_back({1, "A102", 40, RoomType::LECTURE_HALL});
    inst.rooms.push_back({2, "LAB1", 35, RoomType::LAB});

    inst.subjects.push_back({0, "Mathematics", "MA101", SubjectType::THEORY, 4});
    inst.subjects.push_back({1, "Programming", "CS101", SubjectType::THEORY, 3});
    inst.subjects.push_back({2, "Programming Lab", "CS101L", SubjectType::PRACTICAL, 2});
    inst.subjects.push_back({3, "Physics", "PH101", SubjectType::THEORY, 3});
    inst.subjects.push_back({4, "Seminar", "SE100", SubjectType::THEORY, 1});

    Faculty alice;
    alice.id = 0;
    alice.name = "Prof. Alice";
    alice.subjectIds = {0, 4};
    alice.preferredSlots = DaySlotMap{{0, {0, 1, 2}}, {1, {0, 1, 2}}, {2, {0, 1, 2}},
                                      {3, {0, 1, 2}}, {4, {0, 1, 2}}};

    Faculty bob;
    bob.id = 1;
    bob.name = "Prof. Bob";
    bob.subjectIds = {1, 2};

    Faculty carol;
    carol.id = 2;
    carol.name = "Dr. Carol";
    carol.subjectIds = {2, 3};

    Faculty dan;
    dan.id = 3;
    dan.name = "Dr. Dan";
    dan.subjectIds = {0, 3};

    inst.faculty = {alice, bob, carol, dan};

    inst.batches.push_back({0, "CS-1A", 35, {0, 1, 2, 3, 4}, {}});
    inst.batches.push_back({1, "CS-1B", 30, {0, 1, 2, 3}, {}});

    // Dan only teaches on Monday to Wednesday mornings.
    inst.facultyAvailability.push_back({3, DaySlotMap{{0, {0, 1, 2, 3}}, {1, {0, 1, 2, 3}}, {2, {0, 1, 2, 3}}}});

    // Batch B always gets Bob for programming.
    inst.facultyAllocations.push_back({1, 1, {1}});

    // Weekly seminar of batch A on Friday afternoon.
    inst.pinnedAssignments.push_back({0, "Friday seminar", 4, 0, 0, 0, {4}, {4}, 1});
    return inst;
}


///////////////////////////
///   DEMO: GENERATED   ///
///////////////////////////
/**
 * @brief Generated department: every subject has two qualified lecturers and
 * every batch takes a rotating selection of subjects.
 *
 * @param numBatches       Number of batches.
 * @param numSubjects      Number of subjects (every fourth one is a practical).
 * @param subjectsPerBatch Subjects taken by each batch.
 * @param numLectureHalls  Lecture rooms; labs are half as many (at least one).
 */
static ProblemInstance makeDemoDepartment(int numBatches, int numSubjects, int subjectsPerBatch,
                                          int numLectureHalls) {
    ProblemInstance inst;
    inst.geometry.workingDays = {0, 1, 2, 3, 4};
    inst.geometry.slotsPerDay = 7;

    int roomId = 0;
    for (int r = 0; r < numLectureHalls; ++r)
        inst.rooms.push_back({roomId++, "LH" + std::to_string(r + 1), 60 + 10 * (r % 3), RoomType::LECTURE_HALL});
    for (int r = 0; r < std::max(1, numLectureHalls / 2); ++r)
        inst.rooms.push_back({roomId++, "LAB" + std::to_string(r + 1), 45, RoomType::LAB});

    for (int s = 0; s < numSubjects; ++s) {
        bool practical = s % 4 == 3;
        inst.subjects.push_back({s,
                                 (practical ? "Lab " : "Course ") + std::to_string(s + 1),
                                 (practical ? "LB" : "CO") + std::to_string(100 + s),
                                 practical ? SubjectType::PRACTICAL : SubjectType::THEORY,
                                 practical ? 2 : 3});
    }

    // Faculty f teaches subjects f and f+1 (mod numSubjects).
    for (int f = 0; f < numSubjects; ++f) {
        Faculty fac;
        fac.id = f;
        fac.name = "Lecturer " + std::to_string(f + 1);
        fac.subjectIds = {f, (f + 1) % numSubjects};
        if (f % 3 == 0) {
            DaySlotMap mornings;
            for (int d : inst.geometry.workingDays) mornings[d] = {0, 1, 2, 3};
            fac.preferredSlots = mornings;
        }
        inst.faculty.push_back(fac);
    }

    for (int b = 0; b < numBatches; ++b) {
        Batch batch;
        batch.id = b;
        batch.name = "Batch " + std::to_string(b + 1);
        batch.studentCount = 30 + 5 * (b % 3);
        for (int k = 0; k < subjectsPerBatch; ++k)
            batch.subjectIds.push_back((b * 2 + k) % numSubjects);
        inst.batches.push_back(batch);
    }

    // One pinned theory session per batch on Monday, first slot.
    int pinId = 0;
    for (int b = 0; b < numBatches; ++b) {
        for (int sid : inst.batches[b].subjectIds) {
            if (inst.subjects[sid].type != SubjectType::THEORY) continue;
            int fid = sid;
            int room = b % numLectureHalls;
            // Lecture halls are shared, so only pin where the hall is still free.
            if (b >= numLectureHalls) break;
            inst.pinnedAssignments.push_back({pinId++, "Opening lecture " + inst.batches[b].name,
                                              sid, fid, room, b, {0}, {0}, 1});
            break;
        }
    }
    return inst;
}

ProblemInstance makeDemoInstance(DemoSize size) {
    switch (size) {
        case DemoSize::S: return makeDemoSmall();
        case DemoSize::M: return makeDemoDepartment(4, 8, 5, 4);
        case DemoSize::L: return makeDemoDepartment(8, 14, 6, 6);
    }
    return makeDemoSmall();
}
