///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "substitutes.hpp"
#include "constraints.hpp"
#include "fitness.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/// Sessions taught and idle slots of one faculty member over the week.
void teachingLoad(const TimetableGrid& grid, int facultyId, int& workload, int& gaps) {
    std::vector<std::vector<bool>> busy(grid.numDays(), std::vector<bool>(grid.slotsPerDay(), false));
    workload = 0;
    for (const ClassAssignment& a : grid.assignments()) {
        if (std::find(a.facultyIds.begin(), a.facultyIds.end(), facultyId) == a.facultyIds.end()) continue;
        ++workload;
        busy[a.day][a.slot] = true;
    }
    gaps = 0;
    for (const std::vector<bool>& day : busy) gaps += countGaps(day);
}

bool allocatedTo(const ProblemInstance& inst, int batchId, int facultyId) {
    return std::any_of(inst.facultyAllocations.begin(), inst.facultyAllocations.end(),
                       [&](const FacultyAllocation& a) {
                           return a.batchId == batchId &&
                                  std::find(a.facultyIds.begin(), a.facultyIds.end(), facultyId) != a.facultyIds.end();
                       });
}

} // namespace


///////////////////////////
///     SUBSTITUTES     ///
///////////////////////////
SubstituteRequest buildSubstituteRequest(const ProblemContext& ctx, const TimetableGrid& grid, int assignmentId) {
    int b, day, slot;
    if (!grid.locate(assignmentId, b, day, slot)) {
        throw std::invalid_argument("assignment " + std::to_string(assignmentId) + " is not in the timetable");
    }
    const ClassAssignment& target = *grid.at(b, day, slot);

    SubstituteRequest request;
    request.assignmentId = assignmentId;
    request.subjectId = target.subjectId;
    request.batchId = target.batchId;
    const Subject* subject = ctx.subject(target.subjectId);
    const Batch* batch = ctx.batch(target.batchId);
    request.subjectName = subject ? subject->name : "";
    request.batchName = batch ? batch->name : "";

    AvailabilityOracle oracle(ctx, grid);
    for (const Faculty& f : ctx.instance().faculty) {
        if (std::find(target.facultyIds.begin(), target.facultyIds.end(), f.id) != target.facultyIds.end()) continue;
        if (!oracle.facultyFree(f.id, day, slot)) continue;

        SubstituteCandidate c;
        c.facultyId = f.id;
        c.name = f.name;
        for (int sid : f.subjectIds) {
            if (ctx.subject(sid)) c.suitableSubjectIds.push_back(sid);
        }
        if (c.suitableSubjectIds.empty()) continue;

        teachingLoad(grid, f.id, c.workload, c.gapCount);
        c.canTeachSubject = std::find(c.suitableSubjectIds.begin(), c.suitableSubjectIds.end(),
                                      target.subjectId) != c.suitableSubjectIds.end();
        c.allocatedToBatch = allocatedTo(ctx.instance(), target.batchId, f.id);
        request.candidates.push_back(c);
    }
    return request;
}

std::vector<RankedSubstitute> rankByPriorities(const SubstituteRequest& request) {
    int maxWorkload = 0, maxGaps = 0, minWorkload = -1;
    for (const SubstituteCandidate& c : request.candidates) {
        maxWorkload = std::max(maxWorkload, c.workload);
        maxGaps = std::max(maxGaps, c.gapCount);
        if (minWorkload < 0 || c.workload < minWorkload) minWorkload = c.workload;
    }

    std::vector<RankedSubstitute> ranked;
    for (const SubstituteCandidate& c : request.candidates) {
        RankedSubstitute r;
        r.candidate = c;
        double points = 0.0;
        if (c.canTeachSubject) {
            points += 40.0;
            r.reasons.push_back("Can teach the original subject");
        }
        if (c.allocatedToBatch) {
            points += 25.0;
            r.reasons.push_back("Already allocated to this batch");
        }
        points += maxWorkload == 0 ? 20.0 : 20.0 * (1.0 - (double)c.workload / maxWorkload);
        if (c.workload == minWorkload) r.reasons.push_back("Has a light workload this week");
        points += maxGaps == 0 ? 15.0 : 15.0 * (1.0 - (double)c.gapCount / maxGaps);
        if (c.gapCount == 0) r.reasons.push_back("Maintains a compact schedule");

        r.score = (int)std::lround(points);
        ranked.push_back(r);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedSubstitute& a, const RankedSubstitute& b) { return a.score > b.score; });
    return ranked;
}

std::vector<RankedSubstitute> unrankedSubstitutes(const std::vector<SubstituteCandidate>& candidates) {
    std::vector<RankedSubstitute> out;
    for (const SubstituteCandidate& c : candidates) out.push_back({c, 50, {"Availability confirmed."}});
    return out;
}
