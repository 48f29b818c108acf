///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "repair.hpp"
#include "constraints.hpp"
#include <set>
#include <spdlog/spdlog.h>
#include <utility>
#include <unordered_map>
#include <vector>


///////////////////////////
///       REPAIR        ///
///////////////////////////
RepairEngine::RepairEngine(const ProblemContext& ctx, int attemptsPerSession)
        : ctx_(ctx), attemptsPerSession_(attemptsPerSession) {}

bool RepairEngine::canKeep(const ClassAssignment& a, const TimetableGrid& kept) const {
    if (!ctx_.isWorkingDay(a.day)) return false;

    const Subject* subject = ctx_.subject(a.subjectId);
    if (!subject) return false;

    // Staffing below the subject's minimum headcount.
    std::set<int> staff(a.facultyIds.begin(), a.facultyIds.end());
    if ((int)staff.size() < subject->requiredFacultyCount()) return false;

    AvailabilityOracle oracle(ctx_, kept);
    if (!oracle.roomFree(a.roomId, a.day, a.slot, a.batchId, a.subjectId, a.id)) return false;
    for (int fid : staff) {
        if (!oracle.facultyFree(fid, a.day, a.slot, a.id)) return false;
    }
    return true;
}

RepairReport RepairEngine::repair(TimetableGrid& grid, std::mt19937& rng) const {
    RepairReport report;
    TimetableGrid kept = ctx_.emptyGrid();

    // 1. Prime occupancy with the pinned sessions.
    std::vector<std::unordered_map<int, int>> placed(grid.numBatches());
    for (int b = 0; b < grid.numBatches(); ++b) {
        for (int d = 0; d < grid.numDays(); ++d) {
            for (int s = 0; s < grid.slotsPerDay(); ++s) {
                const ClassAssignment* a = grid.at(b, d, s);
                if (!a || !a->pinned) continue;
                kept.put(b, *a);
                ++placed[b][a->subjectId];
            }
        }
    }

    // 2. Keep each movable session only if it fits around what is already kept.
    for (int b = 0; b < grid.numBatches(); ++b) {
        for (int d = 0; d < grid.numDays(); ++d) {
            for (int s = 0; s < grid.slotsPerDay(); ++s) {
                const ClassAssignment* a = grid.at(b, d, s);
                if (!a || a->pinned) continue;
                if (placed[b][a->subjectId] >= ctx_.requiredSessions(b, a->subjectId)) {
                    ++report.surplusRemoved;
                    continue;
                }
                if (!canKeep(*a, kept)) {
                    ++report.conflictsRemoved;
                    continue;
                }
                kept.put(b, *a);
                ++placed[b][a->subjectId];
            }
        }
    }

    // 3-4. Fill every shortfall with fresh random placements.
    for (const SessionRequirement& req : ctx_.requirements()) {
        int missing = req.sessions - placed[req.batchIndex][req.subjectId];
        for (int k = 0; k < missing; ++k) {
            bool done = false;
            for (int attempt = 0; attempt < attemptsPerSession_ && !done; ++attempt) {
                auto placement = drawPlacement(ctx_, kept, req.batchId, req.subjectId, rng);
                if (!placement) continue;
                placement->id = kept.nextAssignmentId();
                kept.put(req.batchIndex, *placement);
                done = true;
            }
            if (done) {
                ++report.placed;
                ++placed[req.batchIndex][req.subjectId];
            } else {
                ++report.unplaced;
            }
        }
    }

    if (report.unplaced > 0) {
        spdlog::debug("repair left {} session(s) unplaced (removed {} conflicting, {} surplus)",
                     report.unplaced, report.conflictsRemoved, report.surplusRemoved);
    }
    grid = std::move(kept);
    return report;
}
