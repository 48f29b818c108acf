///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "problem_context.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

[[noreturn]] void fail(const std::string& message) {
    throw std::invalid_argument("invalid problem instance: " + message);
}

/// Insert id -> index, rejecting duplicates.
void indexId(std::unordered_map<int, int>& index, int id, int position, const char* kind) {
    if (!index.emplace(id, position).second) {
        std::ostringstream ss;
        ss << "duplicate " << kind << " id " << id;
        fail(ss.str());
    }
}

const std::vector<int> kNoCandidates;

} // namespace


///////////////////////////
///    CONSTRUCTION     ///
///////////////////////////
ProblemContext::ProblemContext(const ProblemInstance& inst) : inst_(inst) {
    indexEntities();
    validateReferences();
    buildRequirements();
    buildFacultyCandidates();
    expandPinnedAssignments();
}

void ProblemContext::indexEntities() {
    for (int i = 0; i < (int)inst_.batches.size(); ++i)
        indexId(batchIndex_, inst_.batches[i].id, i, "batch");
    for (int i = 0; i < (int)inst_.subjects.size(); ++i)
        indexId(subjectIndex_, inst_.subjects[i].id, i, "subject");
    for (int i = 0; i < (int)inst_.faculty.size(); ++i)
        indexId(facultyIndex_, inst_.faculty[i].id, i, "faculty");
    for (int i = 0; i < (int)inst_.rooms.size(); ++i)
        indexId(roomIndex_, inst_.rooms[i].id, i, "room");
    for (int i = 0; i < (int)inst_.facultyAvailability.size(); ++i)
        indexId(availabilityIndex_, inst_.facultyAvailability[i].facultyId, i, "faculty availability");
}

/**
 * @brief Fail fast on malformed geometry or dangling references.
 *
 * Every id mentioned anywhere in the snapshot must resolve; silently
 * skipping a bad reference would schedule a different problem than the
 * caller asked for.
 */
void ProblemContext::validateReferences() const {
    const TimetableGeometry& geo = inst_.geometry;
    if (geo.workingDays.empty()) fail("no working days configured");
    if (geo.slotsPerDay <= 0) fail("slotsPerDay must be positive");
    std::set<int> seenDays;
    for (int d : geo.workingDays) {
        if (d < 0 || d >= 7) fail("working day index " + std::to_string(d) + " outside [0, 7)");
        if (!seenDays.insert(d).second) fail("working day " + std::to_string(d) + " listed twice");
    }

    for (const Subject& s : inst_.subjects) {
        if (s.hoursPerWeek < 0) fail("subject " + std::to_string(s.id) + " has negative hoursPerWeek");
    }
    for (const Room& r : inst_.rooms) {
        if (r.capacity < 0) fail("room " + std::to_string(r.id) + " has negative capacity");
    }

    for (const Faculty& f : inst_.faculty) {
        for (int sid : f.subjectIds) {
            if (!subject(sid)) {
                fail("faculty " + std::to_string(f.id) + " is qualified for unknown subject " + std::to_string(sid));
            }
        }
    }

    for (const Batch& b : inst_.batches) {
        if (b.studentCount < 0) fail("batch " + std::to_string(b.id) + " has negative studentCount");
        for (int sid : b.subjectIds) {
            if (!subject(sid)) {
                fail("batch " + std::to_string(b.id) + " requires unknown subject " + std::to_string(sid));
            }
        }
        for (int rid : b.allocatedRoomIds) {
            if (!room(rid)) {
                fail("batch " + std::to_string(b.id) + " is restricted to unknown room " + std::to_string(rid));
            }
        }
    }

    for (const PinnedAssignment& p : inst_.pinnedAssignments) {
        const std::string tag = "pinned assignment " + std::to_string(p.id);
        if (!batch(p.batchId)) fail(tag + " refers to unknown batch " + std::to_string(p.batchId));
        if (!subject(p.subjectId)) fail(tag + " refers to unknown subject " + std::to_string(p.subjectId));
        if (!faculty(p.facultyId)) fail(tag + " refers to unknown faculty " + std::to_string(p.facultyId));
        if (!room(p.roomId)) fail(tag + " refers to unknown room " + std::to_string(p.roomId));
        if (p.duration <= 0) fail(tag + " has non-positive duration");
        for (int d : p.days) {
            if (!isWorkingDay(d)) fail(tag + " uses non-working day " + std::to_string(d));
        }
        for (int s : p.startSlots) {
            if (s < 0 || s >= geo.slotsPerDay) fail(tag + " starts at invalid slot " + std::to_string(s));
        }
    }

    for (const FacultyAvailability& a : inst_.facultyAvailability) {
        if (!faculty(a.facultyId)) {
            fail("availability record for unknown faculty " + std::to_string(a.facultyId));
        }
    }

    for (const FacultyAllocation& a : inst_.facultyAllocations) {
        const std::string tag = "faculty allocation (batch " + std::to_string(a.batchId) +
                                ", subject " + std::to_string(a.subjectId) + ")";
        if (!batch(a.batchId)) fail(tag + " refers to unknown batch");
        if (!subject(a.subjectId)) fail(tag + " refers to unknown subject");
        for (int fid : a.facultyIds) {
            if (!faculty(fid)) fail(tag + " refers to unknown faculty " + std::to_string(fid));
        }
    }
}

void ProblemContext::buildRequirements() {
    requiredSessions_.assign(inst_.batches.size(), {});
    for (int b = 0; b < (int)inst_.batches.size(); ++b) {
        const Batch& batch = inst_.batches[b];
        for (int sid : batch.subjectIds) {
            // A subject listed twice is still one requirement.
            if (requiredSessions_[b].count(sid)) continue;
            int hours = subject(sid)->hoursPerWeek;
            requiredSessions_[b][sid] = hours;
            requirements_.push_back({b, batch.id, sid, hours});
            totalSessions_ += hours;
        }
    }
}

void ProblemContext::buildFacultyCandidates() {
    candidates_.assign(inst_.batches.size(), {});
    for (const SessionRequirement& req : requirements_) {
        std::vector<int> ids;
        for (const FacultyAllocation& a : inst_.facultyAllocations) {
            if (a.batchId == req.batchId && a.subjectId == req.subjectId && !a.facultyIds.empty()) {
                ids = a.facultyIds;
                break;
            }
        }
        if (ids.empty()) {
            for (const Faculty& f : inst_.faculty) {
                if (std::find(f.subjectIds.begin(), f.subjectIds.end(), req.subjectId) != f.subjectIds.end()) {
                    ids.push_back(f.id);
                }
            }
        }
        candidates_[req.batchIndex][req.subjectId] = std::move(ids);
    }
}

void ProblemContext::expandPinnedAssignments() {
    const int slotsPerDay = inst_.geometry.slotsPerDay;
    for (const PinnedAssignment& p : inst_.pinnedAssignments) {
        for (int day : p.days) {
            for (int start : p.startSlots) {
                for (int k = 0; k < p.duration; ++k) {
                    int slot = start + k;
                    // Pins running past the end of the day are cut short.
                    if (slot >= slotsPerDay) break;
                    ClassAssignment a;
                    a.id = 0;
                    a.subjectId = p.subjectId;
                    a.facultyIds = {p.facultyId};
                    a.roomId = p.roomId;
                    a.batchId = p.batchId;
                    a.day = day;
                    a.slot = slot;
                    a.pinned = true;
                    pinnedPlacements_.push_back(a);
                }
            }
        }
    }
}


///////////////////////////
///       LOOKUPS       ///
///////////////////////////
int ProblemContext::batchIndex(int batchId) const {
    auto it = batchIndex_.find(batchId);
    return it == batchIndex_.end() ? -1 : it->second;
}

int ProblemContext::facultyIndex(int facultyId) const {
    auto it = facultyIndex_.find(facultyId);
    return it == facultyIndex_.end() ? -1 : it->second;
}

const Batch* ProblemContext::batch(int batchId) const {
    auto it = batchIndex_.find(batchId);
    return it == batchIndex_.end() ? nullptr : &inst_.batches[it->second];
}

const Subject* ProblemContext::subject(int subjectId) const {
    auto it = subjectIndex_.find(subjectId);
    return it == subjectIndex_.end() ? nullptr : &inst_.subjects[it->second];
}

const Faculty* ProblemContext::faculty(int facultyId) const {
    auto it = facultyIndex_.find(facultyId);
    return it == facultyIndex_.end() ? nullptr : &inst_.faculty[it->second];
}

const Room* ProblemContext::room(int roomId) const {
    auto it = roomIndex_.find(roomId);
    return it == roomIndex_.end() ? nullptr : &inst_.rooms[it->second];
}

const FacultyAvailability* ProblemContext::availabilityFor(int facultyId) const {
    auto it = availabilityIndex_.find(facultyId);
    return it == availabilityIndex_.end() ? nullptr : &inst_.facultyAvailability[it->second];
}

const std::vector<int>& ProblemContext::facultyCandidates(int batchId, int subjectId) const {
    int b = batchIndex(batchId);
    if (b < 0) return kNoCandidates;
    auto it = candidates_[b].find(subjectId);
    return it == candidates_[b].end() ? kNoCandidates : it->second;
}

int ProblemContext::requiredSessions(int batchIndex, int subjectId) const {
    if (batchIndex < 0 || batchIndex >= (int)requiredSessions_.size()) return 0;
    auto it = requiredSessions_[batchIndex].find(subjectId);
    return it == requiredSessions_[batchIndex].end() ? 0 : it->second;
}

bool ProblemContext::isWorkingDay(int day) const {
    const auto& days = inst_.geometry.workingDays;
    return std::find(days.begin(), days.end(), day) != days.end();
}

TimetableGrid ProblemContext::emptyGrid() const {
    return TimetableGrid((int)inst_.batches.size(), inst_.geometry.dayCount(), inst_.geometry.slotsPerDay);
}

void ProblemContext::validateGrid(const TimetableGrid& grid) const {
    if (grid.numBatches() != (int)inst_.batches.size() ||
        grid.numDays() != inst_.geometry.dayCount() ||
        grid.slotsPerDay() != inst_.geometry.slotsPerDay) {
        throw std::invalid_argument("timetable shape does not match the problem instance");
    }
    std::set<int> ids;
    for (int b = 0; b < grid.numBatches(); ++b) {
        for (int d = 0; d < grid.numDays(); ++d) {
            for (int s = 0; s < grid.slotsPerDay(); ++s) {
                const ClassAssignment* a = grid.at(b, d, s);
                if (!a) continue;
                const std::string tag = "timetable assignment " + std::to_string(a->id);
                if (a->batchId != inst_.batches[b].id || a->day != d || a->slot != s) {
                    throw std::invalid_argument(tag + " does not match its grid position");
                }
                if (!isWorkingDay(d)) throw std::invalid_argument(tag + " is on a non-working day");
                if (!subject(a->subjectId)) throw std::invalid_argument(tag + " refers to an unknown subject");
                if (!room(a->roomId)) throw std::invalid_argument(tag + " refers to an unknown room");
                for (int fid : a->facultyIds) {
                    if (!faculty(fid)) throw std::invalid_argument(tag + " refers to an unknown faculty member");
                }
                if (!ids.insert(a->id).second) throw std::invalid_argument(tag + " id is used twice");
            }
        }
    }
}
