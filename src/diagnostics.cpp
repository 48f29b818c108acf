///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "diagnostics.hpp"
#include <algorithm>
#include <set>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

const Subject* findSubject(const ProblemInstance& inst, int id) {
    for (const Subject& s : inst.subjects)
        if (s.id == id) return &s;
    return nullptr;
}

/// Allocated faculty if any, else every qualified faculty member.
std::vector<int> candidateFaculty(const ProblemInstance& inst, int batchId, int subjectId) {
    for (const FacultyAllocation& a : inst.facultyAllocations) {
        if (a.batchId == batchId && a.subjectId == subjectId && !a.facultyIds.empty())
            return a.facultyIds;
    }
    std::vector<int> ids;
    for (const Faculty& f : inst.faculty) {
        if (std::find(f.subjectIds.begin(), f.subjectIds.end(), subjectId) != f.subjectIds.end())
            ids.push_back(f.id);
    }
    return ids;
}

bool hasUsableRoom(const ProblemInstance& inst, const Batch& batch, const Subject& subject) {
    for (const Room& r : inst.rooms) {
        if (r.type != subject.requiredRoomType()) continue;
        if (r.capacity < batch.studentCount) continue;
        if (!batch.allocatedRoomIds.empty() &&
            std::find(batch.allocatedRoomIds.begin(), batch.allocatedRoomIds.end(), r.id) ==
            batch.allocatedRoomIds.end())
            continue;
        return true;
    }
    return false;
}

} // namespace


///////////////////////////
///     DIAGNOSTICS     ///
///////////////////////////
std::vector<DiagnosticIssue> runPreflightDiagnostics(const ProblemInstance& inst) {
    std::vector<DiagnosticIssue> issues;

    // Subjects no faculty member can teach.
    std::set<int> taught;
    for (const Faculty& f : inst.faculty) taught.insert(f.subjectIds.begin(), f.subjectIds.end());
    for (const Subject& s : inst.subjects) {
        if (taught.count(s.id)) continue;
        issues.push_back({Severity::WARNING, "Unassigned Subject",
                          "The subject \"" + s.name + "\" (" + s.code + ") is not assigned to any faculty member.",
                          "Assign this subject to at least one faculty member."});
    }

    for (const Batch& batch : inst.batches) {
        std::set<int> seen;
        for (int sid : batch.subjectIds) {
            if (!seen.insert(sid).second) continue;
            const Subject* subject = findSubject(inst, sid);
            if (!subject) continue;

            std::vector<int> staff = candidateFaculty(inst, batch.id, sid);
            if (staff.empty()) {
                issues.push_back({Severity::CRITICAL, "No Qualified Faculty",
                                  "The subject \"" + subject->name + "\" required by batch \"" + batch.name +
                                  "\" has no faculty qualified to teach it.",
                                  "Assign a faculty member to teach \"" + subject->code +
                                  "\" or remove it from the batch's curriculum."});
            } else if ((int)staff.size() < subject->requiredFacultyCount()) {
                issues.push_back({Severity::CRITICAL, "Insufficient Practical Staff",
                                  "The practical \"" + subject->name + "\" for batch \"" + batch.name + "\" needs " +
                                  std::to_string(subject->requiredFacultyCount()) + " faculty but only " +
                                  std::to_string(staff.size()) + " can teach it.",
                                  "Allocate or qualify more faculty for \"" + subject->code + "\"."});
            }

            if (!hasUsableRoom(inst, batch, *subject)) {
                issues.push_back({Severity::CRITICAL, "No Suitable Room",
                                  "No " + toString(subject->requiredRoomType()) + " can seat batch \"" + batch.name +
                                  "\" (" + std::to_string(batch.studentCount) + " students) for \"" +
                                  subject->name + "\".",
                                  "Add a larger room of that type or relax the batch's room restriction."});
            }
        }
    }

    for (const Faculty& f : inst.faculty) {
        if (!f.subjectIds.empty()) continue;
        issues.push_back({Severity::WARNING, "Faculty Without Subjects",
                          "Faculty member \"" + f.name + "\" is not assigned to teach any subjects.",
                          "Assign subjects to this faculty member or remove them if they are no longer active."});
    }
    return issues;
}

bool hasCriticalIssues(const std::vector<DiagnosticIssue>& issues) {
    return std::any_of(issues.begin(), issues.end(),
                       [](const DiagnosticIssue& i) { return i.severity == Severity::CRITICAL; });
}

std::string toString(Severity severity) {
    return severity == Severity::CRITICAL ? "critical" : "warning";
}
