///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <algorithm>
#include <iomanip>

///////////////////////////
///       HELPERS       ///
///////////////////////////

/**
 * @brief Human-readable names for each week day.
 *
 * Indexed by the 0-based day index used in the timetable model.
 */
static const char* const kDayNames[] = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
};

/**
 * @brief Print the header row for a per-day schedule table.
 *
 * Uses fixed-width columns to align time, subject, type, faculty and room.
 */
static void printDayTableHeader(std::ostream& out) {
    out << "    "
        << std::left << std::setw(19) << "Time"
        << " | " << std::left << std::setw(14) << "Subject"
        << " | " << std::left << std::setw(9)  << "Type"
        << " | " << std::left << std::setw(22) << "Faculty"
        << " | " << std::left << std::setw(8)  << "Room"
        << "\n";

    // Underline with a matching ASCII separator line.
    out << "    "
        << std::string(19, '-')
        << "-+-" << std::string(14, '-')
        << "-+-" << std::string(9, '-')
        << "-+-" << std::string(22, '-')
        << "-+-" << std::string(8, '-')
        << "\n";
}

/**
 * @brief Resolve a list of faculty ids to a comma-separated list of names.
 */
static std::string facultyNames(const ProblemInstance& inst, const std::vector<int>& ids) {
    std::string names;
    for (int fid : ids) {
        auto it = std::find_if(inst.faculty.begin(), inst.faculty.end(),
                               [fid](const Faculty& f) { return f.id == fid; });
        if (!names.empty()) names += ", ";
        names += it != inst.faculty.end() ? it->name : "UnknownFaculty";
    }
    return names;
}

/**
 * @brief Print pretty, per-batch schedules for a timetable.
 *
 * For each batch, walks its grid row day by day and prints a small table for
 * every day that has at least one session. Pinned sessions are marked with '*'.
 */
void printBatchSchedules(std::ostream& out, const ProblemInstance& inst, const TimetableGrid& grid,
                         const std::vector<std::string>& slotLabels) {
    for (int b = 0; b < (int)inst.batches.size() && b < grid.numBatches(); ++b) {
        const Batch& batch = inst.batches[b];
        out << "----------------------------------------\n";
        out << "Schedule for " << batch.name << " (" << batch.studentCount << " students):\n";

        bool any = false;
        for (int d = 0; d < grid.numDays(); ++d) {
            bool dayHeaderPrinted = false;
            for (int s = 0; s < grid.slotsPerDay(); ++s) {
                const ClassAssignment* a = grid.at(b, d, s);
                if (!a) continue;
                any = true;

                // When the day changes, print a new day header and table header.
                if (!dayHeaderPrinted) {
                    out << "\n  " << (d < 7 ? kDayNames[d] : "Day") << ":\n";
                    printDayTableHeader(out);
                    dayHeaderPrinted = true;
                }

                // Fallback names make incomplete data obvious in the printed schedule.
                auto subj = std::find_if(inst.subjects.begin(), inst.subjects.end(),
                                         [a](const Subject& x) { return x.id == a->subjectId; });
                auto room = std::find_if(inst.rooms.begin(), inst.rooms.end(),
                                         [a](const Room& x) { return x.id == a->roomId; });
                std::string subjName = subj != inst.subjects.end() ? subj->code : "UnknownSubject";
                std::string typeStr = subj != inst.subjects.end() ? toString(subj->type) : "Unknown";
                std::string roomName = room != inst.rooms.end() ? room->name : "UnknownRoom";
                std::string timeRange = s < (int)slotLabels.size() ? slotLabels[s] : "Slot " + std::to_string(s + 1);
                if (a->pinned) subjName += "*";

                out << "    "
                    << std::left << std::setw(19) << timeRange
                    << " | " << std::left << std::setw(14) << subjName
                    << " | " << std::left << std::setw(9)  << typeStr
                    << " | " << std::left << std::setw(22) << facultyNames(inst, a->facultyIds)
                    << " | " << std::left << std::setw(8)  << roomName
                    << "\n";
            }
        }
        if (!any) out << "  (no sessions)\n";
        out << "\n";
    }
}

void printMetrics(std::ostream& out, const TimetableMetrics& m) {
    out << "score=" << std::fixed << std::setprecision(2) << m.score
        << " hardConflicts=" << m.hardConflicts
        << " studentGaps=" << m.studentGaps
        << " facultyGaps=" << m.facultyGaps
        << " workloadStdDev=" << m.facultyWorkloadStdDev
        << " preferenceViolations=" << m.preferenceViolations
        << " unplaced=" << m.unplacedSessions
        << std::defaultfloat << "\n";
}

void printAnalytics(std::ostream& out, const AnalyticsReport& report) {
    out << "Faculty workload:\n";
    for (const FacultyWorkloadEntry& f : report.facultyWorkload) {
        out << "    " << std::left << std::setw(22) << f.name << std::right << std::setw(3) << f.totalHours << " h\n";
    }
    out << "Room utilization:\n";
    for (const RoomUtilizationEntry& r : report.roomUtilization) {
        out << "    " << std::left << std::setw(8) << r.name
            << std::right << std::setw(4) << r.utilizationPercent << " %"
            << " (" << r.totalHours << " h, " << r.capacity << " seats)\n";
    }
    out << "Student quality of life:\n";
    for (const BatchQualityEntry& b : report.batchQuality) {
        out << "    " << std::left << std::setw(10) << b.name
            << " avg gaps/day " << std::fixed << std::setprecision(2) << b.avgGapsPerDay << std::defaultfloat
            << ", longest runs " << b.maxConsecutiveHours << " h\n";
    }
}

void printSubstitutes(std::ostream& out, const std::vector<RankedSubstitute>& substitutes) {
    if (substitutes.empty()) {
        out << "    (no available substitutes)\n";
        return;
    }
    for (const RankedSubstitute& r : substitutes) {
        out << "    " << std::right << std::setw(3) << r.score << "  " << std::left << std::setw(22) << r.candidate.name;
        for (size_t i = 0; i < r.reasons.size(); ++i) out << (i ? "; " : " ") << r.reasons[i];
        out << "\n";
    }
}
