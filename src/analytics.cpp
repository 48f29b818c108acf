///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "analytics.hpp"
#include "fitness.hpp"
#include <algorithm>
#include <cmath>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/// Longest run of consecutive occupied slots in one day.
int longestRun(const std::vector<bool>& occupied) {
    int best = 0, current = 0;
    for (bool used : occupied) {
        current = used ? current + 1 : 0;
        best = std::max(best, current);
    }
    return best;
}

} // namespace


///////////////////////////
///      ANALYTICS      ///
///////////////////////////
AnalyticsReport generateAnalyticsReport(const ProblemContext& ctx, const TimetableGrid& grid) {
    const ProblemInstance& inst = ctx.instance();
    const std::vector<ClassAssignment> sessions = grid.assignments();
    AnalyticsReport report;

    // Faculty workload.
    for (const Faculty& f : inst.faculty) {
        int hours = 0;
        for (const ClassAssignment& a : sessions) {
            hours += (int)std::count(a.facultyIds.begin(), a.facultyIds.end(), f.id);
        }
        report.facultyWorkload.push_back({f.id, f.name, hours});
    }
    std::stable_sort(report.facultyWorkload.begin(), report.facultyWorkload.end(),
                     [](const FacultyWorkloadEntry& a, const FacultyWorkloadEntry& b) {
                         return a.totalHours > b.totalHours;
                     });

    // Room utilization and heatmap.
    const int available = (int)inst.geometry.workingDays.size() * grid.slotsPerDay();
    for (const Room& r : inst.rooms) {
        std::vector<std::vector<int>> heat(grid.numDays(), std::vector<int>(grid.slotsPerDay(), 0));
        int hours = 0;
        for (const ClassAssignment& a : sessions) {
            if (a.roomId != r.id) continue;
            ++hours;
            heat[a.day][a.slot] = 1;
        }
        int percent = available > 0 ? (int)std::lround(100.0 * hours / available) : 0;
        report.roomUtilization.push_back({r.id, r.name, r.capacity, hours, percent});
        report.roomHeatmap[r.id] = std::move(heat);
    }
    std::stable_sort(report.roomUtilization.begin(), report.roomUtilization.end(),
                     [](const RoomUtilizationEntry& a, const RoomUtilizationEntry& b) {
                         return a.utilizationPercent > b.utilizationPercent;
                     });

    // Student quality of life.
    const int days = std::max(1, (int)inst.geometry.workingDays.size());
    for (int b = 0; b < grid.numBatches(); ++b) {
        int gaps = 0, consecutive = 0;
        for (int d = 0; d < grid.numDays(); ++d) {
            std::vector<bool> occupied(grid.slotsPerDay());
            for (int s = 0; s < grid.slotsPerDay(); ++s) occupied[s] = grid.occupied(b, d, s);
            gaps += countGaps(occupied);
            consecutive += longestRun(occupied);
        }
        const Batch& batch = inst.batches[b];
        report.batchQuality.push_back({batch.id, batch.name, (double)gaps / days, consecutive});
    }
    return report;
}
