#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "problem_context.hpp"
#include "timetable.hpp"
#include <map>
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
struct FacultyWorkloadEntry {
    int facultyId;
    std::string name;
    int totalHours;
};

struct RoomUtilizationEntry {
    int roomId;
    std::string name;
    int capacity;
    int totalHours;
    int utilizationPercent; ///< Rounded share of all working (day, slot) cells.
};

struct BatchQualityEntry {
    int batchId;
    std::string name;
    double avgGapsPerDay;    ///< Idle slots inside batch days, averaged over working days.
    int maxConsecutiveHours; ///< Sum over days of the longest back-to-back run.
};

/**
 * @brief Post-run statistics of one timetable.
 */
struct AnalyticsReport {
    std::vector<FacultyWorkloadEntry> facultyWorkload;   ///< Busiest first.
    std::vector<RoomUtilizationEntry> roomUtilization;   ///< Most used first.
    std::vector<BatchQualityEntry> batchQuality;         ///< Instance batch order.
    std::map<int, std::vector<std::vector<int>>> roomHeatmap; ///< roomId -> [day][slot] 0/1 occupancy.
};


///////////////////////////
///      ANALYTICS      ///
///////////////////////////
/**
 * @brief Workload, room utilization and student quality-of-life figures.
 *
 * Every faculty member and room of the instance gets an entry, including
 * unused ones. Sorting is stable, so ties keep instance order.
 */
AnalyticsReport generateAnalyticsReport(const ProblemContext& ctx, const TimetableGrid& grid);
