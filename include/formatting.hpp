#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "analytics.hpp"
#include "model.hpp"
#include "substitutes.hpp"
#include "timetable.hpp"
#include <ostream>
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Print one table per batch and day: time, subject, type, faculty, room.
 *
 * @param slotLabels Optional label per slot index; "Slot N" is used when missing.
 */
void printBatchSchedules(std::ostream& out, const ProblemInstance& inst, const TimetableGrid& grid,
                         const std::vector<std::string>& slotLabels = {});

/// One-line summary of a metric breakdown.
void printMetrics(std::ostream& out, const TimetableMetrics& metrics);

/// Faculty hours, room utilization and batch quality-of-life tables.
void printAnalytics(std::ostream& out, const AnalyticsReport& report);

/// One line per ranked substitute: score, name and reasons.
void printSubstitutes(std::ostream& out, const std::vector<RankedSubstitute>& substitutes);
