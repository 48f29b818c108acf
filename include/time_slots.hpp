#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>
#include <vector>


///////////////////////////
///     TIME SLOTS      ///
///////////////////////////
/**
 * @brief A named pause in the teaching day ("HH:mm" times).
 */
struct BreakPeriod {
    std::string name;
    std::string startTime;
    std::string endTime;
};

/**
 * @brief College day settings from which the slot geometry is derived.
 */
struct TimetableSettings {
    std::string collegeStartTime = "09:00";
    std::string collegeEndTime = "17:00";
    int periodDuration = 60; ///< Minutes per slot.
    std::vector<BreakPeriod> breaks;
};

/**
 * @brief One teaching period of the day.
 */
struct TimeSlot {
    int startMinute; ///< Minutes from midnight.
    int endMinute;
    std::string label; ///< e.g. "9:00 AM - 10:00 AM".
};

/**
 * @brief Parse "HH:mm" into minutes from midnight.
 *
 * Throws std::invalid_argument on malformed input.
 */
int timeToMinutes(const std::string& time);

/// Minutes from midnight as "h:mm AM/PM".
std::string minutesToReadableTime(int minutes);

/**
 * @brief Lay out the teaching periods of one day.
 *
 * Periods run back to back from the start time. A period that starts inside
 * or would overlap a break is dropped and the cursor jumps to the end of the
 * break. Generation stops at the end time, and after 50 iterations in any
 * case. The number of returned slots is the geometry's slotsPerDay.
 */
std::vector<TimeSlot> generateTimeSlots(const TimetableSettings& settings);
