///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "time_slots.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>


///////////////////////////
///     TIME SLOTS      ///
///////////////////////////
int timeToMinutes(const std::string& time) {
    int hours = 0, minutes = 0;
    char tail = '\0';
    if (std::sscanf(time.c_str(), "%d:%d%c", &hours, &minutes, &tail) != 2 ||
        hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        throw std::invalid_argument("malformed time '" + time + "', expected HH:mm");
    }
    return hours * 60 + minutes;
}

std::string minutesToReadableTime(int minutes) {
    int h = minutes / 60;
    int m = minutes % 60;
    const char* ampm = h >= 12 ? "PM" : "AM";
    h = h % 12;
    if (h == 0) h = 12;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%d:%02d %s", h, m, ampm);
    return buf;
}

std::vector<TimeSlot> generateTimeSlots(const TimetableSettings& settings) {
    if (settings.periodDuration <= 0) {
        throw std::invalid_argument("periodDuration must be positive");
    }
    const int start = timeToMinutes(settings.collegeStartTime);
    const int end = timeToMinutes(settings.collegeEndTime);
    const int duration = settings.periodDuration;

    struct Span { int from, to; };
    std::vector<Span> breaks;
    for (const BreakPeriod& b : settings.breaks)
        breaks.push_back({timeToMinutes(b.startTime), timeToMinutes(b.endTime)});
    std::sort(breaks.begin(), breaks.end(), [](const Span& a, const Span& b) { return a.from < b.from; });

    std::vector<TimeSlot> slots;
    int current = start;
    int iterations = 0;
    const int kMaxIterations = 50;

    while (current + duration <= end && iterations < kMaxIterations) {
        ++iterations;

        // Inside a break: jump to its end.
        auto inside = std::find_if(breaks.begin(), breaks.end(),
                                   [&](const Span& b) { return current >= b.from && current < b.to; });
        if (inside != breaks.end()) {
            current = inside->to;
            continue;
        }

        // A period cut by a break is dropped.
        int proposedEnd = current + duration;
        auto overlap = std::find_if(breaks.begin(), breaks.end(),
                                    [&](const Span& b) { return current < b.to && proposedEnd > b.from; });
        if (overlap != breaks.end()) {
            current = overlap->to;
            continue;
        }

        slots.push_back({current, proposedEnd,
                         minutesToReadableTime(current) + " - " + minutesToReadableTime(proposedEnd)});
        current = proposedEnd;
    }
    return slots;
}
