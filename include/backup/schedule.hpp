#pragma once

#include "common/job.hpp"
#include <string>
#include <optional>

enum class ScheduleKind {
    Manual,
    Daily,
    Hourly,
    Once,
    Weekly
};

std::string toString(ScheduleKind kind);
std::optional<ScheduleKind> parseScheduleKind(const std::string& text);

// 0 = Monday .. 6 = Sunday
std::string weekdayName(int dayOfWeek);
std::optional<int> parseWeekday(const std::string& text);

struct ScheduleSpec {
    ScheduleKind kind{ScheduleKind::Manual};
    int hour{0};
    int minute{0};
    std::string date;   // YYYY-MM-DD, Once only
    int dayOfWeek{0};   // Weekly only
};

// Empty when the schedule is usable, otherwise a message naming the bad field.
std::string validateSchedule(const ScheduleSpec& spec);

// Next occurrence strictly after now, in UTC. Manual schedules, past Once
// dates and invalid specs have none.
std::optional<TimePoint> computeNextRun(const ScheduleSpec& spec, TimePoint now);

// Value persisted when a run ends. Anchored to the run's start, and Once never re-fires.
std::optional<TimePoint> computeNextRunAfterStart(const ScheduleSpec& spec, TimePoint runStart);

// "2024-01-02T02:00:00Z"
std::string formatIso8601(TimePoint time);

// Accepts a 'T' or space separator, fractional seconds, and a trailing "Z",
// "+HH:MM"/"-HH:MM" offset or no zone at all (read as UTC).
std::optional<TimePoint> parseIso8601(const std::string& text);
