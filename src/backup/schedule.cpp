#include "backup/schedule.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace {

const std::array<const char*, 7> kWeekdays = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
};

std::tm toUtcTm(TimePoint time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

TimePoint fromUtcTm(std::tm tm) {
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

// Midnight UTC of the day containing time.
TimePoint startOfDay(TimePoint time) {
    std::tm tm = toUtcTm(time);
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    return fromUtcTm(tm);
}

bool parseDate(const std::string& date, int& year, int& month, int& day) {
    char tail = 0;
    if (std::sscanf(date.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &tail) != 3) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return false;
    }

    // Reject dates timegm would silently normalise, such as Feb 30.
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    std::time_t t = timegm(&tm);
    std::tm check{};
    gmtime_r(&t, &check);
    return check.tm_mday == day && check.tm_mon == month - 1;
}

} // namespace

std::string toString(ScheduleKind kind) {
    switch (kind) {
        case ScheduleKind::Manual: return "Manual";
        case ScheduleKind::Daily: return "Daily";
        case ScheduleKind::Hourly: return "Hourly";
        case ScheduleKind::Once: return "Once";
        case ScheduleKind::Weekly: return "Weekly";
    }
    return "Manual";
}

std::optional<ScheduleKind> parseScheduleKind(const std::string& text) {
    const std::string value = utils::toLower(utils::trim(text));
    if (value.empty() || value == "manual") return ScheduleKind::Manual;
    if (value == "daily") return ScheduleKind::Daily;
    if (value == "hourly") return ScheduleKind::Hourly;
    if (value == "once") return ScheduleKind::Once;
    if (value == "weekly") return ScheduleKind::Weekly;
    return std::nullopt;
}

std::string weekdayName(int dayOfWeek) {
    if (dayOfWeek < 0 || dayOfWeek > 6) {
        return "";
    }
    return kWeekdays[dayOfWeek];
}

std::optional<int> parseWeekday(const std::string& text) {
    const std::string value = utils::trim(text);
    for (size_t i = 0; i < kWeekdays.size(); ++i) {
        if (utils::iequals(value, kWeekdays[i]) ||
            (value.size() == 3 && utils::iequals(value, std::string(kWeekdays[i]).substr(0, 3)))) {
            return static_cast<int>(i);
        }
    }
    return std::nullopt;
}

std::string validateSchedule(const ScheduleSpec& spec) {
    if (spec.hour < 0 || spec.hour > 23) {
        return "hour must be between 0 and 23";
    }
    if (spec.minute < 0 || spec.minute > 59) {
        return "minute must be between 0 and 59";
    }
    if (spec.kind == ScheduleKind::Weekly && (spec.dayOfWeek < 0 || spec.dayOfWeek > 6)) {
        return "day of week must be between 0 (Monday) and 6 (Sunday)";
    }
    if (spec.kind == ScheduleKind::Once) {
        int year = 0, month = 0, day = 0;
        if (!parseDate(spec.date, year, month, day)) {
            return "date must be a valid YYYY-MM-DD value";
        }
    }
    return "";
}

std::optional<TimePoint> computeNextRun(const ScheduleSpec& spec, TimePoint now) {
    const std::string problem = validateSchedule(spec);
    if (!problem.empty()) {
        Logger::warning("Cannot compute next run: " + problem);
        return std::nullopt;
    }

    const auto slot = std::chrono::hours(spec.hour) + std::chrono::minutes(spec.minute);

    switch (spec.kind) {
        case ScheduleKind::Manual:
            return std::nullopt;

        case ScheduleKind::Daily: {
            TimePoint candidate = startOfDay(now) + slot;
            if (candidate <= now) {
                candidate += std::chrono::hours(24);
            }
            return candidate;
        }

        case ScheduleKind::Hourly: {
            std::tm tm = toUtcTm(now);
            tm.tm_min = 0;
            tm.tm_sec = 0;
            TimePoint candidate = fromUtcTm(tm) + std::chrono::minutes(spec.minute);
            if (candidate <= now) {
                candidate += std::chrono::hours(1);
            }
            return candidate;
        }

        case ScheduleKind::Weekly: {
            std::tm tm = toUtcTm(now);
            const int today = (tm.tm_wday + 6) % 7;
            const int daysAhead = (spec.dayOfWeek - today + 7) % 7;
            TimePoint candidate = startOfDay(now) + std::chrono::hours(24 * daysAhead) + slot;
            if (candidate <= now) {
                candidate += std::chrono::hours(24 * 7);
            }
            return candidate;
        }

        case ScheduleKind::Once: {
            int year = 0, month = 0, day = 0;
            parseDate(spec.date, year, month, day);
            std::tm tm{};
            tm.tm_year = year - 1900;
            tm.tm_mon = month - 1;
            tm.tm_mday = day;
            tm.tm_hour = spec.hour;
            tm.tm_min = spec.minute;
            TimePoint candidate = fromUtcTm(tm);
            if (candidate > now) {
                return candidate;
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<TimePoint> computeNextRunAfterStart(const ScheduleSpec& spec, TimePoint runStart) {
    if (spec.kind == ScheduleKind::Once) {
        return std::nullopt;
    }
    return computeNextRun(spec, runStart);
}

std::string formatIso8601(TimePoint time) {
    std::tm tm = toUtcTm(time);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::optional<TimePoint> parseIso8601(const std::string& text) {
    const std::string value = utils::trim(text);
    if (value.size() < 19) {
        return std::nullopt;
    }

    std::tm tm{};
    char separator = 0;
    int consumed = 0;
    if (std::sscanf(value.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &separator,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 7) {
        return std::nullopt;
    }
    if (separator != 'T' && separator != ' ') {
        return std::nullopt;
    }
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    size_t pos = static_cast<size_t>(consumed);
    std::chrono::microseconds fraction{0};
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        long long digits = 0;
        int count = 0;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
            if (count < 6) {
                digits = digits * 10 + (value[pos] - '0');
                ++count;
            }
            ++pos;
        }
        while (count < 6) {
            digits *= 10;
            ++count;
        }
        fraction = std::chrono::microseconds(digits);
    }

    std::chrono::minutes offset{0};
    if (pos < value.size()) {
        const char zone = value[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int offsetHours = 0, offsetMinutes = 0;
            if (std::sscanf(value.c_str() + pos + 1, "%2d:%2d", &offsetHours, &offsetMinutes) != 2) {
                return std::nullopt;
            }
            offset = std::chrono::hours(offsetHours) + std::chrono::minutes(offsetMinutes);
            if (zone == '-') {
                offset = -offset;
            }
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != value.size()) {
        return std::nullopt;
    }

    TimePoint result = fromUtcTm(tm) - offset;
    return result + std::chrono::duration_cast<TimePoint::duration>(fraction);
}
