#ifndef NCF_SCHEDULE_HPP
#define NCF_SCHEDULE_HPP

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ncf {

/// Minutes since local midnight, 0..1439.
struct TimeOfDay {
    int minutes = 0;

    TimeOfDay() = default;
    TimeOfDay(int hour, int minute) : minutes(hour * 60 + minute) {}

    /// Parse "HH:MM"; nullopt when malformed or out of range.
    static std::optional<TimeOfDay> parse(const std::string& text);
    std::string to_string() const;

    bool operator==(const TimeOfDay& o) const { return minutes == o.minutes; }
    bool operator<(const TimeOfDay& o) const { return minutes < o.minutes; }
};

/**
 * @brief Allowed-access window, read-only to netcurfew
 *
 * Weekdays are 0 = Monday .. 6 = Sunday. end < start denotes an overnight
 * window.
 */
struct Schedule {
    std::string name;
    bool enabled = true;
    std::set<int> days;
    TimeOfDay start;
    TimeOfDay end;

    /// start <= t < end, or t >= start || t < end when overnight.
    bool contains(const TimeOfDay& t) const;
};

struct UsageCounter {
    long accumulated_seconds = 0;
    std::optional<int> daily_limit_minutes;   // absent: no limit
};

enum class AccessReason {
    NoSchedules,
    WithinSchedule,
    OutsideSchedule,
    DailyLimitReached
};

const char* to_string(AccessReason reason);

struct AccessDecision {
    bool allowed = true;
    AccessReason code = AccessReason::NoSchedules;
    std::string reason;
    std::optional<std::chrono::system_clock::time_point> next_available;
};

/**
 * @brief Local wall-clock reading handed to the evaluator
 */
struct WallClock {
    std::chrono::system_clock::time_point instant;
    int weekday = 0;          // 0 = Monday
    int minute_of_day = 0;
    int second = 0;

    static WallClock from_time_point(std::chrono::system_clock::time_point tp);
    static WallClock now() { return from_time_point(std::chrono::system_clock::now()); }
};

/**
 * @brief Pure access decision from schedules, clock and usage
 *
 * No I/O; the clock is an argument.
 */
class ScheduleEvaluator {
public:
    static AccessDecision is_allowed(const WallClock& now,
                                     const std::vector<Schedule>& schedules,
                                     const UsageCounter& usage);

    /// Nearest future start of an enabled schedule, within the next week.
    static std::optional<std::chrono::system_clock::time_point>
    next_start(const WallClock& now, const std::vector<Schedule>& schedules);
};

} // namespace ncf

#endif // NCF_SCHEDULE_HPP
