#include "ncf_schedule.hpp"

#include <cstdio>
#include <ctime>
#include <vector>

namespace ncf {

namespace {
constexpr int kMinutesPerDay = 24 * 60;
}

std::optional<TimeOfDay> TimeOfDay::parse(const std::string& text) {
    int h = -1, m = -1;
    char tail = 0;
    if (std::sscanf(text.c_str(), "%d:%d%c", &h, &m, &tail) != 2) return std::nullopt;
    if (h < 0 || h > 23 || m < 0 || m > 59) return std::nullopt;
    return TimeOfDay(h, m);
}

std::string TimeOfDay::to_string() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
    return buf;
}

bool Schedule::contains(const TimeOfDay& t) const {
    if (start.minutes <= end.minutes) {
        return start.minutes <= t.minutes && t.minutes < end.minutes;
    }
    return t.minutes >= start.minutes || t.minutes < end.minutes;
}

const char* to_string(AccessReason reason) {
    switch (reason) {
        case AccessReason::NoSchedules:       return "access allowed";
        case AccessReason::WithinSchedule:    return "access allowed";
        case AccessReason::OutsideSchedule:   return "outside allowed schedule";
        case AccessReason::DailyLimitReached: return "daily limit reached";
    }
    return "unknown";
}

WallClock WallClock::from_time_point(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    WallClock wc;
    wc.instant = tp;
    wc.weekday = (tm_buf.tm_wday + 6) % 7;   // tm_wday: 0 = Sunday
    wc.minute_of_day = tm_buf.tm_hour * 60 + tm_buf.tm_min;
    wc.second = tm_buf.tm_sec;
    return wc;
}

AccessDecision ScheduleEvaluator::is_allowed(const WallClock& now,
                                             const std::vector<Schedule>& schedules,
                                             const UsageCounter& usage) {
    AccessDecision d;
    if (schedules.empty()) {
        d.allowed = true;
        d.code = AccessReason::NoSchedules;
    } else {
        TimeOfDay t;
        t.minutes = now.minute_of_day;
        d.allowed = false;
        for (const auto& s : schedules) {
            if (s.enabled && s.days.count(now.weekday) && s.contains(t)) {
                d.allowed = true;
                break;
            }
        }
        d.code = d.allowed ? AccessReason::WithinSchedule : AccessReason::OutsideSchedule;
    }

    if (d.allowed && usage.daily_limit_minutes &&
        usage.accumulated_seconds >= static_cast<long>(*usage.daily_limit_minutes) * 60) {
        d.allowed = false;
        d.code = AccessReason::DailyLimitReached;
    }

    if (d.code == AccessReason::OutsideSchedule) {
        d.next_available = next_start(now, schedules);
    }
    d.reason = to_string(d.code);
    return d;
}

std::optional<std::chrono::system_clock::time_point>
ScheduleEvaluator::next_start(const WallClock& now, const std::vector<Schedule>& schedules) {
    // Offset in minutes from the current minute; 0 would be "now", not future.
    std::optional<int> best;
    for (const auto& s : schedules) {
        if (!s.enabled) continue;
        // An overnight window also opens a listed day at midnight (t < end).
        std::vector<int> opens;
        if (s.start.minutes > s.end.minutes && s.end.minutes > 0) opens.push_back(0);
        opens.push_back(s.start.minutes);

        bool found = false;
        for (int day_offset = 0; day_offset <= 7 && !found; ++day_offset) {
            int weekday = (now.weekday + day_offset) % 7;
            if (!s.days.count(weekday)) continue;
            for (int open : opens) {
                int offset = day_offset * kMinutesPerDay + open - now.minute_of_day;
                if (offset <= 0) continue;
                if (!best || offset < *best) best = offset;
                found = true;
                break;
            }
        }
    }
    if (!best) return std::nullopt;
    return now.instant - std::chrono::seconds(now.second) + std::chrono::minutes(*best);
}

} // namespace ncf
