#include "time_resolver.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <cctype>
#include <cstdio>

namespace wakeprompt {

namespace {

int leading_number(const std::string& text) {
    int n = 0;
    for (char c : text) {
        if (c < '0' || c > '9') break;
        n = n * 10 + (c - '0');
    }
    return n;
}

bool all_digits(const std::string& text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) return 29;
    return days[month - 1];
}

std::string with_unit(long long n, const char* unit) {
    return std::to_string(n) + unit;
}

} // namespace

// ── Clock and calendar parsing ──────────────────────────────────────

ClockTime parse_clock(const std::string& clock) {
    ClockTime ct;
    if (clock.size() != 5 || clock[2] != ':') return ct;
    ct.hour = leading_number(clock.substr(0, 2));
    ct.minute = leading_number(clock.substr(3, 2));
    if (ct.hour > 23) ct.hour = 0;
    if (ct.minute > 59) ct.minute = 0;
    return ct;
}

bool is_valid_clock(const std::string& clock) {
    if (clock.size() != 5 || clock[2] != ':') return false;
    std::string h = clock.substr(0, 2), m = clock.substr(3, 2);
    if (!all_digits(h) || !all_digits(m)) return false;
    return std::stoi(h) <= 23 && std::stoi(m) <= 59;
}

bool is_valid_date(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;
    std::string y = date.substr(0, 4), m = date.substr(5, 2), d = date.substr(8, 2);
    if (!all_digits(y) || !all_digits(m) || !all_digits(d)) return false;
    int year = std::stoi(y), month = std::stoi(m), day = std::stoi(d);
    if (month < 1 || month > 12) return false;
    return day >= 1 && day <= days_in_month(year, month);
}

int weekday_number(const std::string& name) {
    static const char* names[] = {
        "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"};
    std::string key = to_lower(trim(name));
    for (int i = 0; i < 7; i++) {
        if (key == names[i]) return i;
    }
    return -1;
}

// ── Next fire time ──────────────────────────────────────────────────

TimePoint next_run(const ScheduleEntry& entry, TimePoint now) {
    ScopedTimezone zone(entry.timezone);
    const auto& spec = entry.schedule;

    if (spec.type == kScheduleOnce) {
        if (spec.date.empty() || spec.time.empty()) {
            throw ValidationError("date/time required");
        }
        if (!is_valid_date(spec.date) || !is_valid_clock(spec.time)) {
            throw ValidationError("invalid date/time: " + spec.date + " " + spec.time);
        }
        int y = 0, mo = 0, d = 0;
        std::sscanf(spec.date.c_str(), "%d-%d-%d", &y, &mo, &d);
        ClockTime ct = parse_clock(spec.time);
        TimePoint when = from_local(y, mo, d, ct.hour, ct.minute);
        if (when <= now) throw ValidationError("scheduled time is in the past");
        return when;
    }

    if (spec.type == kScheduleDaily) {
        ClockTime ct = parse_clock(spec.time);
        std::tm tm = to_local_tm(now);
        int y = tm.tm_year + 1900, mo = tm.tm_mon + 1;
        TimePoint candidate = from_local(y, mo, tm.tm_mday, ct.hour, ct.minute);
        if (candidate <= now) candidate = from_local(y, mo, tm.tm_mday + 1, ct.hour, ct.minute);
        return candidate;
    }

    if (spec.type == kScheduleWeekly) {
        int target = weekday_number(spec.weekday);
        if (target < 0) throw ValidationError("invalid weekday: " + spec.weekday);
        ClockTime ct = parse_clock(spec.time);
        std::tm tm = to_local_tm(now);
        int y = tm.tm_year + 1900, mo = tm.tm_mon + 1;
        int delta = (target - tm.tm_wday + 7) % 7;
        TimePoint candidate = from_local(y, mo, tm.tm_mday + delta, ct.hour, ct.minute);
        if (candidate <= now) {
            candidate = from_local(y, mo, tm.tm_mday + delta + 7, ct.hour, ct.minute);
        }
        return candidate;
    }

    throw ValidationError("unknown schedule type: " + spec.type);
}

// ── Labels ──────────────────────────────────────────────────────────

std::string relative_label(TimePoint t, TimePoint now) {
    using namespace std::chrono;
    if (is_unset(t)) return "";

    if (t > now) {
        auto secs = duration_cast<seconds>(t - now).count();
        if (secs < 60) return "in <1m";
        if (secs < 3600) return "in " + with_unit(secs / 60, "m");
        if (secs < 86400) return "in " + with_unit(secs / 3600, "h");
        return "in " + with_unit(secs / 86400, "d");
    }

    auto secs = duration_cast<seconds>(now - t).count();
    if (secs < 60) return "just now";
    if (secs < 3600) return with_unit(secs / 60, "m") + " ago";
    if (secs < 86400) return with_unit(secs / 3600, "h") + " ago";
    return with_unit(secs / 86400, "d") + " ago";
}

} // namespace wakeprompt
