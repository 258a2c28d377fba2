#pragma once
#include "schedule.hpp"
#include "timeutil.hpp"
#include <string>

namespace wakeprompt {

struct ClockTime {
    int hour = 0;
    int minute = 0;
};

// Best-effort "HH:MM" reader. Anything not shaped like HH:MM gives 00:00,
// digits stop at the first non-digit, and out-of-range fields become 0.
ClockTime parse_clock(const std::string& clock);

// Strict forms used when a schedule is created or edited.
bool is_valid_clock(const std::string& clock);
bool is_valid_date(const std::string& date);

// 0 = Sunday .. 6 = Saturday, -1 for an unknown name. Case-insensitive.
int weekday_number(const std::string& name);

// Next fire instant of `entry` strictly after `now`, evaluated in the
// entry's time zone (machine zone when unset or unknown).
// Throws ValidationError for an unknown type or weekday, a malformed
// one-time date, or a one-time instant that is not in the future.
TimePoint next_run(const ScheduleEntry& entry, TimePoint now);

// "in <1m", "in 5m", "in 3h", "in 2d", "just now", "5m ago", "3h ago",
// "2d ago"; "" for an unset time.
std::string relative_label(TimePoint t, TimePoint now);

} // namespace wakeprompt
