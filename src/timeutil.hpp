#pragma once
#include <chrono>
#include <ctime>
#include <string>

namespace wakeprompt {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// A default-constructed TimePoint (the epoch) means "unset".
inline bool is_unset(TimePoint t) { return t == TimePoint{}; }

// Switches the process time zone (TZ) for the lifetime of the guard.
// An empty, "Local" or unknown zone name leaves the machine zone in place.
// Not thread-safe: the zone is process-global state.
class ScopedTimezone {
public:
    explicit ScopedTimezone(const std::string& name);
    ~ScopedTimezone();

    ScopedTimezone(const ScopedTimezone&) = delete;
    ScopedTimezone& operator=(const ScopedTimezone&) = delete;

private:
    bool active_ = false;
    bool had_previous_ = false;
    std::string previous_;
};

bool timezone_exists(const std::string& name);

// IANA name of the machine zone, or "" if it cannot be determined.
std::string local_timezone_name();

std::tm to_local_tm(TimePoint t);

// Local wall-clock time to instant; fields are normalized the way mktime does.
TimePoint from_local(int year, int month, int day, int hour, int minute, int second = 0);

// "2026-10-19T16:00:00.123456789Z" (fraction omitted when zero).
std::string format_rfc3339(TimePoint t);
// Accepts "Z" or "+hh:mm" offsets and any fraction length; throws std::runtime_error.
TimePoint parse_rfc3339(const std::string& text);

// "10/19/26 09:00:00" in the machine zone: the form pmset expects.
std::string format_wake_time(TimePoint t);

// "Mon, 19 Oct 2026 09:00:00 PDT" in the machine zone.
std::string format_rfc1123(TimePoint t);

// strftime in the machine zone.
std::string format_local(TimePoint t, const char* fmt);

} // namespace wakeprompt
