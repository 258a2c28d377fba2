#pragma once
#include "timeutil.hpp"
#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace wakeprompt {

constexpr const char* kScheduleOnce = "once";
constexpr const char* kScheduleDaily = "daily";
constexpr const char* kScheduleWeekly = "weekly";

constexpr const char* kStatusSuccess = "success";
constexpr const char* kStatusError = "error";

// ── Data structures ─────────────────────────────────────────────────

struct ScheduleSpec {
    std::string type;     // "once", "daily" or "weekly"
    std::string date;     // YYYY-MM-DD, once only
    std::string time;     // HH:MM, 24-hour
    std::string weekday;  // day name, weekly only

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["type"] = type;
        if (!date.empty()) j["date"] = date;
        if (!time.empty()) j["time"] = time;
        if (!weekday.empty()) j["weekday"] = weekday;
        return j;
    }
    static ScheduleSpec from_json(const nlohmann::json& j) {
        ScheduleSpec s;
        s.type = j.value("type", "");
        s.date = j.value("date", "");
        s.time = j.value("time", "");
        s.weekday = j.value("weekday", "");
        return s;
    }

    bool operator==(const ScheduleSpec& o) const {
        return type == o.type && date == o.date && time == o.time && weekday == o.weekday;
    }
};

// What the target program is asked to do. Opaque to the engine apart from
// the command line it is turned into.
struct RunTarget {
    std::string project_path;
    std::string session_id;
    std::string session_path;
    bool new_session = false;
    std::string model;
    std::string permission_mode;
    std::string prompt;

    bool operator==(const RunTarget& o) const {
        return project_path == o.project_path && session_id == o.session_id &&
               session_path == o.session_path && new_session == o.new_session &&
               model == o.model && permission_mode == o.permission_mode && prompt == o.prompt;
    }
};

// The OS account a schedule runs as.
struct Account {
    std::string user;
    int uid = -1;
    int gid = -1;
    std::string home_dir;
    std::string path_env;

    // PATH, HOME, USER and LOGNAME for processes started on this account's behalf.
    std::map<std::string, std::string> environment() const {
        return {{"PATH", path_env}, {"HOME", home_dir}, {"USER", user}, {"LOGNAME", user}};
    }

    // The account running this process.
    static Account current(const std::string& fallback_path);

    bool operator==(const Account& o) const {
        return user == o.user && uid == o.uid && gid == o.gid &&
               home_dir == o.home_dir && path_env == o.path_env;
    }
};

struct ScheduleEntry {
    std::string id;
    RunTarget target;
    ScheduleSpec schedule;
    std::string timezone;
    TimePoint created_at;
    TimePoint updated_at;
    TimePoint next_run;
    std::string wake_time;    // next_run rendered for the wake scheduler
    std::string binary_path;  // executable the OS timer invokes
    Account account;

    nlohmann::json to_json() const;
    static ScheduleEntry from_json(const nlohmann::json& j);

    bool operator==(const ScheduleEntry& o) const {
        return id == o.id && target == o.target && schedule == o.schedule &&
               timezone == o.timezone && created_at == o.created_at &&
               updated_at == o.updated_at && next_run == o.next_run &&
               wake_time == o.wake_time && binary_path == o.binary_path && account == o.account;
    }
};

// One execution attempt.
struct LogEntry {
    std::string id;
    std::string schedule_id;
    TimePoint ran_at;
    std::string status = kStatusError;
    int exit_code = 0;
    std::string error;
    std::string prompt_preview;
    std::string model;
    std::string session_id;
    bool new_session = false;
    std::string output_path;
    std::string project_path;

    nlohmann::json to_json() const;
    static LogEntry from_json(const nlohmann::json& j);
};

// Throws ValidationError unless the fields present match the type and
// every clock, date and weekday value is well formed.
void validate_spec(const ScheduleSpec& spec);

// Copy of `spec` with the fields its type does not use cleared.
ScheduleSpec normalize_spec(ScheduleSpec spec);

} // namespace wakeprompt
