#include "schedule.hpp"
#include "errors.hpp"
#include "time_resolver.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace wakeprompt {

namespace {

void write_time(nlohmann::json& j, const char* key, TimePoint t) {
    if (!is_unset(t)) j[key] = format_rfc3339(t);
}

TimePoint read_time(const nlohmann::json& j, const char* key) {
    std::string text = j.value(key, "");
    if (text.empty()) return TimePoint{};
    return parse_rfc3339(text);
}

} // namespace

// ── Account ─────────────────────────────────────────────────────────

Account Account::current(const std::string& fallback_path) {
    Account a;
    a.uid = static_cast<int>(getuid());
    a.gid = static_cast<int>(getgid());

    if (const struct passwd* pw = getpwuid(getuid())) {
        if (pw->pw_name) a.user = pw->pw_name;
        if (pw->pw_dir) a.home_dir = pw->pw_dir;
        a.gid = static_cast<int>(pw->pw_gid);
    }
    if (a.user.empty()) {
        if (const char* u = std::getenv("USER")) a.user = u;
    }
    if (const char* h = std::getenv("HOME"); h && *h) a.home_dir = h;

    const char* path = std::getenv("PATH");
    a.path_env = (path && *path) ? path : fallback_path;
    return a;
}

// ── ScheduleEntry JSON ──────────────────────────────────────────────

nlohmann::json ScheduleEntry::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["projectPath"] = target.project_path;
    if (!target.session_id.empty()) j["sessionId"] = target.session_id;
    if (!target.session_path.empty()) j["sessionPath"] = target.session_path;
    j["newSession"] = target.new_session;
    j["model"] = target.model;
    if (!target.permission_mode.empty()) j["permissionMode"] = target.permission_mode;
    j["prompt"] = target.prompt;
    j["schedule"] = schedule.to_json();
    j["timezone"] = timezone;
    write_time(j, "createdAt", created_at);
    write_time(j, "updatedAt", updated_at);
    write_time(j, "nextRun", next_run);
    j["wakeTime"] = wake_time;
    j["binaryPath"] = binary_path;
    j["user"] = account.user;
    j["uid"] = account.uid;
    j["gid"] = account.gid;
    j["homeDir"] = account.home_dir;
    j["pathEnv"] = account.path_env;
    return j;
}

ScheduleEntry ScheduleEntry::from_json(const nlohmann::json& j) {
    ScheduleEntry e;
    e.id = j.value("id", "");
    e.target.project_path = j.value("projectPath", "");
    e.target.session_id = j.value("sessionId", "");
    e.target.session_path = j.value("sessionPath", "");
    e.target.new_session = j.value("newSession", false);
    e.target.model = j.value("model", "");
    e.target.permission_mode = j.value("permissionMode", "");
    e.target.prompt = j.value("prompt", "");
    if (j.contains("schedule") && j["schedule"].is_object()) {
        e.schedule = ScheduleSpec::from_json(j["schedule"]);
    }
    e.timezone = j.value("timezone", "");
    e.created_at = read_time(j, "createdAt");
    e.updated_at = read_time(j, "updatedAt");
    e.next_run = read_time(j, "nextRun");
    e.wake_time = j.value("wakeTime", "");
    e.binary_path = j.value("binaryPath", "");
    e.account.user = j.value("user", "");
    e.account.uid = j.value("uid", -1);
    e.account.gid = j.value("gid", -1);
    e.account.home_dir = j.value("homeDir", "");
    e.account.path_env = j.value("pathEnv", "");
    return e;
}

// ── LogEntry JSON ───────────────────────────────────────────────────

nlohmann::json LogEntry::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["scheduleId"] = schedule_id;
    write_time(j, "ranAt", ran_at);
    j["status"] = status;
    j["exitCode"] = exit_code;
    if (!error.empty()) j["error"] = error;
    j["promptPreview"] = prompt_preview;
    j["model"] = model;
    if (!session_id.empty()) j["sessionId"] = session_id;
    j["newSession"] = new_session;
    if (!output_path.empty()) j["outputPath"] = output_path;
    if (!project_path.empty()) j["projectPath"] = project_path;
    return j;
}

LogEntry LogEntry::from_json(const nlohmann::json& j) {
    LogEntry l;
    l.id = j.value("id", "");
    l.schedule_id = j.value("scheduleId", "");
    l.ran_at = read_time(j, "ranAt");
    l.status = j.value("status", kStatusError);
    l.exit_code = j.value("exitCode", 0);
    l.error = j.value("error", "");
    l.prompt_preview = j.value("promptPreview", "");
    l.model = j.value("model", "");
    l.session_id = j.value("sessionId", "");
    l.new_session = j.value("newSession", false);
    l.output_path = j.value("outputPath", "");
    l.project_path = j.value("projectPath", "");
    return l;
}

// ── Validation ──────────────────────────────────────────────────────

void validate_spec(const ScheduleSpec& spec) {
    if (spec.type == kScheduleOnce) {
        if (spec.date.empty() || spec.time.empty()) {
            throw ValidationError("once schedule requires date and time");
        }
        if (!spec.weekday.empty()) throw ValidationError("once schedule does not take a weekday");
        if (!is_valid_date(spec.date)) throw ValidationError("invalid date: " + spec.date);
        if (!is_valid_clock(spec.time)) throw ValidationError("invalid time: " + spec.time);
    } else if (spec.type == kScheduleDaily) {
        if (spec.time.empty()) throw ValidationError("daily schedule requires a time");
        if (!spec.date.empty() || !spec.weekday.empty()) {
            throw ValidationError("daily schedule takes only a time");
        }
        if (!is_valid_clock(spec.time)) throw ValidationError("invalid time: " + spec.time);
    } else if (spec.type == kScheduleWeekly) {
        if (spec.time.empty() || spec.weekday.empty()) {
            throw ValidationError("weekly schedule requires weekday and time");
        }
        if (!spec.date.empty()) throw ValidationError("weekly schedule does not take a date");
        if (weekday_number(spec.weekday) < 0) {
            throw ValidationError("invalid weekday: " + spec.weekday);
        }
        if (!is_valid_clock(spec.time)) throw ValidationError("invalid time: " + spec.time);
    } else {
        throw ValidationError("unknown schedule type: " + spec.type);
    }
}

ScheduleSpec normalize_spec(ScheduleSpec spec) {
    spec.type = to_lower(trim(spec.type));
    spec.time = trim(spec.time);
    if (spec.type != kScheduleOnce) spec.date.clear();
    if (spec.type != kScheduleWeekly) spec.weekday.clear();
    spec.date = trim(spec.date);
    spec.weekday = trim(spec.weekday);
    return spec;
}

} // namespace wakeprompt
