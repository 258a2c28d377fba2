#pragma once
#include "config.hpp"
#include "plist.hpp"
#include "process.hpp"
#include "schedule.hpp"
#include <string>

namespace wakeprompt {

// Internal flag the OS timer passes along with a schedule id.
constexpr const char* kRunFlag = "--run";

// "<prefix>.<id>": launchd label and pmset owner of a schedule.
std::string job_label(const Config& cfg, const std::string& id);

// Calendar fields for the job, taken from the entry's next run in the
// machine zone (launchd reads StartCalendarInterval in local time).
// once: year/month/day/hour/minute; daily: hour/minute;
// weekly: weekday/hour/minute. Computes the next run when unset.
CalendarTrigger calendar_trigger(const ScheduleEntry& entry, TimePoint now);

// Installs schedules as launchd daemons.
class JobRegistrar {
public:
    JobRegistrar(const Config& cfg, ProcessRunner& runner, bool elevated);
    virtual ~JobRegistrar() = default;

    // Writes the descriptor and (re)loads it; a job already loaded under
    // the same label is booted out first. Throws RegistrationError.
    virtual void install(const ScheduleEntry& entry);
    // Unloads and deletes the job. Best-effort, never throws.
    virtual void remove(const ScheduleEntry& entry);
    // remove() when already running as root; otherwise nothing.
    void remove_if_privileged(const ScheduleEntry& entry);

    JobDescriptor descriptor_for(const ScheduleEntry& entry, TimePoint now) const;
    std::string job_path(const std::string& id) const;

private:
    const Config& cfg_;
    ProcessRunner& runner_;
    bool elevated_;

    ProcessResult admin(const std::vector<std::string>& argv, bool quiet);
};

} // namespace wakeprompt
