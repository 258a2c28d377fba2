#pragma once
#include "config.hpp"
#include "process.hpp"
#include "schedule.hpp"
#include <string>

namespace wakeprompt {

// pmset wake requests, owned by the schedule's job label so they can be
// cancelled independently of the launchd job.
class WakeScheduler {
public:
    WakeScheduler(const Config& cfg, ProcessRunner& runner, bool elevated);
    virtual ~WakeScheduler() = default;

    // `when` is a wake-time string ("MM/DD/YY HH:MM:SS"); empty is a no-op.
    // Throws RegistrationError.
    virtual void schedule(const ScheduleEntry& entry, const std::string& when);
    // Cancels the request recorded in entry.wake_time. Returns false and
    // logs when pmset refuses; never throws.
    virtual bool cancel(const ScheduleEntry& entry);

private:
    const Config& cfg_;
    ProcessRunner& runner_;
    bool elevated_;
};

} // namespace wakeprompt
