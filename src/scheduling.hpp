#pragma once
#include "config.hpp"
#include "job_registrar.hpp"
#include "schedule.hpp"
#include "schedule_store.hpp"
#include "wake.hpp"
#include <string>

namespace wakeprompt {

// What a user asked for, before identity and timing are filled in.
struct ScheduleDraft {
    RunTarget target;
    ScheduleSpec schedule;
    std::string timezone;
};

// Turns a draft into a storable entry. When `existing` is given its id and
// creation time are kept and its timezone and account fields fill any gaps.
// Throws ValidationError.
ScheduleEntry build_entry(const ScheduleDraft& draft, const ScheduleEntry* existing,
                          const Account& account, const std::string& binary_path,
                          const Config& cfg, TimePoint now);

// Keeps the store, the launchd job and the pmset wake of each schedule in step.
class ScheduleService {
public:
    ScheduleService(ScheduleStore& store, JobRegistrar& registrar, WakeScheduler& wake);

    // Stores, installs and arms the wake; a failed install or wake undoes
    // what was already done and rethrows.
    void create(const ScheduleEntry& entry);
    // Replaces `previous` (same id) with `entry`.
    void update(const ScheduleEntry& previous, const ScheduleEntry& entry);
    // Throws NotFoundError, leaving the store untouched, for an unknown id.
    ScheduleEntry remove(const std::string& id);

private:
    ScheduleStore& store_;
    JobRegistrar& registrar_;
    WakeScheduler& wake_;
};

} // namespace wakeprompt
