#pragma once
#include "config.hpp"
#include "credentials.hpp"
#include "job_registrar.hpp"
#include "notify.hpp"
#include "process.hpp"
#include "schedule.hpp"
#include "schedule_store.hpp"
#include "transcripts.hpp"
#include "wake.hpp"
#include <functional>
#include <string>

namespace wakeprompt {

// Collaborators of a run. All owned by the caller.
struct RunDeps {
    ScheduleStore& store;
    JobRegistrar& registrar;
    WakeScheduler& wake;
    CredentialProvider& credentials;
    SessionLocator& sessions;
    Notifier& notifier;
    ProcessRunner& runner;
};

// Directory the target program starts in: the project path when it is a
// real directory outside the transcript tree and `data_dir`, else the cwd
// recorded in the session transcript, else "".
std::string resolve_work_dir(const ScheduleEntry& entry, const std::string& data_dir);

// Target program invocation (before any session crossing):
//   <program> -p [--model M] [--permission-mode P] [--resume ID] <prompt>
// with the credential injected and competing credential variables blanked.
Command build_target_command(const Config& cfg, const ScheduleEntry& entry,
                             const std::string& program_path, const std::string& token,
                             const std::string& work_dir, const std::string& output_path);

// Executes one schedule when its OS timer fires.
class RunController {
public:
    using ClockFn = std::function<TimePoint()>;

    RunController(const Config& cfg, RunDeps deps, bool elevated, ClockFn clock = Clock::now);

    // Runs schedule `id` to completion and returns the appended log record.
    // Throws NotFoundError for an unknown id, and SetupError after logging
    // a failed record when the run could not be started. The target's own
    // exit status is reported in the record, not thrown.
    LogEntry run(const std::string& id);

private:
    const Config& cfg_;
    RunDeps deps_;
    bool elevated_;
    ClockFn clock_;

    [[noreturn]] void fail_setup(LogEntry& log, const ScheduleEntry& entry, const std::string& message);
    ProcessResult execute(const Command& cmd, const ScheduleEntry& entry, const std::string& output_path);
    void retire_or_rearm(ScheduleEntry entry);
};

} // namespace wakeprompt
