#include "run_controller.hpp"
#include "errors.hpp"
#include "privilege.hpp"
#include "time_resolver.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace wakeprompt {

namespace {

constexpr size_t kLogPreviewChars = 120;

// Runs retention once the run is over, however it ended.
class PruneOnExit {
public:
    PruneOnExit(const ScheduleStore& store, const Config& cfg, int uid, int gid)
        : store_(store), cfg_(cfg), uid_(uid), gid_(gid) {}
    ~PruneOnExit() {
        try {
            store_.prune_logs(cfg_.max_run_logs, cfg_.max_daemon_logs, uid_, gid_);
        } catch (const std::exception& e) {
            std::cerr << "[store] Prune failed: " << e.what() << "\n";
        }
    }
    PruneOnExit(const PruneOnExit&) = delete;
    PruneOnExit& operator=(const PruneOnExit&) = delete;

private:
    const ScheduleStore& store_;
    const Config& cfg_;
    int uid_;
    int gid_;
};

bool is_usable_work_dir(const std::string& path, const std::string& data_dir) {
    if (path.empty()) return false;
    if (path.find("/.claude/projects/") != std::string::npos) return false;
    if (!data_dir.empty() && is_within(normalize_path(path), normalize_path(data_dir))) return false;
    std::error_code ec;
    return fs::is_directory(path, ec);
}

} // namespace

std::string resolve_work_dir(const ScheduleEntry& entry, const std::string& data_dir) {
    std::string path = trim(entry.target.project_path);
    if (is_usable_work_dir(path, data_dir)) return path;

    if (!entry.target.session_path.empty()) {
        std::string cwd = extract_cwd(entry.target.session_path);
        if (is_usable_work_dir(cwd, data_dir)) return cwd;
    }
    return "";
}

Command build_target_command(const Config& cfg, const ScheduleEntry& entry,
                             const std::string& program_path, const std::string& token,
                             const std::string& work_dir, const std::string& output_path) {
    const auto& t = entry.target;

    Command cmd;
    cmd.program = program_path;
    cmd.args.push_back("-p");
    if (!t.model.empty() && t.model != "auto") {
        cmd.args.push_back("--model");
        cmd.args.push_back(t.model);
    }
    if (!t.permission_mode.empty() && t.permission_mode != "default") {
        cmd.args.push_back("--permission-mode");
        cmd.args.push_back(t.permission_mode);
    }
    if (!t.new_session && !t.session_id.empty()) {
        cmd.args.push_back("--resume");
        cmd.args.push_back(t.session_id);
    }
    cmd.args.push_back(t.prompt);

    for (auto& name : cfg.cleared_env) cmd.env[name] = "";
    cmd.env[cfg.credential_env] = token;
    cmd.work_dir = work_dir;
    cmd.output_path = output_path;
    return cmd;
}

// ── RunController ───────────────────────────────────────────────────

RunController::RunController(const Config& cfg, RunDeps deps, bool elevated, ClockFn clock)
    : cfg_(cfg), deps_(deps), elevated_(elevated), clock_(std::move(clock)) {}

void RunController::fail_setup(LogEntry& log, const ScheduleEntry& entry, const std::string& message) {
    log.error = message;
    try {
        deps_.store.append_log(log, entry.account.uid, entry.account.gid);
    } catch (const std::exception& e) {
        std::cerr << "[run] Could not record failure: " << e.what() << "\n";
    }
    std::cerr << "[run] " << entry.id << ": " << message << "\n";
    throw SetupError(message);
}

LogEntry RunController::run(const std::string& id) {
    ScheduleEntry entry = deps_.store.find(id);
    const Account& account = entry.account;
    PruneOnExit prune(deps_.store, cfg_, account.uid, account.gid);

    LogEntry log;
    log.id = new_id();
    log.schedule_id = entry.id;
    log.ran_at = clock_();
    log.status = kStatusError;
    log.prompt_preview = preview(entry.target.prompt, kLogPreviewChars);
    log.model = entry.target.model;
    log.session_id = entry.target.session_id;
    log.new_session = entry.target.new_session;
    log.project_path = entry.target.project_path;

    std::string output_path;
    try {
        deps_.store.ensure();
        output_path = deps_.store.run_log_path(log);
        fs::create_directories(fs::path(output_path).parent_path());
        std::ofstream touch(output_path, std::ios::app);
        if (!touch) throw std::runtime_error("open " + output_path + ": " + std::strerror(errno));
    } catch (const std::exception& e) {
        fail_setup(log, entry, e.what());
    }
    if (account.uid >= 0 && account.gid >= 0 &&
        ::chown(output_path.c_str(), static_cast<uid_t>(account.uid),
                static_cast<gid_t>(account.gid)) != 0) {
        std::cerr << "[run] chown " << output_path << ": " << std::strerror(errno) << "\n";
    }

    ExecContext ctx{account, elevated_};

    std::string program = deps_.runner.which(cfg_.target_program, account.path_env);
    if (program.empty()) {
        fail_setup(log, entry, cfg_.target_program + " not found in PATH; install: " + cfg_.install_hint);
    }

    std::string token;
    try {
        token = deps_.credentials.resolve(ctx);
    } catch (const SetupError& e) {
        fail_setup(log, entry, e.what());
    }

    std::string work_dir = resolve_work_dir(entry, deps_.store.base_dir());
    if (work_dir.empty()) work_dir = account.home_dir;

    Command target = build_target_command(cfg_, entry, program, token, work_dir, output_path);
    std::cerr << "[run] " << entry.id << ": " << describe_command(target) << " (in " << work_dir << ")\n";
    ProcessResult result = execute(run_as(ctx, target), entry, output_path);

    if (result.ok()) {
        log.status = kStatusSuccess;
        log.exit_code = 0;
    } else {
        log.exit_code = result.exit_code >= 0 ? result.exit_code : 1;
        log.error = result.error;
    }

    if (log.session_id.empty() && entry.target.new_session && log.status == kStatusSuccess) {
        try {
            log.session_id = deps_.sessions.find_new_session(entry, ctx, log.ran_at);
        } catch (const std::exception& e) {
            std::cerr << "[sessions] Lookup failed: " << e.what() << "\n";
        }
    }

    log.output_path = output_path;
    try {
        log = deps_.store.append_log(log, account.uid, account.gid);
    } catch (const std::exception& e) {
        std::cerr << "[run] Could not append log: " << e.what() << "\n";
    }

    try {
        deps_.notifier.notify(ctx, summarize_run(log));
    } catch (const std::exception& e) {
        std::cerr << "[notify] " << e.what() << "\n";
    }

    try {
        retire_or_rearm(entry);
    } catch (const std::exception& e) {
        std::cerr << "[run] " << entry.id << ": " << e.what() << "\n";
    }

    std::cerr << "[run] " << entry.id << ": " << log.status
              << (log.error.empty() ? "" : " (" + log.error + ")") << "\n";
    return log;
}

ProcessResult RunController::execute(const Command& cmd, const ScheduleEntry& entry,
                                     const std::string& output_path) {
    int pid = 0;
    try {
        pid = deps_.runner.spawn(cmd);
    } catch (const SetupError& e) {
        ProcessResult r;
        r.exit_code = 1;
        r.error = e.what();
        return r;
    }

    // Keep the machine awake for as long as the target runs, when the host has a helper.
    int awake_pid = -1;
    const char* path = std::getenv("PATH");
    std::string helper = deps_.runner.which(cfg_.keep_awake,
                                            path && *path ? path : entry.account.path_env);
    if (!helper.empty()) {
        Command awake;
        awake.program = helper;
        awake.args = {"-d", "-i", "-s", "-w", std::to_string(pid)};
        awake.output_path = output_path;
        try {
            awake_pid = deps_.runner.spawn(awake);
        } catch (const SetupError& e) {
            std::cerr << "[run] " << cfg_.keep_awake << " unavailable: " << e.what() << "\n";
        }
    }

    ProcessResult result = deps_.runner.wait(pid);
    if (awake_pid > 0) deps_.runner.wait(awake_pid);
    return result;
}

void RunController::retire_or_rearm(ScheduleEntry entry) {
    const Account& account = entry.account;

    if (entry.schedule.type == kScheduleOnce) {
        deps_.registrar.remove_if_privileged(entry);
        try {
            deps_.store.remove(entry.id);
        } catch (const NotFoundError&) {
            // already gone
        }
        deps_.store.chown_schedules(account.uid, account.gid);
        std::cerr << "[run] " << entry.id << ": one-time schedule retired\n";
        return;
    }

    TimePoint now = clock_();
    CalendarTrigger installed = calendar_trigger(entry, now);
    entry.next_run = next_run(entry, now);
    entry.updated_at = now;
    entry.wake_time = format_wake_time(entry.next_run);
    deps_.store.update(entry);
    deps_.store.chown_schedules(account.uid, account.gid);
    if (elevated_) {
        // The job fires on machine-local fields; a zone offset change on
        // either side moves them.
        if (!(calendar_trigger(entry, now) == installed)) {
            try {
                deps_.registrar.install(entry);
            } catch (const RegistrationError& e) {
                std::cerr << "[run] " << entry.id << ": could not move job: " << e.what() << "\n";
            }
        }
        deps_.wake.schedule(entry, entry.wake_time);
    }
    std::cerr << "[run] " << entry.id << ": next run " << format_rfc3339(entry.next_run) << "\n";
}

} // namespace wakeprompt
