#include "schedule_cmd.hpp"
#include "config.hpp"
#include "credentials.hpp"
#include "errors.hpp"
#include "job_registrar.hpp"
#include "notify.hpp"
#include "privilege.hpp"
#include "run_controller.hpp"
#include "schedule_store.hpp"
#include "time_resolver.hpp"
#include "transcripts.hpp"
#include "utils.hpp"
#include "wake.hpp"
#include <algorithm>
#include <iostream>

namespace wakeprompt {

// ── Argument parsing ────────────────────────────────────────────────

std::string apply_draft_args(const std::vector<std::string>& args, size_t start, ScheduleDraft& draft) {
    auto need = [&](size_t i, size_t n) { return i + n < args.size(); };

    for (size_t i = start; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a == "--project" && need(i, 1)) {
            draft.target.project_path = normalize_path(args[++i]);
        } else if (a == "--prompt" && need(i, 1)) {
            draft.target.prompt = args[++i];
        } else if (a == "--once" && need(i, 2)) {
            draft.schedule = ScheduleSpec{kScheduleOnce, args[i + 1], args[i + 2], ""};
            i += 2;
        } else if (a == "--daily" && need(i, 1)) {
            draft.schedule = ScheduleSpec{kScheduleDaily, "", args[++i], ""};
        } else if (a == "--weekly" && need(i, 2)) {
            draft.schedule = ScheduleSpec{kScheduleWeekly, "", args[i + 2], args[i + 1]};
            i += 2;
        } else if (a == "--session" && need(i, 1)) {
            draft.target.session_id = args[++i];
            draft.target.new_session = false;
        } else if (a == "--session-path" && need(i, 1)) {
            draft.target.session_path = normalize_path(args[++i]);
        } else if (a == "--new-session") {
            draft.target.session_id.clear();
            draft.target.session_path.clear();
            draft.target.new_session = true;
        } else if (a == "--model" && need(i, 1)) {
            draft.target.model = args[++i];
        } else if (a == "--permission-mode" && need(i, 1)) {
            draft.target.permission_mode = args[++i];
        } else if (a == "--timezone" && need(i, 1)) {
            draft.timezone = args[++i];
        } else {
            return "unknown or incomplete option: " + a;
        }
    }
    return "";
}

std::string describe_schedule(const ScheduleSpec& spec) {
    if (spec.type == kScheduleOnce) return "once " + spec.date + " " + spec.time;
    if (spec.type == kScheduleWeekly) return "weekly " + to_lower(spec.weekday) + " " + spec.time;
    return spec.type + " " + spec.time;
}

// ── Output ──────────────────────────────────────────────────────────

static void print_next_run(const ScheduleEntry& entry) {
    std::cout << "Next run: " << format_rfc1123(entry.next_run)
              << " (" << relative_label(entry.next_run, Clock::now()) << ")\n";
}

static void print_scheduled(const ScheduleEntry& entry) {
    std::cout << "Scheduled.\n";
    std::cout << "ID: " << entry.id << "\n";
    print_next_run(entry);
    std::cout << "Project: " << humanize_path(entry.target.project_path) << "\n";
}

static void print_updated(const ScheduleEntry& entry) {
    std::cout << "Schedule updated.\n";
    std::cout << "ID: " << entry.id << "\n";
    print_next_run(entry);
}

static const char* kDraftUsage =
    "  --project DIR --prompt TEXT\n"
    "  (--once YYYY-MM-DD HH:MM | --daily HH:MM | --weekly DAY HH:MM)\n"
    "  [--session ID --session-path FILE | --new-session]\n"
    "  [--model M] [--permission-mode P] [--timezone ZONE]\n";

// ── Commands ────────────────────────────────────────────────────────

int cmd_run(const std::string& id) {
    Config cfg = Config::load(default_config_path());
    bool elevated = running_elevated();

    PosixProcessRunner runner;
    ScheduleStore store(cfg.data_path(home_dir()));
    JobRegistrar registrar(cfg, runner, elevated);
    WakeScheduler wake(cfg, runner, elevated);
    KeychainCredentialProvider credentials(cfg, runner);
    TranscriptSessionLocator sessions(cfg);
    OsascriptNotifier notifier(cfg, runner);

    RunController controller(cfg, RunDeps{store, registrar, wake, credentials, sessions, notifier, runner},
                             elevated);
    controller.run(id);
    return 0;
}

int cmd_add(const std::vector<std::string>& args) {
    ScheduleDraft draft;
    draft.target.new_session = true;
    std::string err = apply_draft_args(args, 0, draft);
    if (!err.empty() || draft.target.project_path.empty() || draft.schedule.type.empty()) {
        if (!err.empty()) std::cerr << err << "\n";
        std::cerr << "Usage: wakeprompt add\n" << kDraftUsage;
        return 1;
    }
    if (running_elevated()) {
        std::cerr << "Run wakeprompt as your own user; it asks for sudo when needed\n";
        return 1;
    }

    if (draft.timezone.empty()) {
        std::string local = local_timezone_name();
        if (timezone_exists(local)) draft.timezone = local;
    }

    Config cfg = Config::load(default_config_path());
    std::string binary = current_executable_path();
    if (binary.empty()) throw SetupError("resolve wakeprompt path");

    ScheduleEntry entry = build_entry(draft, nullptr, Account::current(cfg.fallback_path),
                                      binary, cfg, Clock::now());

    PosixProcessRunner runner;
    ensure_privilege(runner, false);

    ScheduleStore store(cfg.data_path(home_dir()));
    JobRegistrar registrar(cfg, runner, false);
    WakeScheduler wake(cfg, runner, false);
    ScheduleService service(store, registrar, wake);
    service.create(entry);

    print_scheduled(entry);
    return 0;
}

int cmd_edit(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: wakeprompt edit <id> [options]\n" << kDraftUsage;
        return 1;
    }
    if (running_elevated()) {
        std::cerr << "Run wakeprompt as your own user; it asks for sudo when needed\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());
    ScheduleStore store(cfg.data_path(home_dir()));
    ScheduleEntry current = store.find(args[0]);

    ScheduleDraft draft{current.target, current.schedule, current.timezone};
    std::string err = apply_draft_args(args, 1, draft);
    if (!err.empty()) {
        std::cerr << err << "\n" << "Usage: wakeprompt edit <id> [options]\n" << kDraftUsage;
        return 1;
    }

    std::string binary = current_executable_path();
    if (binary.empty()) binary = current.binary_path;
    ScheduleEntry entry = build_entry(draft, &current, Account::current(cfg.fallback_path),
                                      binary, cfg, Clock::now());

    PosixProcessRunner runner;
    ensure_privilege(runner, false);

    JobRegistrar registrar(cfg, runner, false);
    WakeScheduler wake(cfg, runner, false);
    ScheduleService service(store, registrar, wake);
    service.update(current, entry);

    print_updated(entry);
    return 0;
}

int cmd_remove(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Usage: wakeprompt remove <id>\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());
    bool elevated = running_elevated();
    ScheduleStore store(cfg.data_path(home_dir()));
    store.find(args[0]);

    PosixProcessRunner runner;
    ensure_privilege(runner, elevated);

    JobRegistrar registrar(cfg, runner, elevated);
    WakeScheduler wake(cfg, runner, elevated);
    ScheduleService service(store, registrar, wake);
    ScheduleEntry removed = service.remove(args[0]);

    std::cout << "Schedule deleted.\n";
    std::cout << "ID: " << removed.id << "\n";
    return 0;
}

int cmd_list() {
    Config cfg = Config::load(default_config_path());
    ScheduleStore store(cfg.data_path(home_dir()));
    auto schedules = store.load();

    std::sort(schedules.begin(), schedules.end(), [](const ScheduleEntry& a, const ScheduleEntry& b) {
        if (a.next_run == b.next_run) return a.created_at < b.created_at;
        if (is_unset(a.next_run)) return false;
        if (is_unset(b.next_run)) return true;
        return a.next_run < b.next_run;
    });

    if (schedules.empty()) {
        std::cout << "No schedules.\n";
        return 0;
    }

    auto now = Clock::now();
    for (auto& s : schedules) {
        std::cout << s.id << "  " << describe_schedule(s.schedule);
        if (!s.timezone.empty()) std::cout << " [" << s.timezone << "]";
        std::cout << "\n";
        std::cout << "  next:    ";
        if (is_unset(s.next_run)) {
            std::cout << "-\n";
        } else {
            std::cout << format_rfc1123(s.next_run) << " (" << relative_label(s.next_run, now) << ")\n";
        }
        std::cout << "  project: " << humanize_path(s.target.project_path) << "\n";
        std::cout << "  prompt:  " << preview(s.target.prompt, 60) << "\n";
    }
    return 0;
}

int cmd_logs(const std::vector<std::string>& args) {
    Config cfg = Config::load(default_config_path());
    size_t limit = cfg.max_run_logs > 0 ? static_cast<size_t>(cfg.max_run_logs) : 0;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--limit" && i + 1 < args.size()) {
            limit = static_cast<size_t>(std::stoul(args[++i]));
        } else {
            std::cerr << "Usage: wakeprompt logs [--limit N]\n";
            return 1;
        }
    }

    ScheduleStore store(cfg.data_path(home_dir()));
    auto logs = store.load_logs(limit);
    if (logs.empty()) {
        std::cout << "No runs yet.\n";
        return 0;
    }

    auto now = Clock::now();
    for (auto& l : logs) {
        std::cout << format_local(l.ran_at, "%Y-%m-%d %H:%M:%S") << " (" << relative_label(l.ran_at, now)
                  << ")  " << l.status << "  exit=" << l.exit_code << "  " << l.schedule_id << "\n";
        if (!l.prompt_preview.empty()) std::cout << "  prompt:  " << l.prompt_preview << "\n";
        if (!l.session_id.empty()) std::cout << "  session: " << l.session_id << "\n";
        if (!l.error.empty()) std::cout << "  error:   " << l.error << "\n";
        if (!l.output_path.empty()) std::cout << "  output:  " << humanize_path(l.output_path) << "\n";
    }
    return 0;
}

int cmd_sessions(const std::vector<std::string>& args) {
    if (args.size() != 2 || args[0] != "--project") {
        std::cerr << "Usage: wakeprompt sessions --project DIR\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());
    std::string project = normalize_path(args[1]);
    std::string dir = find_project_dir(cfg.projects_path(home_dir()), project);
    if (dir.empty()) {
        std::cout << "No sessions for " << humanize_path(project) << ".\n";
        return 0;
    }

    auto sessions = collect_sessions(dir);
    fill_session_previews(sessions);

    auto now = Clock::now();
    for (auto& s : sessions) {
        std::cout << s.id << "  " << relative_label(s.mod_time, now) << "\n";
        if (!s.preview.empty()) std::cout << "  " << s.preview << "\n";
    }
    return 0;
}

int cmd_prune() {
    Config cfg = Config::load(default_config_path());
    ScheduleStore store(cfg.data_path(home_dir()));
    Account account = Account::current(cfg.fallback_path);
    store.prune_logs(cfg.max_run_logs, cfg.max_daemon_logs, account.uid, account.gid);
    std::cout << "Logs pruned.\n";
    return 0;
}

int cmd_init(const std::string& config_path) {
    if (fs::exists(config_path)) {
        std::cout << "Config already exists: " << config_path << "\n";
        return 0;
    }
    Config{}.save(config_path);
    std::cout << "Created config: " << config_path << "\n";
    return 0;
}

} // namespace wakeprompt
