#include "job_registrar.hpp"
#include "errors.hpp"
#include "privilege.hpp"
#include "schedule_store.hpp"
#include "time_resolver.hpp"
#include <fstream>
#include <iostream>

namespace wakeprompt {

std::string job_label(const Config& cfg, const std::string& id) {
    return cfg.job_label_prefix + "." + id;
}

CalendarTrigger calendar_trigger(const ScheduleEntry& entry, TimePoint now) {
    const auto& spec = entry.schedule;
    if (spec.type != kScheduleOnce && spec.type != kScheduleDaily && spec.type != kScheduleWeekly) {
        throw ValidationError("unknown schedule type: " + spec.type);
    }
    if (spec.type == kScheduleWeekly && weekday_number(spec.weekday) < 0) {
        throw ValidationError("invalid weekday: " + spec.weekday);
    }

    TimePoint when = is_unset(entry.next_run) ? next_run(entry, now) : entry.next_run;
    std::tm tm = to_local_tm(when);

    CalendarTrigger t;
    t.hour = tm.tm_hour;
    t.minute = tm.tm_min;
    if (spec.type == kScheduleOnce) {
        t.year = tm.tm_year + 1900;
        t.month = tm.tm_mon + 1;
        t.day = tm.tm_mday;
    } else if (spec.type == kScheduleWeekly) {
        t.weekday = tm.tm_wday;
    }
    return t;
}

// ── JobRegistrar ────────────────────────────────────────────────────

namespace {

// Temp descriptor, deleted when the install attempt ends.
class TempFile {
public:
    explicit TempFile(std::string path) : path_(std::move(path)) {}
    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

JobRegistrar::JobRegistrar(const Config& cfg, ProcessRunner& runner, bool elevated)
    : cfg_(cfg), runner_(runner), elevated_(elevated) {}

std::string JobRegistrar::job_path(const std::string& id) const {
    return (fs::path(cfg_.job_dir) / (job_label(cfg_, id) + ".plist")).string();
}

JobDescriptor JobRegistrar::descriptor_for(const ScheduleEntry& entry, TimePoint now) const {
    ScheduleStore account_store(cfg_.data_path(entry.account.home_dir));

    JobDescriptor job;
    job.label = job_label(cfg_, entry.id);
    job.program_arguments = {entry.binary_path, kRunFlag, entry.id};
    job.trigger = calendar_trigger(entry, now);
    job.stdout_path = account_store.daemon_stdout_path(entry.id);
    job.stderr_path = account_store.daemon_stderr_path(entry.id);
    job.environment = entry.account.environment();
    job.run_at_load = false;
    return job;
}

ProcessResult JobRegistrar::admin(const std::vector<std::string>& argv, bool quiet) {
    Command cmd;
    cmd.program = argv.front();
    cmd.args.assign(argv.begin() + 1, argv.end());
    cmd.quiet = quiet;
    cmd.interactive = !quiet && !elevated_;
    return runner_.run(privileged(elevated_, cmd));
}

void JobRegistrar::install(const ScheduleEntry& entry) {
    JobDescriptor job = descriptor_for(entry, Clock::now());

    TempFile tmp((fs::temp_directory_path() / ("wakeprompt-" + entry.id + ".plist")).string());
    {
        std::ofstream out(tmp.path(), std::ios::trunc);
        if (!out) throw RegistrationError("write launchd plist: cannot open " + tmp.path());
        out << encode_plist(job);
        out.flush();
        if (!out) throw RegistrationError("write launchd plist: short write to " + tmp.path());
    }

    std::string dest = job_path(entry.id);
    auto installed = admin({"install", "-m", "644", tmp.path(), dest}, false);
    if (!installed.ok()) throw RegistrationError("install launchd plist: " + installed.error);

    admin({"launchctl", "bootout", cfg_.launchd_domain, dest}, true);
    auto loaded = admin({"launchctl", "bootstrap", cfg_.launchd_domain, dest}, false);
    if (!loaded.ok()) throw RegistrationError("load launchd job: " + loaded.error);

    std::cerr << "[launchd] Installed " << job.label << "\n";
}

void JobRegistrar::remove(const ScheduleEntry& entry) {
    std::string dest = job_path(entry.id);
    admin({"launchctl", "bootout", cfg_.launchd_domain, dest}, true);
    auto removed = admin({"rm", "-f", dest}, false);
    if (!removed.ok()) {
        std::cerr << "[launchd] Could not delete " << dest << ": " << removed.error << "\n";
    }
}

void JobRegistrar::remove_if_privileged(const ScheduleEntry& entry) {
    if (!elevated_) return;
    remove(entry);
}

} // namespace wakeprompt
