#include "errors.hpp"
#include "job_registrar.hpp"
#include "plist.hpp"
#include "test_framework.hpp"
#include "test_helpers.hpp"
#include "time_resolver.hpp"
#include "wake.hpp"

namespace {

using wakeprompt::tests::require;
using wakeprompt::tests::TempDir;
using namespace wakeprompt;

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

Config job_config(const TempDir& dir) {
    Config cfg;
    cfg.job_dir = dir.str("LaunchDaemons");
    cfg.data_dir = dir.str("data");
    fs::create_directories(cfg.job_dir);
    return cfg;
}

ScheduleEntry daily_at(const std::string& id, const std::string& time) {
    auto e = tests::make_entry(id, ScheduleSpec{kScheduleDaily, "", time, ""});
    e.next_run = next_run(e, Clock::now());
    e.wake_time = format_wake_time(e.next_run);
    return e;
}

} // namespace

void register_job_registrar_tests(std::vector<wakeprompt::tests::TestCase>& tests) {
    tests.push_back({"plist_encodes_job_fields_in_order", [] {
        JobDescriptor job;
        job.label = "com.wakeprompt.abc";
        job.program_arguments = {"/Applications/Wake & Run/wakeprompt", "--run", "abc"};
        job.trigger.hour = 9;
        job.trigger.minute = 5;
        job.stdout_path = "/data/logs/daemon-abc.out.log";
        job.stderr_path = "/data/logs/daemon-abc.err.log";
        job.environment = {{"HOME", "/Users/tester"}, {"PATH", "/usr/bin:/bin"}};

        std::string xml = encode_plist(job);
        require(starts_with(xml, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"), "missing XML prolog");
        require(contains(xml, "<string>/Applications/Wake &amp; Run/wakeprompt</string>"), "path not escaped");
        require(contains(xml, "<key>Hour</key>\n<integer>9</integer>"), "hour missing");
        require(contains(xml, "<key>Minute</key>\n<integer>5</integer>"), "minute missing");
        require(!contains(xml, "<key>Year</key>") && !contains(xml, "<key>Weekday</key>"),
                "unset calendar fields written");
        require(contains(xml, "<key>RunAtLoad</key>\n<false/>"), "RunAtLoad should be false");

        auto label = xml.find("<key>Label</key>");
        auto args = xml.find("<key>ProgramArguments</key>");
        auto cal = xml.find("<key>StartCalendarInterval</key>");
        auto out = xml.find("<key>StandardOutPath</key>");
        auto env = xml.find("<key>EnvironmentVariables</key>");
        require(label < args && args < cal && cal < out && out < env, "keys out of order");
    }});

    tests.push_back({"plist_escapes_markup", [] {
        require(xml_escape("a<b>&\"c'") == "a&lt;b&gt;&amp;&quot;c&apos;", "escape");
    }});

    tests.push_back({"job_calendar_trigger_per_schedule_type", [] {
        ScopedTimezone utc("UTC");
        auto now = parse_rfc3339("2026-10-19T12:00:00Z");

        auto once = tests::make_entry("o", ScheduleSpec{kScheduleOnce, "2026-12-24", "18:45", ""});
        once.next_run = parse_rfc3339("2026-12-24T18:45:00Z");
        CalendarTrigger want_once;
        want_once.year = 2026;
        want_once.month = 12;
        want_once.day = 24;
        want_once.hour = 18;
        want_once.minute = 45;
        require(calendar_trigger(once, now) == want_once, "once trigger");

        auto daily = tests::make_entry("d", ScheduleSpec{kScheduleDaily, "", "07:30", ""});
        auto d = calendar_trigger(daily, now);
        require(d.hour == 7 && d.minute == 30 && d.year < 0 && d.weekday < 0, "daily trigger");

        auto weekly = tests::make_entry("w", ScheduleSpec{kScheduleWeekly, "", "09:15", "Wednesday"});
        auto w = calendar_trigger(weekly, now);
        require(w.weekday == 3 && w.hour == 9 && w.minute == 15 && w.day < 0, "weekly trigger");
    }});

    tests.push_back({"job_calendar_trigger_rejects_bad_weekday", [] {
        auto weekly = tests::make_entry("w", ScheduleSpec{kScheduleWeekly, "", "09:15", "Someday"});
        bool threw = false;
        try {
            calendar_trigger(weekly, Clock::now());
        } catch (const ValidationError&) {
            threw = true;
        }
        require(threw, "bad weekday accepted");
    }});

    tests.push_back({"job_descriptor_runs_binary_with_run_flag", [] {
        TempDir dir;
        Config cfg = job_config(dir);
        tests::FakeRunner runner;
        JobRegistrar registrar(cfg, runner, true);

        auto entry = daily_at("abc", "09:00");
        auto job = registrar.descriptor_for(entry, Clock::now());
        require(job.label == "com.wakeprompt.abc", "label " + job.label);
        require(job.program_arguments ==
                    std::vector<std::string>{"/usr/local/bin/wakeprompt", "--run", "abc"},
                "program arguments");
        require(!job.run_at_load, "job must not run at load");
        require(job.environment.at("USER") == "tester" && job.environment.at("PATH") == "/usr/bin:/bin",
                "account environment");
        require(contains(job.stdout_path, "daemon-abc.out.log"), "stdout path " + job.stdout_path);
        require(registrar.job_path("abc") == cfg.job_dir + "/com.wakeprompt.abc.plist", "job path");
    }});

    tests.push_back({"job_install_twice_leaves_one_loaded_job", [] {
        TempDir dir;
        Config cfg = job_config(dir);
        tests::FakeRunner runner;
        JobRegistrar registrar(cfg, runner, true);
        auto entry = daily_at("abc", "09:00");

        registrar.install(entry);
        registrar.install(entry);

        std::string path = registrar.job_path("abc");
        require(runner.loaded.size() == 1 && runner.loaded.count(path) == 1, "expected one loaded job");
        require(fs::exists(path), "descriptor not written");
        size_t plists = 0;
        for (auto& f : fs::directory_iterator(cfg.job_dir)) {
            if (f.path().extension() == ".plist") plists++;
        }
        require(plists == 1, "expected one descriptor file");
        require(contains(read_file(path), "<string>com.wakeprompt.abc</string>"), "descriptor content");
        require(runner.count("bootstrap") == 2 && runner.count("bootout") == 2, "bootout before each bootstrap");
        for (auto& c : runner.commands) require(c.program != "sudo", "elevated registrar used sudo");
    }});

    tests.push_back({"job_install_failure_is_registration_error", [] {
        TempDir dir;
        Config cfg = job_config(dir);
        tests::FakeRunner runner;
        runner.failing.insert("bootstrap");
        JobRegistrar registrar(cfg, runner, true);

        std::string message;
        try {
            registrar.install(daily_at("abc", "09:00"));
        } catch (const RegistrationError& e) {
            message = e.what();
        }
        require(starts_with(message, "load launchd job:"), "message '" + message + "'");
        require(runner.loaded.empty(), "job should not be loaded");
    }});

    tests.push_back({"job_install_unprivileged_goes_through_sudo", [] {
        TempDir dir;
        Config cfg = job_config(dir);
        tests::FakeRunner runner;
        JobRegistrar registrar(cfg, runner, false);

        registrar.install(daily_at("abc", "09:00"));
        require(!runner.commands.empty(), "no commands run");
        for (auto& c : runner.commands) require(c.program == "sudo", "command without sudo: " + c.program);
        require(runner.loaded.size() == 1, "job not loaded");
    }});

    tests.push_back({"job_remove_tolerates_missing_job", [] {
        TempDir dir;
        Config cfg = job_config(dir);
        tests::FakeRunner runner;
        JobRegistrar registrar(cfg, runner, true);

        registrar.remove(daily_at("never-installed", "09:00"));
        require(runner.count("bootout") == 1 && runner.count("rm") == 1, "expected bootout and rm");

        auto entry = daily_at("abc", "09:00");
        registrar.install(entry);
        registrar.remove(entry);
        require(runner.loaded.empty(), "job still loaded");
        require(!fs::exists(registrar.job_path("abc")), "descriptor still present");
    }});

    tests.push_back({"job_remove_if_privileged_needs_root", [] {
        TempDir dir;
        Config cfg = job_config(dir);
        tests::FakeRunner runner;
        JobRegistrar user_registrar(cfg, runner, false);
        user_registrar.remove_if_privileged(daily_at("abc", "09:00"));
        require(runner.commands.empty(), "unprivileged removal ran commands");

        JobRegistrar root_registrar(cfg, runner, true);
        root_registrar.remove_if_privileged(daily_at("abc", "09:00"));
        require(runner.count("rm") == 1, "privileged removal skipped");
    }});

    tests.push_back({"wake_schedule_and_cancel_commands", [] {
        Config cfg;
        tests::FakeRunner runner;
        WakeScheduler wake(cfg, runner, true);
        auto entry = daily_at("abc", "09:00");

        wake.schedule(entry, "10/20/26 09:00:00");
        auto argv = tests::FakeRunner::argv_of(runner.commands.back());
        require(argv == std::vector<std::string>{"pmset", "schedule", "wakeorpoweron", "10/20/26 09:00:00",
                                                 "com.wakeprompt.abc"},
                "schedule argv");

        entry.wake_time = "10/20/26 09:00:00";
        require(wake.cancel(entry), "cancel failed");
        argv = tests::FakeRunner::argv_of(runner.commands.back());
        require(argv.size() == 6 && argv[2] == "cancel" && argv[4] == "10/20/26 09:00:00", "cancel argv");

        size_t before = runner.commands.size();
        wake.schedule(entry, "");
        entry.wake_time.clear();
        require(wake.cancel(entry), "empty cancel should succeed");
        require(runner.commands.size() == before, "empty wake time ran pmset");
    }});

    tests.push_back({"wake_failures", [] {
        Config cfg;
        tests::FakeRunner runner;
        runner.failing.insert("pmset");
        WakeScheduler wake(cfg, runner, false);
        auto entry = daily_at("abc", "09:00");

        bool threw = false;
        try {
            wake.schedule(entry, entry.wake_time);
        } catch (const RegistrationError&) {
            threw = true;
        }
        require(threw, "schedule failure not raised");
        require(!wake.cancel(entry), "cancel failure should return false");
        require(runner.commands.back().program == "sudo", "unprivileged pmset without sudo");
    }});
}
