#pragma once
#include "credentials.hpp"
#include "errors.hpp"
#include "notify.hpp"
#include "process.hpp"
#include "schedule.hpp"
#include "transcripts.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <fstream>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace wakeprompt::tests {

// Scratch directory removed with everything in it when the guard goes.
class TempDir {
public:
    TempDir() {
        static std::mt19937_64 rng{std::random_device{}()};
        path_ = fs::temp_directory_path() / ("wakeprompt-test-" + std::to_string(rng()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str(const std::string& sub = "") const {
        return sub.empty() ? path_.string() : (path_ / sub).string();
    }

private:
    fs::path path_;
};

class EnvGuard {
public:
    explicit EnvGuard(std::string key) : key_(std::move(key)) {
        if (const char* old = std::getenv(key_.c_str())) {
            had_old_ = true;
            old_ = old;
        }
    }
    ~EnvGuard() {
        if (had_old_) {
            setenv(key_.c_str(), old_.c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }
    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    std::string key_;
    bool had_old_ = false;
    std::string old_;
};

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

inline void write_script(const fs::path& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                              fs::perms::others_read | fs::perms::others_exec);
}

inline ScheduleEntry make_entry(const std::string& id, const ScheduleSpec& spec,
                                const std::string& timezone = "UTC") {
    ScheduleEntry e;
    e.id = id;
    e.target.project_path = "/tmp";
    e.target.prompt = "summarize yesterday's commits";
    e.target.model = "auto";
    e.target.permission_mode = "acceptEdits";
    e.target.new_session = true;
    e.schedule = spec;
    e.timezone = timezone;
    e.binary_path = "/usr/local/bin/wakeprompt";
    e.account.user = "tester";
    e.account.home_dir = "/Users/tester";
    e.account.path_env = "/usr/bin:/bin";
    return e;
}

// Stands in for sudo, install, launchctl, rm, pmset and security.
// launchctl keeps a set of loaded job paths and, like launchd, refuses to
// bootstrap a path that is already loaded.
class FakeRunner : public ProcessRunner {
public:
    std::vector<Command> commands;
    std::set<std::string> loaded;
    std::set<std::string> failing;  // "install", "bootstrap", "rm", "pmset", "security"
    std::map<std::string, std::string> executables;
    std::string keychain_token;

    int spawn(const Command& cmd) override {
        commands.push_back(cmd);
        int pid = next_pid_++;
        results_[pid] = simulate(cmd);
        return pid;
    }

    ProcessResult wait(int pid) override {
        auto it = results_.find(pid);
        if (it == results_.end()) {
            ProcessResult r;
            r.error = "wait: no such process";
            return r;
        }
        ProcessResult r = it->second;
        results_.erase(it);
        return r;
    }

    std::string which(const std::string& name, const std::string&) override {
        auto it = executables.find(name);
        return it == executables.end() ? "" : it->second;
    }

    // Program and arguments with a leading sudo removed.
    static std::vector<std::string> argv_of(const Command& cmd) {
        std::vector<std::string> argv{cmd.program};
        argv.insert(argv.end(), cmd.args.begin(), cmd.args.end());
        if (argv.size() > 1 && argv[0] == "sudo" && argv[1] != "-v") argv.erase(argv.begin());
        return argv;
    }

    // Commands run as `program` (for launchctl, `program` may be its subcommand).
    size_t count(const std::string& program) const {
        size_t n = 0;
        for (auto& c : commands) {
            auto argv = argv_of(c);
            if (argv[0] == program) n++;
            else if (argv[0] == "launchctl" && argv.size() > 1 && argv[1] == program) n++;
        }
        return n;
    }

private:
    int next_pid_ = 1000;
    std::map<int, ProcessResult> results_;

    ProcessResult simulate(const Command& cmd) {
        auto argv = argv_of(cmd);
        ProcessResult r;
        r.exit_code = 0;
        auto fail = [&](int code) {
            r.exit_code = code;
            r.error = "exit status " + std::to_string(code);
            return r;
        };

        const std::string& prog = argv[0];
        if (prog == "install") {
            if (failing.count("install")) return fail(71);
            std::error_code ec;
            fs::copy_file(argv[argv.size() - 2], argv.back(), fs::copy_options::overwrite_existing, ec);
            if (ec) return fail(71);
        } else if (prog == "launchctl" && argv.size() >= 4) {
            const std::string& path = argv[3];
            if (argv[1] == "bootout") {
                if (loaded.erase(path) == 0) return fail(3);
            } else if (argv[1] == "bootstrap") {
                if (failing.count("bootstrap") || loaded.count(path)) return fail(5);
                loaded.insert(path);
            }
        } else if (prog == "rm") {
            if (failing.count("rm")) return fail(1);
            std::error_code ec;
            fs::remove(argv.back(), ec);
        } else if (prog == "pmset") {
            if (failing.count("pmset")) return fail(1);
        } else if (prog == "/usr/bin/security") {
            if (failing.count("security") || keychain_token.empty()) return fail(44);
            r.output = keychain_token + "\n";
        }
        return r;
    }
};

class FakeCredentials : public CredentialProvider {
public:
    std::string token = "test-token";
    bool missing = false;
    int calls = 0;

    std::string resolve(const ExecContext&) override {
        calls++;
        if (missing) throw SetupError("missing setup token; run claude setup-token");
        return token;
    }
};

class FakeSessions : public SessionLocator {
public:
    std::string session_id;
    int calls = 0;

    std::string find_new_session(const ScheduleEntry&, const ExecContext&, TimePoint) override {
        calls++;
        return session_id;
    }
};

class RecordingNotifier : public Notifier {
public:
    std::vector<Notification> sent;

    void notify(const ExecContext&, const Notification& n) override { sent.push_back(n); }
};

} // namespace wakeprompt::tests
