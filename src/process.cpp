#include "process.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstring>
#include <csignal>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace wakeprompt {

namespace {

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; e++) {
        std::string kv = *e;
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    return env;
}

std::string signal_name(int sig) {
    const char* name = strsignal(sig);
    if (!name) return "signal " + std::to_string(sig);
    return to_lower(name);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

// ── Lookup ──────────────────────────────────────────────────────────

std::string find_in_path(const std::string& path_env, const std::string& name) {
    auto executable = [](const std::string& p) {
        struct stat st{};
        return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) return executable(name) ? name : "";

    std::istringstream iss(path_env);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = (fs::path(dir) / name).string();
        if (executable(candidate)) return candidate;
    }
    return "";
}

std::string describe_command(const Command& cmd) {
    std::string out = cmd.program;
    for (auto& a : cmd.args) {
        bool plain = !a.empty() && a.find_first_of(" \t\n\"'\\$") == std::string::npos;
        out += ' ';
        out += plain ? a : "'" + a + "'";
    }
    return out;
}

// ── ProcessRunner ───────────────────────────────────────────────────

ProcessResult ProcessRunner::run(const Command& cmd) {
    int pid = 0;
    try {
        pid = spawn(cmd);
    } catch (const SetupError& e) {
        ProcessResult r;
        r.error = e.what();
        return r;
    }
    return wait(pid);
}

// ── PosixProcessRunner ──────────────────────────────────────────────

std::string PosixProcessRunner::which(const std::string& name, const std::string& path_env) {
    return find_in_path(path_env, name);
}

int PosixProcessRunner::spawn(const Command& cmd) {
    auto env = current_environment();
    for (auto& [k, v] : cmd.env) env[k] = v;

    std::string search_path = env.count("PATH") ? env["PATH"] : "";
    std::string exe = find_in_path(search_path, cmd.program);
    if (exe.empty()) throw SetupError("executable not found: " + cmd.program);

    int out_fd = -1;
    if (!cmd.output_path.empty()) {
        out_fd = ::open(cmd.output_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (out_fd < 0) {
            throw SetupError("open output " + cmd.output_path + ": " + std::strerror(errno));
        }
    }

    int pipe_out[2] = {-1, -1};
    if (cmd.capture && pipe(pipe_out) != 0) {
        close_fd(out_fd);
        throw SetupError(std::string("create pipe: ") + std::strerror(errno));
    }

    // Everything the child needs is built before fork.
    std::vector<std::string> env_strs;
    for (auto& [k, v] : env) env_strs.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& s : env_strs) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(cmd.program.c_str()));
    for (auto& a : cmd.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_fd(out_fd);
        close_fd(pipe_out[0]);
        close_fd(pipe_out[1]);
        throw SetupError(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0 && !cmd.interactive) dup2(devnull, STDIN_FILENO);

        if (out_fd >= 0) {
            dup2(out_fd, STDOUT_FILENO);
            dup2(out_fd, STDERR_FILENO);
        } else if (cmd.quiet && devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        if (pipe_out[1] >= 0) {
            dup2(pipe_out[1], STDOUT_FILENO);
            if (cmd.quiet && devnull >= 0) dup2(devnull, STDERR_FILENO);
            ::close(pipe_out[0]);
            ::close(pipe_out[1]);
        }
        if (devnull > STDERR_FILENO) ::close(devnull);

        if (!cmd.work_dir.empty() && chdir(cmd.work_dir.c_str()) != 0) _exit(127);

        execve(exe.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    // Parent
    close_fd(out_fd);
    if (pipe_out[1] >= 0) {
        ::close(pipe_out[1]);
        capture_fds_[pid] = pipe_out[0];
    }
    return static_cast<int>(pid);
}

ProcessResult PosixProcessRunner::wait(int pid) {
    ProcessResult result;

    auto it = capture_fds_.find(pid);
    if (it != capture_fds_.end()) {
        int fd = it->second;
        capture_fds_.erase(it);
        char buf[4096];
        while (true) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                result.output.append(buf, static_cast<size_t>(n));
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
        ::close(fd);
    }

    int status = 0;
    pid_t r;
    do {
        r = waitpid(static_cast<pid_t>(pid), &status, 0);
    } while (r < 0 && errno == EINTR);

    if (r < 0) {
        result.error = std::string("wait: ") + std::strerror(errno);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code != 0) result.error = "exit status " + std::to_string(result.exit_code);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
        result.error = "signal: " + signal_name(result.signal);
    }
    return result;
}

} // namespace wakeprompt
