#pragma once
#include <map>
#include <string>
#include <vector>

namespace wakeprompt {

// ── Data structures ─────────────────────────────────────────────────

struct Command {
    std::string program;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // overrides; an empty value blanks the variable
    std::string work_dir;
    std::string output_path;  // stdout and stderr appended here when set
    bool quiet = false;       // discard stdout and stderr
    bool capture = false;     // return stdout in ProcessResult::output
    bool interactive = false; // keep the caller's stdin instead of /dev/null
};

struct ProcessResult {
    int exit_code = -1;
    int signal = 0;
    std::string output;
    std::string error;  // "exit status N", "signal: killed", or a start failure

    bool ok() const { return exit_code == 0 && error.empty(); }
};

// ── Runner ──────────────────────────────────────────────────────────

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Starts `cmd`; throws SetupError when it cannot be started.
    virtual int spawn(const Command& cmd) = 0;
    // Blocks until `pid` (returned by spawn) exits.
    virtual ProcessResult wait(int pid) = 0;
    // Full path of `name` on `path_env`, or "".
    virtual std::string which(const std::string& name, const std::string& path_env) = 0;

    // spawn + wait; a start failure is reported in the result, not thrown.
    virtual ProcessResult run(const Command& cmd);
};

// fork/execve implementation.
class PosixProcessRunner : public ProcessRunner {
public:
    int spawn(const Command& cmd) override;
    ProcessResult wait(int pid) override;
    std::string which(const std::string& name, const std::string& path_env) override;

private:
    std::map<int, int> capture_fds_;  // pid -> read end of the stdout pipe
};

// Searches the colon-separated `path_env` for an executable regular file.
// Names containing '/' are checked as given.
std::string find_in_path(const std::string& path_env, const std::string& name);

// Shell-style rendering for diagnostics.
std::string describe_command(const Command& cmd);

} // namespace wakeprompt
