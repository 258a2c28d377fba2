#include "privilege.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <climits>
#include <unistd.h>
#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace wakeprompt {

bool running_elevated() {
    return geteuid() == 0;
}

Command run_as(const ExecContext& ctx, const Command& cmd) {
    std::map<std::string, std::string> env;
    for (auto& [k, v] : ctx.account.environment()) {
        if (!v.empty()) env[k] = v;
    }

    if (!ctx.crosses_session()) {
        Command out = cmd;
        for (auto& [k, v] : cmd.env) env[k] = v;
        out.env = std::move(env);
        return out;
    }

    Command out;
    out.program = "/bin/launchctl";
    out.args = {"asuser", std::to_string(ctx.account.uid),
                "/usr/bin/sudo", "-u", ctx.account.user, "-H", "--",
                "/usr/bin/env"};
    for (auto& [k, v] : cmd.env) out.args.push_back(k + "=" + v);
    out.args.push_back(cmd.program);
    out.args.insert(out.args.end(), cmd.args.begin(), cmd.args.end());

    out.env = std::move(env);
    out.work_dir = cmd.work_dir;
    out.output_path = cmd.output_path;
    out.quiet = cmd.quiet;
    out.capture = cmd.capture;
    out.interactive = cmd.interactive;
    return out;
}

Command privileged(bool elevated, const Command& cmd) {
    if (elevated) return cmd;
    Command out = cmd;
    out.program = "sudo";
    out.args.clear();
    out.args.push_back(cmd.program);
    out.args.insert(out.args.end(), cmd.args.begin(), cmd.args.end());
    return out;
}

void ensure_privilege(ProcessRunner& runner, bool elevated) {
    if (elevated) return;
    Command cmd;
    cmd.program = "sudo";
    cmd.args = {"-v"};
    cmd.interactive = true;
    auto result = runner.run(cmd);
    if (!result.ok()) {
        throw SetupError("administrator access required: " + result.error);
    }
}

std::string current_executable_path() {
#ifdef __APPLE__
    char buf[PATH_MAX];
    uint32_t size = sizeof(buf);
    if (_NSGetExecutablePath(buf, &size) == 0) {
        std::error_code ec;
        auto canonical = fs::weakly_canonical(buf, ec);
        return ec ? std::string(buf) : canonical.string();
    }
    return "";
#else
    std::error_code ec;
    auto target = fs::read_symlink("/proc/self/exe", ec);
    return ec ? "" : target.string();
#endif
}

} // namespace wakeprompt
