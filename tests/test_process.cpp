#include "errors.hpp"
#include "privilege.hpp"
#include "process.hpp"
#include "test_framework.hpp"
#include "test_helpers.hpp"

namespace {

using wakeprompt::tests::require;
using wakeprompt::tests::TempDir;
using namespace wakeprompt;

Command shell(const std::string& script) {
    Command cmd;
    cmd.program = "/bin/sh";
    cmd.args = {"-c", script};
    return cmd;
}

bool has_arg(const Command& cmd, const std::string& arg) {
    return std::find(cmd.args.begin(), cmd.args.end(), arg) != cmd.args.end();
}

} // namespace

void register_process_tests(std::vector<wakeprompt::tests::TestCase>& tests) {
    tests.push_back({"process_reports_exit_status", [] {
        PosixProcessRunner runner;
        auto r = runner.run(shell("exit 3"));
        require(r.exit_code == 3, "exit code " + std::to_string(r.exit_code));
        require(r.error == "exit status 3", "error " + r.error);
        require(!r.ok(), "non-zero exit reported ok");

        auto ok = runner.run(shell("exit 0"));
        require(ok.ok() && ok.error.empty(), "clean exit not ok");
    }});

    tests.push_back({"process_reports_signal_death", [] {
        PosixProcessRunner runner;
        auto r = runner.run(shell("kill -9 $$"));
        require(r.signal == 9, "signal " + std::to_string(r.signal));
        require(r.exit_code == 137, "exit code " + std::to_string(r.exit_code));
        require(starts_with(r.error, "signal: "), "error " + r.error);
    }});

    tests.push_back({"process_captures_stdout_with_env_overrides", [] {
        PosixProcessRunner runner;
        auto cmd = shell("printf '%s' \"$WAKEPROMPT_TEST_VALUE\"");
        cmd.env["WAKEPROMPT_TEST_VALUE"] = "hello there";
        cmd.capture = true;
        auto r = runner.run(cmd);
        require(r.ok(), "run failed: " + r.error);
        require(r.output == "hello there", "output '" + r.output + "'");
    }});

    tests.push_back({"process_appends_output_and_uses_work_dir", [] {
        TempDir dir;
        PosixProcessRunner runner;
        std::string out = dir.str("out.log");
        tests::write_file(out, "first\n");

        auto cmd = shell("pwd; echo oops >&2");
        cmd.work_dir = dir.str();
        cmd.output_path = out;
        auto r = runner.run(cmd);
        require(r.ok(), "run failed: " + r.error);

        std::string text = read_file(out);
        require(starts_with(text, "first\n"), "output file truncated");
        require(text.find(fs::canonical(dir.path()).string()) != std::string::npos ||
                    text.find(dir.str()) != std::string::npos,
                "work dir not used: " + text);
        require(text.find("oops") != std::string::npos, "stderr not captured");
    }});

    tests.push_back({"process_missing_program_is_a_start_failure", [] {
        PosixProcessRunner runner;
        Command cmd;
        cmd.program = "wakeprompt-no-such-program";
        bool threw = false;
        try {
            runner.spawn(cmd);
        } catch (const SetupError& e) {
            threw = std::string(e.what()).find("executable not found") != std::string::npos;
        }
        require(threw, "spawn should throw SetupError");

        auto r = runner.run(cmd);
        require(!r.ok() && r.error.find("executable not found") != std::string::npos,
                "run should report the start failure");
    }});

    tests.push_back({"process_find_in_path", [] {
        TempDir dir;
        tests::write_script(dir.path() / "bin" / "tool", "exit 0\n");
        tests::write_file(dir.path() / "bin" / "plain", "not executable");

        std::string path = "/nonexistent:" + dir.str("bin");
        require(find_in_path(path, "tool") == dir.str("bin/tool"), "executable not found");
        require(find_in_path(path, "plain").empty(), "non-executable file matched");
        require(find_in_path(path, "missing").empty(), "missing file matched");
        require(find_in_path("", dir.str("bin/tool")) == dir.str("bin/tool"), "absolute path not checked");
    }});

    tests.push_back({"privilege_run_as_same_session_layers_env", [] {
        ExecContext ctx;
        ctx.account.user = "tester";
        ctx.account.uid = 501;
        ctx.account.home_dir = "/Users/tester";
        ctx.account.path_env = "/opt/bin:/usr/bin";
        ctx.elevated = false;

        Command cmd;
        cmd.program = "claude";
        cmd.args = {"-p", "hi"};
        cmd.env["HOME"] = "/override";
        cmd.env["TOKEN"] = "t";

        auto out = run_as(ctx, cmd);
        require(out.program == "claude" && out.args == cmd.args, "command rewritten without crossing");
        require(out.env["PATH"] == "/opt/bin:/usr/bin", "account PATH missing");
        require(out.env["HOME"] == "/override", "command override lost");
        require(out.env["TOKEN"] == "t", "command env lost");
        require(out.env["LOGNAME"] == "tester", "LOGNAME missing");
    }});

    tests.push_back({"privilege_run_as_crossing_enters_user_session", [] {
        ExecContext ctx;
        ctx.account.user = "tester";
        ctx.account.uid = 501;
        ctx.account.home_dir = "/Users/tester";
        ctx.account.path_env = "/usr/bin";
        ctx.elevated = true;
        require(ctx.crosses_session(), "root acting for uid 501 should cross");

        Command cmd;
        cmd.program = "/usr/local/bin/claude";
        cmd.args = {"-p", "hi"};
        cmd.env["TOKEN"] = "t";
        cmd.output_path = "/tmp/out.log";

        auto out = run_as(ctx, cmd);
        require(out.program == "/bin/launchctl", "program " + out.program);
        std::vector<std::string> head(out.args.begin(), out.args.begin() + 8);
        std::vector<std::string> want = {"asuser", "501", "/usr/bin/sudo", "-u", "tester", "-H", "--",
                                         "/usr/bin/env"};
        require(head == want, "unexpected session prefix");
        require(has_arg(out, "TOKEN=t"), "env not passed through env(1)");
        require(out.args[out.args.size() - 3] == "/usr/local/bin/claude", "target program not last");
        require(out.args.back() == "hi", "target args lost");
        require(out.output_path == "/tmp/out.log", "output path lost");

        ExecContext root_for_root{ctx.account, true};
        root_for_root.account.uid = 0;
        require(!root_for_root.crosses_session(), "root acting for root should not cross");
    }});

    tests.push_back({"privilege_prefixes_sudo_unless_elevated", [] {
        Command cmd;
        cmd.program = "pmset";
        cmd.args = {"schedule", "cancel"};
        auto wrapped = privileged(false, cmd);
        require(wrapped.program == "sudo", "sudo missing");
        require(wrapped.args.size() == 3 && wrapped.args[0] == "pmset", "sudo argv");
        require(privileged(true, cmd).program == "pmset", "elevated command wrapped");
    }});

    tests.push_back({"privilege_ensure_reports_refusal", [] {
        tests::FakeRunner runner;
        ensure_privilege(runner, true);
        require(runner.commands.empty(), "elevated caller should not run sudo");

        ensure_privilege(runner, false);
        require(runner.commands.size() == 1 && runner.commands[0].program == "sudo" &&
                    runner.commands[0].args == std::vector<std::string>{"-v"},
                "expected sudo -v");
        require(runner.commands[0].interactive, "sudo -v needs the terminal");
    }});
}
