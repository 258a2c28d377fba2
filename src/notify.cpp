#include "notify.hpp"
#include "utils.hpp"
#include <iostream>

namespace wakeprompt {

namespace {

// A bare "exit status N" says nothing the subtitle does not.
bool is_meaningful_error(const std::string& error) {
    std::string e = trim(error);
    if (e.empty()) return false;
    return !starts_with(to_lower(e), "exit status");
}

} // namespace

Notification summarize_run(const LogEntry& log) {
    Notification n;
    n.title = "WakePrompt";
    n.subtitle = "Run complete";
    n.message = log.prompt_preview;

    bool success = log.status == kStatusSuccess;
    if (!success) {
        n.subtitle = "Run failed";
        if (is_meaningful_error(log.error)) n.message = log.error;
    }
    if (trim(n.message).empty()) n.message = success ? "Run finished." : "Run failed.";

    n.message = truncate_text(trim(n.message), 140);
    return n;
}

std::string escape_applescript(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n':
            case '\r': out += ' '; break;
            default: out += c;
        }
    }
    return out;
}

std::string build_notification_script(const Notification& n) {
    return "display notification \"" + escape_applescript(n.message) +
           "\" with title \"" + escape_applescript(n.title) +
           "\" subtitle \"" + escape_applescript(n.subtitle) + "\"";
}

// ── OsascriptNotifier ───────────────────────────────────────────────

OsascriptNotifier::OsascriptNotifier(const Config& cfg, ProcessRunner& runner)
    : cfg_(cfg), runner_(runner) {}

void OsascriptNotifier::notify(const ExecContext& ctx, const Notification& n) {
    if (!cfg_.notifications) return;

    Command cmd;
    cmd.program = "/usr/bin/osascript";
    cmd.args = {"-e", build_notification_script(n)};
    cmd.quiet = true;

    auto result = runner_.run(run_as(ctx, cmd));
    if (!result.ok()) {
        std::cerr << "[notify] osascript failed: " << result.error << "\n";
    }
}

} // namespace wakeprompt
