#pragma once
#include "config.hpp"
#include "privilege.hpp"
#include "process.hpp"
#include "schedule.hpp"
#include <string>

namespace wakeprompt {

struct Notification {
    std::string title;
    std::string subtitle;
    std::string message;
};

// Title, subtitle and a message of at most 140 characters for a finished run.
Notification summarize_run(const LogEntry& log);

// AppleScript `display notification` statement.
std::string build_notification_script(const Notification& n);

std::string escape_applescript(const std::string& text);

class Notifier {
public:
    virtual ~Notifier() = default;
    // Best-effort; never throws.
    virtual void notify(const ExecContext& ctx, const Notification& n) = 0;
};

// Posts through osascript inside the account's session.
class OsascriptNotifier : public Notifier {
public:
    OsascriptNotifier(const Config& cfg, ProcessRunner& runner);
    void notify(const ExecContext& ctx, const Notification& n) override;

private:
    const Config& cfg_;
    ProcessRunner& runner_;
};

} // namespace wakeprompt
