#include "wake.hpp"
#include "errors.hpp"
#include "job_registrar.hpp"
#include "privilege.hpp"
#include <iostream>

namespace wakeprompt {

WakeScheduler::WakeScheduler(const Config& cfg, ProcessRunner& runner, bool elevated)
    : cfg_(cfg), runner_(runner), elevated_(elevated) {}

void WakeScheduler::schedule(const ScheduleEntry& entry, const std::string& when) {
    if (when.empty()) return;
    Command cmd;
    cmd.program = "pmset";
    cmd.args = {"schedule", "wakeorpoweron", when, job_label(cfg_, entry.id)};
    cmd.interactive = !elevated_;

    auto result = runner_.run(privileged(elevated_, cmd));
    if (!result.ok()) throw RegistrationError("schedule wake: " + result.error);
    std::cerr << "[wake] Wake scheduled for " << when << "\n";
}

bool WakeScheduler::cancel(const ScheduleEntry& entry) {
    if (entry.wake_time.empty()) return true;
    Command cmd;
    cmd.program = "pmset";
    cmd.args = {"schedule", "cancel", "wakeorpoweron", entry.wake_time, job_label(cfg_, entry.id)};
    cmd.interactive = !elevated_;

    auto result = runner_.run(privileged(elevated_, cmd));
    if (!result.ok()) {
        std::cerr << "[wake] Cancel " << entry.wake_time << " failed: " << result.error << "\n";
        return false;
    }
    return true;
}

} // namespace wakeprompt
