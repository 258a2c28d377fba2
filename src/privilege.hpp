#pragma once
#include "process.hpp"
#include "schedule.hpp"
#include <string>

namespace wakeprompt {

// Who a command runs for, and whether the caller holds root.
struct ExecContext {
    Account account;
    bool elevated = false;

    // Root acting for an ordinary account must enter that account's session.
    bool crosses_session() const { return elevated && account.uid > 0; }
};

bool running_elevated();

// Rewrites `cmd` to run for `ctx.account`. Without crossing, the account's
// PATH/HOME/USER/LOGNAME are layered under the command's own overrides.
// With crossing, the command is launched inside the account's login session:
//   launchctl asuser <uid> sudo -u <user> -H -- env K=V... <program> <args>
Command run_as(const ExecContext& ctx, const Command& cmd);

// Administrative commands go through sudo unless already elevated.
Command privileged(bool elevated, const Command& cmd);

// Validates sudo credentials up front (prompting on the terminal) so later
// administrative steps do not stall half-way. Throws SetupError on refusal.
void ensure_privilege(ProcessRunner& runner, bool elevated);

// Absolute path of the running binary.
std::string current_executable_path();

} // namespace wakeprompt
