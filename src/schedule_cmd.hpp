#pragma once
#include "scheduling.hpp"
#include <string>
#include <vector>

namespace wakeprompt {

// Applies --project/--prompt/--once/--daily/--weekly/--session/
// --session-path/--model/--permission-mode/--timezone flags from
// args[start..] onto `draft`. Returns an error message, or "" on success.
std::string apply_draft_args(const std::vector<std::string>& args, size_t start, ScheduleDraft& draft);

// "once 2026-10-20 09:00", "daily 09:00", "weekly monday 09:00".
std::string describe_schedule(const ScheduleSpec& spec);

int cmd_run(const std::string& id);
int cmd_add(const std::vector<std::string>& args);
int cmd_edit(const std::vector<std::string>& args);
int cmd_remove(const std::vector<std::string>& args);
int cmd_list();
int cmd_logs(const std::vector<std::string>& args);
// Transcripts of a project, newest first, for picking a --session id.
int cmd_sessions(const std::vector<std::string>& args);
int cmd_prune();
// Writes a default config to `config_path` unless one is already there.
int cmd_init(const std::string& config_path);

} // namespace wakeprompt
