#pragma once
#include "config.hpp"
#include "privilege.hpp"
#include "schedule.hpp"
#include "timeutil.hpp"
#include <string>
#include <vector>

namespace wakeprompt {

// One "<uuid>.jsonl" transcript inside a project directory.
struct SessionInfo {
    std::string id;
    std::string path;
    TimePoint mod_time;
    std::string preview;
};

bool is_uuid(const std::string& value);

// Transcripts in `dir`, newest first (ties by id).
// Throws std::runtime_error when `dir` is missing or not a directory.
std::vector<SessionInfo> collect_sessions(const std::string& dir);

// Readers below return "" when the file cannot be read or holds nothing useful.

// First "cwd" field within the first 200 records.
std::string extract_cwd(const std::string& path);
// First user message text within the first 400 records, whitespace-normalized.
std::string extract_first_user_text(const std::string& path);
// Summary, else first user text, else first assistant text; 140 characters at most.
std::string extract_preview(const std::string& path);

// Fills SessionInfo::preview using 2-4 worker threads. Always drains.
void fill_session_previews(std::vector<SessionInfo>& sessions);

// Transcript directory name for a project: the absolute path with '/' -> '-'.
std::string project_dir_name(const std::string& project_path);

// Transcript directory under `projects_root` holding sessions for
// `project_path`, or "".
std::string find_project_dir(const std::string& projects_root, const std::string& project_path);

// Compares whitespace-normalized 200-character prefixes, ignoring ASCII
// case: true when either is a prefix of the other.
bool prompt_matches_text(const std::string& prompt, const std::string& text);

// Attributes a freshly started session to a run.
class SessionLocator {
public:
    virtual ~SessionLocator() = default;
    // Id of the session the run begun at `since` created, or "".
    virtual std::string find_new_session(const ScheduleEntry& entry, const ExecContext& ctx,
                                         TimePoint since) = 0;
};

// Looks for a transcript modified in [since - 30s, now] whose first user
// message matches the scheduled prompt. Heuristic: concurrent sessions or
// reworded prompts are simply not attributed.
class TranscriptSessionLocator : public SessionLocator {
public:
    explicit TranscriptSessionLocator(const Config& cfg);
    std::string find_new_session(const ScheduleEntry& entry, const ExecContext& ctx,
                                 TimePoint since) override;

private:
    const Config& cfg_;
};

} // namespace wakeprompt
