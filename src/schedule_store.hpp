#pragma once
#include "schedule.hpp"
#include <string>
#include <vector>

namespace wakeprompt {

constexpr int kScheduleFileVersion = 1;

// Exclusive advisory lock held on "<path>.lock" for the guard's lifetime.
// The lock file is left in place so later lockers contend on the same inode.
class FileLock {
public:
    explicit FileLock(const std::string& path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

// File-backed schedule list and run history.
//
//   <base>/schedules.json   {"version": 1, "schedules": [...]}
//   <base>/logs.jsonl       one LogEntry per line, chronological
//   <base>/logs/            run-<id>-<stamp>.log and daemon-<id>.{out,err}.log
class ScheduleStore {
public:
    explicit ScheduleStore(const std::string& base_dir);

    const std::string& base_dir() const { return base_dir_; }
    const std::string& logs_dir() const { return logs_dir_; }
    const std::string& schedules_path() const { return schedules_path_; }
    const std::string& logs_path() const { return logs_path_; }

    // Creates the data and log directories.
    void ensure() const;

    // Missing file = empty list.
    std::vector<ScheduleEntry> load() const;
    // Atomic: writes a sibling temp file, then renames over the list.
    void save(const std::vector<ScheduleEntry>& entries) const;

    ScheduleEntry find(const std::string& id) const;  // throws NotFoundError
    void add(const ScheduleEntry& entry) const;
    void update(const ScheduleEntry& entry) const;             // throws NotFoundError
    ScheduleEntry remove(const std::string& id) const;         // throws NotFoundError

    // Best-effort ownership fix-up of the schedule list.
    void chown_schedules(int uid, int gid) const;

    // Appends one record, assigning an id when empty. Ownership is handed
    // to uid/gid when both are >= 0.
    LogEntry append_log(LogEntry entry, int uid = -1, int gid = -1) const;

    // Newest first; malformed lines are skipped. limit 0 = all.
    std::vector<LogEntry> load_logs(size_t limit = 0) const;

    // Keeps the newest `run_max` log records and the run outputs they
    // reference, and the newest `daemon_max` daemon log files by mtime.
    void prune_logs(int run_max, int daemon_max, int uid = -1, int gid = -1) const;

    // Default run output location for a log record.
    std::string run_log_path(const LogEntry& entry) const;

    std::string daemon_stdout_path(const std::string& schedule_id) const;
    std::string daemon_stderr_path(const std::string& schedule_id) const;

private:
    std::string base_dir_;
    std::string logs_dir_;
    std::string schedules_path_;
    std::string logs_path_;

    void write_log_index(std::vector<LogEntry> entries, int uid, int gid) const;
};

} // namespace wakeprompt
