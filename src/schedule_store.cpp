#include "schedule_store.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace wakeprompt {

// ── FileLock ────────────────────────────────────────────────────────

FileLock::FileLock(const std::string& path) {
    std::string lock_path = path + ".lock";
    fd_ = ::open(lock_path.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("lock " + lock_path + ": " + std::strerror(errno));
    }
    while (flock(fd_, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("lock " + lock_path + ": " + std::strerror(err));
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

// ── Helpers ─────────────────────────────────────────────────────────

namespace {

struct LogFile {
    std::string path;
    fs::file_time_type mod_time;
};

std::vector<LogFile> list_log_files(const std::string& dir, const std::string& prefix,
                                    const std::string& suffix) {
    std::vector<LogFile> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return files;

    for (auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code fec;
        if (!entry.is_regular_file(fec)) continue;
        std::string name = entry.path().filename().string();
        if (!starts_with(name, prefix)) continue;
        if (name.size() < suffix.size() ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        auto mtime = entry.last_write_time(fec);
        if (fec) continue;
        files.push_back({entry.path().string(), mtime});
    }
    return files;
}

void sort_newest_first(std::vector<LogFile>& files) {
    std::sort(files.begin(), files.end(),
              [](const LogFile& a, const LogFile& b) { return a.mod_time > b.mod_time; });
}

void remove_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

void chown_quietly(const std::string& path, int uid, int gid) {
    if (uid < 0 || gid < 0) return;
    if (::chown(path.c_str(), static_cast<uid_t>(uid), static_cast<gid_t>(gid)) != 0) {
        std::cerr << "[store] chown " << path << ": " << std::strerror(errno) << "\n";
    }
}

std::string clean_path(const std::string& p) {
    return fs::path(p).lexically_normal().string();
}

} // namespace

// ── ScheduleStore ───────────────────────────────────────────────────

ScheduleStore::ScheduleStore(const std::string& base_dir)
    : base_dir_(base_dir),
      logs_dir_((fs::path(base_dir) / "logs").string()),
      schedules_path_((fs::path(base_dir) / "schedules.json").string()),
      logs_path_((fs::path(base_dir) / "logs.jsonl").string()) {}

void ScheduleStore::ensure() const {
    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) throw std::runtime_error("create data directory: " + ec.message());
    fs::create_directories(logs_dir_, ec);
    if (ec) throw std::runtime_error("create logs directory: " + ec.message());
}

std::vector<ScheduleEntry> ScheduleStore::load() const {
    ensure();
    std::vector<ScheduleEntry> entries;

    std::ifstream f(schedules_path_);
    if (!f) {
        std::error_code ec;
        if (!fs::exists(schedules_path_, ec)) return entries;
        throw std::runtime_error("read schedules: cannot open " + schedules_path_);
    }

    try {
        auto j = nlohmann::json::parse(f);
        if (j.contains("schedules") && j["schedules"].is_array()) {
            for (auto& item : j["schedules"]) {
                entries.push_back(ScheduleEntry::from_json(item));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("parse schedules: ") + e.what());
    }
    return entries;
}

void ScheduleStore::save(const std::vector<ScheduleEntry>& entries) const {
    ensure();

    nlohmann::json j;
    j["version"] = kScheduleFileVersion;
    j["schedules"] = nlohmann::json::array();
    for (auto& e : entries) j["schedules"].push_back(e.to_json());

    std::string tmp = schedules_path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("write schedules: cannot open " + tmp);
        out << j.dump(2);
        out.flush();
        if (!out) {
            remove_quietly(tmp);
            throw std::runtime_error("write schedules: short write to " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, schedules_path_, ec);
    if (ec) {
        remove_quietly(tmp);
        throw std::runtime_error("write schedules: " + ec.message());
    }
}

ScheduleEntry ScheduleStore::find(const std::string& id) const {
    for (auto& e : load()) {
        if (e.id == id) return e;
    }
    throw NotFoundError("schedule not found: " + id);
}

void ScheduleStore::add(const ScheduleEntry& entry) const {
    ensure();
    FileLock lock(schedules_path_);
    auto entries = load();
    entries.push_back(entry);
    save(entries);
}

void ScheduleStore::update(const ScheduleEntry& entry) const {
    ensure();
    FileLock lock(schedules_path_);
    auto entries = load();
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const ScheduleEntry& e) { return e.id == entry.id; });
    if (it == entries.end()) throw NotFoundError("schedule not found: " + entry.id);
    *it = entry;
    save(entries);
}

ScheduleEntry ScheduleStore::remove(const std::string& id) const {
    ensure();
    FileLock lock(schedules_path_);
    auto entries = load();
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const ScheduleEntry& e) { return e.id == id; });
    if (it == entries.end()) throw NotFoundError("schedule not found: " + id);
    ScheduleEntry removed = *it;
    entries.erase(it);
    save(entries);
    return removed;
}

void ScheduleStore::chown_schedules(int uid, int gid) const {
    chown_quietly(schedules_path_, uid, gid);
}

// ── Run history ─────────────────────────────────────────────────────

LogEntry ScheduleStore::append_log(LogEntry entry, int uid, int gid) const {
    ensure();
    if (entry.id.empty()) entry.id = new_id();

    {
        std::ofstream out(logs_path_, std::ios::app);
        if (!out) throw std::runtime_error("write log: cannot open " + logs_path_);
        out << entry.to_json().dump() << "\n";
        out.flush();
        if (!out) throw std::runtime_error("write log: short write to " + logs_path_);
    }

    chown_quietly(logs_path_, uid, gid);
    return entry;
}

std::vector<LogEntry> ScheduleStore::load_logs(size_t limit) const {
    ensure();
    std::vector<LogEntry> entries;

    std::ifstream f(logs_path_);
    if (!f) {
        std::error_code ec;
        if (!fs::exists(logs_path_, ec)) return entries;
        throw std::runtime_error("read logs: cannot open " + logs_path_);
    }

    std::string line;
    while (std::getline(f, line)) {
        line = trim(line);
        if (line.empty()) continue;
        try {
            entries.push_back(LogEntry::from_json(nlohmann::json::parse(line)));
        } catch (const nlohmann::json::exception&) {
            continue;
        } catch (const std::runtime_error&) {
            continue;  // unreadable timestamp
        }
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const LogEntry& a, const LogEntry& b) { return a.ran_at > b.ran_at; });
    if (limit > 0 && entries.size() > limit) entries.resize(limit);
    return entries;
}

std::string ScheduleStore::run_log_path(const LogEntry& entry) const {
    std::string name = "run-" + entry.schedule_id + "-" +
                       format_local(entry.ran_at, "%Y%m%d-%H%M%S") + ".log";
    return (fs::path(logs_dir_) / name).string();
}

std::string ScheduleStore::daemon_stdout_path(const std::string& schedule_id) const {
    return (fs::path(logs_dir_) / ("daemon-" + schedule_id + ".out.log")).string();
}

std::string ScheduleStore::daemon_stderr_path(const std::string& schedule_id) const {
    return (fs::path(logs_dir_) / ("daemon-" + schedule_id + ".err.log")).string();
}

// ── Retention ───────────────────────────────────────────────────────

void ScheduleStore::prune_logs(int run_max, int daemon_max, int uid, int gid) const {
    if (run_max <= 0 && daemon_max <= 0) return;
    ensure();

    auto entries = load_logs(0);
    if (run_max > 0 && entries.size() > static_cast<size_t>(run_max)) {
        entries.resize(static_cast<size_t>(run_max));
    }

    std::set<std::string> keep;
    for (auto& e : entries) {
        std::string path = e.output_path.empty() ? run_log_path(e) : e.output_path;
        if (!path.empty()) keep.insert(clean_path(path));
    }

    write_log_index(entries, uid, gid);

    // Run outputs: referenced by the kept index, or newest by mtime when
    // there is no index to go by.
    if (run_max > 0) {
        auto files = list_log_files(logs_dir_, "run-", ".log");
        if (!keep.empty()) {
            for (auto& file : files) {
                if (!keep.count(clean_path(file.path))) remove_quietly(file.path);
            }
        } else if (files.size() > static_cast<size_t>(run_max)) {
            sort_newest_first(files);
            for (size_t i = static_cast<size_t>(run_max); i < files.size(); i++) {
                remove_quietly(files[i].path);
            }
        }
    }

    // Daemon stdout/stderr are never referenced by the index.
    if (daemon_max > 0) {
        auto files = list_log_files(logs_dir_, "daemon-", ".log");
        if (files.size() > static_cast<size_t>(daemon_max)) {
            sort_newest_first(files);
            for (size_t i = static_cast<size_t>(daemon_max); i < files.size(); i++) {
                remove_quietly(files[i].path);
            }
        }
    }
}

void ScheduleStore::write_log_index(std::vector<LogEntry> entries, int uid, int gid) const {
    std::error_code ec;
    if (entries.empty() && !fs::exists(logs_path_, ec)) return;

    std::reverse(entries.begin(), entries.end());

    std::string tmp = logs_path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("write log: cannot open " + tmp);
        for (auto& e : entries) out << e.to_json().dump() << "\n";
        out.flush();
        if (!out) {
            remove_quietly(tmp);
            throw std::runtime_error("write log: short write to " + tmp);
        }
    }

    fs::rename(tmp, logs_path_, ec);
    if (ec) {
        remove_quietly(tmp);
        throw std::runtime_error("write log: " + ec.message());
    }
    chown_quietly(logs_path_, uid, gid);
}

} // namespace wakeprompt
