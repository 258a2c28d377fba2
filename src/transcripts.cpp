#include "transcripts.hpp"
#include "utils.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace wakeprompt {

namespace {

constexpr size_t kPreviewMaxChars = 140;
constexpr int kMaxCwdLines = 200;
constexpr int kMaxPreviewLines = 400;
constexpr size_t kPromptMatchChars = 200;

TimePoint to_time_point(fs::file_time_type ftime) {
    auto delta = ftime - fs::file_time_type::clock::now();
    return Clock::now() + std::chrono::duration_cast<Clock::duration>(delta);
}

bool is_role(const nlohmann::json& rec, const char* role) {
    if (rec.value("type", "") == role) return true;
    auto it = rec.find("message");
    return it != rec.end() && it->is_object() && it->value("role", "") == role;
}

std::string text_item(const nlohmann::json& item) {
    if (item.is_string()) return item.get<std::string>();
    if (!item.is_object()) return "";
    auto type = item.find("type");
    if (type != item.end() && type->is_string()) {
        std::string t = type->get<std::string>();
        if (!t.empty() && t != "text") return "";
    }
    auto text = item.find("text");
    if (text != item.end() && text->is_string()) return text->get<std::string>();
    return "";
}

// Text of message.content: a string, the first text item of an array, or a text object.
std::string content_text(const nlohmann::json& rec) {
    auto msg = rec.find("message");
    if (msg == rec.end() || !msg->is_object()) return "";
    auto content = msg->find("content");
    if (content == msg->end()) return "";

    if (content->is_string()) return content->get<std::string>();
    if (content->is_array()) {
        for (auto& item : *content) {
            std::string t = text_item(item);
            if (!t.empty()) return t;
        }
        return "";
    }
    return text_item(*content);
}

// Calls `fn` with each parsed record until it returns false.
// Unparseable lines are skipped; `max_records` caps parsed records.
template <typename Fn>
void scan_records(const std::string& path, int max_records, Fn fn) {
    std::ifstream f(path);
    if (!f) return;
    std::string line;
    int seen = 0;
    while (std::getline(f, line)) {
        line = trim(line);
        if (line.empty()) continue;
        nlohmann::json rec;
        try {
            rec = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error&) {
            continue;
        }
        if (!rec.is_object()) continue;
        try {
            if (!fn(rec)) return;
        } catch (const nlohmann::json::exception&) {
            // field of an unexpected type; treat like an unreadable line
        }
        if (++seen >= max_records) return;
    }
}

} // namespace

// ── Session files ───────────────────────────────────────────────────

bool is_uuid(const std::string& value) {
    if (value.size() != 36) return false;
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::vector<SessionInfo> collect_sessions(const std::string& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) throw std::runtime_error("project path not found: " + dir);
    if (!fs::is_directory(dir, ec)) throw std::runtime_error("project path is not a directory: " + dir);

    std::vector<SessionInfo> sessions;
    fs::directory_iterator it(dir, ec);
    if (ec) throw std::runtime_error("read project directory " + dir + ": " + ec.message());

    for (auto& entry : it) {
        std::error_code fec;
        if (entry.is_directory(fec)) continue;
        std::string name = entry.path().filename().string();
        std::string lower = to_lower(name);
        if (lower.size() <= 6 || lower.compare(lower.size() - 6, 6, ".jsonl") != 0) continue;
        std::string id = name.substr(0, name.size() - 6);
        if (!is_uuid(id)) continue;

        auto mtime = entry.last_write_time(fec);
        if (fec) continue;
        sessions.push_back({id, entry.path().string(), to_time_point(mtime), ""});
    }

    std::sort(sessions.begin(), sessions.end(), [](const SessionInfo& a, const SessionInfo& b) {
        if (a.mod_time == b.mod_time) return a.id < b.id;
        return a.mod_time > b.mod_time;
    });
    return sessions;
}

std::string extract_cwd(const std::string& path) {
    std::string cwd;
    scan_records(path, kMaxCwdLines, [&](const nlohmann::json& rec) {
        cwd = rec.value("cwd", "");
        return cwd.empty();
    });
    return cwd;
}

std::string extract_first_user_text(const std::string& path) {
    std::string text;
    scan_records(path, kMaxPreviewLines, [&](const nlohmann::json& rec) {
        if (is_role(rec, "user")) text = content_text(rec);
        return text.empty();
    });
    return normalize_whitespace(text);
}

std::string extract_preview(const std::string& path) {
    std::string summary, user_text, assistant_text;
    scan_records(path, kMaxPreviewLines, [&](const nlohmann::json& rec) {
        if (rec.value("type", "") == "summary") {
            summary = rec.value("summary", "");
            if (!summary.empty()) return false;
        }
        if (user_text.empty() && is_role(rec, "user")) user_text = content_text(rec);
        if (assistant_text.empty() && is_role(rec, "assistant")) assistant_text = content_text(rec);
        return true;
    });

    if (!summary.empty()) return preview(summary, kPreviewMaxChars);
    if (!user_text.empty()) return preview(user_text, kPreviewMaxChars);
    return preview(assistant_text, kPreviewMaxChars);
}

void fill_session_previews(std::vector<SessionInfo>& sessions) {
    if (sessions.empty()) return;

    unsigned workers = std::thread::hardware_concurrency();
    workers = std::clamp(workers, 2u, 4u);
    workers = std::min<unsigned>(workers, static_cast<unsigned>(sessions.size()));

    std::atomic<size_t> next{0};
    std::vector<std::thread> pool;
    for (unsigned w = 0; w < workers; w++) {
        pool.emplace_back([&]() {
            for (size_t i = next++; i < sessions.size(); i = next++) {
                sessions[i].preview = extract_preview(sessions[i].path);
            }
        });
    }
    for (auto& t : pool) t.join();
}

// ── Project directories ─────────────────────────────────────────────

std::string project_dir_name(const std::string& project_path) {
    std::string name = normalize_path(project_path);
    std::replace(name.begin(), name.end(), '/', '-');
    return name;
}

std::string find_project_dir(const std::string& projects_root, const std::string& project_path) {
    if (trim(project_path).empty() || projects_root.empty()) return "";
    std::string wanted = normalize_path(project_path);

    std::error_code ec;
    fs::path direct = fs::path(projects_root) / project_dir_name(wanted);
    if (fs::is_directory(direct, ec)) return direct.string();

    fs::directory_iterator it(projects_root, ec);
    if (ec) return "";
    for (auto& entry : it) {
        std::error_code dec;
        if (!entry.is_directory(dec)) continue;

        std::vector<SessionInfo> sessions;
        try {
            sessions = collect_sessions(entry.path().string());
        } catch (const std::runtime_error&) {
            continue;
        }
        for (size_t i = 0; i < sessions.size() && i < 5; i++) {
            std::string cwd = extract_cwd(sessions[i].path);
            if (!cwd.empty() && normalize_path(cwd) == wanted) return entry.path().string();
        }
    }
    return "";
}

bool prompt_matches_text(const std::string& prompt, const std::string& text) {
    std::string p = to_lower(utf8_prefix(normalize_whitespace(prompt), kPromptMatchChars));
    std::string t = to_lower(utf8_prefix(normalize_whitespace(text), kPromptMatchChars));
    if (p.empty() || t.empty()) return false;
    return starts_with(p, t) || starts_with(t, p);
}

// ── TranscriptSessionLocator ────────────────────────────────────────

TranscriptSessionLocator::TranscriptSessionLocator(const Config& cfg) : cfg_(cfg) {}

std::string TranscriptSessionLocator::find_new_session(const ScheduleEntry& entry,
                                                       const ExecContext& ctx, TimePoint since) {
    if (trim(entry.target.prompt).empty()) return "";

    std::string root = cfg_.projects_path(ctx.account.home_dir);
    std::string dir = find_project_dir(root, entry.target.project_path);
    if (dir.empty()) return "";

    std::vector<SessionInfo> sessions;
    try {
        sessions = collect_sessions(dir);
    } catch (const std::runtime_error& e) {
        std::cerr << "[sessions] " << e.what() << "\n";
        return "";
    }

    TimePoint cutoff = since - std::chrono::seconds(30);
    TimePoint now = Clock::now();
    for (auto& s : sessions) {
        if (s.mod_time < cutoff) break;
        if (s.mod_time > now) continue;
        if (!prompt_matches_text(entry.target.prompt, extract_first_user_text(s.path))) continue;

        if (ctx.crosses_session() &&
            ::chown(s.path.c_str(), static_cast<uid_t>(ctx.account.uid),
                    static_cast<gid_t>(ctx.account.gid)) != 0) {
            std::cerr << "[sessions] chown " << s.path << " failed\n";
        }
        return s.id;
    }
    return "";
}

} // namespace wakeprompt
