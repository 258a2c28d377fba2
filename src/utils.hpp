#pragma once
#include <string>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <random>
#include <algorithm>
#include <cctype>

namespace wakeprompt {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

// Expands a leading "~" against `home` (the caller's $HOME when empty).
inline std::string expand_path(const std::string& p, const std::string& home = "") {
    std::string base = home.empty() ? home_dir() : home;
    if (p == "~") return base;
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return base + p.substr(1);
    }
    return p;
}

inline std::string default_config_path() {
    return home_dir() + "/.wakeprompt/config.json";
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; });
    auto last = std::find_if_not(s.rbegin(), s.rend(),
                                 [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (first >= last) return "";
    return std::string(first, last);
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Collapses every whitespace run to a single space and trims both ends.
inline std::string normalize_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += static_cast<char>(c);
    }
    return out;
}

// Number of UTF-8 code points in `text`.
inline size_t utf8_length(const std::string& text) {
    size_t n = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

// First `count` UTF-8 code points of `text`.
inline std::string utf8_prefix(const std::string& text, size_t count) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); i++) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (seen == count) return text.substr(0, i);
            seen++;
        }
    }
    return text;
}

// Truncates to `max` code points, ending with "..." when shortened.
inline std::string truncate_text(const std::string& text, size_t max) {
    if (utf8_length(text) <= max) return text;
    if (max <= 3) return utf8_prefix(text, max);
    return utf8_prefix(text, max - 3) + "...";
}

// Single-line, whitespace-normalized preview of at most `max` code points.
inline std::string preview(const std::string& text, size_t max) {
    std::string t = normalize_whitespace(text);
    if (t.empty()) return "";
    return truncate_text(t, max);
}

// Random RFC 4122 version-4 identifier.
inline std::string new_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    unsigned char b[16];
    for (int i = 0; i < 16; i += 8) {
        uint64_t v = rng();
        for (int k = 0; k < 8; k++) b[i + k] = static_cast<unsigned char>(v >> (k * 8));
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += hex[b[i] >> 4];
        out += hex[b[i] & 0x0f];
    }
    return out;
}

// Absolute, lexically normalized form of `path` with "~" expanded.
inline std::string normalize_path(const std::string& path, const std::string& home = "") {
    std::string expanded = expand_path(path, home);
    if (expanded.empty()) return "";
    std::error_code ec;
    fs::path abs = fs::absolute(expanded, ec);
    if (ec) abs = fs::path(expanded);
    std::string out = abs.lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

// True when `candidate` equals `parent` or lies beneath it.
inline bool is_within(const std::string& candidate, const std::string& parent) {
    if (candidate.empty() || parent.empty()) return false;
    if (candidate == parent) return true;
    std::string prefix = parent.back() == '/' ? parent : parent + "/";
    return starts_with(candidate, prefix);
}

// Replaces a leading home directory with "~" for display.
inline std::string humanize_path(const std::string& path) {
    std::string home = normalize_path(home_dir());
    std::string clean = fs::path(path).lexically_normal().string();
    if (clean == home) return "~";
    if (is_within(clean, home)) return "~" + clean.substr(home.size());
    return clean;
}

} // namespace wakeprompt
