#include "timeutil.hpp"
#include "utils.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <vector>
#include <unistd.h>
#include <limits.h>

namespace wakeprompt {

// ── Time zones ──────────────────────────────────────────────────────

bool timezone_exists(const std::string& name) {
    if (name == "UTC" || name == "GMT" || name == "Etc/UTC") return true;
    if (name.empty() || name[0] == '/' || name.find("..") != std::string::npos) return false;

    std::vector<std::string> roots;
    if (const char* dir = std::getenv("TZDIR"); dir && *dir) roots.emplace_back(dir);
    roots.emplace_back("/usr/share/zoneinfo");
    roots.emplace_back("/var/db/timezone/zoneinfo");
    roots.emplace_back("/usr/lib/zoneinfo");

    std::error_code ec;
    for (auto& root : roots) {
        if (fs::is_regular_file(fs::path(root) / name, ec)) return true;
    }
    return false;
}

std::string local_timezone_name() {
    if (const char* tz = std::getenv("TZ"); tz && *tz) {
        std::string name = tz;
        if (name[0] == ':') name = name.substr(1);
        return name;
    }
    char buf[PATH_MAX];
    ssize_t len = readlink("/etc/localtime", buf, sizeof(buf) - 1);
    if (len <= 0) return "";
    buf[len] = '\0';
    std::string target = buf;
    auto pos = target.find("zoneinfo/");
    if (pos == std::string::npos) return "";
    return target.substr(pos + 9);
}

ScopedTimezone::ScopedTimezone(const std::string& name) {
    if (name.empty() || name == "Local" || !timezone_exists(name)) return;

    if (const char* prev = std::getenv("TZ")) {
        had_previous_ = true;
        previous_ = prev;
    }
    setenv("TZ", name.c_str(), 1);
    tzset();
    active_ = true;
}

ScopedTimezone::~ScopedTimezone() {
    if (!active_) return;
    if (had_previous_) {
        setenv("TZ", previous_.c_str(), 1);
    } else {
        unsetenv("TZ");
    }
    tzset();
}

// ── Conversions ─────────────────────────────────────────────────────

std::tm to_local_tm(TimePoint t) {
    std::time_t tt = Clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&tt, &tm);
    return tm;
}

TimePoint from_local(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

std::string format_rfc3339(TimePoint t) {
    auto secs = std::chrono::floor<std::chrono::seconds>(t);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(t - secs).count();

    std::time_t tt = Clock::to_time_t(TimePoint(secs));
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);

    std::string out = buf;
    if (nanos > 0) {
        char frac[20];
        std::snprintf(frac, sizeof(frac), "%09lld", static_cast<long long>(nanos));
        std::string f = frac;
        while (!f.empty() && f.back() == '0') f.pop_back();
        out += "." + f;
    }
    return out + "Z";
}

TimePoint parse_rfc3339(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &y, &mo, &d, &h, &mi, &s, &consumed) != 6 ||
        consumed != 19) {
        throw std::runtime_error("invalid timestamp: " + text);
    }

    size_t pos = 19;
    long long nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                digits++;
            }
            pos++;
        }
        for (; digits < 9; digits++) nanos *= 10;
    }

    long offset = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        pos++;
    } else if (pos + 6 <= text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int oh = 0, om = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
            throw std::runtime_error("invalid timestamp offset: " + text);
        }
        offset = (oh * 3600L + om * 60L) * (text[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        throw std::runtime_error("timestamp missing zone: " + text);
    }
    if (pos != text.size()) throw std::runtime_error("invalid timestamp: " + text);

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = s;
    std::time_t utc = timegm(&tm) - offset;
    return Clock::from_time_t(utc) +
           std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos));
}

std::string format_local(TimePoint t, const char* fmt) {
    std::tm tm = to_local_tm(t);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

std::string format_wake_time(TimePoint t) {
    return format_local(t, "%m/%d/%y %H:%M:%S");
}

std::string format_rfc1123(TimePoint t) {
    return format_local(t, "%a, %d %b %Y %H:%M:%S %Z");
}

} // namespace wakeprompt
