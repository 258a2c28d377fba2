#pragma once
#include <map>
#include <string>
#include <vector>

namespace wakeprompt {

// launchd StartCalendarInterval. Fields left at -1 are omitted and match
// any value. weekday: 0 = Sunday.
struct CalendarTrigger {
    int year = -1;
    int month = -1;
    int day = -1;
    int weekday = -1;
    int hour = -1;
    int minute = -1;

    bool operator==(const CalendarTrigger& o) const {
        return year == o.year && month == o.month && day == o.day &&
               weekday == o.weekday && hour == o.hour && minute == o.minute;
    }
};

struct JobDescriptor {
    std::string label;
    std::vector<std::string> program_arguments;
    CalendarTrigger trigger;
    std::string stdout_path;
    std::string stderr_path;
    std::map<std::string, std::string> environment;
    bool run_at_load = false;
};

// XML property list for launchd.
std::string encode_plist(const JobDescriptor& job);

std::string xml_escape(const std::string& value);

} // namespace wakeprompt
