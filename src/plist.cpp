#include "plist.hpp"
#include <sstream>

namespace wakeprompt {

std::string xml_escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c;
        }
    }
    return out;
}

namespace {

void write_key(std::ostringstream& out, const std::string& key) {
    out << "<key>" << xml_escape(key) << "</key>\n";
}

void write_string(std::ostringstream& out, const std::string& value) {
    out << "<string>" << xml_escape(value) << "</string>\n";
}

void write_integer(std::ostringstream& out, const char* key, int value) {
    if (value < 0) return;
    write_key(out, key);
    out << "<integer>" << value << "</integer>\n";
}

} // namespace

std::string encode_plist(const JobDescriptor& job) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
           "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
        << "<plist version=\"1.0\">\n"
        << "<dict>\n";

    write_key(out, "Label");
    write_string(out, job.label);

    write_key(out, "ProgramArguments");
    out << "<array>\n";
    for (auto& arg : job.program_arguments) write_string(out, arg);
    out << "</array>\n";

    const auto& t = job.trigger;
    write_key(out, "StartCalendarInterval");
    out << "<dict>\n";
    write_integer(out, "Year", t.year);
    write_integer(out, "Month", t.month);
    write_integer(out, "Day", t.day);
    write_integer(out, "Weekday", t.weekday);
    write_integer(out, "Hour", t.hour);
    write_integer(out, "Minute", t.minute);
    out << "</dict>\n";

    if (!job.stdout_path.empty()) {
        write_key(out, "StandardOutPath");
        write_string(out, job.stdout_path);
    }
    if (!job.stderr_path.empty()) {
        write_key(out, "StandardErrorPath");
        write_string(out, job.stderr_path);
    }

    write_key(out, "EnvironmentVariables");
    out << "<dict>\n";
    for (auto& [k, v] : job.environment) {
        write_key(out, k);
        write_string(out, v);
    }
    out << "</dict>\n";

    write_key(out, "RunAtLoad");
    out << (job.run_at_load ? "<true/>\n" : "<false/>\n");

    out << "</dict>\n</plist>\n";
    return out.str();
}

} // namespace wakeprompt
