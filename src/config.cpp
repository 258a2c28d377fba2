#include "config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace wakeprompt {

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["data_dir"] = data_dir;
    j["projects_root"] = projects_root;
    j["max_run_logs"] = max_run_logs;
    j["max_daemon_logs"] = max_daemon_logs;

    j["target_program"] = target_program;
    j["install_hint"] = install_hint;
    j["default_model"] = default_model;
    j["default_permission_mode"] = default_permission_mode;

    j["credential_service"] = credential_service;
    j["credential_env"] = credential_env;
    j["cleared_env"] = cleared_env;
    j["setup_hint"] = setup_hint;

    j["job_dir"] = job_dir;
    j["job_label_prefix"] = job_label_prefix;
    j["launchd_domain"] = launchd_domain;
    j["keep_awake"] = keep_awake;
    j["notifications"] = notifications;

    j["fallback_path"] = fallback_path;
    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    c.data_dir = j.value("data_dir", c.data_dir);
    c.projects_root = j.value("projects_root", c.projects_root);
    c.max_run_logs = j.value("max_run_logs", c.max_run_logs);
    c.max_daemon_logs = j.value("max_daemon_logs", c.max_daemon_logs);

    c.target_program = j.value("target_program", c.target_program);
    c.install_hint = j.value("install_hint", c.install_hint);
    c.default_model = j.value("default_model", c.default_model);
    c.default_permission_mode = j.value("default_permission_mode", c.default_permission_mode);

    c.credential_service = j.value("credential_service", c.credential_service);
    c.credential_env = j.value("credential_env", c.credential_env);
    if (j.contains("cleared_env")) c.cleared_env = parse_string_array(j["cleared_env"]);
    c.setup_hint = j.value("setup_hint", c.setup_hint);

    c.job_dir = j.value("job_dir", c.job_dir);
    c.job_label_prefix = j.value("job_label_prefix", c.job_label_prefix);
    c.launchd_domain = j.value("launchd_domain", c.launchd_domain);
    c.keep_awake = j.value("keep_awake", c.keep_awake);
    c.notifications = j.value("notifications", c.notifications);

    c.fallback_path = j.value("fallback_path", c.fallback_path);
    return c;
}

Config Config::load(const std::string& path) {
    if (!fs::exists(path)) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return Config{};
    }
    try {
        nlohmann::json j = nlohmann::json::parse(read_file(path));
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return Config{};
    }
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    if (!f) throw std::runtime_error("write config: cannot open " + path);
    f << to_json().dump(2) << std::endl;
}

} // namespace wakeprompt
