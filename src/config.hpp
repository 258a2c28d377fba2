#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace wakeprompt {

struct Config {
    // Store
    std::string data_dir = "~/Library/Application Support/WakePrompt";
    std::string projects_root = "~/.claude/projects";  // session transcripts
    int max_run_logs = 50;
    int max_daemon_logs = 50;

    // Target program
    std::string target_program = "claude";
    std::string install_hint = "curl -fsSL https://claude.ai/install.sh | bash";
    std::string default_model = "auto";
    std::string default_permission_mode = "acceptEdits";

    // Credential
    std::string credential_service = "WakePrompt OAuth Token";
    std::string credential_env = "CLAUDE_CODE_OAUTH_TOKEN";
    std::vector<std::string> cleared_env = {"ANTHROPIC_API_KEY", "ANTHROPIC_AUTH_TOKEN"};
    std::string setup_hint = "claude setup-token";

    // launchd / pmset
    std::string job_dir = "/Library/LaunchDaemons";
    std::string job_label_prefix = "com.wakeprompt";
    std::string launchd_domain = "system";
    std::string keep_awake = "caffeinate";
    bool notifications = true;

    // PATH recorded for a schedule when the caller has none
    std::string fallback_path = "/usr/local/bin:/usr/bin:/bin:/usr/sbin:/sbin";

    // Derived helpers; "~" expands against the given account home.
    std::string data_path(const std::string& home) const {
        return expand_path(data_dir, home);
    }
    std::string projects_path(const std::string& home) const {
        return expand_path(projects_root, home);
    }

    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace wakeprompt
