// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flyin::cfg {

struct SessionConfig
{
    // Idle handling. 0 disables the watchdog (never expire).
    uint32_t max_idle_seconds{0};
    std::string heartbeat_path{"/tmp/flyin-heartbeat"};
    uint32_t heartbeat_check_ms{60000};
    // Extensions, installed in order after the defaults (when enabled).
    std::vector<std::string> extensions;
    bool default_extensions{true};
    std::string extensions_dir{"/tmp/flyin-extensions"};
    uint32_t install_timeout_seconds{300};
    // Code server
    std::string server_binary{"code-server"};
    std::string server_host{"0.0.0.0"};
    uint16_t server_port{8080};
    std::vector<std::string> server_args;
    std::string working_dir{"."};
    // Hooks (shell commands); empty = none
    std::string pre_execute;
    std::string post_execute;
    uint32_t hook_timeout_seconds{600};
    // Failure triage: run the task body first, keep the session open if it fails.
    bool run_task_first{false};
    std::string task_command;
    // Shutdown / cancellation
    uint32_t grace_period_ms{5000};
    uint32_t deadline_seconds{0}; // 0 = no deadline
    // Outputs
    std::string report_path;
    std::string debug_program;
    std::string container_image; // build-time only, recorded for the report
    // Logging
    std::string log_level{"info"};
    bool log_json{false};

    std::chrono::milliseconds max_idle() const { return std::chrono::seconds(max_idle_seconds); }
    std::chrono::milliseconds poll_interval() const { return std::chrono::milliseconds(heartbeat_check_ms); }
    std::chrono::milliseconds grace_period() const { return std::chrono::milliseconds(grace_period_ms); }
    std::chrono::milliseconds deadline() const { return std::chrono::seconds(deadline_seconds); }

    // Defaults first (deduplicated), then the user list in order.
    std::vector<std::string> effective_extensions() const;
};

// Loads a YAML file; keys absent from the file keep their defaults. Throws flyin::ConfigError.
SessionConfig load_config(const std::string &path);
// Same, from YAML text (tests, embedded configs).
SessionConfig parse_config(const std::string &yaml_text);
// Range checks shared by the loader and programmatic construction. Throws flyin::ConfigError.
void validate(const SessionConfig &cfg);

} // namespace flyin::cfg
