// SPDX-License-Identifier: Apache-2.0
#include "supervisor/config/session_config.hpp"

#include "common/errors.hpp"
#include "supervisor/extensions/extension_installer.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <limits>

namespace flyin::cfg {

namespace {

// Signed read so that negative values are reported instead of wrapping around.
uint32_t non_negative(const YAML::Node &root, const char *key, uint32_t max = std::numeric_limits<uint32_t>::max())
{
    int64_t v = 0;
    try {
        v = root[key].as<int64_t>();
    } catch (const YAML::Exception &) {
        throw ConfigError(std::string(key) + ": expected an integer");
    }
    if (v < 0)
        throw ConfigError(std::string(key) + " must be >= 0 (got " + std::to_string(v) + ")");
    if (v > static_cast<int64_t>(max))
        throw ConfigError(std::string(key) + " out of range (got " + std::to_string(v) + ")");
    return static_cast<uint32_t>(v);
}

std::string string_value(const YAML::Node &root, const char *key)
{
    try {
        return root[key].as<std::string>();
    } catch (const YAML::Exception &) {
        throw ConfigError(std::string(key) + ": expected a string");
    }
}

bool bool_value(const YAML::Node &root, const char *key)
{
    try {
        return root[key].as<bool>();
    } catch (const YAML::Exception &) {
        throw ConfigError(std::string(key) + ": expected true/false");
    }
}

std::vector<std::string> string_list(const YAML::Node &root, const char *key)
{
    const YAML::Node n = root[key];
    if (n.IsNull())
        return {};
    if (!n.IsSequence())
        throw ConfigError(std::string(key) + ": expected a list of strings");
    try {
        return n.as<std::vector<std::string>>();
    } catch (const YAML::Exception &) {
        throw ConfigError(std::string(key) + ": expected a list of strings");
    }
}

SessionConfig from_node(const YAML::Node &root)
{
    SessionConfig cfg;
    if (!root || root.IsNull())
        return cfg;
    if (!root.IsMap())
        throw ConfigError("configuration root must be a mapping");
    if (root["max_idle_seconds"])
        cfg.max_idle_seconds = non_negative(root, "max_idle_seconds");
    if (root["heartbeat_path"])
        cfg.heartbeat_path = string_value(root, "heartbeat_path");
    if (root["heartbeat_check_ms"])
        cfg.heartbeat_check_ms = non_negative(root, "heartbeat_check_ms");
    if (root["extensions"])
        cfg.extensions = string_list(root, "extensions");
    if (root["default_extensions"])
        cfg.default_extensions = bool_value(root, "default_extensions");
    if (root["extensions_dir"])
        cfg.extensions_dir = string_value(root, "extensions_dir");
    if (root["install_timeout_seconds"])
        cfg.install_timeout_seconds = non_negative(root, "install_timeout_seconds");
    if (root["server_binary"])
        cfg.server_binary = string_value(root, "server_binary");
    if (root["server_host"])
        cfg.server_host = string_value(root, "server_host");
    if (root["server_port"])
        cfg.server_port = static_cast<uint16_t>(non_negative(root, "server_port", 65535));
    if (root["server_args"])
        cfg.server_args = string_list(root, "server_args");
    if (root["working_dir"])
        cfg.working_dir = string_value(root, "working_dir");
    if (root["pre_execute"])
        cfg.pre_execute = string_value(root, "pre_execute");
    if (root["post_execute"])
        cfg.post_execute = string_value(root, "post_execute");
    if (root["hook_timeout_seconds"])
        cfg.hook_timeout_seconds = non_negative(root, "hook_timeout_seconds");
    if (root["run_task_first"])
        cfg.run_task_first = bool_value(root, "run_task_first");
    if (root["task_command"])
        cfg.task_command = string_value(root, "task_command");
    if (root["grace_period_ms"])
        cfg.grace_period_ms = non_negative(root, "grace_period_ms");
    if (root["deadline_seconds"])
        cfg.deadline_seconds = non_negative(root, "deadline_seconds");
    if (root["report_path"])
        cfg.report_path = string_value(root, "report_path");
    if (root["debug_program"])
        cfg.debug_program = string_value(root, "debug_program");
    if (root["container_image"])
        cfg.container_image = string_value(root, "container_image");
    if (root["log_level"])
        cfg.log_level = string_value(root, "log_level");
    if (root["log_json"])
        cfg.log_json = bool_value(root, "log_json");
    validate(cfg);
    return cfg;
}

} // namespace

std::vector<std::string> SessionConfig::effective_extensions() const
{
    std::vector<std::string> out;
    if (default_extensions)
        out = ext::default_extensions();
    for (auto &e : extensions) {
        if (std::find(out.begin(), out.end(), e) == out.end())
            out.push_back(e);
    }
    return out;
}

void validate(const SessionConfig &cfg)
{
    if (cfg.heartbeat_check_ms == 0)
        throw ConfigError("heartbeat_check_ms must be > 0");
    if (cfg.max_idle_seconds > 0 && cfg.heartbeat_path.empty())
        throw ConfigError("heartbeat_path is required when max_idle_seconds > 0");
    if (cfg.server_binary.empty())
        throw ConfigError("server_binary must not be empty");
    if (cfg.install_timeout_seconds == 0)
        throw ConfigError("install_timeout_seconds must be > 0");
    if (cfg.hook_timeout_seconds == 0)
        throw ConfigError("hook_timeout_seconds must be > 0");
}

SessionConfig load_config(const std::string &path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile &) {
        throw ConfigError("cannot open config file '" + path + "'");
    } catch (const YAML::Exception &ex) {
        throw ConfigError("invalid YAML in '" + path + "': " + ex.what());
    }
    return from_node(root);
}

SessionConfig parse_config(const std::string &yaml_text)
{
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception &ex) {
        throw ConfigError(std::string("invalid YAML: ") + ex.what());
    }
    return from_node(root);
}

} // namespace flyin::cfg
