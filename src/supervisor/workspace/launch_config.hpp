// SPDX-License-Identifier: Apache-2.0
// launch_config.hpp
// Editor debug configuration so the user can rerun the task from inside the session.
#pragma once
#include <string>
#include <vector>

namespace flyin::workspace {

inline constexpr const char *launch_config_name = "Interactive Debugging";

// JSON text of .vscode/launch.json with one configuration running `program args...`.
std::string launch_config_json(const std::string &program, const std::vector<std::string> &args);

// Writes <dir>/.vscode/launch.json (creating .vscode). Returns false and logs on failure.
bool write_launch_config(const std::string &dir, const std::string &program, const std::vector<std::string> &args);

} // namespace flyin::workspace
