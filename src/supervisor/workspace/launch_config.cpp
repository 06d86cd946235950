// SPDX-License-Identifier: Apache-2.0
#include "supervisor/workspace/launch_config.hpp"

#include "common/logger.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

namespace flyin::workspace {

namespace {
std::string quoted(const std::string &s)
{
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char esc[8];
                    std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += esc;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
    return out;
}
} // namespace

std::string launch_config_json(const std::string &program, const std::vector<std::string> &args)
{
    std::ostringstream j;
    j << "{\n";
    j << "  \"version\": \"0.2.0\",\n";
    j << "  \"configurations\": [\n";
    j << "    {\n";
    j << "      \"name\": " << quoted(launch_config_name) << ",\n";
    j << "      \"type\": \"python\",\n";
    j << "      \"request\": \"launch\",\n";
    j << "      \"program\": " << quoted(program) << ",\n";
    j << "      \"console\": \"integratedTerminal\",\n";
    j << "      \"justMyCode\": true,\n";
    j << "      \"args\": [";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i)
            j << ", ";
        j << quoted(args[i]);
    }
    j << "]\n";
    j << "    }\n";
    j << "  ]\n";
    j << "}\n";
    return j.str();
}

bool write_launch_config(const std::string &dir, const std::string &program, const std::vector<std::string> &args)
{
    std::string vscode_dir = dir + "/.vscode";
    if (::mkdir(vscode_dir.c_str(), 0755) != 0 && errno != EEXIST) {
        flyin::log::warn("[workspace] cannot create {}: {}", vscode_dir, std::strerror(errno));
        return false;
    }
    std::string path = vscode_dir + "/launch.json";
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        flyin::log::warn("[workspace] cannot write {}", path);
        return false;
    }
    out << launch_config_json(program, args);
    if (!out) {
        flyin::log::warn("[workspace] short write to {}", path);
        return false;
    }
    flyin::log::info("[workspace] wrote {}", path);
    return true;
}

} // namespace flyin::workspace
