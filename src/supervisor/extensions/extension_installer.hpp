// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace flyin::proc {
class IProcessLauncher;
}

namespace flyin::ext {

// Extensions installed ahead of the user list when default_extensions is on.
inline const std::vector<std::string> &default_extensions()
{
    static const std::vector<std::string> defaults{"ms-python.python", "ms-toolsai.jupyter"};
    return defaults;
}

// Predefined optional extension: GitHub Copilot, fetched as a .vsix download.
inline constexpr const char *copilot_extension =
    "https://raw.githubusercontent.com/flyteorg/flytetools/master/flytekitplugins/flyin/GitHub.copilot-1.138.563.vsix";

enum class RefKind
{
    identifier, // publisher.name[@version]
    url, // http(s)://host/path (a .vsix download)
    invalid
};

RefKind classify(std::string_view ref);

struct ExtensionResult
{
    std::string reference;
    bool ok{false};
    std::string detail; // failure reason, or the installed artifact on success
};

struct InstallerOptions
{
    std::string server_binary{"code-server"};
    std::string extensions_dir{"/tmp/flyin-extensions"};
    std::chrono::milliseconds timeout{std::chrono::minutes(5)}; // per download / install step
};

// Installs extensions one by one through the code server CLI. Failures are per item and never throw.
class ExtensionInstaller
{
public:
    ExtensionInstaller(proc::IProcessLauncher &launcher, InstallerOptions opts);

    ExtensionResult install(const std::string &ref);
    std::vector<ExtensionResult> install_all(const std::vector<std::string> &refs);

private:
    ExtensionResult run_step(const std::string &ref, const std::vector<std::string> &argv, const char *what);

    proc::IProcessLauncher &m_launcher;
    InstallerOptions m_opts;
};

// URL tail used as the download file name ("vscodevim.vim-1.27.0.vsix").
std::string download_file_name(std::string_view url);

} // namespace flyin::ext
