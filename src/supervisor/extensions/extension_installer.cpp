// SPDX-License-Identifier: Apache-2.0
#include "supervisor/extensions/extension_installer.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "supervisor/process/process_launcher.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace flyin::ext {

namespace {
bool valid_name_part(std::string_view s)
{
    if (s.empty())
        return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    });
}

bool valid_version(std::string_view s)
{
    if (s.empty())
        return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-';
    });
}
} // namespace

RefKind classify(std::string_view ref)
{
    auto scheme_end = ref.find("://");
    if (scheme_end != std::string_view::npos) {
        auto scheme = ref.substr(0, scheme_end);
        if (scheme != "http" && scheme != "https")
            return RefKind::invalid;
        auto rest = ref.substr(scheme_end + 3);
        auto slash = rest.find('/');
        if (slash == 0 || slash == std::string_view::npos || slash + 1 >= rest.size())
            return RefKind::invalid; // need host and path
        if (rest.find_first_of(" \t\n") != std::string_view::npos)
            return RefKind::invalid;
        return RefKind::url;
    }
    std::string_view id = ref;
    auto at = id.find('@');
    if (at != std::string_view::npos) {
        if (!valid_version(id.substr(at + 1)))
            return RefKind::invalid;
        id = id.substr(0, at);
    }
    auto dot = id.find('.');
    if (dot == std::string_view::npos || id.find('.', dot + 1) != std::string_view::npos)
        return RefKind::invalid;
    if (!valid_name_part(id.substr(0, dot)) || !valid_name_part(id.substr(dot + 1)))
        return RefKind::invalid;
    return RefKind::identifier;
}

std::string download_file_name(std::string_view url)
{
    auto q = url.find_first_of("?#");
    if (q != std::string_view::npos)
        url = url.substr(0, q);
    while (!url.empty() && url.back() == '/')
        url.remove_suffix(1);
    auto slash = url.rfind('/');
    std::string name(slash == std::string_view::npos ? url : url.substr(slash + 1));
    if (name.empty())
        name = "extension";
    if (name.size() < 5 || name.compare(name.size() - 5, 5, ".vsix") != 0)
        name += ".vsix";
    return name;
}

ExtensionInstaller::ExtensionInstaller(proc::IProcessLauncher &launcher, InstallerOptions opts)
    : m_launcher(launcher), m_opts(std::move(opts))
{}

ExtensionResult ExtensionInstaller::run_step(const std::string &ref, const std::vector<std::string> &argv, const char *what)
{
    proc::LaunchSpec spec;
    spec.argv = argv;
    std::optional<int> code;
    try {
        code = proc::run_to_completion(m_launcher, spec, m_opts.timeout);
    } catch (const ProcessLaunchError &ex) {
        return ExtensionResult{ref, false, std::string(what) + ": " + ex.what()};
    }
    if (!code)
        return ExtensionResult{ref, false, std::string(what) + " timed out"};
    if (*code != 0)
        return ExtensionResult{ref, false, std::string(what) + " exited with " + std::to_string(*code)};
    return ExtensionResult{ref, true, {}};
}

ExtensionResult ExtensionInstaller::install(const std::string &ref)
{
    ExtensionResult res;
    switch (classify(ref)) {
        case RefKind::invalid:
            res = ExtensionResult{ref, false, "invalid extension reference"};
            break;
        case RefKind::identifier:
            res = run_step(ref, {m_opts.server_binary, "--install-extension", ref}, "install");
            if (res.ok)
                res.detail = ref;
            break;
        case RefKind::url: {
            std::string file = m_opts.extensions_dir + "/" + download_file_name(ref);
            res = run_step(ref, {"mkdir", "-p", m_opts.extensions_dir}, "prepare");
            if (res.ok)
                res = run_step(ref, {"curl", "-fsSL", "-o", file, ref}, "download");
            if (res.ok)
                res = run_step(ref, {m_opts.server_binary, "--install-extension", file}, "install");
            if (res.ok)
                res.detail = file;
            break;
        }
    }
    if (res.ok) {
        metrics::session().extensions_installed.fetch_add(1, std::memory_order_relaxed);
        flyin::log::info("[ext] installed {}", ref);
    } else {
        metrics::session().extensions_failed.fetch_add(1, std::memory_order_relaxed);
        flyin::log::warn("[ext] {} not installed: {}", ref, res.detail);
    }
    return res;
}

std::vector<ExtensionResult> ExtensionInstaller::install_all(const std::vector<std::string> &refs)
{
    std::vector<ExtensionResult> out;
    out.reserve(refs.size());
    for (auto &r : refs)
        out.push_back(install(r));
    auto ok = std::count_if(out.begin(), out.end(), [](const ExtensionResult &r) { return r.ok; });
    flyin::log::info("[ext] {}/{} extensions installed", ok, out.size());
    return out;
}

} // namespace flyin::ext
