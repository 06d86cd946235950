#include "supervisor/extensions/extension_installer.hpp"
#include "test_fake_process.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

using namespace flyin;
using namespace std::chrono_literals;

int main()
{
    // Reference classification
    assert(ext::classify("ms-python.python") == ext::RefKind::identifier);
    assert(ext::classify("ms-toolsai.jupyter@2024.1.0") == ext::RefKind::identifier);
    assert(ext::classify("https://open-vsx.org/api/vscodevim/vim/1.27.0/file/vscodevim.vim-1.27.0.vsix")
           == ext::RefKind::url);
    assert(ext::classify("http://mirror.local/ext.vsix") == ext::RefKind::url);
    assert(ext::classify(ext::copilot_extension) == ext::RefKind::url);
    assert(ext::download_file_name(ext::copilot_extension) == "GitHub.copilot-1.138.563.vsix");
    assert(ext::classify("ftp://mirror.local/ext.vsix") == ext::RefKind::invalid);
    assert(ext::classify("https://") == ext::RefKind::invalid);
    assert(ext::classify("https://host-only") == ext::RefKind::invalid);
    assert(ext::classify("not an extension") == ext::RefKind::invalid);
    assert(ext::classify("noperiod") == ext::RefKind::invalid);
    assert(ext::classify("a.b.c") == ext::RefKind::invalid);
    assert(ext::classify("pub.name@") == ext::RefKind::invalid);
    assert(ext::classify("") == ext::RefKind::invalid);

    assert(ext::download_file_name("https://x.org/files/vscodevim.vim-1.27.0.vsix") == "vscodevim.vim-1.27.0.vsix");
    assert(ext::download_file_name("https://x.org/api/pub/name/latest?download=1") == "latest.vsix");
    assert(ext::download_file_name("https://x.org/files/") == "files.vsix");

    // One invalid reference among three: the other two still install.
    test::FakeLauncher launcher;
    ext::ExtensionInstaller installer(launcher, ext::InstallerOptions{"code-server", "/tmp/flyin-ext-unit", 1s});
    auto results = installer.install_all(
        {"ms-python.python", "definitely not valid", "https://x.org/files/vscodevim.vim-1.27.0.vsix"});
    assert(results.size() == 3);
    assert(results[0].ok && results[0].reference == "ms-python.python");
    assert(!results[1].ok && results[1].detail == "invalid extension reference");
    assert(results[2].ok);
    assert(results[2].detail == "/tmp/flyin-ext-unit/vscodevim.vim-1.27.0.vsix");

    // Commands issued: identifier install, then mkdir + download + install for the URL.
    auto launched = launcher.launched();
    assert(launched.size() == 4);
    assert(launched[0].argv == (std::vector<std::string>{"code-server", "--install-extension", "ms-python.python"}));
    assert(launched[1].argv[0] == "mkdir");
    assert(launched[2].argv[0] == "curl");
    assert(launched[2].argv.back() == "https://x.org/files/vscodevim.vim-1.27.0.vsix");
    assert(launched[3].argv
           == (std::vector<std::string>{
               "code-server", "--install-extension", "/tmp/flyin-ext-unit/vscodevim.vim-1.27.0.vsix"}));

    // Download failure stops that item without installing; install failures are per item.
    test::FakeLauncher failing;
    failing.rule = [](const proc::LaunchSpec &spec) {
        test::FakeBehavior b;
        if (spec.argv[0] == "curl")
            b.exit_immediately = 22;
        if (spec.argv.back() == "broken.ext")
            b.fail_launch = true;
        return b;
    };
    ext::ExtensionInstaller inst2(failing, ext::InstallerOptions{"code-server", "/tmp/flyin-ext-unit", 1s});
    auto r = inst2.install("https://x.org/files/gone.vsix");
    assert(!r.ok && r.detail == "download exited with 22");
    r = inst2.install("broken.ext");
    assert(!r.ok && r.detail.find("install:") == 0);
    r = inst2.install("good.ext");
    assert(r.ok);
    launched = failing.launched();
    // mkdir, curl, broken.ext, good.ext: no install step after the failed download
    assert(launched.size() == 4);

    std::cout << "unit_extension_installer OK" << std::endl;
    return 0;
}
