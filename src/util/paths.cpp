#include "util/paths.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gitsync::paths {

namespace {
fs::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    if (const auto* pw = getpwuid(getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return fs::current_path();
}
}

fs::path getConfigDir() {
    if (const char* dir = std::getenv("GITSYNC_HOME"); dir && *dir) return dir;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return fs::path(xdg) / "git-sync";
    return homeDir() / ".config" / "git-sync";
}

fs::path getConfigPath() { return getConfigDir() / "config.yaml"; }
fs::path getLockPath() { return getConfigDir() / "gitsync.lock"; }
fs::path getPidPath() { return getConfigDir() / "gitsync.pid"; }
fs::path getLogPath() { return getConfigDir() / "gitsync.log"; }

fs::path normalize(const fs::path& p) {
    fs::path out = p;
    const auto s = p.string();
    if (s == "~") out = homeDir();
    else if (s.rfind("~/", 0) == 0) out = homeDir() / s.substr(2);

    std::error_code ec;
    auto canonical = fs::weakly_canonical(fs::absolute(out), ec);
    if (ec) return fs::absolute(out).lexically_normal();

    // weakly_canonical keeps a trailing separator for "dir/"; drop it so keys compare equal
    if (!canonical.has_filename() && canonical.has_parent_path() && canonical != canonical.root_path())
        canonical = canonical.parent_path();
    return canonical;
}

}
