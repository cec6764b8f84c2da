#pragma once

#include <filesystem>

namespace gitsync::paths {

// Directory holding config, lock token, pidfile and log file.
std::filesystem::path getConfigDir();

std::filesystem::path getConfigPath();
std::filesystem::path getLockPath();
std::filesystem::path getPidPath();
std::filesystem::path getLogPath();

// Expands a leading '~' and normalizes to an absolute, lexically clean path.
std::filesystem::path normalize(const std::filesystem::path& p);

}
