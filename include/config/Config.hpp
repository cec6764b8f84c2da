#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace gitsync::config {

constexpr unsigned int DEFAULT_INTERVAL_MINUTES = 5;
constexpr unsigned int MIN_INTERVAL_MINUTES = 1;
constexpr const auto* DEFAULT_NETWORK_HOST = "github.com";
constexpr uint16_t DEFAULT_NETWORK_PORT = 443;
constexpr const auto* DEFAULT_BRANCH = "main";
constexpr const auto* DEFAULT_COMMIT_MESSAGE = "Auto-sync ({timestamp})";

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// One tracked directory; path is the unique key.
struct Entry {
    std::filesystem::path path;
    std::optional<std::string> remote;
    std::string branch = DEFAULT_BRANCH;
    bool push = true;
    std::string commit_message = DEFAULT_COMMIT_MESSAGE;
};

struct GitConfig {
    std::string binary = "git";
    unsigned int local_timeout_seconds = 60;
    unsigned int remote_timeout_seconds = 120;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum gitsync = spdlog::level::info;   // startup/shutdown, fatal errors
    spdlog::level::level_enum sync    = spdlog::level::info;   // per-entry outcome lines
    spdlog::level::level_enum git     = spdlog::level::warn;   // subprocess failures only
    spdlog::level::level_enum net     = spdlog::level::info;
    spdlog::level::level_enum runtime = spdlog::level::info;   // lock, scheduler, daemon
    spdlog::level::level_enum shell   = spdlog::level::warn;
};

struct LoggingConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    std::vector<Entry> entries;
    unsigned int interval_minutes = DEFAULT_INTERVAL_MINUTES;
    std::string network_host = DEFAULT_NETWORK_HOST;
    uint16_t network_port = DEFAULT_NETWORK_PORT;
    unsigned int probe_timeout_ms = 2000;
    GitConfig git;
    LoggingConfig logging;

    [[nodiscard]] const Entry* find(const std::filesystem::path& path) const;
    Entry* find(const std::filesystem::path& path);

    void save(const std::filesystem::path& path) const;
};

// Missing file -> defaults written to disk. Malformed file -> config::Error.
Config loadConfig(const std::filesystem::path& path);

std::string renderYaml(const Config& c);

void to_json(nlohmann::json& j, const Entry& e);
void to_json(nlohmann::json& j, const Config& c);

}
