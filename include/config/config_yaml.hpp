#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace gitsync::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<Entry> {
    static Node encode(const Entry& rhs) {
        Node node;
        node["path"] = rhs.path.string();
        if (rhs.remote) node["remote"] = *rhs.remote;
        node["branch"] = rhs.branch;
        node["push"] = rhs.push;
        node["commit_message"] = rhs.commit_message;
        return node;
    }

    // Path normalization and validation happen in loadConfig()
    static bool decode(const Node& node, Entry& rhs) {
        if (!node.IsMap() || !node["path"] || !node["path"].IsScalar()) return false;
        rhs.path = node["path"].as<std::string>();
        if (const auto remote = node["remote"]; remote && !remote.IsNull()) {
            if (const auto url = remote.as<std::string>(); !url.empty()) rhs.remote = url;
        }
        rhs.branch = node["branch"].as<std::string>(DEFAULT_BRANCH);
        rhs.push = node["push"].as<bool>(true);
        rhs.commit_message = node["commit_message"].as<std::string>(DEFAULT_COMMIT_MESSAGE);
        return true;
    }
};

template<>
struct convert<GitConfig> {
    static Node encode(const GitConfig& rhs) {
        Node node;
        node["binary"] = rhs.binary;
        node["local_timeout_seconds"] = rhs.local_timeout_seconds;
        node["remote_timeout_seconds"] = rhs.remote_timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, GitConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.binary = node["binary"].as<std::string>("git");
        rhs.local_timeout_seconds = node["local_timeout_seconds"].as<unsigned int>(60);
        rhs.remote_timeout_seconds = node["remote_timeout_seconds"].as<unsigned int>(120);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["gitsync"] = to_std_string(spdlog::level::to_string_view(rhs.gitsync));
        node["sync"]    = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["git"]     = to_std_string(spdlog::level::to_string_view(rhs.git));
        node["net"]     = to_std_string(spdlog::level::to_string_view(rhs.net));
        node["runtime"] = to_std_string(spdlog::level::to_string_view(rhs.runtime));
        node["shell"]   = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.gitsync = spdlog::level::from_str(node["gitsync"].as<std::string>("info"));
        rhs.sync    = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.git     = spdlog::level::from_str(node["git"].as<std::string>("warn"));
        rhs.net     = spdlog::level::from_str(node["net"].as<std::string>("info"));
        rhs.runtime = spdlog::level::from_str(node["runtime"].as<std::string>("info"));
        rhs.shell   = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}
