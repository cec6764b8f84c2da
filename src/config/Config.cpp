#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/paths.hpp"

#include <fstream>
#include <unordered_set>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace gitsync::config {

namespace {

template <typename T> T getOrDefault(const YAML::Node& node, const std::string& key, const T& def) {
    return node[key] ? node[key].as<T>() : def;
}

Entry decodeEntry(const YAML::Node& node, const size_t idx) {
    if (!node.IsMap()) throw Error(fmt::format("entries[{}] is not a mapping", idx));
    if (!node["path"] || !node["path"].IsScalar() || node["path"].as<std::string>().empty())
        throw Error(fmt::format("entries[{}] has no path", idx));

    auto entry = node.as<Entry>();
    const auto raw = entry.path.string();
    if (raw.front() != '~' && entry.path.is_relative())
        throw Error(fmt::format("entries[{}] path must be absolute: {}", idx, raw));
    if (entry.branch.empty()) throw Error(fmt::format("entries[{}] has an empty branch", idx));

    entry.path = paths::normalize(entry.path);
    return entry;
}

}

const Entry* Config::find(const fs::path& path) const {
    for (const auto& e : entries) if (e.path == path) return &e;
    return nullptr;
}

Entry* Config::find(const fs::path& path) {
    for (auto& e : entries) if (e.path == path) return &e;
    return nullptr;
}

Config loadConfig(const fs::path& path) {
    Config cfg;

    if (!fs::exists(path)) {
        cfg.save(path);
        return cfg;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw Error(fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
    }

    if (!root || root.IsNull()) throw Error(fmt::format("Config {} is empty", path.string()));
    if (!root.IsMap()) throw Error(fmt::format("Config {} must be a mapping at the top level", path.string()));

    try {
        const int interval = getOrDefault<int>(root, "interval_minutes", DEFAULT_INTERVAL_MINUTES);
        if (interval < static_cast<int>(MIN_INTERVAL_MINUTES)) {
            spdlog::warn("[Config] Interval too low ({}); using {} minute", interval, MIN_INTERVAL_MINUTES);
            cfg.interval_minutes = MIN_INTERVAL_MINUTES;
        } else cfg.interval_minutes = static_cast<unsigned int>(interval);

        cfg.network_host = getOrDefault<std::string>(root, "network_host", DEFAULT_NETWORK_HOST);
        cfg.network_port = getOrDefault<uint16_t>(root, "network_port", DEFAULT_NETWORK_PORT);
        cfg.probe_timeout_ms = getOrDefault<unsigned int>(root, "probe_timeout_ms", 2000);
        if (cfg.network_host.empty()) throw Error("network_host must not be empty");

        if (auto node = root["git"]) YAML::convert<GitConfig>::decode(node, cfg.git);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

        if (const auto entries = root["entries"]; entries && !entries.IsNull()) {
            if (!entries.IsSequence()) throw Error("entries must be a list");

            std::unordered_set<std::string> seen;
            for (size_t i = 0; i < entries.size(); ++i) {
                auto entry = decodeEntry(entries[i], i);
                if (!seen.insert(entry.path.string()).second)
                    throw Error(fmt::format("entries[{}] duplicates path {}", i, entry.path.string()));
                cfg.entries.push_back(std::move(entry));
            }
        }
    } catch (const YAML::Exception& e) {
        throw Error(fmt::format("Invalid config {}: {}", path.string(), e.what()));
    }

    return cfg;
}

std::string renderYaml(const Config& c) {
    YAML::Node root;
    root["interval_minutes"] = c.interval_minutes;
    root["network_host"] = c.network_host;
    root["network_port"] = c.network_port;
    root["probe_timeout_ms"] = c.probe_timeout_ms;
    root["git"] = c.git;
    root["logging"] = c.logging;

    YAML::Node entries(YAML::NodeType::Sequence);
    for (const auto& e : c.entries) entries.push_back(e);
    root["entries"] = entries;

    YAML::Emitter out;
    out << root;
    return std::string(out.c_str()) + "\n";
}

void Config::save(const fs::path& path) const {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    // Write beside the target and rename so readers never see a partial file
    const auto tmp = fs::path(path.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) throw Error("Failed to write config file: " + tmp.string());
        out << renderYaml(*this);
        out.flush();
        if (!out) throw Error("Failed to write config file: " + tmp.string());
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) throw Error(fmt::format("Failed to replace config file {}: {}", path.string(), ec.message()));
}

void to_json(nlohmann::json& j, const Entry& e) {
    j = {
        {"path", e.path.string()},
        {"remote", e.remote ? nlohmann::json(*e.remote) : nlohmann::json(nullptr)},
        {"branch", e.branch},
        {"push", e.push},
        {"commit_message", e.commit_message}
    };
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"entries", c.entries},
        {"interval_minutes", c.interval_minutes},
        {"network_host", c.network_host},
        {"network_port", c.network_port}
    };
}

}
