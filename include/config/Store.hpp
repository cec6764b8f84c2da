#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitsync::config {

// Fields left unset keep their current value on update, or the default on create.
struct EntryUpdate {
    std::optional<std::string> remote;
    std::optional<std::string> branch;
    std::optional<bool> push;
    std::optional<std::string> commit_message;
};

// Load/modify/save wrapper around one config file. Persists only on mutation.
class Store {
public:
    explicit Store(std::filesystem::path path);

    [[nodiscard]] Config load() const;
    void save(const Config& cfg) const;

    Entry add(const std::filesystem::path& path, const EntryUpdate& update = {}) const;
    bool remove(const std::filesystem::path& path) const;
    [[nodiscard]] std::vector<Entry> list() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
