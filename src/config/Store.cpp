#include "config/Store.hpp"
#include "util/paths.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace gitsync::config {

Store::Store(fs::path path) : path_(std::move(path)) {}

Config Store::load() const { return loadConfig(path_); }

void Store::save(const Config& cfg) const { cfg.save(path_); }

Entry Store::add(const fs::path& path, const EntryUpdate& update) const {
    if (update.branch && update.branch->empty()) throw Error("branch must not be empty");

    auto cfg = load();
    const auto key = paths::normalize(path);

    Entry* entry = cfg.find(key);
    if (!entry) {
        cfg.entries.push_back(Entry{.path = key});
        entry = &cfg.entries.back();
    }

    if (update.remote) {
        if (update.remote->empty()) entry->remote.reset();
        else entry->remote = *update.remote;
    }
    if (update.branch) entry->branch = *update.branch;
    if (update.push) entry->push = *update.push;
    if (update.commit_message) entry->commit_message = *update.commit_message;

    Entry result = *entry;
    save(cfg);
    return result;
}

bool Store::remove(const fs::path& path) const {
    auto cfg = load();
    const auto key = paths::normalize(path);
    const auto removed = std::erase_if(cfg.entries, [&](const Entry& e) { return e.path == key; });
    if (removed == 0) return false;
    save(cfg);
    return true;
}

std::vector<Entry> Store::list() const { return load().entries; }

}
