#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace gitsync::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;           // CLI stdout
    std::string stderr_text;           // CLI stderr
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandUsage {
    std::string name;
    std::unordered_set<std::string> aliases;
    std::string synopsis;                    // e.g. "add <path> [--remote URL]"
    std::string description;
    std::unordered_set<std::string> switches; // flags that never take a value
};

struct CommandInfo {
    CommandUsage usage;
    CommandHandler handler;
};

}
