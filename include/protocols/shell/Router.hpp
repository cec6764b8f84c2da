#pragma once

#include "protocols/shell/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace gitsync::shell {

class Router {
public:
    void registerCommand(CommandUsage usage, CommandHandler handler);

    CommandResult execute(const std::vector<std::string>& args) const;

    // Top-level help listing every registered command in registration order.
    [[nodiscard]] std::string helpText() const;

    [[nodiscard]] bool has(const std::string& nameOrAlias) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::vector<std::string> order_;

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
    static std::string normalize_alias(const std::string& s);
    static std::string strip_leading_dashes(const std::string& s);
};

}
