#include "protocols/shell/Router.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/Parser.hpp"
#include "log/Registry.hpp"
#include "util/shellArgsHelpers.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cctype>

namespace gitsync::shell {

void Router::registerCommand(CommandUsage usage, CommandHandler handler) {
    const std::string key = normalize(usage.name);
    if (usage.description.empty()) usage.description = "No description provided.";

    std::unordered_set<std::string> kept;
    for (const std::string& alias : usage.aliases) {
        const auto a = normalize_alias(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            log::Registry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                         a, aliasMap_.at(a), key);
            continue;
        }
        kept.insert(alias);
        aliasMap_[a] = key;
        log::Registry::shell()->debug("Alias '{}' mapped to '{}'", a, key);
    }
    usage.aliases = std::move(kept);

    if (!commands_.contains(key)) order_.push_back(key);
    commands_[key] = CommandInfo{std::move(usage), std::move(handler)};
}

bool Router::has(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const auto n = normalize_alias(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    const auto toks = tokenize(args);
    log::Registry::shell()->debug("[Router] Tokens: {}", to_string(toks));

    if (toks.empty()) return {2, helpText(), "No command provided."};

    const auto canonical = canonicalFor(toks.front().text);
    if (!commands_.contains(canonical))
        return {2, helpText(), fmt::format("Unknown command or alias: {}", toks.front().text)};

    const auto& info = commands_.at(canonical);
    auto call = parseTokens(toks, info.usage.switches);
    call.name = canonical;

    if (hasFlag(call, "help") || hasFlag(call, "h"))
        return ok(fmt::format("usage: gitsync {}\n\n  {}\n", info.usage.synopsis, info.usage.description));

    log::Registry::shell()->debug("[Router] Executing command: '{}'", canonical);
    return info.handler(call);
}

std::string Router::helpText() const {
    size_t width = 0;
    for (const auto& key : order_) width = std::max(width, commands_.at(key).usage.synopsis.size());

    std::string out = "usage: gitsync [--verbose] <command> [options]\n\ncommands:\n";
    for (const auto& key : order_) {
        const auto& u = commands_.at(key).usage;
        out += fmt::format("  {:<{}}  {}\n", u.synopsis, width, u.description);
    }
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Router::strip_leading_dashes(const std::string& s) {
    size_t i = 0; while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}

std::string Router::normalize_alias(const std::string& s) {
    return normalize(strip_leading_dashes(s));
}

}
