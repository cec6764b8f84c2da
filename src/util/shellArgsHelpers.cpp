#include "util/shellArgsHelpers.hpp"
#include "runtime/ExitCode.hpp"

#include <algorithm>
#include <limits>

using namespace gitsync::shell;

CommandResult gitsync::shell::invalid(std::string msg) {
    return {static_cast<int>(runtime::EXIT_USAGE), "", std::move(msg)};
}
CommandResult gitsync::shell::ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult gitsync::shell::fail(const int exitCode, std::string msg) { return {exitCode, "", std::move(msg)}; }

std::optional<std::string> gitsync::shell::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

bool gitsync::shell::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}
bool gitsync::shell::hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

std::optional<unsigned int> gitsync::shell::parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) {
            return std::nullopt; // overflow
        }
    }

    return static_cast<unsigned int>(v);
}

std::optional<std::string> gitsync::shell::unknownOption(const CommandCall& c, const std::initializer_list<std::string> allowed) {
    for (const auto& kv : c.options)
        if (std::ranges::find(allowed, kv.key) == allowed.end()) return kv.key;
    return std::nullopt;
}
