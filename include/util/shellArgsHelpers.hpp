#pragma once

#include "protocols/shell/types.hpp"

#include <initializer_list>
#include <optional>
#include <string>

namespace gitsync::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);
CommandResult fail(int exitCode, std::string msg);

// Value of --key; empty string when the flag was given without one
std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& sv);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

// Rejects options not named in allowed; returns the offending key
std::optional<std::string> unknownOption(const CommandCall& c, std::initializer_list<std::string> allowed);

}
