#pragma once

#include "protocols/shell/types.hpp"

#include <string>

namespace gitsync::config { struct Entry; }

namespace gitsync::shell {

// "<path> (remote=<url>, branch=<b>, push|no-push)"
std::string describe(const config::Entry& e);

// Maps the fatal error types onto exit codes; anything else propagates.
CommandResult guarded(const CommandHandler& handler, const CommandCall& call);

}
