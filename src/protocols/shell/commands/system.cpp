#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "util/shellArgsHelpers.hpp"

namespace gitsync::shell {

void registerSystemCommands(Router& r) {
    r.registerCommand({
        .name = "help",
        .aliases = {"h", "?"},
        .synopsis = "help",
        .description = "Show this help",
        .switches = {}
    }, [&r](const CommandCall&) { return ok(r.helpText()); });

    r.registerCommand({
        .name = "version",
        .aliases = {},
        .synopsis = "version",
        .description = "Print the gitsync version",
        .switches = {}
    }, [](const CommandCall&) { return ok("gitsync v" + std::string(GITSYNC_VERSION) + "\n"); });
}

}
