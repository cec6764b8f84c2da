#include "protocols/shell/commands.hpp"
#include "protocols/shell/commands/helpers.hpp"
#include "protocols/shell/Router.hpp"
#include "config/Store.hpp"
#include "util/paths.hpp"
#include "util/shellArgsHelpers.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace gitsync::shell {

static CommandResult handle_add(const CommandCall& call, const Context& ctx) {
    if (const auto bad = unknownOption(call, {"remote", "branch", "commit-message", "push", "no-push"}))
        return invalid(fmt::format("add: unknown option --{}", *bad));
    if (call.positionals.size() != 1) return invalid("add: expected exactly one <path>");
    if (hasKey(call, "push") && hasKey(call, "no-push"))
        return invalid("add: --push and --no-push are mutually exclusive");

    config::EntryUpdate update{
        .remote = optVal(call, "remote"),
        .branch = optVal(call, "branch"),
        .push = std::nullopt,
        .commit_message = optVal(call, "commit-message")
    };
    if (hasKey(call, "push")) update.push = true;
    if (hasKey(call, "no-push")) update.push = false;

    const config::Store store(ctx.configPath);
    const bool existed = store.load().find(paths::normalize(call.positionals.front())) != nullptr;
    const auto entry = store.add(call.positionals.front(), update);

    return ok(fmt::format("{} {}\n", existed ? "Updated" : "Added", describe(entry)));
}

static CommandResult handle_remove(const CommandCall& call, const Context& ctx) {
    if (const auto bad = unknownOption(call, {})) return invalid(fmt::format("remove: unknown option --{}", *bad));
    if (call.positionals.size() != 1) return invalid("remove: expected exactly one <path>");

    const config::Store store(ctx.configPath);
    const auto target = paths::normalize(call.positionals.front());
    if (store.remove(target)) return ok(fmt::format("Removed {}\n", target.string()));
    return ok(fmt::format("Path not found: {}\n", target.string()));
}

static CommandResult handle_list(const CommandCall& call, const Context& ctx) {
    if (const auto bad = unknownOption(call, {"json"})) return invalid(fmt::format("list: unknown option --{}", *bad));
    if (!call.positionals.empty()) return invalid("list: takes no arguments");

    const auto entries = config::Store(ctx.configPath).list();

    if (hasFlag(call, "json")) {
        CommandResult res;
        res.data = entries;
        res.has_data = true;
        res.stdout_text = res.data.dump(2) + "\n";
        return res;
    }

    if (entries.empty()) return ok("No tracked paths yet. Use add <path> to start.\n");

    std::string out;
    for (const auto& e : entries) out += fmt::format("- {}\n", describe(e));
    return ok(out);
}

void registerEntryCommands(Router& r, const Context& ctx) {
    r.registerCommand({
        .name = "add",
        .aliases = {},
        .synopsis = "add <path> [--remote URL] [--branch B] [--commit-message M] [--no-push|--push]",
        .description = "Track a directory, or update the settings of a tracked one",
        .switches = {"push", "no-push"}
    }, [&ctx](const CommandCall& c) { return guarded([&](const CommandCall& cc) { return handle_add(cc, ctx); }, c); });

    r.registerCommand({
        .name = "remove",
        .aliases = {"rm"},
        .synopsis = "remove <path>",
        .description = "Stop tracking a directory (files are left alone)",
        .switches = {}
    }, [&ctx](const CommandCall& c) { return guarded([&](const CommandCall& cc) { return handle_remove(cc, ctx); }, c); });

    r.registerCommand({
        .name = "list",
        .aliases = {"ls"},
        .synopsis = "list [--json]",
        .description = "List tracked directories",
        .switches = {"json"}
    }, [&ctx](const CommandCall& c) { return guarded([&](const CommandCall& cc) { return handle_list(cc, ctx); }, c); });
}

}
