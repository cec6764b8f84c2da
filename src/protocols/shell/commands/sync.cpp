#include "protocols/shell/commands.hpp"
#include "protocols/shell/commands/helpers.hpp"
#include "protocols/shell/Router.hpp"
#include "config/Store.hpp"
#include "runtime/Daemon.hpp"
#include "runtime/Engine.hpp"
#include "runtime/ExitCode.hpp"
#include "runtime/Scheduler.hpp"
#include "util/paths.hpp"
#include "util/shellArgsHelpers.hpp"

#include <ctime>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace gitsync::shell {

namespace {

std::optional<bool> pushOverrideFrom(const CommandCall& call) {
    if (hasKey(call, "no-push-all")) return false;
    return std::nullopt;
}

int exitCodeFor(const sync::CycleSummary& summary) {
    return summary.anyFailed() ? runtime::EXIT_ENTRY_FAILED : runtime::EXIT_OK;
}

std::string formatTime(const std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

}

static CommandResult handle_sync(const CommandCall& call, const Context& ctx) {
    if (const auto bad = unknownOption(call, {"no-push-all", "json"}))
        return invalid(fmt::format("sync: unknown option --{}", *bad));
    if (!call.positionals.empty()) return invalid("sync: takes no arguments");

    const auto cfg = config::Store(ctx.configPath).load();
    const auto engine = ctx.makeEngine(cfg);
    runtime::Scheduler scheduler(cfg, ctx.lockPath, *engine->op);

    const auto summary = scheduler.runOnce(pushOverrideFrom(call));

    CommandResult res;
    res.exit_code = exitCodeFor(summary);
    if (hasFlag(call, "json")) {
        res.data = summary;
        res.has_data = true;
        res.stdout_text = res.data.dump(2) + "\n";
    } else {
        res.stdout_text = summary.str() + "\n";
    }
    return res;
}

static CommandResult handle_run(const CommandCall& call, const Context& ctx) {
    if (const auto bad = unknownOption(call, {"interval", "once", "daemon", "pidfile", "logfile", "no-push-all"}))
        return invalid(fmt::format("run: unknown option --{}", *bad));
    if (!call.positionals.empty()) return invalid("run: takes no arguments");

    runtime::RunOptions opts;
    opts.once = hasKey(call, "once");
    opts.daemon = hasKey(call, "daemon");
    opts.pushOverride = pushOverrideFrom(call);

    if (opts.once && opts.daemon) return invalid("run: --once and --daemon cannot be combined");

    if (const auto iv = optVal(call, "interval")) {
        const auto minutes = parseUInt(*iv);
        if (!minutes) return invalid(fmt::format("run: --interval expects a whole number of minutes, got '{}'", *iv));
        opts.interval_minutes = *minutes;
    }

    const auto pidfile = optVal(call, "pidfile");
    const auto logfile = optVal(call, "logfile");
    if ((pidfile && pidfile->empty()) || (logfile && logfile->empty()))
        return invalid("run: --pidfile and --logfile need a path");

    opts.pidfile = pidfile ? paths::normalize(*pidfile) : ctx.pidPath;
    if (logfile) opts.logfile = paths::normalize(*logfile);
    else if (opts.daemon) opts.logfile = ctx.logPath;

    const auto cfg = config::Store(ctx.configPath).load();
    const auto engine = ctx.makeEngine(cfg);
    runtime::Scheduler scheduler(cfg, ctx.lockPath, *engine->op);

    const auto last = scheduler.run(opts);
    if (opts.once) return {exitCodeFor(last), last.str() + "\n", ""};
    return ok("");
}

static CommandResult handle_stop(const CommandCall& call, const Context& ctx) {
    if (const auto bad = unknownOption(call, {"pidfile"})) return invalid(fmt::format("stop: unknown option --{}", *bad));
    if (!call.positionals.empty()) return invalid("stop: takes no arguments");

    const auto pidfile = optVal(call, "pidfile");
    const auto path = pidfile && !pidfile->empty() ? paths::normalize(*pidfile) : ctx.pidPath;

    if (runtime::stop(path, ctx.lockPath)) return ok("Daemon stopped.\n");
    return ok("No daemon running.\n");
}

static CommandResult handle_status(const CommandCall& call, const Context& ctx) {
    if (const auto bad = unknownOption(call, {"pidfile", "json"}))
        return invalid(fmt::format("status: unknown option --{}", *bad));

    const auto pidfile = optVal(call, "pidfile");
    const auto path = pidfile && !pidfile->empty() ? paths::normalize(*pidfile) : ctx.pidPath;
    const auto state = runtime::status(path, ctx.lockPath);

    CommandResult res;
    res.exit_code = state ? runtime::EXIT_OK : runtime::EXIT_NOT_RUNNING;

    if (hasFlag(call, "json")) {
        res.data = {{"running", state.has_value()}};
        if (state) res.data["daemon"] = *state;
        res.has_data = true;
        res.stdout_text = res.data.dump(2) + "\n";
        return res;
    }

    if (!state) res.stdout_text = "gitsync is not running\n";
    else res.stdout_text = fmt::format("gitsync is running (pid {}, since {}, log {})\n",
                                       state->pid, formatTime(state->started_at), state->log_file.string());
    return res;
}

void registerSyncCommands(Router& r, const Context& ctx) {
    r.registerCommand({
        .name = "sync",
        .aliases = {},
        .synopsis = "sync [--no-push-all] [--json]",
        .description = "Run one sync pass over every tracked directory",
        .switches = {"no-push-all", "json"}
    }, [&ctx](const CommandCall& c) { return guarded([&](const CommandCall& cc) { return handle_sync(cc, ctx); }, c); });

    r.registerCommand({
        .name = "run",
        .aliases = {},
        .synopsis = "run [--interval N] [--once] [--daemon] [--pidfile P] [--logfile L] [--no-push-all]",
        .description = "Sync every N minutes until stopped, optionally in the background",
        .switches = {"once", "daemon", "no-push-all"}
    }, [&ctx](const CommandCall& c) { return guarded([&](const CommandCall& cc) { return handle_run(cc, ctx); }, c); });

    r.registerCommand({
        .name = "stop",
        .aliases = {},
        .synopsis = "stop [--pidfile P]",
        .description = "Stop the background instance",
        .switches = {}
    }, [&ctx](const CommandCall& c) { return guarded([&](const CommandCall& cc) { return handle_stop(cc, ctx); }, c); });

    r.registerCommand({
        .name = "status",
        .aliases = {},
        .synopsis = "status [--pidfile P] [--json]",
        .description = "Report whether a background instance is running",
        .switches = {"json"}
    }, [&ctx](const CommandCall& c) { return guarded([&](const CommandCall& cc) { return handle_status(cc, ctx); }, c); });
}

}
