#include "protocols/shell/commands/helpers.hpp"
#include "protocols/shell/commands.hpp"
#include "config/Config.hpp"
#include "runtime/Daemon.hpp"
#include "runtime/Engine.hpp"
#include "runtime/ExitCode.hpp"
#include "runtime/InstanceLock.hpp"
#include "util/paths.hpp"
#include "util/shellArgsHelpers.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace gitsync::shell {

Context defaultContext() {
    return {
        .configPath = paths::getConfigPath(),
        .lockPath = paths::getLockPath(),
        .pidPath = paths::getPidPath(),
        .logPath = paths::getLogPath(),
        .makeEngine = runtime::makeEngine
    };
}

std::string describe(const config::Entry& e) {
    std::string flags;
    if (e.remote) flags += fmt::format("remote={}, ", *e.remote);
    flags += fmt::format("branch={}, {}", e.branch, e.push ? "push" : "no-push");
    return fmt::format("{} ({})", e.path.string(), flags);
}

CommandResult guarded(const CommandHandler& handler, const CommandCall& call) {
    try {
        return handler(call);
    } catch (const config::Error& e) {
        log::Registry::gitsync()->error("Configuration error: {}", e.what());
        return fail(runtime::EXIT_FATAL, fmt::format("Configuration error: {}", e.what()));
    } catch (const runtime::AlreadyRunning& e) {
        return fail(runtime::EXIT_ALREADY_RUNNING, e.what());
    } catch (const runtime::DaemonError& e) {
        log::Registry::runtime()->error("[Daemon] {}", e.what());
        return fail(runtime::EXIT_FATAL, e.what());
    }
}

}
