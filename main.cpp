#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/commands.hpp"
#include "runtime/ExitCode.hpp"

#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>
#include <fmt/core.h>

using namespace gitsync;

namespace {

// Strips the global flags that apply before any command runs
bool takeVerbose(std::vector<std::string>& args) {
    bool verbose = false;
    for (auto it = args.begin(); it != args.end() && *it != "--";) {
        if (*it == "--verbose" || *it == "-v") {
            verbose = true;
            it = args.erase(it);
        } else ++it;
    }
    return verbose;
}

void initLogging(const shell::Context& ctx) {
    if (!std::filesystem::exists(ctx.configPath)) {
        log::Registry::init();
        return;
    }
    try {
        log::Registry::init(config::loadConfig(ctx.configPath).logging);
    } catch (const config::Error& e) {
        // The command that needs the config reports this as fatal
        log::Registry::init();
        log::Registry::gitsync()->debug("Using default logging; config unreadable: {}", e.what());
    }
}

void emit(std::FILE* stream, const std::string& text) {
    if (text.empty()) return;
    fmt::print(stream, "{}", text);
    if (text.back() != '\n') fmt::print(stream, "\n");
}

}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    const bool verbose = takeVerbose(args);

    try {
        const auto ctx = shell::defaultContext();
        initLogging(ctx);
        if (verbose) log::Registry::setConsoleLevel(spdlog::level::debug);

        shell::Router router;
        shell::registerAllCommands(router, ctx);

        const auto res = router.execute(args);
        emit(stdout, res.stdout_text);
        emit(stderr, res.stderr_text);

        log::Registry::shutdown();
        return res.exit_code;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::gitsync()->error("[-] {}", e.what());
        else fmt::print(stderr, "gitsync: {}\n", e.what());
        return runtime::EXIT_FATAL;
    }
}
