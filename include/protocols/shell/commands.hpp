#pragma once

#include <filesystem>
#include <functional>
#include <memory>

namespace gitsync::config { struct Config; }
namespace gitsync::runtime { struct Engine; }

namespace gitsync::shell {

class Router;

// Locations and collaborators every command works against.
struct Context {
    std::filesystem::path configPath;
    std::filesystem::path lockPath;
    std::filesystem::path pidPath;
    std::filesystem::path logPath;
    std::function<std::unique_ptr<runtime::Engine>(const config::Config&)> makeEngine;
};

// Context rooted at the well-known config directory, backed by the real git binary
Context defaultContext();

void registerEntryCommands(Router& r, const Context& ctx);
void registerSyncCommands(Router& r, const Context& ctx);
void registerSystemCommands(Router& r);

inline void registerAllCommands(Router& r, const Context& ctx) {
    registerEntryCommands(r, ctx);
    registerSyncCommands(r, ctx);
    registerSystemCommands(r);
}

}
