#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace gitsync::config { struct LoggingConfig; }

namespace gitsync::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);
    static void init();

    // Adds the rotating file sink to every registered logger.
    static void attachFile(const std::filesystem::path& path);

    // Drops every logger; only meant for tests and re-exec paths.
    static void shutdown();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> gitsync() { return get("gitsync"); }
    static std::shared_ptr<spdlog::logger> sync()    { return get("sync"); }
    static std::shared_ptr<spdlog::logger> git()     { return get("git"); }
    static std::shared_ptr<spdlog::logger> net()     { return get("net"); }
    static std::shared_ptr<spdlog::logger> runtime() { return get("runtime"); }
    static std::shared_ptr<spdlog::logger> shell()   { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

    static void setConsoleLevel(spdlog::level::level_enum lvl);

    // Console output no longer goes to a terminal (daemon mode)
    static void disableConsoleColor();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;
    static inline spdlog::level::level_enum file_level_ = spdlog::level::info;

    static inline size_t max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t max_files_ = 5;
};

}
