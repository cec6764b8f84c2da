#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <stdexcept>

namespace gitsync::log {

void Registry::init() { init(config::LoggingConfig{}); }

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);
    file_level_ = cnf.file_log_level;

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, console_sink_);
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    };

    const auto& sub = cnf.subsystem_levels;
    makeLogger("gitsync", sub.gitsync);
    makeLogger("sync",    sub.sync);
    makeLogger("git",     sub.git);
    makeLogger("net",     sub.net);
    makeLogger("runtime", sub.runtime);
    makeLogger("shell",   sub.shell);

    initialized_ = true;
}

void Registry::attachFile(const std::filesystem::path& path) {
    if (!initialized_) throw std::runtime_error("[LogRegistry] attachFile() called before init()");
    if (file_sink_ && path == log_path_) return;

    namespace fs = std::filesystem;
    if (path.has_parent_path() && !fs::exists(path.parent_path())) fs::create_directories(path.parent_path());

    auto fresh = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), max_bytes_, max_files_);
    fresh->set_level(file_level_);
    fresh->set_pattern(LOG_FORMAT);

    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        auto& sinks = lg->sinks();
        lg->flush();
        if (file_sink_) std::erase(sinks, file_sink_);
        sinks.push_back(fresh);
    });

    file_sink_ = std::move(fresh);
    log_path_ = path;
}

void Registry::shutdown() {
    spdlog::drop_all();
    console_sink_.reset();
    file_sink_.reset();
    log_path_.clear();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::setConsoleLevel(const spdlog::level::level_enum lvl) {
    if (!console_sink_) return;
    console_sink_->set_level(lvl);
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->level() > lvl) lg->set_level(lvl);
    });
}

void Registry::disableConsoleColor() {
    if (console_sink_) console_sink_->set_color_mode(spdlog::color_mode::never);
}

}
