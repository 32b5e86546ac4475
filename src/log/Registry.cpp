#include "log/Registry.hpp"
#include "paths.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <stdexcept>

namespace bk::log {

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    const fs::path logDir = cnf.log_dir.empty() ? paths::getLogPath() : cnf.log_dir;
    if (!fs::exists(logDir)) fs::create_directories(logDir);

    const auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(cnf.console_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);

    const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (logDir / "basekeeper.log").string(), 1024 * 1024 * 10, 5);
    rotatingSink->set_level(cnf.file_level);
    rotatingSink->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name) {
        const auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{consoleSink, rotatingSink});
        logger->set_level(spdlog::level::trace);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    makeLogger("basekeeper");
    makeLogger("backend");
    makeLogger("backup");
    makeLogger("http");
    makeLogger("config");
    makeLogger("auth");

    initialized_ = true;
    get("basekeeper")->debug("[Registry] Initialized, log dir: {}", logDir.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
