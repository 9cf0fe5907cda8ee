#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <vector>

namespace lb::log {

void Registry::init(const config::LoggingConfig& cnf, const bool verbose) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    const auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(verbose ? spdlog::level::debug : cnf.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);
    sinks.push_back(consoleSink);

    if (cnf.log_dir) {
        namespace fs = std::filesystem;
        const auto& logDir = *cnf.log_dir;
        if (!fs::exists(logDir)) fs::create_directories(logDir);

        const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logDir / "lightbox.log").string(), main_max_bytes_, main_max_files_);
        rotatingSink->set_level(cnf.levels.file_log_level);
        rotatingSink->set_pattern(LOG_FORMAT);
        sinks.push_back(rotatingSink);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(verbose ? spdlog::level::debug : lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;

    makeLogger("lightbox", sub_levels.lightbox);
    makeLogger("upload", sub_levels.upload);
    makeLogger("catalog", sub_levels.catalog);
    makeLogger("remote", sub_levels.remote);

    initialized_ = true;
    lightbox()->debug("[log::Registry] Initialized{}",
                      cnf.log_dir ? ", writing to " + cnf.log_dir->string() : std::string{});
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
