#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace lb::config { struct LoggingConfig; }

namespace lb::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. verbose forces debug everywhere on the console.
    static void init(const config::LoggingConfig& cnf, bool verbose = false);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> lightbox() { return get("lightbox"); }
    static std::shared_ptr<spdlog::logger> upload()   { return get("upload"); }
    static std::shared_ptr<spdlog::logger> catalog()  { return get("catalog"); }
    static std::shared_ptr<spdlog::logger> remote()   { return get("remote"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
