#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace lb::config {

struct UploadConfig {
    unsigned int threads = 4;
    double max_error_percent = 2.0;
    std::optional<unsigned int> max_errors;   // absolute cap, replaces the percentage when set
    bool is_public = false;
    std::vector<std::string> tags;
    std::vector<std::string> extensions = {"jpg", "jpeg", "png", "gif", "tif", "tiff"};
};

struct FlickrConfig {
    std::string api_key;
    std::string api_secret;
    std::filesystem::path token_cache;
    std::string perms = "write";
    unsigned int timeout_seconds = 300;
    std::string rest_endpoint = "https://api.flickr.com/services/rest/";
    std::string upload_endpoint = "https://up.flickr.com/services/upload/";
    std::string oauth_endpoint = "https://www.flickr.com/services/oauth/";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum lightbox = spdlog::level::info;   // startup, shutdown, run summary
    spdlog::level::level_enum upload   = spdlog::level::info;   // per-file progress and failures
    spdlog::level::level_enum catalog  = spdlog::level::info;   // skipped entries are debug
    spdlog::level::level_enum remote   = spdlog::level::warn;   // API errors, set creation
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::optional<std::filesystem::path> log_dir;
    LogLevelsConfig levels;
};

struct Config {
    UploadConfig upload;
    FlickrConfig flickr;
    LoggingConfig logging;

    [[nodiscard]] std::string dump() const;
};

std::filesystem::path defaultConfigPath();
std::filesystem::path defaultTokenCachePath();

// Throws ConfigurationError when the file is missing, malformed or holds invalid values.
Config loadConfig(const std::filesystem::path& path);

// Loads defaultConfigPath() when it exists, built-in defaults otherwise. Environment overrides apply to both.
Config loadDefaultConfig();

void applyEnvironment(Config& cfg);
void validate(const Config& cfg);

}
