#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/errors.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace lb::config {

namespace fs = std::filesystem;

namespace {

fs::path configHome() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return fs::path(xdg);
    if (const char* home = std::getenv("HOME"); home && *home) return fs::path(home) / ".config";
    return fs::current_path();
}

template <typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node || node.IsNull()) return;
    if (!YAML::convert<T>::decode(node, out))
        throw ConfigurationError("Config section '" + key + "' must be a mapping");
}

}

fs::path defaultConfigPath() {
    if (const char* explicitPath = std::getenv("LIGHTBOX_CONFIG"); explicitPath && *explicitPath) return explicitPath;
    return configHome() / "lightbox" / "config.yaml";
}

fs::path defaultTokenCachePath() {
    return configHome() / "lightbox" / "oauth-token.json";
}

Config loadConfig(const fs::path& path) {
    if (!fs::exists(path)) throw ConfigurationError("Config file not found: " + path.string());

    Config cfg;
    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (root && !root.IsNull()) {
            if (!root.IsMap()) throw ConfigurationError("Config file must contain a mapping: " + path.string());
            decodeSection(root, "upload", cfg.upload);
            decodeSection(root, "flickr", cfg.flickr);
            decodeSection(root, "logging", cfg.logging);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse config file " + path.string() + ": " + e.what());
    }

    if (cfg.flickr.token_cache.empty()) cfg.flickr.token_cache = defaultTokenCachePath();
    applyEnvironment(cfg);
    validate(cfg);
    return cfg;
}

Config loadDefaultConfig() {
    if (const auto path = defaultConfigPath(); fs::exists(path)) return loadConfig(path);

    Config cfg;
    cfg.flickr.token_cache = defaultTokenCachePath();
    applyEnvironment(cfg);
    validate(cfg);
    return cfg;
}

void applyEnvironment(Config& cfg) {
    if (const char* key = std::getenv("LIGHTBOX_FLICKR_API_KEY"); key && *key) cfg.flickr.api_key = key;
    if (const char* secret = std::getenv("LIGHTBOX_FLICKR_API_SECRET"); secret && *secret) cfg.flickr.api_secret = secret;
}

void validate(const Config& cfg) {
    if (cfg.upload.threads == 0) throw ConfigurationError("upload.threads must be a positive integer");
    if (cfg.upload.max_error_percent < 0.0 || cfg.upload.max_error_percent > 100.0)
        throw ConfigurationError("upload.max_error_percent must be between 0 and 100");
    if (cfg.upload.extensions.empty()) throw ConfigurationError("upload.extensions must not be empty");
    if (cfg.flickr.perms != "read" && cfg.flickr.perms != "write" && cfg.flickr.perms != "delete")
        throw ConfigurationError("flickr.perms must be one of read, write, delete");
    if (cfg.flickr.timeout_seconds == 0) throw ConfigurationError("flickr.timeout_seconds must be positive");
}

std::string Config::dump() const {
    YAML::Emitter out;
    YAML::Node root;
    root["upload"] = YAML::convert<UploadConfig>::encode(upload);
    root["flickr"] = YAML::convert<FlickrConfig>::encode(flickr);
    root["logging"] = YAML::convert<LoggingConfig>::encode(logging);
    out << root;
    return {out.c_str()};
}

}
