#pragma once

#include "config/Config.hpp"
#include "util/errors.hpp"

#include <yaml-cpp/yaml.h>

namespace lb::config {

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

// spdlog::level::from_str() maps unknown names to "off"; a typo must not silence logging.
inline spdlog::level::level_enum parseLevel(const std::string& name) {
    using namespace spdlog::level;
    if (name == "trace") return trace;
    if (name == "debug") return debug;
    if (name == "info") return info;
    if (name == "warn" || name == "warning") return warn;
    if (name == "err" || name == "error") return err;
    if (name == "critical") return critical;
    if (name == "off") return off;
    throw ConfigurationError("Unknown log level: '" + name + "'");
}

}

namespace YAML {

using namespace lb::config;

template<>
struct convert<UploadConfig> {
    static Node encode(const UploadConfig& rhs) {
        Node node;
        node["threads"] = rhs.threads;
        node["max_error_percent"] = rhs.max_error_percent;
        if (rhs.max_errors) node["max_errors"] = *rhs.max_errors;
        else node["max_errors"] = Null;
        node["public"] = rhs.is_public;
        node["tags"] = rhs.tags;
        node["extensions"] = rhs.extensions;
        return node;
    }

    static bool decode(const Node& node, UploadConfig& rhs) {
        if (!node.IsMap()) return false;

        if (node["threads"]) {
            const auto threads = node["threads"].as<long long>();
            if (threads <= 0) throw lb::ConfigurationError("upload.threads must be a positive integer");
            rhs.threads = static_cast<unsigned int>(threads);
        }

        if (node["max_error_percent"]) rhs.max_error_percent = node["max_error_percent"].as<double>();

        if (node["max_errors"] && !node["max_errors"].IsNull()) {
            const auto cap = node["max_errors"].as<long long>();
            if (cap < 0) throw lb::ConfigurationError("upload.max_errors must not be negative");
            rhs.max_errors = static_cast<unsigned int>(cap);
        }

        rhs.is_public = node["public"].as<bool>(false);
        if (node["tags"]) rhs.tags = node["tags"].as<std::vector<std::string>>();
        if (node["extensions"]) rhs.extensions = node["extensions"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<FlickrConfig> {
    static Node encode(const FlickrConfig& rhs) {
        Node node;
        node["api_key"] = rhs.api_key;
        node["api_secret"] = rhs.api_secret.empty() ? "" : "********";
        node["token_cache"] = rhs.token_cache.string();
        node["perms"] = rhs.perms;
        node["timeout_seconds"] = rhs.timeout_seconds;
        node["rest_endpoint"] = rhs.rest_endpoint;
        node["upload_endpoint"] = rhs.upload_endpoint;
        node["oauth_endpoint"] = rhs.oauth_endpoint;
        return node;
    }

    static bool decode(const Node& node, FlickrConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.api_key = node["api_key"].as<std::string>("");
        rhs.api_secret = node["api_secret"].as<std::string>("");
        if (node["token_cache"]) rhs.token_cache = node["token_cache"].as<std::string>();
        rhs.perms = node["perms"].as<std::string>("write");
        if (node["timeout_seconds"]) rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>();
        rhs.rest_endpoint = node["rest_endpoint"].as<std::string>(rhs.rest_endpoint);
        rhs.upload_endpoint = node["upload_endpoint"].as<std::string>(rhs.upload_endpoint);
        rhs.oauth_endpoint = node["oauth_endpoint"].as<std::string>(rhs.oauth_endpoint);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["lightbox"] = to_std_string(spdlog::level::to_string_view(rhs.lightbox));
        node["upload"]   = to_std_string(spdlog::level::to_string_view(rhs.upload));
        node["catalog"]  = to_std_string(spdlog::level::to_string_view(rhs.catalog));
        node["remote"]   = to_std_string(spdlog::level::to_string_view(rhs.remote));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["lightbox"]) rhs.lightbox = parseLevel(node["lightbox"].as<std::string>());
        if (node["upload"])   rhs.upload   = parseLevel(node["upload"].as<std::string>());
        if (node["catalog"])  rhs.catalog  = parseLevel(node["catalog"].as<std::string>());
        if (node["remote"])   rhs.remote   = parseLevel(node["remote"].as<std::string>());
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystems"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["console"]) rhs.console_log_level = parseLevel(node["console"].as<std::string>());
        if (node["file"]) rhs.file_log_level = parseLevel(node["file"].as<std::string>());
        if (node["subsystems"]) convert<SubsystemLogLevelsConfig>::decode(node["subsystems"], rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        if (rhs.log_dir) node["log_dir"] = rhs.log_dir->string();
        else node["log_dir"] = Null;
        node["levels"] = convert<LogLevelsConfig>::encode(rhs.levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_dir"] && !node["log_dir"].IsNull()) rhs.log_dir = node["log_dir"].as<std::string>();
        if (node["levels"]) convert<LogLevelsConfig>::decode(node["levels"], rhs.levels);
        return true;
    }
};

}
