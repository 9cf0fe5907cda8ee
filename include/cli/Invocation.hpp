#pragma once

#include "upload/model/RunOptions.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lb::config { struct Config; }

namespace lb::cli {

struct Invocation {
    std::filesystem::path directory;
    std::optional<std::string> setName;
    std::optional<std::string> tags;
    std::optional<unsigned int> threads;
    std::optional<double> maxErrorPercent;
    std::optional<unsigned int> maxErrors;
    std::optional<std::filesystem::path> configPath;
    bool isPublic = false;
    bool verbose = false;
    bool help = false;
};

// args excludes the program name. Throws ConfigurationError on bad usage.
Invocation parseInvocation(const std::vector<std::string>& args);

std::string usage(const std::string& program = "lightbox");

// Command line wins over configuration; tags are appended to the configured ones.
upload::model::RunOptions buildRunOptions(const Invocation& inv, const config::Config& cfg);

}
