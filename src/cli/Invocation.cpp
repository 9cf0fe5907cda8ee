#include "cli/Invocation.hpp"
#include "cli/Args.hpp"
#include "config/Config.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

#include <fmt/format.h>

using namespace lb::cli;

namespace {

const std::vector<OptionSpec>& optionTable() {
    static const std::vector<OptionSpec> specs = {
        {"setname", 's', true},
        {"tags", 't', true},
        {"threads", '\0', true},
        {"public", 'p', false},
        {"max-error-percent", '\0', true},
        {"max-errors", '\0', true},
        {"config", 'c', true},
        {"verbose", 'v', false},
        {"help", 'h', false},
    };
    return specs;
}

}

Invocation lb::cli::parseInvocation(const std::vector<std::string>& args) {
    const auto call = parseArgs("lightbox", args, optionTable());

    Invocation inv;
    inv.help = hasFlag(call, "help");
    if (inv.help) return inv;

    if (call.positionals.empty()) throw lb::ConfigurationError("Missing directory argument");
    if (call.positionals.size() > 1)
        throw lb::ConfigurationError("Unexpected argument: " + call.positionals[1]);
    inv.directory = call.positionals.front();

    inv.setName = optVal(call, "setname");
    inv.tags = optVal(call, "tags");
    inv.isPublic = hasFlag(call, "public");
    inv.verbose = hasFlag(call, "verbose");

    if (const auto cfg = optVal(call, "config")) {
        if (cfg->empty()) throw lb::ConfigurationError("--config needs a file path");
        inv.configPath = *cfg;
    }

    if (const auto threads = optVal(call, "threads")) {
        const auto n = parseUInt(*threads);
        if (!n || *n == 0) throw lb::ConfigurationError("--threads must be a positive integer, got '" + *threads + "'");
        inv.threads = n;
    }

    if (const auto pct = optVal(call, "max-error-percent")) {
        const auto v = parseDouble(*pct);
        if (!v || *v < 0.0 || *v > 100.0)
            throw lb::ConfigurationError("--max-error-percent must be between 0 and 100, got '" + *pct + "'");
        inv.maxErrorPercent = v;
    }

    if (const auto maxErrors = optVal(call, "max-errors")) {
        const auto n = parseUInt(*maxErrors);
        if (!n) throw lb::ConfigurationError("--max-errors must be a non-negative integer, got '" + *maxErrors + "'");
        inv.maxErrors = n;
    }

    return inv;
}

std::string lb::cli::usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [options] <directory>\n"
        "\n"
        "Upload the photos of a directory to a Flickr photoset, skipping those already in it.\n"
        "\n"
        "Options:\n"
        "  -s, --setname <title>        Photoset title (default: directory name)\n"
        "  -t, --tags <tags>            Space-delimited tags added to every photo\n"
        "      --threads <n>            Parallel uploads (default: 4)\n"
        "  -p, --public                 Make uploaded photos public (default: private)\n"
        "      --max-error-percent <p>  Abort once more than p% of the uploads failed (default: 2)\n"
        "      --max-errors <n>         Abort once more than n uploads failed\n"
        "  -c, --config <file>          Configuration file\n"
        "  -v, --verbose                Debug logging\n"
        "  -h, --help                   Show this help\n",
        program);
}

lb::upload::model::RunOptions lb::cli::buildRunOptions(const Invocation& inv, const config::Config& cfg) {
    upload::model::RunOptions opts;
    opts.directory = inv.directory;
    opts.threads = inv.threads.value_or(cfg.upload.threads);
    opts.isPublic = inv.isPublic || cfg.upload.is_public;
    opts.extensions = cfg.upload.extensions;
    opts.permission = remote::permissionFromString(cfg.flickr.perms);

    opts.budget.max_error_percent = inv.maxErrorPercent.value_or(cfg.upload.max_error_percent);
    if (inv.maxErrors) opts.budget.max_errors = inv.maxErrors;
    else if (!inv.maxErrorPercent) opts.budget.max_errors = cfg.upload.max_errors;

    opts.tags = cfg.upload.tags;
    if (inv.tags)
        for (auto& t : util::splitWhitespace(*inv.tags)) opts.tags.push_back(std::move(t));

    if (inv.setName) {
        auto title = *inv.setName;
        util::trimInPlace(title);
        if (title.empty()) throw lb::ConfigurationError("Set name must not be empty");
        opts.collectionTitle = std::move(title);
    }

    return opts;
}
