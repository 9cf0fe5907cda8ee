#include "cli/Args.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

using namespace lb::cli;

namespace {

const OptionSpec* findLong(const std::vector<OptionSpec>& specs, const std::string& key) {
    const auto it = std::ranges::find_if(specs, [&](const OptionSpec& s) { return s.key == key; });
    return it == specs.end() ? nullptr : &*it;
}

const OptionSpec* findShort(const std::vector<OptionSpec>& specs, const char c) {
    const auto it = std::ranges::find_if(specs, [&](const OptionSpec& s) { return s.shortName != '\0' && s.shortName == c; });
    return it == specs.end() ? nullptr : &*it;
}

}

void lb::cli::setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

CommandCall lb::cli::parseArgs(const std::string_view name, const std::vector<std::string>& args,
                               const std::vector<OptionSpec>& specs) {
    CommandCall call;
    call.name = std::string(name);

    bool stopFlags = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& tok = args[i];

        if (stopFlags || tok.size() < 2 || tok[0] != '-') {
            call.positionals.push_back(tok);
            continue;
        }

        if (tok == "--") {
            stopFlags = true;
            continue;
        }

        if (tok.starts_with("--")) {
            auto key = tok.substr(2);
            std::optional<std::string> inlineVal;
            if (const auto eq = key.find('='); eq != std::string::npos) {
                inlineVal = key.substr(eq + 1);
                key.resize(eq);
            }

            const auto* spec = findLong(specs, key);
            if (!spec) throw lb::ConfigurationError("Unknown option: --" + key);

            if (!spec->takesValue) {
                if (inlineVal) throw lb::ConfigurationError("Option --" + key + " takes no value");
                setOpt(call, spec->key, std::nullopt);
            } else if (inlineVal) {
                setOpt(call, spec->key, inlineVal);
            } else {
                if (i + 1 >= args.size()) throw lb::ConfigurationError("Option --" + key + " needs a value");
                setOpt(call, spec->key, args[++i]);
            }
            continue;
        }

        // Short options, possibly grouped; a value-taking one consumes the rest or the next token
        for (size_t j = 1; j < tok.size(); ++j) {
            const auto* spec = findShort(specs, tok[j]);
            if (!spec) throw lb::ConfigurationError(std::string("Unknown option: -") + tok[j]);

            if (!spec->takesValue) {
                setOpt(call, spec->key, std::nullopt);
                continue;
            }

            if (j + 1 < tok.size()) {
                setOpt(call, spec->key, tok.substr(j + 1));
            } else {
                if (i + 1 >= args.size()) throw lb::ConfigurationError(std::string("Option -") + tok[j] + " needs a value");
                setOpt(call, spec->key, args[++i]);
            }
            break;
        }
    }

    return call;
}

std::optional<std::string> lb::cli::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

bool lb::cli::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

std::optional<unsigned int> lb::cli::parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}

std::optional<double> lb::cli::parseDouble(const std::string& sv) {
    if (sv.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(sv.c_str(), &end);
    if (errno != 0 || end != sv.c_str() + sv.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}
