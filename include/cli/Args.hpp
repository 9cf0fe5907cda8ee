#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lb::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct OptionSpec {
    std::string key;        // long name without dashes, used as the option key
    char shortName = '\0';
    bool takesValue = false;
};

// Parses argv-style tokens against a fixed option table. Accepts --key value, --key=value, -k value
// and grouped short flags (-pv). "--" ends option parsing. Last occurrence wins.
// Throws ConfigurationError for unknown options and missing values.
CommandCall parseArgs(std::string_view name, const std::vector<std::string>& args, const std::vector<OptionSpec>& specs);

void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& sv);
std::optional<double> parseDouble(const std::string& sv);

}
