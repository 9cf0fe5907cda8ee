#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lb::util {

void trimInPlace(std::string& s);

[[nodiscard]] std::string toLower(std::string_view s);

// Splits on runs of whitespace, dropping empty tokens.
[[nodiscard]] std::vector<std::string> splitWhitespace(std::string_view s);

[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view sep);

}
