#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lb::util {

using Params = std::vector<std::pair<std::string, std::string>>;

// RFC 3986: everything except ALPHA / DIGIT / "-" / "." / "_" / "~" is %XX encoded (upper-case hex).
std::string percentEncode(std::string_view in);
std::string percentDecode(std::string_view in);

std::string base64Encode(const std::string& raw);
std::string hmacSha1Raw(const std::string& key, const std::string& data);

// Random lowercase hex, 2 * bytes characters.
std::string randomHex(size_t bytes = 16);

// key=value&key=value with both sides percent-encoded, in the given order.
std::string formUrlEncode(const Params& params);

// Parses an application/x-www-form-urlencoded body (OAuth token endpoints answer in this format).
std::map<std::string, std::string> parseFormUrlEncoded(std::string_view body);

}
