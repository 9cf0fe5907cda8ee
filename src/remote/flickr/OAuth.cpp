#include "remote/flickr/OAuth.hpp"

#include <algorithm>
#include <chrono>

using namespace lb::util;

namespace lb::remote::flickr {

std::string signatureBaseString(const std::string& httpMethod, const std::string& url, const Params& params) {
    Params encoded;
    encoded.reserve(params.size());
    for (const auto& [k, v] : params) encoded.emplace_back(percentEncode(k), percentEncode(v));
    std::ranges::sort(encoded);

    std::string normalized;
    for (const auto& [k, v] : encoded) {
        if (!normalized.empty()) normalized += '&';
        normalized += k;
        normalized += '=';
        normalized += v;
    }

    return httpMethod + '&' + percentEncode(url) + '&' + percentEncode(normalized);
}

std::string sign(const std::string& baseString, const std::string& consumerSecret, const std::string& tokenSecret) {
    const auto key = percentEncode(consumerSecret) + '&' + percentEncode(tokenSecret);
    return base64Encode(hmacSha1Raw(key, baseString));
}

Params signParams(const std::string& httpMethod, const std::string& url, Params params,
                  const Credentials& creds, const std::string& nonce, const uint64_t timestamp) {
    params.emplace_back("oauth_consumer_key", creds.consumer_key);
    params.emplace_back("oauth_nonce", nonce);
    params.emplace_back("oauth_signature_method", "HMAC-SHA1");
    params.emplace_back("oauth_timestamp", std::to_string(timestamp));
    params.emplace_back("oauth_version", "1.0");
    if (!creds.token.empty()) params.emplace_back("oauth_token", creds.token);

    const auto signature = sign(signatureBaseString(httpMethod, url, params), creds.consumer_secret, creds.token_secret);
    params.emplace_back("oauth_signature", signature);
    return params;
}

Params signParams(const std::string& httpMethod, const std::string& url, Params params, const Credentials& creds) {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return signParams(httpMethod, url, std::move(params), creds, randomHex(16), static_cast<uint64_t>(now));
}

}
