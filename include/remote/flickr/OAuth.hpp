#pragma once

#include "util/oauthHelpers.hpp"

#include <cstdint>
#include <string>

namespace lb::remote::flickr {

struct Credentials {
    std::string consumer_key;
    std::string consumer_secret;
    std::string token;           // empty before the request-token step
    std::string token_secret;
};

// METHOD&enc(url)&enc(k1=v1&k2=v2...) with pairs sorted by encoded key, then encoded value.
std::string signatureBaseString(const std::string& httpMethod, const std::string& url, const util::Params& params);

// HMAC-SHA1 keyed with enc(consumer_secret)&enc(token_secret), base64.
std::string sign(const std::string& baseString, const std::string& consumerSecret, const std::string& tokenSecret);

// Returns params plus the oauth_* protocol parameters and oauth_signature.
util::Params signParams(const std::string& httpMethod, const std::string& url, util::Params params,
                        const Credentials& creds, const std::string& nonce, uint64_t timestamp);

// Fresh nonce, current time.
util::Params signParams(const std::string& httpMethod, const std::string& url, util::Params params,
                        const Credentials& creds);

}
