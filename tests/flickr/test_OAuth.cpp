#include <gtest/gtest.h>
#include "remote/flickr/OAuth.hpp"
#include "util/oauthHelpers.hpp"

#include <algorithm>

using namespace lb::remote::flickr;
using namespace lb::util;

namespace {

std::string valueOf(const Params& params, const std::string& key) {
    const auto it = std::ranges::find_if(params, [&](const auto& kv) { return kv.first == key; });
    return it == params.end() ? std::string{} : it->second;
}

}

TEST(PercentEncodeTest, Rfc3986Vectors) {
    EXPECT_EQ(percentEncode("Ladies + Gentlemen"), "Ladies%20%2B%20Gentlemen");
    EXPECT_EQ(percentEncode("Dogs, Cats & Mice"), "Dogs%2C%20Cats%20%26%20Mice");
    EXPECT_EQ(percentEncode("An encoded string!"), "An%20encoded%20string%21");
    EXPECT_EQ(percentEncode("-._~"), "-._~");
    EXPECT_EQ(percentEncode("\xE2\x98\x83"), "%E2%98%83");
}

TEST(PercentEncodeTest, DecodeReversesEncodingAndPlus) {
    EXPECT_EQ(percentDecode("Dogs%2C%20Cats%20%26%20Mice"), "Dogs, Cats & Mice");
    EXPECT_EQ(percentDecode("a+b"), "a b");
    EXPECT_EQ(percentDecode("100%"), "100%");
}

TEST(FormEncodingTest, ParsesTokenResponse) {
    const auto fields = parseFormUrlEncoded(
        "fullname=Jamal%20Fanaian&oauth_token=72157626318069415-087bfc7b5816092c"
        "&oauth_token_secret=a202d1f853ec69de&user_nsid=21207597%40N07&username=jamalfanaian");
    EXPECT_EQ(fields.at("fullname"), "Jamal Fanaian");
    EXPECT_EQ(fields.at("oauth_token"), "72157626318069415-087bfc7b5816092c");
    EXPECT_EQ(fields.at("oauth_token_secret"), "a202d1f853ec69de");
    EXPECT_EQ(fields.at("user_nsid"), "21207597@N07");
}

TEST(FormEncodingTest, KeepsOrderAndEncodes) {
    EXPECT_EQ(formUrlEncode({{"b", "x y"}, {"a", "&"}}), "b=x%20y&a=%26");
}

TEST(OAuthTest, SignatureBaseStringSortsEncodedParams) {
    const auto base = signatureBaseString("GET", "https://api.flickr.com/services/rest/",
                                          {{"per_page", "500"}, {"method", "flickr.photosets.getList"}, {"page", "1"}});
    EXPECT_EQ(base, "GET&https%3A%2F%2Fapi.flickr.com%2Fservices%2Frest%2F"
                    "&method%3Dflickr.photosets.getList%26page%3D1%26per_page%3D500");
}

TEST(OAuthTest, ReferenceSignature) {
    const Credentials creds{"dpf43f3p2l4k3l03", "kd94hf93k423kf44", "nnch734d00sl2jdk", "pfkkdhi9sl3r4s00"};
    const auto params = signParams("GET", "http://photos.example.net/photos",
                                   {{"file", "vacation.jpg"}, {"size", "original"}}, creds,
                                   "kllo9940pd9333jh", 1191242096);

    EXPECT_EQ(valueOf(params, "oauth_signature"), "tR3+Ty81lMeYAr/Fid0kMTYa/WM=");
    EXPECT_EQ(valueOf(params, "oauth_signature_method"), "HMAC-SHA1");
    EXPECT_EQ(valueOf(params, "oauth_version"), "1.0");
    EXPECT_EQ(valueOf(params, "oauth_token"), "nnch734d00sl2jdk");
}

TEST(OAuthTest, SignsRestCallWithReservedCharacters) {
    const Credentials creds{"key", "secret", "tok", "tsecret"};
    const auto params = signParams("GET", "https://api.flickr.com/services/rest/",
                                   {{"method", "flickr.photosets.getList"}, {"per_page", "500"}, {"page", "1"},
                                    {"title", "Summer & Sea"}},
                                   creds, "abc123", 1700000000);

    EXPECT_EQ(valueOf(params, "oauth_signature"), "dOUdfHMcHxxR3sKMwamZewAXti0=");
}

TEST(OAuthTest, NoTokenBeforeRequestTokenStep) {
    const Credentials creds{"key", "secret", {}, {}};
    const auto params = signParams("GET", "https://www.flickr.com/services/oauth/request_token",
                                   {{"oauth_callback", "oob"}}, creds);
    EXPECT_EQ(std::ranges::count_if(params, [](const auto& kv) { return kv.first == "oauth_token"; }), 0);
    EXPECT_EQ(valueOf(params, "oauth_nonce").size(), 32u);
    EXPECT_FALSE(valueOf(params, "oauth_signature").empty());
}

TEST(OAuthTest, NoncesDiffer) {
    EXPECT_NE(randomHex(), randomHex());
    EXPECT_EQ(randomHex(4).size(), 8u);
}

TEST(OAuthTest, Base64OfHmac) {
    EXPECT_EQ(base64Encode("hello"), "aGVsbG8=");
    EXPECT_EQ(hmacSha1Raw("key", "data").size(), 20u);
}
