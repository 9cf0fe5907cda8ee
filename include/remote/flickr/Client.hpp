#pragma once

#include "config/Config.hpp"
#include "remote/Client.hpp"
#include "remote/flickr/OAuth.hpp"
#include "remote/flickr/TokenStore.hpp"
#include "remote/flickr/response.hpp"
#include "util/curlWrappers.hpp"
#include "util/oauthHelpers.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace lb::remote::flickr {

// Shows the authorization URL and returns the verifier code the user typed in.
using VerifierPrompt = std::function<std::string(const std::string& authorizeUrl)>;

// remote::Client over the Flickr REST API, signed with OAuth 1.0a. Each request gets its own curl
// handle; after authenticate() the credentials are immutable, so workers may call concurrently.
class Client final : public remote::Client {
public:
    static constexpr unsigned int PER_PAGE = 500;
    static constexpr int PHOTO_ALREADY_IN_SET = 3;

    Client(config::FlickrConfig cfg, VerifierPrompt prompt);

    void authenticate(Permission perms) override;
    std::string upload(const UploadRequest& req, const ProgressFn& progress = {}) override;
    std::vector<model::Collection> listCollections() override;
    model::Collection createCollection(const std::string& title, const std::string& primaryItemId) override;
    std::vector<model::Item> listCollectionMembers(const std::string& collectionId) override;
    void addMember(const std::string& collectionId, const std::string& itemId) override;

    [[nodiscard]] const std::optional<Token>& token() const { return token_; }

private:
    config::FlickrConfig cfg_;
    VerifierPrompt prompt_;
    TokenStore store_;
    std::optional<Token> token_;

    [[nodiscard]] Credentials credentials() const;

    // Signed REST call, GET for reads and form POST for writes. Returns the raw body.
    std::string call(const std::string& method, util::Params params, bool post = false) const;

    util::HttpResponse request(const std::string& httpMethod, const std::string& url,
                               const util::Params& signedParams) const;

    TokenCheck checkToken() const;
    void authorizeInteractively(Permission perms);
    std::map<std::string, std::string> oauthStep(const std::string& step, util::Params params,
                                                 const Credentials& creds) const;
};

}
