#include "remote/flickr/Client.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

using namespace lb::util;
using namespace lb::log;

namespace lb::remote::flickr {

namespace {

struct ProgressState {
    const ProgressFn* fn;
};

int xferInfo(void* userdata, curl_off_t, curl_off_t, const curl_off_t ultotal, const curl_off_t ulnow) {
    const auto* state = static_cast<ProgressState*>(userdata);
    if (state->fn && *state->fn && ultotal > 0)
        (*state->fn)(static_cast<uint64_t>(ulnow), static_cast<uint64_t>(ultotal));
    return 0;
}

}

Client::Client(config::FlickrConfig cfg, VerifierPrompt prompt)
    : cfg_(std::move(cfg)), prompt_(std::move(prompt)), store_(cfg_.token_cache) {}

Credentials Client::credentials() const {
    Credentials c{cfg_.api_key, cfg_.api_secret, {}, {}};
    if (token_) {
        c.token = token_->token;
        c.token_secret = token_->secret;
    }
    return c;
}

void Client::authenticate(const Permission perms) {
    if (cfg_.api_key.empty() || cfg_.api_secret.empty())
        throw lb::AuthError("Flickr API key and secret must be configured (flickr.api_key / flickr.api_secret)");

    if (auto cached = store_.load(); cached && cached->covers(perms)) {
        token_ = std::move(cached);
        try {
            const auto check = checkToken();
            token_->perms = permissionFromString(check.perms);
            if (token_->covers(perms)) {
                Registry::remote()->info("[FlickrClient] Authenticated as {} ({})", token_->username, token_->user_nsid);
                return;
            }
            Registry::remote()->warn("[FlickrClient] Cached token only grants {} permission", check.perms);
        } catch (const lb::ApiError& e) {
            if (e.code == -1) {
                token_.reset();
                throw lb::AuthError(std::string("Could not verify cached token: ") + e.what());
            }
            Registry::remote()->warn("[FlickrClient] Cached token rejected: {}", e.what());
        } catch (const lb::ConfigurationError& e) {
            Registry::remote()->warn("[FlickrClient] Cached token reports unknown permission: {}", e.what());
        }
        token_.reset();
    }

    try {
        authorizeInteractively(perms);
    } catch (const lb::AuthError&) {
        token_.reset();
        throw;
    } catch (const std::exception& e) {
        token_.reset();
        throw lb::AuthError(std::string("Flickr authorization failed: ") + e.what());
    }
}

void Client::authorizeInteractively(const Permission perms) {
    if (!prompt_) throw lb::AuthError("No cached token and no way to ask for a verifier code");

    const Credentials consumerOnly{cfg_.api_key, cfg_.api_secret, {}, {}};
    auto requestToken = oauthStep("request_token", {{"oauth_callback", "oob"}}, consumerOnly);
    if (requestToken["oauth_token"].empty() || requestToken["oauth_token_secret"].empty())
        throw lb::AuthError("Flickr returned no request token");

    const auto url = cfg_.oauth_endpoint + "authorize?oauth_token=" + percentEncode(requestToken["oauth_token"]) +
                     "&perms=" + to_string(perms);

    auto verifier = prompt_(url);
    trimInPlace(verifier);
    if (verifier.empty()) throw lb::AuthError("No verifier code entered");

    const Credentials requestCreds{cfg_.api_key, cfg_.api_secret, requestToken["oauth_token"], requestToken["oauth_token_secret"]};
    auto access = oauthStep("access_token", {{"oauth_verifier", verifier}}, requestCreds);
    if (access["oauth_token"].empty() || access["oauth_token_secret"].empty())
        throw lb::AuthError("Flickr returned no access token");

    Token t;
    t.token = access["oauth_token"];
    t.secret = access["oauth_token_secret"];
    t.perms = perms;
    t.user_nsid = access["user_nsid"];
    t.username = access["username"];
    t.fullname = access["fullname"];
    token_ = t;

    try {
        store_.save(t);
    } catch (const std::exception& e) {
        Registry::remote()->warn("[FlickrClient] Could not cache access token: {}", e.what());
    }

    Registry::remote()->info("[FlickrClient] Authorized as {} ({})", t.username, t.user_nsid);
}

std::map<std::string, std::string> Client::oauthStep(const std::string& step, Params params, const Credentials& creds) const {
    const auto url = cfg_.oauth_endpoint + step;
    const auto res = request("GET", url, signParams("GET", url, std::move(params), creds));
    auto fields = parseFormUrlEncoded(res.body);

    if (const auto it = fields.find("oauth_problem"); it != fields.end())
        throw lb::AuthError("Flickr " + step + " failed: " + it->second);
    if (!res.ok()) throw lb::AuthError("Flickr " + step + " failed: " + res.error());
    return fields;
}

TokenCheck Client::checkToken() const {
    return parseCheckToken(call("flickr.auth.oauth.checkToken", {}));
}

HttpResponse Client::request(const std::string& httpMethod, const std::string& url, const Params& signedParams) const {
    const auto timeout = static_cast<long>(cfg_.timeout_seconds);
    const auto encoded = formUrlEncode(signedParams);

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT, timeout);
        if (httpMethod == "POST") {
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_COPYPOSTFIELDS, encoded.c_str());
        } else {
            const auto full = url + "?" + encoded;
            curl_easy_setopt(h, CURLOPT_URL, full.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        }
    });
}

std::string Client::call(const std::string& method, Params params, const bool post) const {
    params.emplace_back("method", method);
    const auto httpMethod = post ? std::string("POST") : std::string("GET");

    Registry::remote()->trace("[FlickrClient] {} {}", httpMethod, method);
    const auto res = request(httpMethod, cfg_.rest_endpoint,
                             signParams(httpMethod, cfg_.rest_endpoint, std::move(params), credentials()));

    // Flickr reports API failures with HTTP 200 and <rsp stat="fail">
    if (res.curl != CURLE_OK || (res.http / 100 != 2 && res.body.empty()))
        throw lb::ApiError(-1, method + ": " + res.error());

    checkResponse(res.body);
    return res.body;
}

std::string Client::upload(const UploadRequest& req, const ProgressFn& progress) {
    if (!token_) throw lb::UploadError("Not authenticated");

    Params fields = {
        {"title", req.title},
        {"tags", join(req.tags, " ")},
        {"is_public", req.is_public ? "1" : "0"},
        {"is_friend", "0"},
        {"is_family", "0"},
    };
    const auto signedFields = signParams("POST", cfg_.upload_endpoint, std::move(fields), credentials());

    try {
        ensureCurlGlobalInit();

        CurlEasy h;
        MimeForm form(h);
        for (const auto& [k, v] : signedFields) form.addField(k, v);
        form.addFile("photo", req.path.string());

        std::string body, hdr;
        ProgressState state{&progress};

        curl_easy_setopt(h, CURLOPT_URL, cfg_.upload_endpoint.c_str());
        curl_easy_setopt(h, CURLOPT_MIMEPOST, form.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdr);
        if (progress) {
            curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferInfo);
            curl_easy_setopt(h, CURLOPT_XFERINFODATA, &state);
        }

        HttpResponse res;
        res.curl = curl_easy_perform(h);
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &res.http);
        res.body.swap(body);

        if (res.curl != CURLE_OK) throw lb::UploadError(req.path.string() + ": " + res.error());
        return parseUploadedPhotoId(res.body);
    } catch (const lb::UploadError&) {
        throw;
    } catch (const lb::ApiError& e) {
        throw lb::UploadError(req.path.string() + ": Flickr error " + std::to_string(e.code) + ": " + e.what());
    } catch (const std::exception& e) {
        throw lb::UploadError(req.path.string() + ": " + e.what());
    }
}

std::vector<model::Collection> Client::listCollections() {
    std::vector<model::Collection> all;
    for (unsigned int page = 1;; ++page) {
        auto p = parsePhotosets(call("flickr.photosets.getList",
                                     {{"per_page", std::to_string(PER_PAGE)}, {"page", std::to_string(page)}}));
        for (auto& c : p.items) all.push_back(std::move(c));
        if (p.last() || p.items.empty()) break;
    }
    Registry::remote()->debug("[FlickrClient] {} photosets", all.size());
    return all;
}

model::Collection Client::createCollection(const std::string& title, const std::string& primaryItemId) {
    const auto id = parseCreatedPhotosetId(
        call("flickr.photosets.create", {{"title", title}, {"primary_photo_id", primaryItemId}}, true));

    model::Collection c;
    c.id = id;
    c.title = title;
    return c;
}

std::vector<model::Item> Client::listCollectionMembers(const std::string& collectionId) {
    std::vector<model::Item> all;
    for (unsigned int page = 1;; ++page) {
        auto p = parsePhotosetPhotos(call("flickr.photosets.getPhotos",
                                          {{"photoset_id", collectionId},
                                           {"per_page", std::to_string(PER_PAGE)},
                                           {"page", std::to_string(page)}}));
        for (auto& i : p.items) all.push_back(std::move(i));
        if (p.last() || p.items.empty()) break;
    }
    return all;
}

void Client::addMember(const std::string& collectionId, const std::string& itemId) {
    try {
        call("flickr.photosets.addPhoto", {{"photoset_id", collectionId}, {"photo_id", itemId}}, true);
    } catch (const lb::ApiError& e) {
        if (e.code != PHOTO_ALREADY_IN_SET) throw;
        Registry::remote()->debug("[FlickrClient] Photo {} already in photoset {}", itemId, collectionId);
    }
}

}
