#include "remote/flickr/TokenStore.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace lb::remote;
using namespace lb::remote::flickr;
using namespace lb::log;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace lb::remote::flickr {

void to_json(json& j, const Token& t) {
    j = {
        {"oauth_token", t.token},
        {"oauth_token_secret", t.secret},
        {"perms", to_string(t.perms)},
        {"user_nsid", t.user_nsid},
        {"username", t.username},
        {"fullname", t.fullname}
    };
}

void from_json(const json& j, Token& t) {
    j.at("oauth_token").get_to(t.token);
    j.at("oauth_token_secret").get_to(t.secret);
    t.perms = permissionFromString(j.at("perms").get<std::string>());
    t.user_nsid = j.value("user_nsid", "");
    t.username = j.value("username", "");
    t.fullname = j.value("fullname", "");
}

}

TokenStore::TokenStore(fs::path path) : path_(std::move(path)) {}

std::optional<Token> TokenStore::load() const {
    std::error_code ec;
    if (path_.empty() || !fs::exists(path_, ec)) return std::nullopt;

    std::ifstream in(path_);
    if (!in) {
        Registry::remote()->warn("[TokenStore] Cannot read token cache {}", path_.string());
        return std::nullopt;
    }

    try {
        auto token = json::parse(in).get<Token>();
        if (token.token.empty() || token.secret.empty()) return std::nullopt;
        return token;
    } catch (const std::exception& e) {
        Registry::remote()->warn("[TokenStore] Ignoring unusable token cache {}: {}", path_.string(), e.what());
        return std::nullopt;
    }
}

void TokenStore::save(const Token& token) const {
    if (path_.empty()) throw std::runtime_error("No token cache path configured");

    if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

    std::ofstream out(path_, std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot write token cache " + path_.string());

    // Owner-only before the secret goes in
    fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    out << json(token).dump(2) << '\n';
    out.close();
    if (!out) throw std::runtime_error("Failed writing token cache " + path_.string());
    Registry::remote()->debug("[TokenStore] Saved access token to {}", path_.string());
}

void TokenStore::clear() const {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) Registry::remote()->warn("[TokenStore] Failed to remove {}: {}", path_.string(), ec.message());
}
