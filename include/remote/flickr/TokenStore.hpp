#pragma once

#include "remote/Client.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace lb::remote::flickr {

struct Token {
    std::string token;
    std::string secret;
    Permission perms = Permission::Read;
    std::string user_nsid;
    std::string username;
    std::string fullname;

    // read < write < delete
    [[nodiscard]] bool covers(const Permission wanted) const {
        return static_cast<int>(perms) >= static_cast<int>(wanted);
    }
};

// Access token persisted as JSON, readable by the owner only.
class TokenStore {
public:
    explicit TokenStore(std::filesystem::path path);

    // nullopt when the file is missing or unreadable.
    [[nodiscard]] std::optional<Token> load() const;

    // Throws std::runtime_error when the file cannot be written.
    void save(const Token& token) const;

    void clear() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
