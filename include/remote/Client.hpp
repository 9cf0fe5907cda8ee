#pragma once

#include "remote/model/Collection.hpp"
#include "remote/model/Item.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace lb::remote {

enum class Permission { Read, Write, Delete };

[[nodiscard]] std::string to_string(Permission p);
[[nodiscard]] Permission permissionFromString(const std::string& s);

struct UploadRequest {
    std::filesystem::path path;
    std::string title;
    std::vector<std::string> tags;
    bool is_public = false;
};

// bytes sent, bytes total
using ProgressFn = std::function<void(uint64_t, uint64_t)>;

// Contract of the photo-hosting service. Implementations must be safe to call from several worker
// threads at once once authenticate() has returned.
class Client {
public:
    virtual ~Client() = default;

    // Throws AuthError.
    virtual void authenticate(Permission perms) = 0;

    // Returns the remotely assigned id. Throws UploadError.
    virtual std::string upload(const UploadRequest& req, const ProgressFn& progress = {}) = 0;

    virtual std::vector<model::Collection> listCollections() = 0;

    virtual model::Collection createCollection(const std::string& title, const std::string& primaryItemId) = 0;

    virtual std::vector<model::Item> listCollectionMembers(const std::string& collectionId) = 0;

    // Throws ApiError.
    virtual void addMember(const std::string& collectionId, const std::string& itemId) = 0;
};

}
