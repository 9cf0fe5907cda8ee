#pragma once

#include "remote/model/Collection.hpp"
#include "remote/model/Item.hpp"

#include <string>
#include <vector>

namespace lb::remote::flickr {

template <typename T>
struct Page {
    std::vector<T> items;
    unsigned int page = 1;
    unsigned int pages = 1;

    [[nodiscard]] bool last() const { return page >= pages; }
};

struct TokenCheck {
    std::string perms;
    std::string user_nsid;
    std::string username;
    std::string fullname;
};

// All parsers throw ApiError(code, msg) for <rsp stat="fail"> and ApiError(-1, ...) for bodies that
// are not a well-formed <rsp stat="ok"> document.
void checkResponse(const std::string& body);

Page<model::Collection> parsePhotosets(const std::string& body);
Page<model::Item> parsePhotosetPhotos(const std::string& body);
std::string parseUploadedPhotoId(const std::string& body);
std::string parseCreatedPhotosetId(const std::string& body);
TokenCheck parseCheckToken(const std::string& body);

}
