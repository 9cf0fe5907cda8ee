#include "remote/flickr/response.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

#include <pugixml.hpp>

using namespace lb::remote::model;

namespace lb::remote::flickr {

namespace {

pugi::xml_node loadRsp(pugi::xml_document& doc, const std::string& body) {
    const pugi::xml_parse_result result = doc.load_string(body.c_str());
    if (!result) throw ApiError(-1, std::string("Malformed response: ") + result.description());

    const pugi::xml_node rsp = doc.child("rsp");
    if (!rsp) throw ApiError(-1, "Response has no <rsp> element");

    const std::string stat = rsp.attribute("stat").as_string();
    if (stat == "ok") return rsp;

    if (stat == "fail") {
        const auto err = rsp.child("err");
        throw ApiError(err.attribute("code").as_int(-1), err.attribute("msg").as_string("Unknown error"));
    }

    throw ApiError(-1, "Unexpected response status '" + stat + "'");
}

template <typename T>
void readPaging(const pugi::xml_node& node, Page<T>& page) {
    page.page = node.attribute("page").as_uint(1);
    page.pages = node.attribute("pages").as_uint(1);
    if (page.pages == 0) page.pages = 1;
}

std::string requiredText(const pugi::xml_node& node, const char* what) {
    std::string text = node.text().as_string();
    util::trimInPlace(text);
    if (text.empty()) throw ApiError(-1, std::string("Response is missing ") + what);
    return text;
}

}

void checkResponse(const std::string& body) {
    pugi::xml_document doc;
    loadRsp(doc, body);
}

Page<Collection> parsePhotosets(const std::string& body) {
    pugi::xml_document doc;
    const auto sets = loadRsp(doc, body).child("photosets");
    if (!sets) throw ApiError(-1, "Response is missing <photosets>");

    Page<Collection> page;
    readPaging(sets, page);

    for (const pugi::xml_node set : sets.children("photoset")) {
        Collection c;
        c.id = set.attribute("id").as_string();
        c.title = set.child("title").text().as_string();
        c.description = set.child("description").text().as_string();
        if (c.id.empty()) throw ApiError(-1, "Photoset without id in listing");
        page.items.push_back(std::move(c));
    }

    return page;
}

Page<Item> parsePhotosetPhotos(const std::string& body) {
    pugi::xml_document doc;
    const auto set = loadRsp(doc, body).child("photoset");
    if (!set) throw ApiError(-1, "Response is missing <photoset>");

    Page<Item> page;
    readPaging(set, page);

    const std::string setId = set.attribute("id").as_string();
    for (const pugi::xml_node photo : set.children("photo")) {
        Item item;
        item.id = photo.attribute("id").as_string();
        item.title = photo.attribute("title").as_string();
        if (!setId.empty()) item.collection_id = setId;
        if (item.id.empty()) throw ApiError(-1, "Photo without id in photoset listing");
        page.items.push_back(std::move(item));
    }

    return page;
}

std::string parseUploadedPhotoId(const std::string& body) {
    pugi::xml_document doc;
    return requiredText(loadRsp(doc, body).child("photoid"), "<photoid>");
}

std::string parseCreatedPhotosetId(const std::string& body) {
    pugi::xml_document doc;
    const std::string id = loadRsp(doc, body).child("photoset").attribute("id").as_string();
    if (id.empty()) throw ApiError(-1, "Response is missing the new photoset id");
    return id;
}

TokenCheck parseCheckToken(const std::string& body) {
    pugi::xml_document doc;
    const auto oauth = loadRsp(doc, body).child("oauth");
    if (!oauth) throw ApiError(-1, "Response is missing <oauth>");

    TokenCheck check;
    check.perms = requiredText(oauth.child("perms"), "<perms>");
    const auto user = oauth.child("user");
    check.user_nsid = user.attribute("nsid").as_string();
    check.username = user.attribute("username").as_string();
    check.fullname = user.attribute("fullname").as_string();
    return check;
}

}
