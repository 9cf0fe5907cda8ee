#include <gtest/gtest.h>
#include "remote/flickr/response.hpp"
#include "util/errors.hpp"

using namespace lb::remote::flickr;

TEST(FlickrResponseTest, FailureCarriesCodeAndMessage) {
    try {
        checkResponse(R"(<?xml version="1.0" encoding="utf-8" ?>
<rsp stat="fail"><err code="98" msg="Invalid auth token" /></rsp>)");
        FAIL() << "expected ApiError";
    } catch (const lb::ApiError& e) {
        EXPECT_EQ(e.code, 98);
        EXPECT_STREQ(e.what(), "Invalid auth token");
    }
}

TEST(FlickrResponseTest, GarbageIsParseFailure) {
    try {
        checkResponse("<html><body>502 Bad Gateway</body></html>");
        FAIL() << "expected ApiError";
    } catch (const lb::ApiError& e) {
        EXPECT_EQ(e.code, -1);
    }

    EXPECT_THROW(checkResponse("not xml at all <"), lb::ApiError);
}

TEST(FlickrResponseTest, PhotosetListing) {
    const auto page = parsePhotosets(R"(<rsp stat="ok">
<photosets page="1" pages="2" perpage="500" total="501">
  <photoset id="72157" primary="1" photos="3"><title>Holidays</title><description>Sea</description></photoset>
  <photoset id="72158" primary="2" photos="1"><title>Work</title><description /></photoset>
</photosets></rsp>)");

    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.items[0].id, "72157");
    EXPECT_EQ(page.items[0].title, "Holidays");
    EXPECT_EQ(page.items[0].description, "Sea");
    EXPECT_EQ(page.items[1].title, "Work");
    EXPECT_FALSE(page.items[0].members_loaded);
    EXPECT_EQ(page.page, 1u);
    EXPECT_EQ(page.pages, 2u);
    EXPECT_FALSE(page.last());
}

TEST(FlickrResponseTest, EmptyAccountHasOnePage) {
    const auto page = parsePhotosets(R"(<rsp stat="ok"><photosets page="1" pages="0" total="0" /></rsp>)");
    EXPECT_TRUE(page.items.empty());
    EXPECT_TRUE(page.last());
}

TEST(FlickrResponseTest, PhotosetMembers) {
    const auto page = parsePhotosetPhotos(R"(<rsp stat="ok">
<photoset id="72157" primary="1" owner="1@N0" page="2" per_page="500" pages="2" total="502">
  <photo id="11" secret="a" server="1" farm="1" title="a.jpg" isprimary="1" />
  <photo id="12" secret="b" server="1" farm="1" title="b.PNG" isprimary="0" />
</photoset></rsp>)");

    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.items[1].id, "12");
    EXPECT_EQ(page.items[1].title, "b.PNG");
    EXPECT_EQ(page.items[1].collection_id, "72157");
    EXPECT_TRUE(page.last());
}

TEST(FlickrResponseTest, UploadAnswer) {
    EXPECT_EQ(parseUploadedPhotoId("<rsp stat=\"ok\">\n<photoid>1234</photoid>\n</rsp>"), "1234");
    EXPECT_THROW(parseUploadedPhotoId("<rsp stat=\"ok\"></rsp>"), lb::ApiError);
}

TEST(FlickrResponseTest, CreatedPhotoset) {
    EXPECT_EQ(parseCreatedPhotosetId(
                  R"(<rsp stat="ok"><photoset id="1234" url="http://www.flickr.com/photos/bees/sets/1234/" /></rsp>)"),
              "1234");
}

TEST(FlickrResponseTest, CheckToken) {
    const auto check = parseCheckToken(R"(<rsp stat="ok"><oauth>
<token>72157627611980735-09e87c3024f733da</token><perms>write</perms>
<user nsid="1121451801@N07" username="jamalf" fullname="Jamal F" />
</oauth></rsp>)");
    EXPECT_EQ(check.perms, "write");
    EXPECT_EQ(check.user_nsid, "1121451801@N07");
    EXPECT_EQ(check.username, "jamalf");
}
