#include "panxfer/api/drive_client.hpp"
#include "panxfer/api/endpoints.hpp"
#include "support/fake_transport.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using panxfer::ErrorKind;
using panxfer::api::DriveClient;
using panxfer::auth::AuthContext;
using panxfer::testing::FakeTransport;
using panxfer::testing::envelope;
using json = nlohmann::json;
namespace endpoints = panxfer::api::endpoints;

namespace {

json listed(std::int64_t id, const std::string& name, int type = 0) {
    return json{{"FileId", id}, {"FileName", name}, {"Size", id * 10}, {"Type", type}, {"Etag", "e"}, {"S3KeyFlag", "k"}};
}

std::string header_value(const panxfer::network::HttpRequest& request, const std::string& name) {
    const auto it = std::find_if(request.headers.begin(), request.headers.end(),
                                 [&](const auto& header) { return header.first == name; });
    return it == request.headers.end() ? std::string() : it->second;
}

class DriveClientTest : public ::testing::Test {
protected:
    FakeTransport transport;
    panxfer::core::ClientConfig config;
    AuthContext auth{"client-7"};
    DriveClient drive{transport, config, auth};
};

} // namespace

TEST_F(DriveClientTest, SignInStoresBearerToken) {
    transport.add_json(endpoints::kSignIn, envelope(200, json{{"token", "abc.def"}}, "success"));

    auto signed_in = drive.sign_in("user", "secret");
    ASSERT_TRUE(signed_in.is_ok());
    EXPECT_EQ(auth.current_credential(), "Bearer abc.def");

    const auto sent = transport.requests_to(endpoints::kSignIn);
    ASSERT_EQ(sent.size(), 1u);
    const auto body = json::parse(sent[0].body);
    EXPECT_EQ(body["type"], 1);
    EXPECT_EQ(body["passport"], "user");
    EXPECT_EQ(body["password"], "secret");
    EXPECT_EQ(header_value(sent[0], "loginuuid"), "client-7");
}

TEST_F(DriveClientTest, SignInRejected) {
    transport.add_json(endpoints::kSignIn, envelope(5113, nullptr, "wrong password"));

    auto signed_in = drive.sign_in("user", "bad");
    ASSERT_TRUE(signed_in.is_error());
    EXPECT_EQ(signed_in.error().kind, ErrorKind::Api);
    EXPECT_EQ(signed_in.error().code, 5113);
    EXPECT_TRUE(auth.current_credential().empty());
}

TEST_F(DriveClientTest, SignOutClearsCredential) {
    auth.set_credential("Bearer x");
    drive.sign_out();
    EXPECT_TRUE(auth.current_credential().empty());
}

TEST_F(DriveClientTest, ListingFollowsPagination) {
    transport.add_json(endpoints::kFileList, envelope(0, json{
        {"Total", 3},
        {"InfoList", json::array({listed(1, "a.txt"), listed(2, "b.txt")})},
    }));
    transport.add_json(endpoints::kFileList, envelope(0, json{
        {"Total", 3},
        {"InfoList", json::array({listed(3, "docs", 1)})},
    }));

    auto listing = drive.list_directory(0);
    ASSERT_TRUE(listing.is_ok());
    ASSERT_EQ(listing.value().size(), 3u);
    EXPECT_EQ(listing.value()[0].name, "a.txt");
    EXPECT_EQ(listing.value()[2].kind, panxfer::api::FileKind::Folder);

    const auto sent = transport.requests_to(endpoints::kFileList);
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_NE(sent[0].url.find("Page=1"), std::string::npos);
    EXPECT_NE(sent[1].url.find("Page=2"), std::string::npos);
    EXPECT_NE(sent[0].url.find("parentFileId=0"), std::string::npos);
    EXPECT_NE(sent[0].url.find("limit=100"), std::string::npos);
}

TEST_F(DriveClientTest, ListingStopsOnEmptyPage) {
    transport.add_json(endpoints::kFileList, envelope(0, json{
        {"Total", 10},
        {"InfoList", json::array({listed(1, "a.txt")})},
    }));
    transport.add_json(endpoints::kFileList, envelope(0, json{{"Total", 10}, {"InfoList", json::array()}}));

    auto listing = drive.list_directory(5);
    ASSERT_TRUE(listing.is_ok());
    EXPECT_EQ(listing.value().size(), 1u);
    EXPECT_EQ(transport.requests_to(endpoints::kFileList).size(), 2u);
}

TEST_F(DriveClientTest, ListingRejected) {
    transport.add_json(endpoints::kFileList, envelope(401, nullptr, "token expired"));

    auto listing = drive.list_directory(0);
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().kind, ErrorKind::Api);
    EXPECT_EQ(listing.error().code, 401);
}

TEST_F(DriveClientTest, ValidateSession) {
    transport.add_json(endpoints::kFileList, envelope(0, json{{"Total", 0}, {"InfoList", json::array()}}));
    transport.add_json(endpoints::kFileList, envelope(401, nullptr, "unauthorized"));

    auto valid = drive.validate_session();
    ASSERT_TRUE(valid.is_ok());
    EXPECT_TRUE(valid.value());

    auto invalid = drive.validate_session();
    ASSERT_TRUE(invalid.is_ok());
    EXPECT_FALSE(invalid.value());
}

TEST_F(DriveClientTest, CreateFolder) {
    transport.add_json(endpoints::kCreateFolder, envelope(0, json{{"FileId", 99}}));

    ASSERT_TRUE(drive.create_folder(12, "new folder").is_ok());

    const auto sent = transport.requests_to(endpoints::kCreateFolder);
    ASSERT_EQ(sent.size(), 1u);
    const auto body = json::parse(sent[0].body);
    EXPECT_EQ(body["fileName"], "new folder");
    EXPECT_EQ(body["parentFileId"], 12);
    EXPECT_EQ(body["type"], 1);
    EXPECT_EQ(body["event"], "newCreateFolder");
}

TEST_F(DriveClientTest, Trash) {
    transport.add_json(endpoints::kTrash, envelope(0));

    ASSERT_TRUE(drive.trash(31).is_ok());

    const auto sent = transport.requests_to(endpoints::kTrash);
    ASSERT_EQ(sent.size(), 1u);
    const auto body = json::parse(sent[0].body);
    EXPECT_EQ(body["fileTrashInfoList"][0]["fileId"], 31);
    EXPECT_EQ(body["operation"], true);
}

TEST_F(DriveClientTest, ShareBuildsLink) {
    transport.add_json(endpoints::kShareCreate, envelope(0, json{{"ShareKey", "Ab12-xyz"}}));

    auto link = drive.share({4, 5}, "pw12");
    ASSERT_TRUE(link.is_ok());
    EXPECT_EQ(link.value().url, "https://www.123pan.com/s/Ab12-xyz");
    EXPECT_EQ(link.value().password, "pw12");

    const auto body = json::parse(transport.requests_to(endpoints::kShareCreate)[0].body);
    EXPECT_EQ(body["fileIdList"], "4,5");
    EXPECT_EQ(body["sharePwd"], "pw12");
}

TEST_F(DriveClientTest, ShareWithoutFilesIsRejectedLocally) {
    auto link = drive.share({});
    ASSERT_TRUE(link.is_error());
    EXPECT_EQ(link.error().kind, ErrorKind::Api);
    EXPECT_TRUE(transport.requests().empty());
}
