#include "panxfer/api/service_client.hpp"
#include "support/fake_transport.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using panxfer::ErrorKind;
using panxfer::api::ServiceClient;
using panxfer::testing::FakeTransport;
using panxfer::testing::envelope;
using json = nlohmann::json;

namespace {

std::string header_value(const panxfer::network::HttpRequest& request, const std::string& name) {
    const auto it = std::find_if(request.headers.begin(), request.headers.end(),
                                 [&](const auto& header) { return header.first == name; });
    return it == request.headers.end() ? std::string("<absent>") : it->second;
}

} // namespace

TEST(ServiceClient, AppliesFullHeaderSet) {
    FakeTransport transport;
    panxfer::core::ClientConfig config;
    ServiceClient client(transport, config, {"Bearer tok", "client-42"});

    const auto request = client.make_request(panxfer::network::HttpMethod::POST, "/b/api/file/upload_request");
    EXPECT_EQ(request.url, "https://www.123pan.com/b/api/file/upload_request");
    EXPECT_EQ(header_value(request, "authorization"), "Bearer tok");
    EXPECT_EQ(header_value(request, "platform"), "android");
    EXPECT_EQ(header_value(request, "app-version"), "61");
    EXPECT_EQ(header_value(request, "x-app-version"), "2.4.0");
    EXPECT_EQ(header_value(request, "x-channel"), "1004");
    EXPECT_EQ(header_value(request, "devicetype"), "M2101K9C");
    EXPECT_EQ(header_value(request, "devicename"), "Xiaomi");
    EXPECT_EQ(header_value(request, "osversion"), "Android_7.1.2");
    EXPECT_EQ(header_value(request, "loginuuid"), "client-42");
    EXPECT_EQ(header_value(request, "content-type"), "application/json");
}

TEST(ServiceClient, PostJsonDecodesEnvelope) {
    FakeTransport transport;
    transport.add_json("/b/api/demo", envelope(0, json{{"answer", 42}}));
    panxfer::core::ClientConfig config;
    ServiceClient client(transport, config, {"Bearer tok", "c"});

    auto reply = client.post_json("/b/api/demo", json{{"question", "?"}});
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(reply.value().code, 0);
    EXPECT_EQ(reply.value().http_status, 200);
    EXPECT_EQ(reply.value().data["answer"], 42);

    const auto sent = transport.requests();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].method, panxfer::network::HttpMethod::POST);
    EXPECT_EQ(json::parse(sent[0].body)["question"], "?");
}

TEST(ServiceClient, GetJsonEncodesQuery) {
    FakeTransport transport;
    transport.add_json("/b/api/list", envelope(0));
    panxfer::core::ClientConfig config;
    ServiceClient client(transport, config, {"", "c"});

    auto reply = client.get_json("/b/api/list", {{"parentFileId", "0"}, {"SearchData", "a b"}});
    ASSERT_TRUE(reply.is_ok());
    EXPECT_FALSE(reply.value().has_data());

    const auto sent = transport.requests();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].url, "https://www.123pan.com/b/api/list?parentFileId=0&SearchData=a%20b");
}

TEST(ServiceClient, NonJsonSuccessIsProtocolError) {
    auto decoded = ServiceClient::decode(FakeTransport::make_response(200, "<html>maintenance</html>"));
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().kind, ErrorKind::Protocol);
}

TEST(ServiceClient, NonJsonFailureIsApiError) {
    auto decoded = ServiceClient::decode(FakeTransport::make_response(502, "Bad Gateway"));
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().kind, ErrorKind::Api);
    EXPECT_EQ(decoded.error().code, 502);
}

TEST(ServiceClient, EnvelopeWithoutCodeIsProtocolError) {
    auto decoded = ServiceClient::decode(FakeTransport::make_response(200, R"({"data": {}})"));
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().kind, ErrorKind::Protocol);
}

TEST(ServiceClient, TransportFailurePropagates) {
    FakeTransport transport;
    transport.add_failure("/b/api/demo", panxfer::network_error("could not resolve host"));
    panxfer::core::ClientConfig config;
    ServiceClient client(transport, config, {"", "c"});

    auto reply = client.post_json("/b/api/demo", json::object());
    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.error().kind, ErrorKind::Network);
}

TEST(ServiceClient, UrlEncode) {
    EXPECT_EQ(panxfer::api::url_encode("abc-_.~"), "abc-_.~");
    EXPECT_EQ(panxfer::api::url_encode("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(panxfer::api::url_encode(""), "");
}
