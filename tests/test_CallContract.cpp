#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <dockhand/api.hpp>
#include <dockhand/errors.hpp>

#include "mock.hpp"

using namespace dockhand;
using namespace dockhand::test;

using namespace ::testing;

namespace {

std::shared_ptr<api_t>
make_api(const std::shared_ptr<transport_mock>& transport, const config_t& config = config_t()) {
    return std::make_shared<api_t>(transport, null_logger(), config);
}

}  // namespace

TEST(api_t, ReturnsBodyOnSuccess) {
    auto transport = std::make_shared<transport_mock>();
    EXPECT_CALL(*transport, send(StartsWith("GET /info HTTP/1.1\r\n")))
            .WillOnce(Return(reply("{\"Containers\":3}")));

    auto body = make_api(transport)->call("/info", "GET");

    ASSERT_TRUE(body);
    EXPECT_EQ("{\"Containers\":3}", body.value());
}

TEST(api_t, NoResponse) {
    auto transport = std::make_shared<transport_mock>();
    EXPECT_CALL(*transport, send(_))
            .WillOnce(Return(raw_t()));

    auto body = make_api(transport)->call("/info", "GET");

    ASSERT_FALSE(body);
    EXPECT_EQ(error::make_error_code(error::no_response), body.error());
}

TEST(api_t, MalformedResponse) {
    auto transport = std::make_shared<transport_mock>();
    EXPECT_CALL(*transport, send(_))
            .WillOnce(Return(raw_t("this is not http")));

    auto body = make_api(transport)->call("/info", "GET");

    ASSERT_FALSE(body);
    EXPECT_EQ(error::make_error_code(error::malformed_response), body.error());
}

TEST(api_t, EmptyResponseIsMalformedNotMissing) {
    auto transport = std::make_shared<transport_mock>();
    EXPECT_CALL(*transport, send(_))
            .WillOnce(Return(raw_t(std::string())));

    auto body = make_api(transport)->call("/info", "GET");

    ASSERT_FALSE(body);
    EXPECT_EQ(error::make_error_code(error::malformed_response), body.error());
}

TEST(api_t, PreparationFailureNeverReachesTransport) {
    auto transport = std::make_shared<transport_mock>();
    EXPECT_CALL(*transport, send(_))
            .Times(0);

    auto body = make_api(transport)->call("containers/json", "GET");

    ASSERT_FALSE(body);
    EXPECT_EQ(error::make_error_code(error::request_preparation_failed), body.error());
}

TEST(api_t, UnknownMethodNeverReachesTransport) {
    auto transport = std::make_shared<transport_mock>();
    EXPECT_CALL(*transport, send(_))
            .Times(0);

    auto body = make_api(transport)->call("/info", "TRACE");

    ASSERT_FALSE(body);
    EXPECT_EQ(error::make_error_code(error::request_preparation_failed), body.error());
}

TEST(api_t, PrefixesApiVersion) {
    config_t config;
    config.api_version = "v1.37";
    config.host = "docker";

    std::string sent;

    auto transport = std::make_shared<transport_mock>();
    EXPECT_CALL(*transport, send(_))
            .WillOnce(DoAll(SaveArg<0>(&sent), Return(reply("OK"))));

    auto body = make_api(transport, config)->call("/_ping", "GET");

    ASSERT_TRUE(body);
    EXPECT_THAT(sent, StartsWith("GET /v1.37/_ping HTTP/1.1\r\n"));
    EXPECT_THAT(sent, HasSubstr("\r\nHost: docker\r\n"));
}

TEST(api_t, VersionPrefixDoesNotHideBadEndpoint) {
    config_t config;
    config.api_version = "v1.37";

    auto transport = std::make_shared<transport_mock>();
    EXPECT_CALL(*transport, send(_))
            .Times(0);

    auto body = make_api(transport, config)->call("info", "GET");

    EXPECT_EQ(error::make_error_code(error::request_preparation_failed), body.error());
}

TEST(api_t, BodyIsSentVerbatim) {
    const std::string payload = R"({"Image":"alpine","Cmd":["true"]})";
    std::string sent;

    auto transport = std::make_shared<transport_mock>();
    EXPECT_CALL(*transport, send(_))
            .WillOnce(DoAll(SaveArg<0>(&sent), Return(reply("{\"Id\":\"1\"}", "201 Created"))));

    auto body = make_api(transport)->call("/containers/create", "POST", payload);

    ASSERT_TRUE(body);
    EXPECT_THAT(sent, EndsWith("\r\n\r\n" + payload));
    EXPECT_THAT(sent, HasSubstr("Content-Length: " + std::to_string(payload.size()) + "\r\n"));
}

TEST(api_t, ErrorStatusKeepsTheBody) {
    auto transport = std::make_shared<transport_mock>();
    EXPECT_CALL(*transport, send(_))
            .WillOnce(Return(reply("{\"message\":\"page not found\"}", "404 Not Found")));

    auto body = make_api(transport)->call("/nope", "GET");

    ASSERT_TRUE(body);
    EXPECT_EQ("{\"message\":\"page not found\"}", body.value());
}
