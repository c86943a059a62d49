#include <string>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <dockhand/errors.hpp>
#include <dockhand/http.hpp>

using namespace dockhand;
using namespace dockhand::http;

using namespace ::testing;

TEST(format_request, GetWithoutBody) {
    auto request = format_request("/info", "GET", "");

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ("GET /info HTTP/1.1\r\n"
              "Host: localhost\r\n"
              "User-Agent: dockhand\r\n"
              "Connection: close\r\n"
              "\r\n", request.value());
}

TEST(format_request, PostCarriesLengthAndBodyVerbatim) {
    const std::string body = R"({"Image":"debian:jessie"})";
    auto request = format_request("/containers/create?name=box", "POST", body, "docker");

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ("POST /containers/create?name=box HTTP/1.1\r\n"
              "Host: docker\r\n"
              "User-Agent: dockhand\r\n"
              "Connection: close\r\n"
              "Content-Type: application/json\r\n"
              "Content-Length: 25\r\n"
              "\r\n" + body, request.value());
}

TEST(format_request, PostWithoutBodyHasZeroLength) {
    auto request = format_request("/containers/abc/start", "POST", "");

    ASSERT_TRUE(request.has_value());
    EXPECT_THAT(request.value(), HasSubstr("Content-Length: 0\r\n"));
    EXPECT_THAT(request.value(), EndsWith("\r\n\r\n"));
}

TEST(format_request, RejectsEndpointWithoutLeadingSlash) {
    auto request = format_request("containers/json", "GET", "");

    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(error::make_error_code(error::request_preparation_failed), request.error());
}

TEST(format_request, RejectsEmptyEndpoint) {
    auto request = format_request("", "GET", "");

    ASSERT_FALSE(request);
    EXPECT_EQ(error::make_error_code(error::request_preparation_failed), request.error());
}

TEST(format_request, RejectsWhitespaceInEndpoint) {
    auto request = format_request("/containers/json?filter=a b", "GET", "");

    ASSERT_FALSE(request);
    EXPECT_EQ(error::make_error_code(error::request_preparation_failed), request.error());
    EXPECT_THAT(request.failure().reason(), HasSubstr("invalid characters"));
}

TEST(format_request, RejectsLineBreakInEndpoint) {
    auto request = format_request("/info\r\nX-Injected: 1", "GET", "");

    ASSERT_FALSE(request);
    EXPECT_EQ(error::make_error_code(error::request_preparation_failed), request.error());
}

TEST(format_request, RejectsUnknownMethod) {
    EXPECT_FALSE(format_request("/info", "PATCH", ""));
    EXPECT_FALSE(format_request("/info", "get", ""));
    EXPECT_FALSE(format_request("/info", "", ""));
}

TEST(format_request, RejectsBrokenHost) {
    auto request = format_request("/info", "GET", "", "docker\r\n");

    ASSERT_FALSE(request);
    EXPECT_EQ(error::make_error_code(error::request_preparation_failed), request.error());
}

TEST(format_request, AcceptsEveryKnownMethod) {
    EXPECT_TRUE(format_request("/containers/abc", "GET", ""));
    EXPECT_TRUE(format_request("/containers/abc", "POST", ""));
    EXPECT_TRUE(format_request("/containers/abc", "PUT", ""));
    EXPECT_TRUE(format_request("/containers/abc", "DELETE", ""));
    EXPECT_TRUE(format_request("/containers/abc", "HEAD", ""));
}

TEST(format_request, FailureIsNotATransportFailure) {
    auto request = format_request("no-slash", "GET", "");

    EXPECT_NE(error::make_error_code(error::no_response), request.error());
    EXPECT_NE(error::make_error_code(error::malformed_response), request.error());
}

TEST(make_request, HeadersAreLookedUpCaseInsensitively) {
    auto request = make_request("/containers/create", "POST", "{}");

    ASSERT_TRUE(request);
    EXPECT_EQ("2", request.value().headers().header("content-length").get());
    EXPECT_EQ("application/json", request.value().headers().header("CONTENT-TYPE").get());
    EXPECT_FALSE(request.value().headers().header("Transfer-Encoding"));
}

TEST(format_request, RoundTripThroughResponseParser) {
    const std::string body = "{\"Id\":\"4fa6e0f0c678\"}\r\n\r\ntrailing";

    auto request = format_request("/containers/create", "POST", body);
    ASSERT_TRUE(request);

    // The daemon echoing whatever came after the request's own separator.
    const std::string sent = request.value();
    const std::string echoed = sent.substr(sent.find("\r\n\r\n") + 4);

    auto extracted = extract_body("HTTP/1.1 201 Created\r\nContent-Type: application/json\r\n\r\n" + echoed);

    ASSERT_TRUE(extracted);
    EXPECT_EQ(body, extracted.value());
}

TEST(escape, KeepsUnreservedCharacters) {
    EXPECT_EQ("my_container-1.0~x", escape("my_container-1.0~x"));
}

TEST(escape, EncodesEverythingElse) {
    EXPECT_EQ("%7B%22status%22%3A%5B%22running%22%5D%7D", escape(R"({"status":["running"]})"));
    EXPECT_EQ("a%20b%26c%3Dd", escape("a b&c=d"));
}
