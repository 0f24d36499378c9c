#include <gtest/gtest.h>

#include "scapi/net/curl_transport.hpp"
#include "scapi/net/http.hpp"

using namespace scapi::net;
using scapi::ErrorCode;

TEST(HttpRequestTest, HeadersAreCaseInsensitive) {
  Request request;
  request.setHeader("X-Scitemwebapi-Username", "editor");
  request.setHeader("x-scitemwebapi-username", "admin");

  ASSERT_EQ(request.headers.size(), 1u);
  EXPECT_EQ(request.header("X-SCITEMWEBAPI-USERNAME").value_or(""), "admin");
  EXPECT_FALSE(request.hasHeader("X-Scitemwebapi-Password"));
}

TEST(HttpRequestTest, ContentLengthFollowsBody) {
  Request request;
  EXPECT_EQ(request.contentLength(), 0u);
  request.body = "Title=%C3%A6";
  EXPECT_EQ(request.contentLength(), 12u);
}

TEST(HttpRequestTest, ReasonPhrases) {
  EXPECT_EQ(reasonPhrase(200), "OK");
  EXPECT_EQ(reasonPhrase(404), "Not Found");
  EXPECT_EQ(reasonPhrase(500), "Internal Server Error");
  EXPECT_EQ(reasonPhrase(299), "");
}

TEST(CurlTransportTest, RefusedConnectionHasNoResponse) {
  CurlTransport transport;
  Request request;
  request.url = "http://127.0.0.1:1/-/item/v1/";
  request.keep_alive = false;

  auto result = transport.send(request);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kNetworkError);
  EXPECT_FALSE(result.error().response.has_value());
  EXPECT_FALSE(result.error().message.empty());
}

TEST(CurlTransportTest, UserAgentNamesClient) {
  EXPECT_NE(CurlTransport::defaultUserAgent().find("scapi"), std::string::npos);
}
