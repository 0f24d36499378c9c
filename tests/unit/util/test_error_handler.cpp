#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "scapi/util/error_handler.hpp"
#include "scapi/util/security.hpp"

using namespace scapi::util;
using scapi::ErrorCode;

TEST(ErrorHandlerTest, StackTraceJoinsFrames) {
  auto error = makeContextualError(
      ErrorCode::kNetworkError, "Could not resolve host",
      ErrorContext{}.withUri("http://cms/-/item/v1/").push("DataContext::dispatch").push("HttpTransport::send"));

  EXPECT_EQ(error.stackTrace(), "DataContext::dispatch -> HttpTransport::send");
  EXPECT_NE(error.fullDescription().find("uri: http://cms/-/item/v1/"), std::string::npos);
  EXPECT_EQ(error.code(), ErrorCode::kNetworkError);
}

TEST(ErrorHandlerTest, StackTraceEmptyWithoutContext) {
  ContextualError error(ErrorCode::kParseError, "bad body");
  EXPECT_EQ(error.stackTrace(), "");
  EXPECT_FALSE(error.context().has_value());
}

TEST(ErrorHandlerTest, FormatsJson) {
  auto error = makeContextualError(ErrorCode::kHttpError, "Forbidden",
                                   ErrorContext{}.withOperation("getResponse").push("a").push("b"));

  auto parsed = nlohmann::json::parse(ErrorHandler::formatUserError(error, true));
  EXPECT_EQ(parsed["error"], "Forbidden");
  EXPECT_EQ(parsed["operation"], "getResponse");
  EXPECT_EQ(parsed["stack"].size(), 2u);
  EXPECT_EQ(parsed["code"], static_cast<int>(ErrorCode::kHttpError));
  EXPECT_FALSE(parsed.contains("suggestion"));
}

TEST(ErrorHandlerTest, FormatsPlainTextWithSuggestion) {
  auto error = makeContextualError(ErrorCode::kNetworkError, "Could not resolve host",
                                   ErrorContext{}.withOperation("get"));

  auto text = ErrorHandler::formatUserError(error);
  EXPECT_EQ(text.rfind("Error: Could not resolve host", 0), 0u);
  EXPECT_NE(text.find("Command: get"), std::string::npos);
  EXPECT_NE(text.find("Suggestion: Check that the host is reachable"), std::string::npos);
}

TEST(SecurityTest, MasksSensitiveValues) {
  EXPECT_EQ(Security::maskSensitive(""), "[empty]");
  EXPECT_EQ(Security::maskSensitive("abc"), "***");
  EXPECT_EQ(Security::maskSensitive("b"), "*");
  EXPECT_EQ(Security::maskSensitive("secret-pass"), "se*******ss");
}

TEST(SecurityTest, DetectsBlankValues) {
  EXPECT_TRUE(Security::isBlank(""));
  EXPECT_TRUE(Security::isBlank(" \t\n"));
  EXPECT_FALSE(Security::isBlank(" x "));
}

TEST(SecurityTest, SensitiveStringClearsOnMove) {
  SensitiveString original("hunter2");
  SensitiveString moved(std::move(original));
  EXPECT_EQ(moved.value(), "hunter2");
  EXPECT_TRUE(original.empty());

  moved.clear();
  EXPECT_TRUE(moved.empty());
}
