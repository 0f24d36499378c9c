#include <gtest/gtest.h>

#include <vector>

#include <nlohmann/json.hpp>

#include "scapi/cli/application.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace scapi::cli;
using scapi::ErrorCode;
using scapi::test::MockTransport;
using scapi::test::ScopedEnv;
using scapi::test::TempDirectory;

class ApplicationTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Keep any real user configuration out of the tests
    xdg_ = std::make_unique<ScopedEnv>("XDG_CONFIG_HOME", temp_dir_.path().string());
    transport_ = std::make_shared<MockTransport>();
  }

  int run(std::vector<std::string> args) {
    args.insert(args.begin(), "scapi");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    Application app(transport_);
    testing::internal::CaptureStdout();
    int code = app.run(static_cast<int>(argv.size()), argv.data());
    output_ = testing::internal::GetCapturedStdout();
    return code;
  }

  TempDirectory temp_dir_;
  std::unique_ptr<ScopedEnv> xdg_;
  std::shared_ptr<MockTransport> transport_;
  std::string output_;
};

TEST_F(ApplicationTest, GetPrintsItems) {
  transport_->enqueueResponse(200, "OK",
                              R"({"statusCode":200,"result":{"totalCount":1,"resultCount":1,)"
                              R"("items":[{"ID":"{1}","DisplayName":"Home","Path":"/sitecore/content/Home","TemplateName":"Sample Item"}]}})");

  EXPECT_EQ(run({"--host", "cms.example.com", "get", "/sitecore/content/Home"}), 0);
  EXPECT_EQ(transport_->lastRequest().url, "http://cms.example.com/-/item/v1/sitecore/content/Home");
  EXPECT_NE(output_.find("/sitecore/content/Home"), std::string::npos);
  EXPECT_NE(output_.find("1 of 1 item(s)"), std::string::npos);
}

TEST_F(ApplicationTest, GetByIdUsesItemIdParameter) {
  EXPECT_EQ(run({"--host", "cms.example.com", "--secure", "get", "{110D559F}"}), 0);
  EXPECT_EQ(transport_->lastRequest().url, "https://cms.example.com/-/item/v1/?sc_itemid=%7B110D559F%7D");
}

TEST_F(ApplicationTest, NonSuccessStatusFails) {
  transport_->enqueueResponse(404, "Not Found", R"({"statusCode":404,"error":{"message":"Not found"}})");

  EXPECT_EQ(run({"--host", "cms.example.com", "--json", "get", "/missing"}), 1);
  auto parsed = nlohmann::json::parse(output_);
  EXPECT_EQ(parsed["status_code"], 404);
  EXPECT_EQ(parsed["server_error"], "Not found");
}

TEST_F(ApplicationTest, CreateWithoutCredentialsIsRejected) {
  EXPECT_EQ(run({"--host", "cms.example.com", "create", "/sitecore/content/Home",
                 "--name", "News", "--template", "Sample/Sample Item"}), 1);
  EXPECT_EQ(transport_->sendCount(), 0u);
  EXPECT_NE(output_.find("authenticated"), std::string::npos);
}

TEST_F(ApplicationTest, UpdateUsesConfiguredCredentials) {
  ScopedEnv password("SCAPI_TEST_CLI_PASSWORD", "b");
  auto config = temp_dir_.writeFile("scapi.toml",
                                    "host = \"cms.example.com\"\n"
                                    "[credentials]\n"
                                    "username = \"editor\"\n"
                                    "password = \"env:SCAPI_TEST_CLI_PASSWORD\"\n"
                                    "[item_api]\n"
                                    "database = \"master\"\n");

  EXPECT_EQ(run({"--config", config.string(), "update", "/sitecore/content/Home",
                 "--field", "Title=Hello"}), 0);

  const auto& request = transport_->lastRequest();
  EXPECT_EQ(request.method, "PUT");
  EXPECT_EQ(request.url, "http://cms.example.com/-/item/v1/sitecore/content/Home?sc_database=master");
  EXPECT_EQ(request.body, "Title=Hello");
  EXPECT_EQ(request.header("X-Scitemwebapi-Username").value_or(""), "editor");
}

TEST_F(ApplicationTest, MissingHostIsReported) {
  EXPECT_EQ(run({"get", "/a"}), 1);
  EXPECT_NE(output_.find("No host configured"), std::string::npos);
}

TEST_F(ApplicationTest, MissingHostIsReportedAsJson) {
  EXPECT_EQ(run({"--json", "get", "/a"}), 1);
  auto parsed = nlohmann::json::parse(output_);
  EXPECT_EQ(parsed["code"], static_cast<int>(ErrorCode::kConfigError));
  EXPECT_EQ(parsed["operation"], "get");
  EXPECT_NE(parsed["error"].get<std::string>().find("No host configured"), std::string::npos);
  EXPECT_TRUE(parsed.contains("suggestion"));
}

TEST_F(ApplicationTest, PubkeyPrintsKey) {
  transport_->enqueueResponse(200, "OK", scapi::test::publicKeyXml("xGZ5abc=", "AQAB"));

  EXPECT_EQ(run({"--host", "cms.example.com", "pubkey"}), 0);
  EXPECT_NE(output_.find("xGZ5abc="), std::string::npos);
  EXPECT_NE(output_.find("AQAB"), std::string::npos);
}

TEST(FieldAssignmentTest, SplitsOnFirstEquals) {
  auto fields = parseFieldAssignments({"Title=Hello", "Text=a=b"});
  ASSERT_OK(fields);
  ASSERT_EQ(fields->size(), 2u);
  EXPECT_EQ((*fields)[1].first, "Text");
  EXPECT_EQ((*fields)[1].second, "a=b");

  EXPECT_ERROR(parseFieldAssignments({"novalue"}), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseFieldAssignments({"=value"}), ErrorCode::kInvalidArgument);
}
