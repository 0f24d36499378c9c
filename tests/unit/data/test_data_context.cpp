#include <gtest/gtest.h>

#include <stdexcept>

#include "scapi/data/data_context.hpp"
#include "scapi/model/item_query.hpp"
#include "scapi/model/item_response.hpp"
#include "test_helpers.hpp"

using namespace scapi::data;
using namespace scapi::model;
using scapi::ErrorCode;
using scapi::test::MockTransport;

namespace {

// Transport that fails in a way no transport error describes
class ThrowingTransport : public scapi::net::HttpTransport {
public:
  scapi::net::TransportResult send(const scapi::net::Request&) override {
    throw std::runtime_error("socket exploded");
  }
};

}  // namespace

class DataContextTest : public ::testing::Test {
protected:
  void SetUp() override {
    transport_ = std::make_shared<MockTransport>();
    auto context = DataContext::create("cms.example.com", false, transport_);
    ASSERT_OK(context);
    context_.emplace(std::move(*context));
  }

  std::shared_ptr<MockTransport> transport_;
  std::optional<DataContext> context_;
};

TEST_F(DataContextTest, NormalizesHostName) {
  EXPECT_EQ(context_->hostName(), "http://cms.example.com");
  EXPECT_FALSE(context_->isSecure());
  EXPECT_FALSE(context_->isAuthenticated());

  auto secure = DataContext::create("http://cms.example.com/", true, transport_);
  ASSERT_OK(secure);
  EXPECT_EQ(secure->hostName(), "https://cms.example.com");
  EXPECT_TRUE(secure->isSecure());

  auto https = DataContext::create("https://cms.example.com", false, transport_);
  ASSERT_OK(https);
  EXPECT_EQ(https->hostName(), "https://cms.example.com");
}

TEST_F(DataContextTest, RejectsInvalidHostNames) {
  EXPECT_ERROR(DataContext::create("", false, transport_), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(DataContext::create("https://", false, transport_), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(DataContext::create("not a host", false, transport_), ErrorCode::kInvalidArgument);
}

TEST_F(DataContextTest, BuildRequestDisablesKeepAlive) {
  auto request = context_->buildRequest("http://cms.example.com/-/item/v1/a", QueryType::kDelete);
  ASSERT_OK(request);
  EXPECT_EQ(request->method, "DELETE");
  EXPECT_FALSE(request->keep_alive);
  EXPECT_TRUE(request->headers.empty());
}

TEST_F(DataContextTest, AnonymousRequestRefusesBody) {
  EXPECT_ERROR(context_->buildRequest("http://cms.example.com/-/item/v1/a", QueryType::kCreate, "a=b"),
               ErrorCode::kInvalidOperation);
}

TEST_F(DataContextTest, MutatingQueriesNeedAuthentication) {
  auto create = ItemQuery::byPath("/sitecore/content/Home", QueryType::kCreate).withName("News");
  EXPECT_ERROR(context_->getResponse<ItemResponse>(create), ErrorCode::kInvalidOperation);

  auto update = ItemQuery::byPath("/sitecore/content/Home", QueryType::kUpdate).withField("Title", "x");
  EXPECT_ERROR(context_->getResponse<ItemResponse>(update), ErrorCode::kInvalidOperation);

  EXPECT_EQ(transport_->sendCount(), 0u);
}

TEST_F(DataContextTest, ReadSendsGetToQueryUri) {
  transport_->enqueueResponse(200, "OK",
                              R"({"statusCode":200,"result":{"totalCount":1,"resultCount":1,)"
                              R"("items":[{"ID":"{1}","DisplayName":"Home","Path":"/sitecore/content/Home"}]}})");

  auto response = context_->getResponse<ItemResponse>(
      ItemQuery::byPath("/sitecore/content/Home").withDatabase("web"));
  ASSERT_OK(response);

  ASSERT_EQ(transport_->sendCount(), 1u);
  EXPECT_EQ(transport_->lastRequest().method, "GET");
  EXPECT_EQ(transport_->lastRequest().url,
            "http://cms.example.com/-/item/v1/sitecore/content/Home?sc_database=web");

  EXPECT_EQ(response->status_code, 200);
  EXPECT_EQ(response->status_description, "OK");
  EXPECT_TRUE(response->succeeded());
  ASSERT_EQ(response->items.size(), 1u);
  EXPECT_EQ(response->items[0].name, "Home");

  ASSERT_TRUE(response->info.has_value());
  EXPECT_EQ(response->info->uri, transport_->lastRequest().url);
  EXPECT_EQ(response->info->outcome, ExchangeOutcome::kCompleted);
  EXPECT_TRUE(response->info->error_message.empty());
  EXPECT_GE(response->info->response_time.count(), 0);
}

TEST_F(DataContextTest, DeleteIsAllowedAnonymously) {
  transport_->enqueueResponse(200, "OK", R"({"statusCode":200,"result":{"count":1}})");

  auto response = context_->getResponse<ItemResponse>(ItemQuery::byPath("/a", QueryType::kDelete));
  ASSERT_OK(response);
  EXPECT_EQ(transport_->lastRequest().method, "DELETE");
  EXPECT_EQ(response->status_code, 200);
}

TEST_F(DataContextTest, ErrorStatusKeepsParsedPayload) {
  transport_->enqueueResponse(404, "Item Not Found",
                              R"({"statusCode":404,"error":{"message":"Item does not exist"}})");

  auto response = context_->getResponse<ItemResponse>(ItemQuery::byPath("/missing"));
  ASSERT_OK(response);

  EXPECT_EQ(response->status_code, 404);
  EXPECT_EQ(response->status_description, "Item Not Found");
  EXPECT_EQ(response->server_error, "Item does not exist");
  EXPECT_FALSE(response->succeeded());
  EXPECT_EQ(response->info->outcome, ExchangeOutcome::kCompleted);
}

TEST_F(DataContextTest, HtmlErrorPageKeepsStatusAndDescription) {
  transport_->enqueueResponse(404, "Not Found", "<html><body>404 page</body></html>");

  auto response = context_->getResponse<ItemResponse>(ItemQuery::byPath("/missing"));
  ASSERT_OK(response);

  EXPECT_EQ(response->status_code, 404);
  EXPECT_EQ(response->status_description, "Not Found");
  EXPECT_TRUE(response->items.empty());
  ASSERT_TRUE(response->info.has_value());
  EXPECT_EQ(response->info->outcome, ExchangeOutcome::kUnexpectedError);
  EXPECT_FALSE(response->info->error_message.empty());
  EXPECT_FALSE(response->info->stack_trace.empty());
}

TEST_F(DataContextTest, ConnectionFailureBecomesStatus500) {
  transport_->enqueueFailure(ErrorCode::kNetworkError, "Couldn't connect to server");

  auto response = context_->getResponse<ItemResponse>(ItemQuery::byPath("/a"));
  ASSERT_OK(response);

  EXPECT_EQ(response->status_code, 500);
  ASSERT_TRUE(response->info.has_value());
  EXPECT_EQ(response->info->outcome, ExchangeOutcome::kTransportError);
  EXPECT_EQ(response->info->error_message, "Couldn't connect to server");
  EXPECT_FALSE(response->info->stack_trace.empty());
  EXPECT_EQ(response->info->uri, "http://cms.example.com/-/item/v1/a");
}

TEST_F(DataContextTest, TransportFailureWithResponseKeepsItsStatus) {
  scapi::net::TransportError failure;
  failure.code = ErrorCode::kHttpError;
  failure.message = "Transferred a partial file";
  failure.response = scapi::test::makeResponse(503, "Service Unavailable", "");
  transport_->enqueue(std::unexpected(failure));

  auto response = context_->getResponse<ItemResponse>(ItemQuery::byPath("/a"));
  ASSERT_OK(response);

  EXPECT_EQ(response->status_code, 503);
  EXPECT_EQ(response->status_description, "Service Unavailable");
  EXPECT_EQ(response->info->outcome, ExchangeOutcome::kHttpError);
  EXPECT_EQ(response->info->error_message, "Transferred a partial file");
}

TEST_F(DataContextTest, UnparseableBodyKeepsHttpStatus) {
  transport_->enqueueResponse(200, "OK", "<html>not json</html>");

  auto response = context_->getResponse<ItemResponse>(ItemQuery::byPath("/a"));
  ASSERT_OK(response);

  EXPECT_EQ(response->status_code, 200);
  EXPECT_EQ(response->info->outcome, ExchangeOutcome::kUnexpectedError);
  EXPECT_FALSE(response->info->error_message.empty());
  EXPECT_FALSE(response->succeeded());
}

TEST_F(DataContextTest, UnexpectedExceptionBecomesStatus500) {
  auto context = DataContext::create("cms.example.com", false, std::make_shared<ThrowingTransport>());
  ASSERT_OK(context);

  auto response = context->getResponse<ItemResponse>(ItemQuery::byPath("/a"));
  ASSERT_OK(response);
  EXPECT_EQ(response->status_code, 500);
  EXPECT_EQ(response->info->outcome, ExchangeOutcome::kUnexpectedError);
  EXPECT_EQ(response->info->error_message, "socket exploded");
}

TEST_F(DataContextTest, BlankBodyYieldsDefaultResult) {
  transport_->enqueueResponse(204, "No Content", "  \n");

  auto response = context_->getResponse<ItemResponse>(ItemQuery::byPath("/a"));
  ASSERT_OK(response);
  EXPECT_EQ(response->status_code, 204);
  EXPECT_EQ(response->status_description, "No Content");
  EXPECT_TRUE(response->items.empty());
  EXPECT_EQ(response->total_count, 0);
  EXPECT_EQ(response->info->outcome, ExchangeOutcome::kCompleted);
}

TEST_F(DataContextTest, ExecuteFillsSeedOnFailure) {
  transport_->enqueueFailure(ErrorCode::kNetworkError, "Could not resolve host");

  ItemResponse seed;
  seed.total_count = 7;
  auto request = context_->buildRequest("http://cms.example.com/-/item/v1/a", QueryType::kRead);
  ASSERT_OK(request);

  auto response = context_->execute(*request, ResponseFormat::kJson, std::move(seed));
  EXPECT_EQ(response.total_count, 7);
  EXPECT_EQ(response.status_code, 500);
  EXPECT_EQ(response.info->error_message, "Could not resolve host");
}

TEST_F(DataContextTest, ExecuteKeepsSeedForBlankBody) {
  transport_->enqueueResponse(200, "OK", " ");

  ItemResponse seed;
  seed.total_count = 3;
  auto request = context_->buildRequest("http://cms.example.com/-/item/v1/a", QueryType::kRead);
  ASSERT_OK(request);

  auto response = context_->execute(*request, ResponseFormat::kJson, std::move(seed));
  EXPECT_EQ(response.total_count, 3);
  EXPECT_EQ(response.status_code, 200);
  EXPECT_TRUE(response.succeeded());
}

TEST_F(DataContextTest, GetPublicKeyReadsXmlKey) {
  transport_->enqueueResponse(200, "OK", scapi::test::publicKeyXml("xGZ5abc=", "AQAB"));

  auto key = context_->getPublicKey();
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(key->modulus, "xGZ5abc=");
  EXPECT_EQ(key->exponent, "AQAB");
  EXPECT_EQ(transport_->lastRequest().url,
            "http://cms.example.com/-/item/v1/-/actions/getpublickey");
  EXPECT_EQ(transport_->lastRequest().method, "GET");
}

TEST_F(DataContextTest, GetPublicKeyWithoutKeyIsEmpty) {
  transport_->enqueueResponse(200, "OK", "<RSAKeyValue><Modulus>abc</Modulus></RSAKeyValue>");
  EXPECT_FALSE(context_->getPublicKey().has_value());

  transport_->enqueueFailure(ErrorCode::kNetworkError, "Connection refused");
  EXPECT_FALSE(context_->getPublicKey().has_value());
}
