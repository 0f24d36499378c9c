#include <gtest/gtest.h>

#include "scapi/model/item_query.hpp"
#include "scapi/net/http.hpp"

using namespace scapi::model;

TEST(QueryTest, MapsQueryTypesToVerbs) {
  EXPECT_STREQ(toHttpMethod(QueryType::kRead), "GET");
  EXPECT_STREQ(toHttpMethod(QueryType::kCreate), "POST");
  EXPECT_STREQ(toHttpMethod(QueryType::kUpdate), "PUT");
  EXPECT_STREQ(toHttpMethod(QueryType::kDelete), "DELETE");

  EXPECT_TRUE(isMutating(QueryType::kCreate));
  EXPECT_TRUE(isMutating(QueryType::kUpdate));
  EXPECT_FALSE(isMutating(QueryType::kRead));
  EXPECT_FALSE(isMutating(QueryType::kDelete));
}

TEST(QueryTest, ActionQueryUri) {
  ActionQuery query("getpublickey", ResponseFormat::kXml);
  EXPECT_EQ(query.queryType(), QueryType::kRead);
  EXPECT_EQ(query.responseFormat(), ResponseFormat::kXml);
  EXPECT_TRUE(query.fieldsToUpdate().empty());
  EXPECT_EQ(query.buildUri("http://cms.example.com"),
            "http://cms.example.com/-/item/v1/-/actions/getpublickey");
}

TEST(ItemQueryTest, ReadByPath) {
  auto query = ItemQuery::byPath("sitecore/content/Home")
                   .withDatabase("web")
                   .withLanguage("en")
                   .withScope("s|c");

  EXPECT_EQ(query.path(), "/sitecore/content/Home");
  EXPECT_EQ(query.buildUri("http://cms"),
            "http://cms/-/item/v1/sitecore/content/Home?sc_database=web&language=en&scope=s%7Cc");
}

TEST(ItemQueryTest, ReadById) {
  auto query = ItemQuery::byId("{110D559F-DEA5-42EA-9C1C-8A5DF7E70EF9}").withPayload(Payload::kFull);

  EXPECT_EQ(query.buildUri("https://cms"),
            "https://cms/-/item/v1/?sc_itemid=%7B110D559F-DEA5-42EA-9C1C-8A5DF7E70EF9%7D&payload=full");
}

TEST(ItemQueryTest, EncodesPathSegments) {
  auto query = ItemQuery::byPath("/sitecore/content/Home/Our News").withApiVersion(2);
  EXPECT_EQ(query.buildUri("http://cms"), "http://cms/-/item/v2/sitecore/content/Home/Our%20News");
}

TEST(ItemQueryTest, CreateCarriesNameTemplateAndFields) {
  auto query = ItemQuery::byPath("/sitecore/content/Home", QueryType::kCreate)
                   .withName("News")
                   .withTemplate("Sample/Sample Item")
                   .withField("Title", "Latest news");

  EXPECT_EQ(query.queryType(), QueryType::kCreate);
  EXPECT_EQ(query.buildUri("http://cms"),
            "http://cms/-/item/v1/sitecore/content/Home?name=News&template=Sample%2FSample%20Item");
  ASSERT_EQ(query.fieldsToUpdate().size(), 1u);
  EXPECT_EQ(query.fieldsToUpdate()[0].first, "Title");
}

TEST(ItemQueryTest, NameIgnoredOutsideCreate) {
  auto query = ItemQuery::byPath("/a", QueryType::kUpdate).withName("ignored");
  EXPECT_EQ(query.buildUri("http://cms"), "http://cms/-/item/v1/a");
}
