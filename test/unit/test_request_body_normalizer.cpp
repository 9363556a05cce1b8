#include "apicat/core/normalizers.hpp"
#include "document_fixture.hpp"

#include <gtest/gtest.h>

using namespace apicat;
using namespace apicat::openapi;

namespace {

constexpr const char* kDocument = R"({
  "components": {
    "schemas": {
      "Pet": {"type": "object", "xml": {"name": "pet"}, "properties": {"name": {"type": "string"}}}
    },
    "requestBodies": {
      "PetBody": {"description": "Pet to add", "required": true,
                  "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}}
    }
  }
})";

struct RequestBodyFixture : ::testing::Test {
    value doc = test::load_document(kDocument);
    schema_sanitizer sanitizer;
    ref_resolver resolver{doc, sanitizer};
    catalog_options options;
    diagnostic diag;
    normalize_context ctx{resolver, options, &diag};

    result<request_body> normalize(const char* json) {
        return normalize_request_body(test::load_document(json), ctx, "paths./pets.post.requestBody");
    }
};

} // namespace

TEST_F(RequestBodyFixture, ContentSchemaReference) {
    auto body = normalize(R"({"description": "A pet", "content": {
        "application/json": {"schema": {"$ref": "#/components/schemas/Pet"}},
        "application/xml": {"schema": {"$ref": "#/components/schemas/Pet"}}}})");
    ASSERT_TRUE(body);
    EXPECT_EQ(body->description, "A pet");
    EXPECT_FALSE(body->required);
    ASSERT_TRUE(body->schema);
    EXPECT_EQ(body->schema->ref_name, "Pet");
    EXPECT_FALSE(contains_key(*body->schema, "xml"));
    ASSERT_EQ(body->media_types.size(), 2U);
    EXPECT_EQ(body->media_types[1], "application/xml");
}

TEST_F(RequestBodyFixture, ReferencedBodyIsLookedUp) {
    auto body = normalize(R"({"$ref": "#/components/requestBodies/PetBody"})");
    ASSERT_TRUE(body);
    EXPECT_EQ(body->description, "Pet to add");
    EXPECT_TRUE(body->required);
    ASSERT_TRUE(body->schema);
    EXPECT_EQ(body->schema->resolved().kind, schema_kind::object);
}

TEST_F(RequestBodyFixture, ShortDescriptionIsDropped) {
    auto body = normalize(R"({"description": "x",
        "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}})");
    ASSERT_TRUE(body);
    EXPECT_FALSE(body->description);

    auto empty = normalize(R"({"description": "",
        "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}})");
    ASSERT_TRUE(empty);
    EXPECT_FALSE(empty->description);
}

TEST_F(RequestBodyFixture, DescriptionLengthCountsCharactersNotBytes) {
    auto single = normalize(R"({"description": "\u00e9",
        "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}})");
    ASSERT_TRUE(single);
    EXPECT_FALSE(single->description);

    auto word = normalize(R"({"description": "\u00e9t\u00e9",
        "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}})");
    ASSERT_TRUE(word);
    EXPECT_EQ(word->description, "\xc3\xa9t\xc3\xa9");
}

TEST_F(RequestBodyFixture, ArrayOfReferencesIsAccepted) {
    auto body = normalize(R"({"content": {"application/json": {"schema":
        {"type": "array", "items": {"$ref": "#/components/schemas/Pet"}}}}})");
    ASSERT_TRUE(body);
    EXPECT_EQ(body->schema->kind, schema_kind::array);
    EXPECT_EQ(body->schema->items->ref_name, "Pet");
}

TEST_F(RequestBodyFixture, NonStandardLayoutFallsBackToFirstPointer) {
    auto body = normalize(R"({"wrapper": {"payload": {"$ref": "#/components/schemas/Pet"}}})");
    ASSERT_TRUE(body);
    ASSERT_TRUE(body->schema);
    EXPECT_EQ(body->schema->ref_name, "Pet");
}

TEST_F(RequestBodyFixture, InlineBodyWithoutPointerIsFatal) {
    auto body = normalize(R"({"content": {"application/json": {"schema":
        {"type": "object", "properties": {"name": {"type": "string"}}}}}})");
    ASSERT_FALSE(body);
    EXPECT_EQ(body.error(), make_error_code(error_code::request_body_without_reference));
    EXPECT_EQ(diag.location, "paths./pets.post.requestBody");
}

TEST_F(RequestBodyFixture, InlineBodyAcceptedWhenAllowed) {
    options.allow_inline_request_bodies = true;
    auto body = normalize(R"({"content": {"application/json": {"schema":
        {"type": "object", "properties": {"name": {"type": "string"}}}}}})");
    ASSERT_TRUE(body);
    ASSERT_TRUE(body->schema);
    EXPECT_EQ(body->schema->kind, schema_kind::object);
}
