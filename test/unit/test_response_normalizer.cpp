#include "apicat/core/normalizers.hpp"
#include "document_fixture.hpp"

#include <gtest/gtest.h>

using namespace apicat;
using namespace apicat::openapi;

namespace {

constexpr const char* kDocument = R"({
  "components": {
    "schemas": {
      "Pet": {"type": "object", "properties": {"name": {"type": "string"}}},
      "Pets": {"type": "array", "items": {"$ref": "#/components/schemas/Pet"}}
    },
    "headers": {
      "Location": {"description": "created resource", "schema": {"type": "string"}}
    },
    "links": {
      "GetPet": {"operationId": "getPet"}
    },
    "responses": {
      "NotFound": {"description": "missing",
                   "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}}
    }
  }
})";

struct ResponseFixture : ::testing::Test {
    value doc = test::load_document(kDocument);
    schema_sanitizer sanitizer;
    ref_resolver resolver{doc, sanitizer};
    catalog_options options;
    diagnostic diag;
    normalize_context ctx{resolver, options, &diag};

    result<std::vector<response>> normalize(const char* json) {
        return normalize_responses(test::load_document(json), ctx, "responses");
    }
};

} // namespace

TEST_F(ResponseFixture, SwaggerSchemaIsDirectObject) {
    auto res = normalize(R"({"200": {"description": "ok", "schema": {"$ref": "#/components/schemas/Pet"}}})");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->size(), 1U);
    const response& r = res->front();
    EXPECT_EQ(r.code, "200");
    EXPECT_EQ(r.status, 200);
    EXPECT_FALSE(r.is_default);
    EXPECT_EQ(r.description, "ok");
    ASSERT_TRUE(r.returns);
    EXPECT_EQ(r.returns->shape, response_shape::direct);
    EXPECT_EQ(r.returns->schema->ref_name, "Pet");
    EXPECT_TRUE(r.media_types.empty());
}

TEST_F(ResponseFixture, ArraySchemaExposesItem) {
    auto res = normalize(R"({"200": {"schema": {"type": "array", "items": {"$ref": "#/components/schemas/Pet"}}}})");
    ASSERT_TRUE(res);
    const response& r = res->front();
    ASSERT_TRUE(r.returns);
    EXPECT_EQ(r.returns->shape, response_shape::array);
    EXPECT_EQ(r.returns->schema->ref_name, "Pet");
    EXPECT_EQ(r.returns->schema->resolved().kind, schema_kind::object);
}

TEST_F(ResponseFixture, ReferencedArraySchemaIsArray) {
    auto res = normalize(R"({"200": {"content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pets"}}}}})");
    ASSERT_TRUE(res);
    const response& r = res->front();
    ASSERT_TRUE(r.returns);
    EXPECT_EQ(r.returns->shape, response_shape::array);
    EXPECT_EQ(r.returns->schema->ref_name, "Pet");
    ASSERT_EQ(r.media_types.size(), 1U);
    EXPECT_EQ(r.media_types[0], "application/json");
}

TEST_F(ResponseFixture, FirstContentSchemaWins) {
    auto res = normalize(R"({"200": {"content": {
        "text/plain": {},
        "application/json": {"schema": {"$ref": "#/components/schemas/Pet"}},
        "application/xml": {"schema": {"type": "string"}}}}})");
    ASSERT_TRUE(res);
    const response& r = res->front();
    ASSERT_TRUE(r.returns);
    EXPECT_EQ(r.returns->schema->ref_name, "Pet");
    EXPECT_EQ(r.media_types.size(), 3U);
}

TEST_F(ResponseFixture, DefaultAndRangeKeys) {
    auto res = normalize(R"({"2XX": {"description": "fine"}, "default": {"description": "error"}})");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->size(), 2U);
    EXPECT_EQ((*res)[0].code, "2XX");
    EXPECT_EQ((*res)[0].status, 0);
    EXPECT_FALSE((*res)[0].is_default);
    EXPECT_FALSE((*res)[0].returns);
    EXPECT_TRUE((*res)[1].is_default);
    EXPECT_EQ((*res)[1].description, "error");
}

TEST_F(ResponseFixture, ReferencedResponseIsLookedUp) {
    auto res = normalize(R"({"404": {"$ref": "#/components/responses/NotFound"}})");
    ASSERT_TRUE(res);
    const response& r = res->front();
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.description, "missing");
    ASSERT_TRUE(r.returns);
    EXPECT_EQ(r.returns->schema->ref_name, "Pet");
}

TEST_F(ResponseFixture, FallbackSearchFindsNestedPointerAndArrayType) {
    auto res = normalize(R"({"200": {"description": "odd",
        "x-wrapper": {"type": "array", "payload": {"$ref": "#/components/schemas/Pet"}}}})");
    ASSERT_TRUE(res);
    const response& r = res->front();
    ASSERT_TRUE(r.returns);
    EXPECT_EQ(r.returns->shape, response_shape::array);
    EXPECT_EQ(r.returns->schema->ref_name, "Pet");
}

TEST_F(ResponseFixture, HeadersAndLinksAreNotReturnSchemas) {
    auto res = normalize(R"({
      "201": {"description": "created",
              "headers": {"Location": {"$ref": "#/components/headers/Location"}},
              "links": {"self": {"$ref": "#/components/links/GetPet"}}},
      "204": {"description": "gone",
              "content": {"application/json": {"examples": {"a": {"$ref": "#/components/examples/A"}}}}}
    })");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->size(), 2U);
    EXPECT_EQ((*res)[0].status, 201);
    EXPECT_FALSE((*res)[0].returns);
    EXPECT_EQ((*res)[1].status, 204);
    EXPECT_FALSE((*res)[1].returns);
}

TEST_F(ResponseFixture, InlineSchemaWithoutPointer) {
    auto res = normalize(R"({"200": {"schema": {"type": "object", "properties": {"id": {"type": "integer"}}}}})");
    ASSERT_TRUE(res);
    const response& r = res->front();
    ASSERT_TRUE(r.returns);
    EXPECT_EQ(r.returns->shape, response_shape::direct);
    EXPECT_EQ(r.returns->schema->kind, schema_kind::object);
}

TEST_F(ResponseFixture, UnresolvedPointerAbortsWithLocation) {
    auto res = normalize(R"({"200": {"schema": {"$ref": "#/components/schemas/Nope"}}})");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error(), make_error_code(error_code::unresolved_reference));
    EXPECT_EQ(diag.location, "#/components/schemas/Nope");
}
