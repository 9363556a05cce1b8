#include "apicat/core/normalizers.hpp"
#include "document_fixture.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace apicat;
using namespace apicat::openapi;

namespace {

constexpr const char* kDocument = R"({
  "definitions": {
    "Pet": {"type": "object", "properties": {"name": {"type": "string"}}, "xml": {"name": "p"}},
    "Ids": {"type": "array", "items": {"type": "integer"}},
    "Status": {"type": "string", "enum": ["open", "closed"]}
  },
  "parameters": {
    "Limit": {"name": "limit", "in": "query", "type": "integer", "maximum": 100},
    "Alias": {"$ref": "#/parameters/Limit"},
    "LoopA": {"$ref": "#/parameters/LoopB"},
    "LoopB": {"$ref": "#/parameters/LoopA"}
  }
})";

struct ParameterFixture : ::testing::Test {
    value doc = test::load_document(kDocument);
    schema_sanitizer sanitizer;
    ref_resolver resolver{doc, sanitizer};
    catalog_options options;
    diagnostic diag;
    normalize_context ctx{resolver, options, &diag};

    result<parameter> normalize(const char* json) {
        return normalize_parameter(test::load_document(json), ctx, "parameters[0]");
    }
};

} // namespace

TEST_F(ParameterFixture, InlineTypeAndDefaults) {
    auto p = normalize(R"({"name": "id", "in": "path", "required": true, "type": "integer",
                           "format": "int64", "description": "Pet id"})");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->name, "id");
    EXPECT_EQ(p->in, param_location::path);
    EXPECT_TRUE(p->required);
    EXPECT_FALSE(p->deprecated);
    EXPECT_EQ(p->description, "Pet id");
    ASSERT_TRUE(p->type);
    EXPECT_EQ(p->type->kind, schema_kind::primitive);
    EXPECT_EQ(p->type->type_name, "integer");
    EXPECT_EQ(p->format, "int64");
    EXPECT_FALSE(p->items);
    EXPECT_FALSE(p->schema);
    EXPECT_FALSE(p->type->annotations.contains("name"));
}

TEST_F(ParameterFixture, RequiredAndDeprecatedDefaultToFalse) {
    auto p = normalize(R"({"name": "q", "in": "query", "type": "string"})");
    ASSERT_TRUE(p);
    EXPECT_FALSE(p->required);
    EXPECT_FALSE(p->deprecated);
    EXPECT_FALSE(p->description);
}

TEST_F(ParameterFixture, SchemaTypeWithConstraintFallback) {
    auto p = normalize(R"({"name": "code", "in": "query", "pattern": "^[A-Z]+$",
                           "schema": {"type": "string", "pattern": "ignored", "format": "byte",
                                      "maxLength": 8, "minimum": 1}})");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->type->type_name, "string");
    EXPECT_EQ(p->pattern, "^[A-Z]+$");
    EXPECT_EQ(p->format, "byte");
    EXPECT_EQ(p->max_length, 8U);
    EXPECT_EQ(p->minimum, 1.0);
    EXPECT_FALSE(p->maximum);
    ASSERT_TRUE(p->schema);
    EXPECT_EQ(p->schema, p->type);
}

TEST_F(ParameterFixture, MaxLengthOutOfRangeIsNotTruncated) {
    auto huge = normalize(R"({"name": "a", "in": "query", "type": "string", "maxLength": 1e30})");
    ASSERT_TRUE(huge);
    EXPECT_EQ(huge->max_length, std::numeric_limits<size_t>::max());

    auto fractional = normalize(R"({"name": "b", "in": "query", "type": "string", "maxLength": 2.5})");
    ASSERT_TRUE(fractional);
    EXPECT_FALSE(fractional->max_length);

    auto negative = normalize(R"({"name": "c", "in": "query", "type": "string", "maxLength": -1})");
    ASSERT_TRUE(negative);
    EXPECT_FALSE(negative->max_length);
}

TEST_F(ParameterFixture, SchemaReferenceIsResolvedAndSanitized) {
    auto p = normalize(R"({"name": "pet", "in": "body", "schema": {"$ref": "#/definitions/Pet"}})");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->in, param_location::body);
    EXPECT_EQ(p->type->kind, schema_kind::reference);
    EXPECT_EQ(p->type->ref_name, "Pet");
    EXPECT_EQ(p->type->resolved().kind, schema_kind::object);
    EXPECT_FALSE(contains_key(*p->type, "xml"));
}

TEST_F(ParameterFixture, ContentSchemaIsLastTypeSource) {
    auto p = normalize(R"({"name": "filter", "in": "query",
                           "content": {"application/json": {"schema": {"$ref": "#/definitions/Pet"}}}})");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->type->ref_name, "Pet");
    EXPECT_EQ(p->schema, p->type);
}

TEST_F(ParameterFixture, InlineArrayWithItems) {
    auto p = normalize(R"({"name": "tags", "in": "query", "type": "array", "collectionFormat": "csv",
                           "items": {"type": "string", "enum": ["a", "b"], "default": "a"}})");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->type->kind, schema_kind::array);
    ASSERT_TRUE(p->items);
    EXPECT_EQ(p->items->kind, schema_kind::enumeration);
    EXPECT_EQ(p->items->enum_values.size(), 2U);
    ASSERT_NE(p->items->annotations.find("default"), nullptr);
    EXPECT_EQ(p->items->annotation("default"), "a");
}

TEST_F(ParameterFixture, ArrayItemsReferenceResolves) {
    auto p = normalize(R"({"name": "pets", "in": "query", "type": "array",
                           "items": {"$ref": "#/definitions/Pet"}})");
    ASSERT_TRUE(p);
    ASSERT_TRUE(p->items);
    EXPECT_EQ(p->items->ref_name, "Pet");
    EXPECT_EQ(p->items->resolved().properties.size(), 1U);
}

TEST_F(ParameterFixture, SchemaItemsUsedWhenInlineAbsent) {
    auto p = normalize(R"({"name": "ids", "in": "query",
                           "schema": {"type": "array", "items": {"type": "integer"}}})");
    ASSERT_TRUE(p);
    ASSERT_TRUE(p->items);
    EXPECT_EQ(p->items->type_name, "integer");
}

TEST_F(ParameterFixture, ReferencedArraySchemaCarriesItems) {
    auto p = normalize(R"({"name": "ids", "in": "query", "schema": {"$ref": "#/definitions/Ids"}})");
    ASSERT_TRUE(p);
    ASSERT_TRUE(p->items);
    EXPECT_EQ(p->items->type_name, "integer");
}

TEST_F(ParameterFixture, ArrayWithoutItemsIsFatal) {
    auto p = normalize(R"({"name": "tags", "in": "query", "type": "array"})");
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::array_parameter_without_items));
    EXPECT_EQ(diag.location, "parameters[0]");
    EXPECT_EQ(p.error().message(), "array parameter without items is invalid");
}

TEST_F(ParameterFixture, ArrayItemsWithoutTypeOrRefIsFatal) {
    auto p = normalize(R"({"name": "tags", "in": "query", "type": "array", "items": {"format": "x"}})");
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::array_parameter_without_items));
}

TEST_F(ParameterFixture, MissingTypeIsInvalid) {
    auto p = normalize(R"({"name": "x", "in": "query"})");
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::invalid_parameter));
    EXPECT_NE(diag.message.find("'x'"), std::string::npos);
}

TEST_F(ParameterFixture, UnknownLocationIsInvalid) {
    auto p = normalize(R"({"name": "x", "in": "matrix", "type": "string"})");
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::invalid_parameter));
}

TEST_F(ParameterFixture, WrongShapesNameTheKindFound) {
    auto p = normalize(R"(["name", "x"])");
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::invalid_parameter));
    EXPECT_EQ(diag.message, "parameter must be a mapping, got array");

    diagnostic list_diag;
    normalize_context list_ctx{resolver, options, &list_diag};
    auto list = normalize_parameters(test::load_document(R"({"name": "x"})"), list_ctx, "parameters");
    ASSERT_FALSE(list);
    EXPECT_EQ(list_diag.message, "parameters must be a list, got object");
}

TEST_F(ParameterFixture, ReferenceChainsAreFollowed) {
    auto p = normalize(R"({"$ref": "#/parameters/Alias"})");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->name, "limit");
    EXPECT_EQ(p->in, param_location::query);
    EXPECT_EQ(p->maximum, 100.0);
}

TEST_F(ParameterFixture, ReferenceLoopIsCycleError) {
    auto p = normalize(R"({"$ref": "#/parameters/LoopA"})");
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::reference_cycle));
}

TEST_F(ParameterFixture, ListKeepsOrderAndLocations) {
    auto list = normalize_parameters(
        test::load_document(R"([{"name": "a", "in": "query", "type": "string"},
                                {"name": "b", "in": "header", "type": "array"}])"),
        ctx,
        "paths./x.get.parameters");
    ASSERT_FALSE(list);
    EXPECT_EQ(diag.location, "paths./x.get.parameters[1]");

    diag = {};
    auto ok = normalize_parameters(
        test::load_document(R"([{"name": "a", "in": "query", "type": "string"},
                                {"name": "b", "in": "formData", "type": "file"}])"),
        ctx,
        "p");
    ASSERT_TRUE(ok);
    ASSERT_EQ(ok->size(), 2U);
    EXPECT_EQ((*ok)[1].in, param_location::form_data);
}
