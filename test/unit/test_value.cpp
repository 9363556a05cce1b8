#include "apicat/core/value.hpp"

#include <gtest/gtest.h>

using namespace apicat;

TEST(Value, SetKeepsDeclarationOrderAndReplacesInPlace) {
    value v = value::object_node();
    v.set("b", value::number_node(1));
    v.set("a", value::string_node("x"));
    v.set("b", value::number_node(2));

    ASSERT_EQ(v.object.size(), 2U);
    EXPECT_EQ(v.object[0].key, "b");
    EXPECT_EQ(v.object[1].key, "a");
    EXPECT_EQ(v.get_number("b"), 2.0);
}

TEST(Value, TypedGettersAcceptStringForms) {
    value v = value::object_node();
    v.set("required", value::string_node("true"));
    v.set("max", value::string_node("12.5"));
    v.set("name", value::number_node(3));

    EXPECT_EQ(v.get_bool("required"), true);
    EXPECT_EQ(v.get_number("max"), 12.5);
    EXPECT_FALSE(v.get_string("name").has_value());
    EXPECT_FALSE(v.get_bool("missing").has_value());
}

TEST(Value, FindOnNonObjectIsNull) {
    value arr = value::array_node();
    EXPECT_EQ(arr.find("x"), nullptr);
    EXPECT_FALSE(value::string_node("s").contains("s"));
}

TEST(Value, FindFirstKeyIsBreadthFirst) {
    // {"a": {"$ref": "deep"}, "b": [{"c": 1}], "$ref": "top"}
    value inner = value::object_node();
    inner.set("$ref", value::string_node("deep"));
    value root = value::object_node();
    root.set("a", inner);
    root.set("$ref", value::string_node("top"));

    const value* found = find_first_key(root, "$ref");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->scalar, "top");
}

TEST(Value, FindFirstKeyLeftToRightAtSameDepth) {
    value first = value::object_node();
    first.set("type", value::string_node("array"));
    value second = value::object_node();
    second.set("type", value::string_node("object"));
    value list = value::array_node();
    list.array.push_back(first);
    list.array.push_back(second);
    value root = value::object_node();
    root.set("content", list);

    const value* found = find_first_key(root, "type");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->scalar, "array");
    EXPECT_EQ(find_first_key(root, "missing"), nullptr);
}

TEST(Value, ScalarText) {
    EXPECT_EQ(scalar_text(value::number_node(42)), "42");
    EXPECT_EQ(scalar_text(value::number_node(2.5)), "2.5");
    EXPECT_EQ(scalar_text(value::bool_node(false)), "false");
    EXPECT_EQ(scalar_text(value::null_node()), "null");
    EXPECT_EQ(kind_name(value::kind::object), "object");
}

TEST(Value, StructuralEquality) {
    value a = value::object_node();
    a.set("k", value::array_node());
    value b = value::object_node();
    b.set("k", value::array_node());
    EXPECT_EQ(a, b);
    b.set("k", value::null_node());
    EXPECT_NE(a, b);
}
