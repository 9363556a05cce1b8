#include "apicat/core/http.hpp"

#include <gtest/gtest.h>

using namespace apicat::http;

TEST(HttpMethod, ParsesAllVerbsCaseInsensitively) {
    EXPECT_EQ(parse_method("get"), method::get);
    EXPECT_EQ(parse_method("PUT"), method::put);
    EXPECT_EQ(parse_method("Post"), method::post);
    EXPECT_EQ(parse_method("delete"), method::del);
    EXPECT_EQ(parse_method("options"), method::options);
    EXPECT_EQ(parse_method("head"), method::head);
    EXPECT_EQ(parse_method("patch"), method::patch);
    EXPECT_EQ(parse_method("trace"), method::trace);
}

TEST(HttpMethod, RejectsUnknownVerbs) {
    EXPECT_EQ(parse_method("connect"), method::unknown);
    EXPECT_EQ(parse_method("parameters"), method::unknown);
    EXPECT_EQ(parse_method(""), method::unknown);
    EXPECT_EQ(parse_method("gett"), method::unknown);
}

TEST(HttpMethod, ToString) {
    EXPECT_EQ(method_to_string(method::del), "DELETE");
    EXPECT_EQ(method_to_string(method::patch), "PATCH");
    EXPECT_EQ(method_to_string(method::unknown), "UNKNOWN");
}
