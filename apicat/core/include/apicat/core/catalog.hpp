#pragma once

#include "http.hpp"
#include "schema.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apicat::openapi {

enum class param_location : uint8_t { path, query, header, cookie, body, form_data };

std::optional<param_location> parse_param_location(std::string_view in) noexcept;
std::string_view param_location_name(param_location loc) noexcept;

struct parameter {
    std::string name;
    param_location in{param_location::query};
    std::optional<std::string> description;
    bool required = false;
    bool deprecated = false;

    schema_ptr type;   // effective type: inline, schema.type, schema.$ref or content schema
    schema_ptr items;  // set when type is an array; carries item enum/default
    schema_ptr schema; // nested schema object as declared

    std::optional<std::string> pattern;
    std::optional<std::string> format;
    std::optional<size_t> max_length;
    std::optional<double> minimum;
    std::optional<double> maximum;
};

struct request_body {
    std::optional<std::string> description;
    bool required = false;
    schema_ptr schema;
    std::vector<std::string> media_types;
};

enum class response_shape : uint8_t { direct, array };

struct return_schema {
    response_shape shape{response_shape::direct};
    schema_ptr schema; // item schema for arrays
};

struct response {
    std::string code; // key verbatim: "200", "default", "2XX"
    int status = 0;   // 0 for default and range keys
    bool is_default = false;
    std::optional<std::string> description;
    std::optional<return_schema> returns;
    std::vector<std::string> media_types;
};

struct method_entry {
    std::string url;
    std::string path;
    http::method verb{http::method::get};
    std::optional<std::string> operation_id;
    std::optional<std::string> summary;
    std::optional<std::string> description;
    std::vector<std::string> input_formats;
    std::vector<std::string> output_formats;
    std::optional<std::vector<parameter>> parameters;
    std::optional<request_body> body;
    std::optional<std::vector<response>> responses;

    [[nodiscard]] const parameter* find_parameter(std::string_view name) const noexcept;
    [[nodiscard]] const response* find_response(std::string_view code) const noexcept;
};

struct catalog {
    std::string spec_version; // "2.0", "3.0.3", ... empty when undeclared
    std::vector<method_entry> methods;
    size_t deprecated_skipped = 0;

    [[nodiscard]] const method_entry* find(http::method verb, std::string_view path) const noexcept;
};

} // namespace apicat::openapi
