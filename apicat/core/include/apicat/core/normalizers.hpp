#pragma once

#include "catalog.hpp"
#include "options.hpp"
#include "ref_resolver.hpp"
#include "result.hpp"
#include "value.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace apicat::openapi {

struct normalize_context {
    const ref_resolver& resolver;
    const catalog_options& options;
    diagnostic* diag = nullptr;
};

// Follows "$ref" chains of parameter / response / request body / path item
// objects until a value without "$ref" is reached.
result<const value*>
follow_object_ref(const value& v, const normalize_context& ctx, std::string_view location);

result<parameter>
normalize_parameter(const value& param, const normalize_context& ctx, std::string_view location);

// "parameters" list; location is the list's own location ("paths./pets.get.parameters").
result<std::vector<parameter>>
normalize_parameters(const value& params, const normalize_context& ctx, std::string_view location);

result<request_body>
normalize_request_body(const value& body, const normalize_context& ctx, std::string_view location);

result<std::vector<response>>
normalize_responses(const value& responses, const normalize_context& ctx, std::string_view location);

// Keys of a "content" mapping, in declaration order.
std::vector<std::string> media_types_of(const value& holder);

// First content/<media>/schema, or nullptr.
const value* content_schema(const value& holder) noexcept;

} // namespace apicat::openapi
