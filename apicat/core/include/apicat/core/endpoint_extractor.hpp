#pragma once

#include "catalog.hpp"
#include "options.hpp"
#include "result.hpp"
#include "value.hpp"

#include <string>
#include <string_view>

namespace apicat::openapi {

// Walks paths x verbs of an OpenAPI 3.x / Swagger 2.0 document. All or
// nothing: the first fatal error aborts the walk and no catalog is returned.
result<catalog>
build_catalog(const value& doc, const catalog_options& opts, diagnostic* diag = nullptr);

// Location with its last path segment removed:
// "https://h/v2/swagger.json" -> "https://h/v2".
std::string derive_base_url(std::string_view location);

} // namespace apicat::openapi
