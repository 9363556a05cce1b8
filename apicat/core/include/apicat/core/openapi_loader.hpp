#pragma once

#include "result.hpp"
#include "value.hpp"

#include <string_view>

namespace apicat::openapi {

// JSON when the trimmed text starts with '{' or '[', YAML otherwise.
result<value> load_from_string(std::string_view text, diagnostic* diag = nullptr);
result<value> load_from_file(const char* path, diagnostic* diag = nullptr);

} // namespace apicat::openapi
