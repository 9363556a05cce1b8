#pragma once

#include <cstdint>
#include <string_view>

namespace apicat::http {

enum class method : uint8_t { get, put, post, del, options, head, patch, trace, unknown };

// Accepts both the OpenAPI path-item spelling ("get") and the wire spelling ("GET").
method parse_method(std::string_view str) noexcept;
std::string_view method_to_string(method m) noexcept;

} // namespace apicat::http
