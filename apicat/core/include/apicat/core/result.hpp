#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace apicat {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    parse_error = 1,
    io_error = 2,
    invalid_document = 3,
    paths_missing = 4,
    paths_empty = 5,
    unknown_http_method = 6,
    malformed_reference = 7,
    unresolved_reference = 8,
    reference_cycle = 9,
    schema_too_deep = 10,
    invalid_parameter = 11,
    array_parameter_without_items = 12,
    request_body_without_reference = 13,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "apicat"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::parse_error:
            return "failed to decode document";
        case ec::io_error:
            return "failed to read document";
        case ec::invalid_document:
            return "document root is not a mapping";
        case ec::paths_missing:
            return "document has no paths";
        case ec::paths_empty:
            return "document paths are empty";
        case ec::unknown_http_method:
            return "unknown HTTP method";
        case ec::malformed_reference:
            return "malformed $ref pointer";
        case ec::unresolved_reference:
            return "$ref pointer does not resolve";
        case ec::reference_cycle:
            return "cyclic $ref chain";
        case ec::schema_too_deep:
            return "schema nesting too deep";
        case ec::invalid_parameter:
            return "invalid parameter";
        case ec::array_parameter_without_items:
            return "array parameter without items is invalid";
        case ec::request_body_without_reference:
            return "request body has no $ref to a named schema";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

// First error wins; later failures while unwinding keep the first detail.
struct diagnostic {
    std::string location;
    std::string message;
};

inline void set_diagnostic(diagnostic* diag, std::string_view location, std::string_view message) {
    if (!diag || !diag->message.empty()) {
        return;
    }
    diag->location.assign(location.begin(), location.end());
    diag->message.assign(message.begin(), message.end());
}

} // namespace apicat

namespace std {
template <> struct is_error_code_enum<apicat::error_code> : true_type {};
} // namespace std
