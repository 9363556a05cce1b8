#include "apicat/core/catalog.hpp"

namespace apicat::openapi {

std::optional<param_location> parse_param_location(std::string_view in) noexcept {
    if (in == "path") return param_location::path;
    if (in == "query") return param_location::query;
    if (in == "header") return param_location::header;
    if (in == "cookie") return param_location::cookie;
    if (in == "body") return param_location::body;
    if (in == "formData") return param_location::form_data;
    return std::nullopt;
}

std::string_view param_location_name(param_location loc) noexcept {
    switch (loc) {
        case param_location::path: return "path";
        case param_location::query: return "query";
        case param_location::header: return "header";
        case param_location::cookie: return "cookie";
        case param_location::body: return "body";
        case param_location::form_data: return "formData";
    }
    return "unknown";
}

const parameter* method_entry::find_parameter(std::string_view name) const noexcept {
    if (!parameters) {
        return nullptr;
    }
    for (const auto& p : *parameters) {
        if (p.name == name) {
            return &p;
        }
    }
    return nullptr;
}

const response* method_entry::find_response(std::string_view code) const noexcept {
    if (!responses) {
        return nullptr;
    }
    for (const auto& r : *responses) {
        if (r.code == code) {
            return &r;
        }
    }
    return nullptr;
}

const method_entry* catalog::find(http::method verb, std::string_view path) const noexcept {
    for (const auto& m : methods) {
        if (m.verb == verb && m.path == path) {
            return &m;
        }
    }
    return nullptr;
}

} // namespace apicat::openapi
