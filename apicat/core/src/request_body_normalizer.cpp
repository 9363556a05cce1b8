#include "apicat/core/normalizers.hpp"

namespace apicat::openapi {

namespace {

// UTF-8 code points; continuation bytes are not counted.
size_t char_count(std::string_view s) noexcept {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

} // namespace

result<request_body>
normalize_request_body(const value& body, const normalize_context& ctx, std::string_view location) {
    auto followed = follow_object_ref(body, ctx, location);
    if (!followed) {
        return std::unexpected(followed.error());
    }
    const value& b = **followed;

    const value* ref = find_first_key(b, "$ref");
    if ((!ref || !ref->is_string()) && !ctx.options.allow_inline_request_bodies) {
        set_diagnostic(ctx.diag, location, "request body has no $ref to a named schema");
        return std::unexpected(make_error_code(error_code::request_body_without_reference));
    }

    request_body out;
    if (!b.is_object()) {
        return out;
    }
    if (auto d = b.get_string("description"); d && char_count(*d) > 1) {
        out.description = std::string(*d);
    }
    out.required = b.get_bool("required").value_or(false);
    out.media_types = media_types_of(b);

    const value* schema_v = content_schema(b);
    if (!schema_v) {
        const value* direct = b.find("schema");
        schema_v = direct && direct->is_object() ? direct : nullptr;
    }

    if (schema_v) {
        auto built = ctx.resolver.build(*schema_v, ctx.diag);
        if (!built) {
            return std::unexpected(built.error());
        }
        out.schema = std::move(*built);
    } else if (ref && ref->is_string()) {
        value pointer = value::object_node();
        pointer.set("$ref", value::string_node(ref->scalar));
        auto built = ctx.resolver.build(pointer, ctx.diag);
        if (!built) {
            return std::unexpected(built.error());
        }
        out.schema = std::move(*built);
    }
    return out;
}

} // namespace apicat::openapi
