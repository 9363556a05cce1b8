#include "apicat/core/normalizers.hpp"

#include <charconv>

namespace apicat::openapi {

namespace {

value reference_to(std::string_view pointer) {
    value v = value::object_node();
    v.set("$ref", value::string_node(std::string(pointer)));
    return v;
}

void parse_status(std::string_view code, response& out) {
    if (code == "default") {
        out.is_default = true;
        return;
    }
    int status = 0;
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
    if (ec == std::errc{} && ptr == code.data() + code.size()) {
        out.status = status;
    }
}

return_schema classify(const schema_ptr& node) {
    const schema_node& target = node->resolved();
    if (target.kind == schema_kind::array) {
        return return_schema{response_shape::array, target.items};
    }
    return return_schema{response_shape::direct, node};
}

result<std::optional<return_schema>>
locate_return_schema(const value& r, const normalize_context& ctx) {
    const value* schema_v = r.find("schema");
    if (!schema_v || !schema_v->is_object()) {
        schema_v = content_schema(r);
    }
    if (schema_v) {
        auto built = ctx.resolver.build(*schema_v, ctx.diag);
        if (!built) {
            return std::unexpected(built.error());
        }
        return classify(*built);
    }

    // Non-standard layouts: first pointer and first type anywhere below,
    // outside of the subtrees that never describe the body.
    static const schema_sanitizer body_only({"headers", "links", "examples", "example"}, false);
    const value body = body_only.sanitize(r);
    const value* ref = find_first_key(body, "$ref");
    if (!ref || !ref->is_string()) {
        return std::optional<return_schema>{};
    }
    auto built = ctx.resolver.build(reference_to(ref->scalar), ctx.diag);
    if (!built) {
        return std::unexpected(built.error());
    }
    const value* type = find_first_key(body, "type");
    bool declared_array = type && type->is_string() && type->scalar == "array";
    if (declared_array && (*built)->resolved().kind != schema_kind::array) {
        return return_schema{response_shape::array, *built};
    }
    return classify(*built);
}

} // namespace

result<std::vector<response>>
normalize_responses(const value& responses, const normalize_context& ctx, std::string_view location) {
    std::vector<response> out;
    if (!responses.is_object()) {
        return out;
    }
    out.reserve(responses.object.size());
    for (const auto& m : responses.object) {
        std::string entry_location = std::string(location) + "." + m.key;
        auto followed = follow_object_ref(m.val, ctx, entry_location);
        if (!followed) {
            return std::unexpected(followed.error());
        }
        const value& r = **followed;

        response res;
        res.code = m.key;
        parse_status(m.key, res);
        if (!r.is_object()) {
            out.push_back(std::move(res));
            continue;
        }
        if (auto d = r.get_string("description")) {
            res.description = std::string(*d);
        }
        res.media_types = media_types_of(r);

        auto returns = locate_return_schema(r, ctx);
        if (!returns) {
            return std::unexpected(returns.error());
        }
        res.returns = std::move(*returns);
        out.push_back(std::move(res));
    }
    return out;
}

} // namespace apicat::openapi
