#include "apicat/core/normalizers.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <optional>

namespace apicat::openapi {

namespace {

// Parameter-object keys that are not part of the inline (Swagger 2.0) schema.
constexpr std::array<std::string_view, 14> kParameterOnlyKeys = {
    "name",  "in",      "description", "required", "deprecated", "allowEmptyValue",
    "style", "explode", "allowReserved", "collectionFormat", "schema", "content",
    "example", "examples"};

value inline_schema(const value& param) {
    value out = value::object_node();
    for (const auto& m : param.object) {
        if (std::find(kParameterOnlyKeys.begin(), kParameterOnlyKeys.end(), m.key) !=
            kParameterOnlyKeys.end()) {
            continue;
        }
        out.object.push_back(m);
    }
    return out;
}

const value* object_field(const value* holder, std::string_view key) noexcept {
    if (!holder) {
        return nullptr;
    }
    const value* v = holder->find(key);
    return v && v->is_object() ? v : nullptr;
}

std::optional<std::string> first_string(const value& param, const value* schema, std::string_view key) {
    if (auto s = param.get_string(key)) {
        return std::string(*s);
    }
    if (schema) {
        if (auto s = schema->get_string(key)) {
            return std::string(*s);
        }
    }
    return std::nullopt;
}

std::optional<double> first_number(const value& param, const value* schema, std::string_view key) {
    if (auto n = param.get_number(key)) {
        return n;
    }
    if (schema) {
        return schema->get_number(key);
    }
    return std::nullopt;
}

result<parameter> fail(const normalize_context& ctx,
                       std::string_view location,
                       error_code code,
                       std::string_view message) {
    set_diagnostic(ctx.diag, location, message);
    return std::unexpected(make_error_code(code));
}

// Non-integral and negative lengths carry no limit; huge ones saturate.
std::optional<size_t> length_limit(double n) noexcept {
    if (!(n >= 0) || std::trunc(n) != n) {
        return std::nullopt;
    }
    constexpr auto kMax = std::numeric_limits<size_t>::max();
    if (n >= static_cast<double>(kMax)) {
        return kMax;
    }
    return static_cast<size_t>(n);
}

} // namespace

result<parameter>
normalize_parameter(const value& param, const normalize_context& ctx, std::string_view location) {
    auto followed = follow_object_ref(param, ctx, location);
    if (!followed) {
        return std::unexpected(followed.error());
    }
    const value& p = **followed;
    if (!p.is_object()) {
        return fail(ctx,
                    location,
                    error_code::invalid_parameter,
                    "parameter must be a mapping, got " + std::string(kind_name(p.k)));
    }

    parameter out;
    auto name = p.get_string("name");
    if (!name) {
        return fail(ctx, location, error_code::invalid_parameter, "parameter has no name");
    }
    out.name = std::string(*name);

    auto in = p.get_string("in");
    auto loc = in ? parse_param_location(*in) : std::nullopt;
    if (!loc) {
        return fail(ctx,
                    location,
                    error_code::invalid_parameter,
                    "parameter '" + out.name + "' has unsupported location '" +
                        std::string(in.value_or("")) + "'");
    }
    out.in = *loc;

    if (auto d = p.get_string("description")) {
        out.description = std::string(*d);
    }
    out.required = p.get_bool("required").value_or(false);
    out.deprecated = p.get_bool("deprecated").value_or(false);

    const value* schema_v = object_field(&p, "schema");
    if (schema_v) {
        auto built = ctx.resolver.build(*schema_v, ctx.diag);
        if (!built) {
            return std::unexpected(built.error());
        }
        out.schema = std::move(*built);
    }

    bool declared_array = false;
    if (auto inline_type = p.get_string("type")) {
        auto built = ctx.resolver.build(inline_schema(p), ctx.diag);
        if (!built) {
            return std::unexpected(built.error());
        }
        out.type = std::move(*built);
        declared_array = *inline_type == "array";
    } else if (schema_v) {
        out.type = out.schema;
        declared_array = schema_v->get_string("type").value_or("") == "array";
    } else if (const value* cs = content_schema(p)) {
        auto built = ctx.resolver.build(*cs, ctx.diag);
        if (!built) {
            return std::unexpected(built.error());
        }
        out.type = std::move(*built);
        out.schema = out.type;
    } else {
        return fail(ctx,
                    location,
                    error_code::invalid_parameter,
                    "parameter '" + out.name + "' declares no type");
    }

    if (declared_array || out.type->resolved().kind == schema_kind::array) {
        const value* items_v = object_field(&p, "items");
        if (!items_v) {
            items_v = object_field(schema_v, "items");
        }
        if (items_v) {
            if (!items_v->contains("type") && !items_v->contains("$ref")) {
                return fail(ctx,
                            location,
                            error_code::array_parameter_without_items,
                            "array parameter '" + out.name +
                                "' items carry neither type nor $ref");
            }
            auto item = ctx.resolver.build(*items_v, ctx.diag);
            if (!item) {
                return std::unexpected(item.error());
            }
            out.items = std::move(*item);
        } else if (!declared_array && out.type->resolved().items) {
            out.items = out.type->resolved().items;
        } else {
            return fail(ctx,
                        location,
                        error_code::array_parameter_without_items,
                        "array parameter '" + out.name + "' without items is invalid");
        }
    }

    out.pattern = first_string(p, schema_v, "pattern");
    out.format = first_string(p, schema_v, "format");
    if (auto n = first_number(p, schema_v, "maxLength")) {
        out.max_length = length_limit(*n);
    }
    out.minimum = first_number(p, schema_v, "minimum");
    out.maximum = first_number(p, schema_v, "maximum");
    return out;
}

result<std::vector<parameter>>
normalize_parameters(const value& params, const normalize_context& ctx, std::string_view location) {
    if (!params.is_array()) {
        set_diagnostic(ctx.diag,
                       location,
                       "parameters must be a list, got " + std::string(kind_name(params.k)));
        return std::unexpected(make_error_code(error_code::invalid_parameter));
    }
    std::vector<parameter> out;
    out.reserve(params.array.size());
    for (size_t i = 0; i < params.array.size(); ++i) {
        std::string item_location = std::string(location) + "[" + std::to_string(i) + "]";
        auto p = normalize_parameter(params.array[i], ctx, item_location);
        if (!p) {
            return std::unexpected(p.error());
        }
        out.push_back(std::move(*p));
    }
    return out;
}

} // namespace apicat::openapi
