#include "apicat/core/ref_resolver.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace apicat::openapi {

namespace {

constexpr std::array<std::string_view, 10> kStructuralKeys = {
    "$ref", "type", "enum", "items", "properties", "additionalProperties",
    "required", "allOf", "oneOf", "anyOf"};

constexpr std::array<std::string_view, 9> kSchemaKeywords = {
    "$ref", "type", "enum", "items", "properties", "additionalProperties",
    "allOf", "oneOf", "anyOf"};

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// URI fragment percent-decoding, then JSON pointer "~1" -> "/", "~0" -> "~".
std::string decode_segment(std::string_view raw) {
    std::string pct;
    pct.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '%' && i + 2 < raw.size()) {
            int hi = hex_value(raw[i + 1]);
            int lo = hex_value(raw[i + 2]);
            if (hi >= 0 && lo >= 0) {
                pct.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        pct.push_back(raw[i]);
    }

    std::string out;
    out.reserve(pct.size());
    for (size_t i = 0; i < pct.size(); ++i) {
        if (pct[i] == '~' && i + 1 < pct.size()) {
            if (pct[i + 1] == '1') {
                out.push_back('/');
                ++i;
                continue;
            }
            if (pct[i + 1] == '0') {
                out.push_back('~');
                ++i;
                continue;
            }
        }
        out.push_back(pct[i]);
    }
    return out;
}

std::vector<std::string> split_pointer(std::string_view body) {
    std::vector<std::string> segments;
    // body starts with '/'
    size_t pos = 1;
    while (true) {
        size_t next = body.find('/', pos);
        if (next == std::string_view::npos) {
            segments.push_back(decode_segment(body.substr(pos)));
            break;
        }
        segments.push_back(decode_segment(body.substr(pos, next - pos)));
        pos = next + 1;
    }
    return segments;
}

std::optional<std::string> declared_type(const value& type) {
    if (type.is_string()) {
        return type.scalar;
    }
    if (type.is_array()) {
        // OpenAPI 3.1 ["string", "null"]
        for (const auto& t : type.array) {
            if (t.is_string() && t.scalar != "null") {
                return t.scalar;
            }
        }
    }
    return std::nullopt;
}

bool is_structural(std::string_view key) noexcept {
    return std::find(kStructuralKeys.begin(), kStructuralKeys.end(), key) != kStructuralKeys.end();
}

bool looks_like_schema(const value& v) noexcept {
    if (!v.is_object()) {
        return false;
    }
    return std::any_of(kSchemaKeywords.begin(), kSchemaKeywords.end(), [&](std::string_view k) {
        return v.contains(k);
    });
}

} // namespace

std::string pointer_name(std::string_view pointer) {
    size_t slash = pointer.rfind('/');
    if (slash == std::string_view::npos) {
        return std::string(pointer);
    }
    return decode_segment(pointer.substr(slash + 1));
}

ref_resolver::ref_resolver(const value& root,
                           const schema_sanitizer& sanitizer,
                           cycle_policy cycles) noexcept
    : root_(root), sanitizer_(sanitizer), cycles_(cycles) {}

result<const value*> ref_resolver::lookup(std::string_view pointer, diagnostic* diag) const {
    if (pointer.empty() || pointer.front() != '#') {
        set_diagnostic(diag, pointer, "only local '#/...' pointers are supported");
        return std::unexpected(make_error_code(error_code::malformed_reference));
    }
    std::string_view body = pointer.substr(1);
    if (body.empty()) {
        return &root_;
    }
    if (body.front() != '/') {
        set_diagnostic(diag, pointer, "pointer must start with '#/'");
        return std::unexpected(make_error_code(error_code::malformed_reference));
    }

    const value* cur = &root_;
    for (const auto& segment : split_pointer(body)) {
        const value* next = nullptr;
        if (cur->is_object()) {
            next = cur->find(segment);
        } else if (cur->is_array()) {
            size_t index = 0;
            auto [ptr, ec] =
                std::from_chars(segment.data(), segment.data() + segment.size(), index);
            if (ec == std::errc{} && ptr == segment.data() + segment.size() &&
                index < cur->array.size()) {
                next = &cur->array[index];
            }
        }
        if (!next) {
            set_diagnostic(diag, pointer, "segment '" + segment + "' not found");
            return std::unexpected(make_error_code(error_code::unresolved_reference));
        }
        cur = next;
    }
    return cur;
}

result<schema_ptr> ref_resolver::resolve(std::string_view pointer, diagnostic* diag) const {
    walk_state st;
    st.diag = diag;
    return expand_pointer(pointer, st, 0);
}

result<schema_ptr> ref_resolver::build(const value& schema, diagnostic* diag) const {
    walk_state st;
    st.diag = diag;
    return build_schema(schema, st, 0);
}

const value* ref_resolver::structural(const value& schema, std::string_view key) const noexcept {
    if (sanitizer_.is_denied(key)) {
        return nullptr;
    }
    return schema.find(key);
}

result<schema_ptr>
ref_resolver::expand_pointer(std::string_view pointer, walk_state& st, int depth) const {
    if (auto hit = memo_.find(pointer); hit != memo_.end()) {
        if (depth + hit->second.height <= kMaxSchemaDepth) {
            st.deepest = std::max(st.deepest, depth + hit->second.height);
            return hit->second.node;
        }
    }

    auto target = lookup(pointer, st.diag);
    if (!target) {
        return std::unexpected(target.error());
    }

    const size_t outer_back_edge = st.lowest_back_edge;
    const int outer_deepest = st.deepest;
    const size_t index = st.stack.size();
    st.lowest_back_edge = kNoBackEdge;
    st.deepest = depth;

    st.stack.emplace_back(pointer);
    auto built = build_schema(**target, st, depth);
    st.stack.pop_back();

    const int height = st.deepest - depth;
    // An expansion that closed no cycle is the same from every starting point.
    if (built && st.lowest_back_edge == kNoBackEdge) {
        memo_.emplace(std::string(pointer), memo_entry{*built, height});
    }
    if (st.lowest_back_edge >= index) {
        st.lowest_back_edge = outer_back_edge;
    } else {
        st.lowest_back_edge = std::min(outer_back_edge, st.lowest_back_edge);
    }
    st.deepest = std::max(outer_deepest, st.deepest);
    return built;
}

result<schema_ptr>
ref_resolver::build_reference(std::string_view pointer, walk_state& st, int depth) const {
    auto on_path = std::find(st.stack.begin(), st.stack.end(), pointer);
    if (on_path != st.stack.end()) {
        if (cycles_ == cycle_policy::reject) {
            set_diagnostic(st.diag, pointer, "cyclic $ref chain through " + std::string(pointer));
            return std::unexpected(make_error_code(error_code::reference_cycle));
        }
        st.lowest_back_edge = std::min(
            st.lowest_back_edge, static_cast<size_t>(std::distance(st.stack.begin(), on_path)));
        auto node = std::make_shared<schema_node>();
        node->kind = schema_kind::recursive;
        node->ref = std::string(pointer);
        node->ref_name = pointer_name(pointer);
        return node;
    }

    auto target = expand_pointer(pointer, st, depth);
    if (!target) {
        return std::unexpected(target.error());
    }
    auto node = std::make_shared<schema_node>();
    node->kind = schema_kind::reference;
    node->ref = std::string(pointer);
    node->ref_name = pointer_name(pointer);
    node->target = std::move(*target);
    return node;
}

result<std::vector<schema_ptr>>
ref_resolver::build_members(const value& list, walk_state& st, int depth) const {
    std::vector<schema_ptr> members;
    members.reserve(list.array.size());
    for (const auto& item : list.array) {
        auto built = build_schema(item, st, depth + 1);
        if (!built) {
            return std::unexpected(built.error());
        }
        members.push_back(std::move(*built));
    }
    return members;
}

result<void> ref_resolver::build_subschemas(std::string_view keyword,
                                            const value& v,
                                            schema_node& node,
                                            walk_state& st,
                                            int depth) const {
    auto add = [&](std::string key, const value& schema) -> result<void> {
        auto built = build_schema(schema, st, depth + 1);
        if (!built) {
            return std::unexpected(built.error());
        }
        node.subschemas.push_back(subschema{std::move(key), std::move(*built)});
        return {};
    };

    std::string base(keyword);
    if (v.is_array()) {
        for (size_t i = 0; i < v.array.size(); ++i) {
            if (auto r = add(base + "/" + std::to_string(i), v.array[i]); !r) {
                return r;
            }
        }
        return {};
    }
    if (v.is_object() && !looks_like_schema(v)) {
        // map of schemas (patternProperties, dependentSchemas, ...)
        for (const auto& m : v.object) {
            if (sanitizer_.is_denied(m.key)) {
                continue;
            }
            if (auto r = add(base + "/" + m.key, m.val); !r) {
                return r;
            }
        }
        return {};
    }
    return add(std::move(base), v);
}

result<schema_ptr>
ref_resolver::build_schema(const value& schema, walk_state& st, int depth) const {
    if (depth > kMaxSchemaDepth) {
        set_diagnostic(st.diag,
                       st.stack.empty() ? std::string_view("#") : std::string_view(st.stack.back()),
                       "schema nesting exceeds " + std::to_string(kMaxSchemaDepth) + " levels");
        return std::unexpected(make_error_code(error_code::schema_too_deep));
    }
    st.deepest = std::max(st.deepest, depth);

    auto node = std::make_shared<schema_node>();
    if (!schema.is_object()) {
        node->type_name = "any";
        return node;
    }

    if (const value* ref = structural(schema, "$ref")) {
        if (!ref->is_string()) {
            set_diagnostic(st.diag,
                           st.stack.empty() ? std::string_view("#") : std::string_view(st.stack.back()),
                           "$ref value must be a string, got " + std::string(kind_name(ref->k)));
            return std::unexpected(make_error_code(error_code::malformed_reference));
        }
        return build_reference(ref->scalar, st, depth);
    }

    const value* type_v = structural(schema, "type");
    const value* enum_v = structural(schema, "enum");
    const value* items_v = structural(schema, "items");
    const value* props_v = structural(schema, "properties");
    const value* addl_v = structural(schema, "additionalProperties");
    const value* required_v = structural(schema, "required");
    const value* all_of_v = structural(schema, "allOf");
    const value* one_of_v = structural(schema, "oneOf");
    const value* any_of_v = structural(schema, "anyOf");

    std::optional<std::string> type = type_v ? declared_type(*type_v) : std::nullopt;

    if (all_of_v && all_of_v->is_array() && all_of_v->array.size() == 1) {
        size_t kept = 0;
        for (const auto& m : schema.object) {
            if (!sanitizer_.is_denied(m.key)) {
                ++kept;
            }
        }
        if (kept == 1) {
            return build_schema(all_of_v->array.front(), st, depth + 1);
        }
    }

    bool consumed_enum = false;
    bool consumed_items = false;
    bool consumed_props = false;

    if (enum_v && enum_v->is_array()) {
        node->kind = schema_kind::enumeration;
        node->type_name = type.value_or("any");
        for (const auto& ev : enum_v->array) {
            node->enum_values.push_back(sanitizer_.sanitize(ev));
        }
        consumed_enum = true;
    } else if (type == "array" || (items_v && !type)) {
        node->kind = schema_kind::array;
        node->type_name = "array";
        if (items_v && items_v->is_object()) {
            auto item = build_schema(*items_v, st, depth + 1);
            if (!item) {
                return std::unexpected(item.error());
            }
            node->items = std::move(*item);
            consumed_items = true;
        }
    } else if (type == "object" || (props_v && props_v->is_object()) ||
               (addl_v && addl_v->is_object() && !type)) {
        node->kind = schema_kind::object;
        node->type_name = "object";
        if (props_v && props_v->is_object()) {
            for (const auto& m : props_v->object) {
                if (sanitizer_.is_denied(m.key)) {
                    continue;
                }
                auto prop = build_schema(m.val, st, depth + 1);
                if (!prop) {
                    return std::unexpected(prop.error());
                }
                node->properties.push_back(property{m.key, std::move(*prop), false});
            }
            consumed_props = true;
        }
        if (required_v && required_v->is_array()) {
            for (const auto& name : required_v->array) {
                if (!name.is_string()) {
                    continue;
                }
                for (auto& p : node->properties) {
                    if (p.name == name.scalar) {
                        p.required = true;
                    }
                }
            }
        }
    } else if ((all_of_v && all_of_v->is_array()) || (one_of_v && one_of_v->is_array()) ||
               (any_of_v && any_of_v->is_array())) {
        node->kind = schema_kind::composition;
        node->type_name = type.value_or("");
    } else if (type) {
        node->kind = schema_kind::primitive;
        node->type_name = *type;
    } else {
        value clean = sanitizer_.sanitize(schema);
        const value* nested = find_first_key(clean, "$ref");
        if (nested && nested->is_string()) {
            return build_reference(nested->scalar, st, depth);
        }
        node->kind = schema_kind::primitive;
        node->type_name = "any";
    }

    if (node->kind == schema_kind::object && addl_v && addl_v->is_object()) {
        auto addl = build_schema(*addl_v, st, depth + 1);
        if (!addl) {
            return std::unexpected(addl.error());
        }
        node->additional_properties = std::move(*addl);
    }

    const std::pair<const value*, std::vector<schema_ptr>*> compositions[] = {
        {all_of_v, &node->all_of}, {one_of_v, &node->one_of}, {any_of_v, &node->any_of}};
    for (const auto& [list, out] : compositions) {
        if (!list || !list->is_array()) {
            continue;
        }
        auto members = build_members(*list, st, depth);
        if (!members) {
            return std::unexpected(members.error());
        }
        *out = std::move(*members);
    }

    for (const auto& m : schema.object) {
        if (sanitizer_.is_denied(m.key)) {
            continue;
        }
        if (is_structural(m.key)) {
            bool keep_as_annotation =
                (m.key == "type" && !type) || (m.key == "enum" && !consumed_enum) ||
                (m.key == "items" && !consumed_items) ||
                (m.key == "properties" && !consumed_props) ||
                (m.key == "additionalProperties" && !m.val.is_object()) ||
                (m.key == "required" &&
                 (node->kind != schema_kind::object || !m.val.is_array())) ||
                ((m.key == "allOf" || m.key == "oneOf" || m.key == "anyOf") &&
                 !m.val.is_array());
            if (!keep_as_annotation) {
                continue;
            }
        }

        value clean = sanitizer_.sanitize(m.val);
        if (find_first_key(clean, "$ref")) {
            if (auto r = build_subschemas(m.key, clean, *node, st, depth); !r) {
                return std::unexpected(r.error());
            }
            continue;
        }
        node->annotations.set(m.key, std::move(clean));
    }

    return node;
}

} // namespace apicat::openapi
