#include "apicat/core/schema.hpp"

namespace apicat::openapi {

namespace {

bool value_contains_key(const value& v, std::string_view key) {
    if (v.is_object()) {
        for (const auto& m : v.object) {
            if (m.key == key || value_contains_key(m.val, key)) {
                return true;
            }
        }
    } else if (v.is_array()) {
        for (const auto& item : v.array) {
            if (value_contains_key(item, key)) {
                return true;
            }
        }
    }
    return false;
}

bool all_equivalent(const std::vector<schema_ptr>& a, const std::vector<schema_ptr>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (!equivalent(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

bool any_contains_key(const std::vector<schema_ptr>& nodes, std::string_view key) {
    for (const auto& n : nodes) {
        if (n && contains_key(*n, key)) {
            return true;
        }
    }
    return false;
}

} // namespace

const schema_node& schema_node::resolved() const noexcept {
    const schema_node* cur = this;
    while (cur->kind == schema_kind::reference && cur->target) {
        cur = cur->target.get();
    }
    return *cur;
}

const property* schema_node::find_property(std::string_view name) const noexcept {
    for (const auto& p : properties) {
        if (p.name == name) {
            return &p;
        }
    }
    return nullptr;
}

std::optional<std::string_view> schema_node::annotation(std::string_view key) const noexcept {
    return annotations.get_string(key);
}

bool schema_node::operator==(const schema_node& other) const {
    if (kind != other.kind || type_name != other.type_name || ref != other.ref ||
        ref_name != other.ref_name) {
        return false;
    }
    if (!equivalent(target, other.target) || !equivalent(items, other.items) ||
        !equivalent(additional_properties, other.additional_properties)) {
        return false;
    }
    if (properties.size() != other.properties.size()) {
        return false;
    }
    for (size_t i = 0; i < properties.size(); ++i) {
        const auto& a = properties[i];
        const auto& b = other.properties[i];
        if (a.name != b.name || a.required != b.required || !equivalent(a.type, b.type)) {
            return false;
        }
    }
    if (!all_equivalent(all_of, other.all_of) || !all_equivalent(one_of, other.one_of) ||
        !all_equivalent(any_of, other.any_of)) {
        return false;
    }
    if (subschemas.size() != other.subschemas.size()) {
        return false;
    }
    for (size_t i = 0; i < subschemas.size(); ++i) {
        if (subschemas[i].keyword != other.subschemas[i].keyword ||
            !equivalent(subschemas[i].type, other.subschemas[i].type)) {
            return false;
        }
    }
    return enum_values == other.enum_values && annotations == other.annotations;
}

std::string_view schema_kind_name(schema_kind k) noexcept {
    switch (k) {
    case schema_kind::primitive:
        return "primitive";
    case schema_kind::object:
        return "object";
    case schema_kind::array:
        return "array";
    case schema_kind::enumeration:
        return "enum";
    case schema_kind::reference:
        return "reference";
    case schema_kind::composition:
        return "composition";
    case schema_kind::recursive:
        return "recursive";
    }
    return "unknown";
}

bool equivalent(const schema_ptr& a, const schema_ptr& b) {
    if (a == b) {
        return true;
    }
    if (!a || !b) {
        return false;
    }
    return *a == *b;
}

bool contains_key(const schema_node& node, std::string_view key) {
    if (value_contains_key(node.annotations, key)) {
        return true;
    }
    for (const auto& ev : node.enum_values) {
        if (value_contains_key(ev, key)) {
            return true;
        }
    }
    for (const auto& sub : node.subschemas) {
        if (sub.keyword == key || (sub.type && contains_key(*sub.type, key))) {
            return true;
        }
    }
    for (const auto& p : node.properties) {
        if (p.name == key || (p.type && contains_key(*p.type, key))) {
            return true;
        }
    }
    if (node.target && contains_key(*node.target, key)) {
        return true;
    }
    if (node.items && contains_key(*node.items, key)) {
        return true;
    }
    if (node.additional_properties && contains_key(*node.additional_properties, key)) {
        return true;
    }
    return any_contains_key(node.all_of, key) || any_contains_key(node.one_of, key) ||
           any_contains_key(node.any_of, key);
}

} // namespace apicat::openapi
