#pragma once

#include "value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apicat::openapi {

enum class schema_kind : uint8_t {
    primitive,   // "string", "integer", ... or "any" when nothing is declared
    object,      // properties / additionalProperties
    array,       // items
    enumeration, // literal value set
    reference,   // followed $ref, target holds the resolved schema
    composition, // allOf / oneOf / anyOf only
    recursive,   // back edge of a cyclic $ref chain, never expanded
};

struct schema_node;
using schema_ptr = std::shared_ptr<const schema_node>;

struct property {
    std::string name;
    schema_ptr type;
    bool required = false;
};

// Keyword whose value held a $ref (e.g. "not"), kept resolved instead of as annotation.
struct subschema {
    std::string keyword;
    schema_ptr type;
};

struct schema_node {
    schema_kind kind{schema_kind::primitive};
    std::string type_name;

    // reference / recursive
    std::string ref;
    std::string ref_name;
    schema_ptr target;

    schema_ptr items; // for arrays
    std::vector<property> properties;
    schema_ptr additional_properties;
    std::vector<schema_ptr> all_of;
    std::vector<schema_ptr> one_of;
    std::vector<schema_ptr> any_of;
    std::vector<value> enum_values;

    // Remaining sanitized keywords (format, description, pattern, ...).
    value annotations = value::object_node();
    std::vector<subschema> subschemas;

    // Follows reference nodes down to the schema they stand for.
    [[nodiscard]] const schema_node& resolved() const noexcept;

    [[nodiscard]] const property* find_property(std::string_view name) const noexcept;
    [[nodiscard]] std::optional<std::string_view> annotation(std::string_view key) const noexcept;

    bool operator==(const schema_node& other) const;
};

std::string_view schema_kind_name(schema_kind k) noexcept;

// Structural equality; two null pointers compare equal.
bool equivalent(const schema_ptr& a, const schema_ptr& b);

// True when key appears anywhere in the tree, property names included.
bool contains_key(const schema_node& node, std::string_view key);

} // namespace apicat::openapi
