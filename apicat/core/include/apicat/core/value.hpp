#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace apicat {

struct member;

// Decoded JSON/YAML document. Mappings keep declaration order.
struct value {
    enum class kind : uint8_t { null, boolean, number, string, object, array };

    kind k{kind::null};
    bool boolean = false;
    double number = 0.0;
    std::string scalar;
    std::vector<member> object;
    std::vector<value> array;

    static value null_node();
    static value bool_node(bool b);
    static value number_node(double d);
    static value string_node(std::string s);
    static value object_node();
    static value array_node();

    [[nodiscard]] bool is_null() const noexcept { return k == kind::null; }
    [[nodiscard]] bool is_bool() const noexcept { return k == kind::boolean; }
    [[nodiscard]] bool is_number() const noexcept { return k == kind::number; }
    [[nodiscard]] bool is_string() const noexcept { return k == kind::string; }
    [[nodiscard]] bool is_object() const noexcept { return k == kind::object; }
    [[nodiscard]] bool is_array() const noexcept { return k == kind::array; }

    [[nodiscard]] const value* find(std::string_view key) const noexcept;
    [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }

    [[nodiscard]] std::optional<std::string_view> get_string(std::string_view key) const noexcept;
    [[nodiscard]] std::optional<bool> get_bool(std::string_view key) const noexcept;
    [[nodiscard]] std::optional<double> get_number(std::string_view key) const noexcept;

    // Appends, or replaces the value of an existing key in place.
    value& set(std::string key, value v);

    bool operator==(const value& other) const;
};

struct member {
    std::string key;
    value val;

    bool operator==(const member& other) const = default;
};

inline value value::null_node() {
    return value{};
}

inline value value::bool_node(bool b) {
    value n;
    n.k = kind::boolean;
    n.boolean = b;
    return n;
}

inline value value::number_node(double d) {
    value n;
    n.k = kind::number;
    n.number = d;
    return n;
}

inline value value::string_node(std::string s) {
    value n;
    n.k = kind::string;
    n.scalar = std::move(s);
    return n;
}

inline value value::object_node() {
    value n;
    n.k = kind::object;
    return n;
}

inline value value::array_node() {
    value n;
    n.k = kind::array;
    return n;
}

std::string_view kind_name(value::kind k) noexcept;

// Breadth-first search: all keys of a mapping are checked before any nested
// container is visited, left to right. Returns the first value stored under key.
const value* find_first_key(const value& root, std::string_view key);

// Scalar rendering used by diagnostics and dumps ("42", "true", "text").
std::string scalar_text(const value& v);

} // namespace apicat
