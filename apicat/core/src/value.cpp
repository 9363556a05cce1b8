#include "apicat/core/value.hpp"

#include <charconv>
#include <cmath>
#include <deque>
#include <utility>

namespace apicat {

const value* value::find(std::string_view key) const noexcept {
    if (k != kind::object) {
        return nullptr;
    }
    for (const auto& m : object) {
        if (m.key == key) {
            return &m.val;
        }
    }
    return nullptr;
}

std::optional<std::string_view> value::get_string(std::string_view key) const noexcept {
    const value* v = find(key);
    if (!v || !v->is_string()) {
        return std::nullopt;
    }
    return std::string_view(v->scalar);
}

std::optional<bool> value::get_bool(std::string_view key) const noexcept {
    const value* v = find(key);
    if (!v) {
        return std::nullopt;
    }
    if (v->is_bool()) {
        return v->boolean;
    }
    if (v->is_string()) {
        if (v->scalar == "true") {
            return true;
        }
        if (v->scalar == "false") {
            return false;
        }
    }
    return std::nullopt;
}

std::optional<double> value::get_number(std::string_view key) const noexcept {
    const value* v = find(key);
    if (!v) {
        return std::nullopt;
    }
    if (v->is_number()) {
        return v->number;
    }
    if (v->is_string()) {
        double d = 0.0;
        auto fc = std::from_chars(v->scalar.data(), v->scalar.data() + v->scalar.size(), d);
        if (fc.ec == std::errc() && fc.ptr == v->scalar.data() + v->scalar.size()) {
            return d;
        }
    }
    return std::nullopt;
}

value& value::set(std::string key, value v) {
    if (k != kind::object) {
        k = kind::object;
        object.clear();
    }
    for (auto& m : object) {
        if (m.key == key) {
            m.val = std::move(v);
            return m.val;
        }
    }
    object.push_back(member{std::move(key), std::move(v)});
    return object.back().val;
}

bool value::operator==(const value& other) const {
    if (k != other.k) {
        return false;
    }
    switch (k) {
    case kind::null:
        return true;
    case kind::boolean:
        return boolean == other.boolean;
    case kind::number:
        return number == other.number;
    case kind::string:
        return scalar == other.scalar;
    case kind::object:
        return object == other.object;
    case kind::array:
        return array == other.array;
    }
    return false;
}

std::string_view kind_name(value::kind k) noexcept {
    switch (k) {
    case value::kind::null:
        return "null";
    case value::kind::boolean:
        return "boolean";
    case value::kind::number:
        return "number";
    case value::kind::string:
        return "string";
    case value::kind::object:
        return "object";
    case value::kind::array:
        return "array";
    }
    return "unknown";
}

const value* find_first_key(const value& root, std::string_view key) {
    std::deque<const value*> queue{&root};
    while (!queue.empty()) {
        const value* cur = queue.front();
        queue.pop_front();
        if (cur->is_object()) {
            for (const auto& m : cur->object) {
                if (m.key == key) {
                    return &m.val;
                }
            }
            for (const auto& m : cur->object) {
                if (m.val.is_object() || m.val.is_array()) {
                    queue.push_back(&m.val);
                }
            }
        } else if (cur->is_array()) {
            for (const auto& item : cur->array) {
                if (item.is_object() || item.is_array()) {
                    queue.push_back(&item);
                }
            }
        }
    }
    return nullptr;
}

std::string scalar_text(const value& v) {
    switch (v.k) {
    case value::kind::null:
        return "null";
    case value::kind::boolean:
        return v.boolean ? "true" : "false";
    case value::kind::number: {
        double integral = 0.0;
        if (std::modf(v.number, &integral) == 0.0 && std::fabs(v.number) < 1e15) {
            return std::to_string(static_cast<long long>(v.number));
        }
        char buf[64];
        auto fc = std::to_chars(buf, buf + sizeof(buf), v.number);
        return std::string(buf, fc.ptr);
    }
    case value::kind::string:
        return v.scalar;
    case value::kind::object:
        return "{...}";
    case value::kind::array:
        return "[...]";
    }
    return {};
}

} // namespace apicat
