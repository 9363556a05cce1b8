#include "apicat/core/sanitizer.hpp"

#include <iterator>

namespace apicat::openapi {

schema_sanitizer::schema_sanitizer(std::vector<std::string> denylist, bool strip_vendor_extensions)
    : denylist_(std::make_move_iterator(denylist.begin()), std::make_move_iterator(denylist.end())),
      strip_vendor_extensions_(strip_vendor_extensions) {}

bool schema_sanitizer::is_denied(std::string_view key) const noexcept {
    if (strip_vendor_extensions_ && key.starts_with("x-")) {
        return true;
    }
    return denylist_.find(key) != denylist_.end();
}

value schema_sanitizer::sanitize(const value& v) const {
    if (v.is_object()) {
        value out = value::object_node();
        out.object.reserve(v.object.size());
        for (const auto& m : v.object) {
            if (is_denied(m.key)) {
                continue;
            }
            out.object.push_back(member{m.key, sanitize(m.val)});
        }
        return out;
    }
    if (v.is_array()) {
        value out = value::array_node();
        out.array.reserve(v.array.size());
        for (const auto& item : v.array) {
            out.array.push_back(sanitize(item));
        }
        return out;
    }
    return v;
}

} // namespace apicat::openapi
