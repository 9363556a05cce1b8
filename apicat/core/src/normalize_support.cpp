#include "apicat/core/normalizers.hpp"

#include <algorithm>

namespace apicat::openapi {

result<const value*>
follow_object_ref(const value& v, const normalize_context& ctx, std::string_view location) {
    const value* cur = &v;
    std::vector<std::string_view> seen;
    while (cur->is_object()) {
        auto ref = cur->get_string("$ref");
        if (!ref) {
            break;
        }
        if (std::find(seen.begin(), seen.end(), *ref) != seen.end()) {
            set_diagnostic(ctx.diag, location, "cyclic $ref chain through " + std::string(*ref));
            return std::unexpected(make_error_code(error_code::reference_cycle));
        }
        seen.push_back(*ref);
        auto target = ctx.resolver.lookup(*ref, ctx.diag);
        if (!target) {
            return std::unexpected(target.error());
        }
        cur = *target;
    }
    return cur;
}

std::vector<std::string> media_types_of(const value& holder) {
    std::vector<std::string> out;
    const value* content = holder.find("content");
    if (!content || !content->is_object()) {
        return out;
    }
    out.reserve(content->object.size());
    for (const auto& m : content->object) {
        out.push_back(m.key);
    }
    return out;
}

const value* content_schema(const value& holder) noexcept {
    const value* content = holder.find("content");
    if (!content || !content->is_object()) {
        return nullptr;
    }
    for (const auto& m : content->object) {
        const value* schema = m.val.find("schema");
        if (schema && schema->is_object()) {
            return schema;
        }
    }
    return nullptr;
}

} // namespace apicat::openapi
