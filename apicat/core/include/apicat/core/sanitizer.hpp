#pragma once

#include "value.hpp"

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace apicat::openapi {

class schema_sanitizer {
public:
    explicit schema_sanitizer(std::vector<std::string> denylist = {"xml"},
                              bool strip_vendor_extensions = false);

    // Copy of v with every denied key removed at any depth.
    [[nodiscard]] value sanitize(const value& v) const;

    [[nodiscard]] bool is_denied(std::string_view key) const noexcept;

private:
    std::set<std::string, std::less<>> denylist_;
    bool strip_vendor_extensions_;
};

} // namespace apicat::openapi
