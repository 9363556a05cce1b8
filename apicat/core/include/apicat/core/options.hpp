#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace apicat::openapi {

enum class cycle_policy : uint8_t {
    represent, // back edge becomes a recursive node
    reject,    // reference_cycle error
};

struct catalog_options {
    std::string base_url;
    std::vector<std::string> denylist{"xml"};
    bool strip_vendor_extensions = false;
    cycle_policy cycles{cycle_policy::represent};
    bool allow_inline_request_bodies = false;
    std::ostream* log = nullptr;
};

} // namespace apicat::openapi
