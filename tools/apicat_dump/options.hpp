#pragma once

#include <string>
#include <vector>

namespace apicat_dump {

struct options {
    std::string input;
    std::string base_url;
    std::string source; // document location the base URL is derived from
    std::vector<std::string> denylist{"xml"};
    bool strip_extensions = false;
    bool reject_cycles = false;
    bool allow_inline_bodies = false;
    bool json_output = false;
    bool check_only = false;
    bool verbose = false;
};

[[noreturn]] void print_usage();
options parse_args(int argc, char** argv);

// "xml,example" -> {"xml", "example"}; empty items dropped.
std::vector<std::string> split_list(const std::string& csv);

} // namespace apicat_dump
