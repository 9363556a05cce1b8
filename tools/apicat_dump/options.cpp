#include "options.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace apicat_dump {

[[noreturn]] void print_usage() {
    std::cout << R"(apicat_dump - build the operation catalog of an OpenAPI / Swagger document

Usage:
  apicat_dump -i <file> [options]

Options:
  -i, --input <file>         API description path (JSON/YAML)
  --base-url <url>           Prefix for every path template
  --source <url>             Document location; base URL is its parent
  --deny <k1,k2>             Keys stripped from schemas (default: xml)
  --strip-extensions         Also strip x-* keys from schemas
  --reject-cycles            Fail on cyclic $ref chains instead of marking them
  --allow-inline-bodies      Accept request bodies without any $ref
  --json                     Print the catalog as JSON
  --check                    Print the summary line only
  -v, --verbose              Progress lines on stderr
  -h, --help                 Show this help
)";
    std::exit(1);
}

std::vector<std::string> split_list(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t comma = csv.find(',', start);
        if (comma == std::string::npos) {
            comma = csv.size();
        }
        if (comma > start) {
            out.push_back(csv.substr(start, comma - start));
        }
        start = comma + 1;
    }
    return out;
}

options parse_args(int argc, char** argv) {
    options opts;
    if (argc < 2) {
        print_usage();
    }
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
        } else if (arg == "-i" || arg == "--input") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.input = argv[++i];
        } else if (arg == "--base-url") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.base_url = argv[++i];
        } else if (arg == "--source") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.source = argv[++i];
        } else if (arg == "--deny") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.denylist = split_list(argv[++i]);
        } else if (arg == "--strip-extensions") {
            opts.strip_extensions = true;
        } else if (arg == "--reject-cycles") {
            opts.reject_cycles = true;
        } else if (arg == "--allow-inline-bodies") {
            opts.allow_inline_bodies = true;
        } else if (arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--check") {
            opts.check_only = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        }
    }
    return opts;
}

} // namespace apicat_dump
