#include "apicat/core/endpoint_extractor.hpp"
#include "apicat/core/openapi_loader.hpp"
#include "apicat_dump/dump.hpp"
#include "apicat_dump/options.hpp"

#include <iostream>
#include <string>

using apicat::diagnostic;
using namespace apicat_dump;

namespace {

void report(const char* stage, const std::error_code& ec, const diagnostic& diag) {
    std::cerr << "[" << stage << "] " << ec.message();
    if (!diag.message.empty()) {
        std::cerr << ": " << diag.location << ": " << diag.message;
    }
    std::cerr << "\n";
}

int run(const options& opts) {
    if (opts.input.empty()) {
        std::cerr << "[apicat] input document is required\n";
        return 1;
    }

    diagnostic diag;
    auto loaded = apicat::openapi::load_from_file(opts.input.c_str(), &diag);
    if (!loaded) {
        report("apicat", loaded.error(), diag);
        return 1;
    }

    apicat::openapi::catalog_options copts;
    copts.base_url = opts.source.empty() ? opts.base_url
                                         : apicat::openapi::derive_base_url(opts.source);
    copts.denylist = opts.denylist;
    copts.strip_vendor_extensions = opts.strip_extensions;
    copts.cycles = opts.reject_cycles ? apicat::openapi::cycle_policy::reject
                                      : apicat::openapi::cycle_policy::represent;
    copts.allow_inline_request_bodies = opts.allow_inline_bodies;
    if (opts.verbose) {
        copts.log = &std::cerr;
    }

    auto cat = apicat::openapi::build_catalog(*loaded, copts, &diag);
    if (!cat) {
        report("catalog", cat.error(), diag);
        return 1;
    }

    if (opts.json_output && !opts.check_only) {
        std::cout << dump_catalog(*cat) << "\n";
        return 0;
    }
    std::cout << "[catalog] OK: version="
              << (cat->spec_version.empty() ? std::string("unknown") : cat->spec_version)
              << ", methods=" << cat->methods.size() << ", deprecated=" << cat->deprecated_skipped
              << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    return run(opts);
}
