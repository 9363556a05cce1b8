#include "apicat/core/openapi_loader.hpp"

#include "apicat/core/serde.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace apicat::openapi {

result<value> load_from_string(std::string_view text, diagnostic* diag) {
    auto trimmed_input = serde::trim_view(text);
    if (trimmed_input.empty()) {
        set_diagnostic(diag, "line 1", "empty document");
        return std::unexpected(make_error_code(error_code::parse_error));
    }

    bool is_json = trimmed_input.front() == '{' || trimmed_input.front() == '[';
    diagnostic local;
    auto decoded =
        is_json ? serde::decode_json(trimmed_input, &local) : serde::decode_yaml(trimmed_input, &local);
    if (!decoded) {
        std::cerr << (is_json ? "[apicat][json] " : "[apicat][yaml] ") << local.location << ": "
                  << local.message << "\n";
        set_diagnostic(diag, local.location, local.message);
        return std::unexpected(make_error_code(error_code::parse_error));
    }
    return std::move(*decoded);
}

result<value> load_from_file(const char* path, diagnostic* diag) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        set_diagnostic(diag, path, "cannot open file");
        return std::unexpected(make_error_code(error_code::io_error));
    }
    // Pipes and procfs files report no size, so read to end of stream.
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        set_diagnostic(diag, path, "read failed");
        return std::unexpected(make_error_code(error_code::io_error));
    }
    return load_from_string(content, diag);
}

} // namespace apicat::openapi
