#include "apicat/core/http.hpp"

#include <algorithm>
#include <cctype>

namespace apicat::http {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

} // namespace

method parse_method(std::string_view str) noexcept {
    if (iequals(str, "GET")) return method::get;
    if (iequals(str, "PUT")) return method::put;
    if (iequals(str, "POST")) return method::post;
    if (iequals(str, "DELETE")) return method::del;
    if (iequals(str, "OPTIONS")) return method::options;
    if (iequals(str, "HEAD")) return method::head;
    if (iequals(str, "PATCH")) return method::patch;
    if (iequals(str, "TRACE")) return method::trace;
    return method::unknown;
}

std::string_view method_to_string(method m) noexcept {
    switch (m) {
        case method::get: return "GET";
        case method::put: return "PUT";
        case method::post: return "POST";
        case method::del: return "DELETE";
        case method::options: return "OPTIONS";
        case method::head: return "HEAD";
        case method::patch: return "PATCH";
        case method::trace: return "TRACE";
        default: return "UNKNOWN";
    }
}

} // namespace apicat::http
