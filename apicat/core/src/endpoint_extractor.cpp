#include "apicat/core/endpoint_extractor.hpp"

#include "apicat/core/normalizers.hpp"
#include "apicat/core/ref_resolver.hpp"
#include "apicat/core/sanitizer.hpp"

#include <algorithm>
#include <array>
#include <ostream>

namespace apicat::openapi {

namespace {

constexpr std::array<std::string_view, 5> kPathItemFields = {
    "parameters", "summary", "description", "servers", "$ref"};

bool is_path_item_field(std::string_view key) noexcept {
    if (key.starts_with("x-")) {
        return true;
    }
    return std::find(kPathItemFields.begin(), kPathItemFields.end(), key) != kPathItemFields.end();
}

std::vector<std::string> string_list(const value* v) {
    std::vector<std::string> out;
    if (!v || !v->is_array()) {
        return out;
    }
    for (const auto& item : v->array) {
        if (item.is_string()) {
            out.push_back(item.scalar);
        }
    }
    return out;
}

std::string detect_version(const value& doc) {
    for (std::string_view key : {"openapi", "swagger"}) {
        const value* v = doc.find(key);
        if (!v) {
            continue;
        }
        if (v->is_string()) {
            return v->scalar;
        }
        if (v->is_number()) {
            // unquoted "swagger: 2.0" in YAML
            std::string text = scalar_text(*v);
            return text.find('.') == std::string::npos ? text + ".0" : text;
        }
    }
    return {};
}

std::optional<std::string> optional_string(const value& v, std::string_view key) {
    if (auto s = v.get_string(key)) {
        return std::string(*s);
    }
    return std::nullopt;
}

// Operation parameters first, then inherited path-level ones it does not override.
std::vector<parameter> merge_parameters(std::vector<parameter> own,
                                        const std::vector<parameter>& inherited) {
    for (const auto& p : inherited) {
        bool overridden = std::any_of(own.begin(), own.end(), [&](const parameter& o) {
            return o.name == p.name && o.in == p.in;
        });
        if (!overridden) {
            own.push_back(p);
        }
    }
    return own;
}

class endpoint_extractor {
public:
    endpoint_extractor(const value& doc, const catalog_options& opts, diagnostic* diag)
        : doc_(doc), opts_(opts), sanitizer_(opts.denylist, opts.strip_vendor_extensions),
          resolver_(doc, sanitizer_, opts.cycles), ctx_{resolver_, opts, diag}, diag_(diag) {}

    result<catalog> run() {
        if (!doc_.is_object()) {
            set_diagnostic(diag_, "$", "document root is not a mapping");
            return std::unexpected(make_error_code(error_code::invalid_document));
        }
        const value* paths = doc_.find("paths");
        if (!paths) {
            set_diagnostic(diag_, "paths", "document has no paths");
            return std::unexpected(make_error_code(error_code::paths_missing));
        }
        if (!paths->is_object() || paths->object.empty()) {
            set_diagnostic(diag_, "paths", "document paths are empty");
            return std::unexpected(make_error_code(error_code::paths_empty));
        }

        catalog out;
        out.spec_version = detect_version(doc_);
        global_consumes_ = string_list(doc_.find("consumes"));
        global_produces_ = string_list(doc_.find("produces"));
        log("[catalog] version=" + (out.spec_version.empty() ? std::string("?") : out.spec_version) +
            ", paths=" + std::to_string(paths->object.size()));

        for (const auto& entry : paths->object) {
            if (auto r = walk_path_item(entry.key, entry.val, out); !r) {
                return std::unexpected(r.error());
            }
        }

        log("[catalog] methods=" + std::to_string(out.methods.size()) +
            ", deprecated=" + std::to_string(out.deprecated_skipped));
        return out;
    }

private:
    void log(const std::string& line) const {
        if (opts_.log) {
            *opts_.log << line << '\n';
        }
    }

    result<void> walk_path_item(const std::string& path, const value& raw, catalog& out) {
        std::string location = "paths." + path;
        auto followed = follow_object_ref(raw, ctx_, location);
        if (!followed) {
            return std::unexpected(followed.error());
        }
        const value& item = **followed;
        if (!item.is_object()) {
            set_diagnostic(diag_,
                           location,
                           "path item must be a mapping, got " + std::string(kind_name(item.k)));
            return std::unexpected(make_error_code(error_code::invalid_document));
        }

        std::vector<parameter> inherited;
        if (const value* params = item.find("parameters")) {
            auto parsed = normalize_parameters(*params, ctx_, location + ".parameters");
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            inherited = std::move(*parsed);
        }

        for (const auto& op : item.object) {
            if (is_path_item_field(op.key)) {
                continue;
            }
            std::string op_location = location + "." + op.key;
            http::method verb = http::parse_method(op.key);
            if (verb == http::method::unknown) {
                set_diagnostic(diag_, op_location, "unknown HTTP method '" + op.key + "'");
                return std::unexpected(make_error_code(error_code::unknown_http_method));
            }
            if (!op.val.is_object()) {
                set_diagnostic(diag_,
                               op_location,
                               "operation must be a mapping, got " +
                                   std::string(kind_name(op.val.k)));
                return std::unexpected(make_error_code(error_code::invalid_document));
            }
            if (op.val.get_bool("deprecated").value_or(false)) {
                ++out.deprecated_skipped;
                log("[catalog] skip deprecated " + std::string(http::method_to_string(verb)) + " " +
                    path);
                continue;
            }

            auto entry = build_method(path, verb, op.val, inherited, op_location);
            if (!entry) {
                return std::unexpected(entry.error());
            }
            out.methods.push_back(std::move(*entry));
        }
        return {};
    }

    result<method_entry> build_method(const std::string& path,
                                      http::method verb,
                                      const value& op,
                                      const std::vector<parameter>& inherited,
                                      const std::string& location) {
        method_entry m;
        m.url = opts_.base_url + path;
        m.path = path;
        m.verb = verb;
        m.operation_id = optional_string(op, "operationId");
        m.summary = optional_string(op, "summary");
        m.description = optional_string(op, "description");

        std::vector<parameter> own;
        if (const value* params = op.find("parameters")) {
            auto parsed = normalize_parameters(*params, ctx_, location + ".parameters");
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            own = std::move(*parsed);
        }
        auto merged = merge_parameters(std::move(own), inherited);
        if (!merged.empty()) {
            m.parameters = std::move(merged);
        }

        if (const value* body = op.find("requestBody")) {
            auto parsed = normalize_request_body(*body, ctx_, location + ".requestBody");
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            m.body = std::move(*parsed);
        }

        if (const value* responses = op.find("responses")) {
            auto parsed = normalize_responses(*responses, ctx_, location + ".responses");
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            if (!parsed->empty()) {
                m.responses = std::move(*parsed);
            }
        }

        m.input_formats = string_list(op.find("consumes"));
        if (m.input_formats.empty()) {
            m.input_formats = global_consumes_;
        }
        if (m.input_formats.empty() && m.body) {
            m.input_formats = m.body->media_types;
        }

        m.output_formats = string_list(op.find("produces"));
        if (m.output_formats.empty()) {
            m.output_formats = global_produces_;
        }
        if (m.output_formats.empty() && m.responses) {
            for (const auto& r : *m.responses) {
                for (const auto& media : r.media_types) {
                    if (std::find(m.output_formats.begin(), m.output_formats.end(), media) ==
                        m.output_formats.end()) {
                        m.output_formats.push_back(media);
                    }
                }
            }
        }
        return m;
    }

    const value& doc_;
    const catalog_options& opts_;
    schema_sanitizer sanitizer_;
    ref_resolver resolver_;
    normalize_context ctx_;
    diagnostic* diag_;
    std::vector<std::string> global_consumes_;
    std::vector<std::string> global_produces_;
};

} // namespace

result<catalog> build_catalog(const value& doc, const catalog_options& opts, diagnostic* diag) {
    endpoint_extractor extractor(doc, opts, diag);
    return extractor.run();
}

std::string derive_base_url(std::string_view location) {
    size_t cut = location.find_first_of("?#");
    if (cut != std::string_view::npos) {
        location = location.substr(0, cut);
    }
    size_t authority = location.find("://");
    size_t floor = authority == std::string_view::npos ? 0 : authority + 3;
    size_t slash = location.rfind('/');
    if (slash == std::string_view::npos || slash < floor) {
        return authority == std::string_view::npos ? std::string() : std::string(location);
    }
    return std::string(location.substr(0, slash));
}

} // namespace apicat::openapi
