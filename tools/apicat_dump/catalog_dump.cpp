#include "dump.hpp"

#include "apicat/core/serde.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace apicat_dump {

namespace {

using apicat::value;
using apicat::openapi::schema_kind;
using apicat::openapi::schema_node;
using apicat::openapi::schema_ptr;
using apicat::serde::escape_json_string;

std::string quoted(std::string_view sv) {
    return "\"" + escape_json_string(sv) + "\"";
}

void write_value(std::ostringstream& os, const value& v) {
    switch (v.k) {
    case value::kind::string:
        os << quoted(v.scalar);
        break;
    case value::kind::object: {
        os << "{";
        bool first = true;
        for (const auto& m : v.object) {
            if (!first) {
                os << ",";
            }
            first = false;
            os << quoted(m.key) << ":";
            write_value(os, m.val);
        }
        os << "}";
        break;
    }
    case value::kind::array: {
        os << "[";
        bool first = true;
        for (const auto& item : v.array) {
            if (!first) {
                os << ",";
            }
            first = false;
            write_value(os, item);
        }
        os << "]";
        break;
    }
    default:
        os << apicat::scalar_text(v);
        break;
    }
}

void write_optional(std::ostringstream& os, const std::optional<std::string>& s) {
    if (s) {
        os << quoted(*s);
    } else {
        os << "null";
    }
}

void write_strings(std::ostringstream& os, const std::vector<std::string>& items) {
    os << "[";
    bool first = true;
    for (const auto& s : items) {
        if (!first) {
            os << ",";
        }
        first = false;
        os << quoted(s);
    }
    os << "]";
}

void write_schema(std::ostringstream& os, const schema_ptr& node);

void write_schema_list(std::ostringstream& os, const std::vector<schema_ptr>& nodes) {
    os << "[";
    bool first = true;
    for (const auto& n : nodes) {
        if (!first) {
            os << ",";
        }
        first = false;
        write_schema(os, n);
    }
    os << "]";
}

void write_schema(std::ostringstream& os, const schema_ptr& node) {
    if (!node) {
        os << "null";
        return;
    }
    const schema_node& s = *node;
    os << "{\"kind\":" << quoted(apicat::openapi::schema_kind_name(s.kind));
    if (!s.type_name.empty()) {
        os << ",\"type\":" << quoted(s.type_name);
    }
    switch (s.kind) {
    case schema_kind::reference:
        os << ",\"ref\":" << quoted(s.ref) << ",\"name\":" << quoted(s.ref_name) << ",\"target\":";
        write_schema(os, s.target);
        break;
    case schema_kind::recursive:
        os << ",\"ref\":" << quoted(s.ref) << ",\"name\":" << quoted(s.ref_name);
        break;
    case schema_kind::array:
        os << ",\"items\":";
        write_schema(os, s.items);
        break;
    case schema_kind::enumeration: {
        os << ",\"enum\":[";
        bool first = true;
        for (const auto& ev : s.enum_values) {
            if (!first) {
                os << ",";
            }
            first = false;
            write_value(os, ev);
        }
        os << "]";
        break;
    }
    case schema_kind::object: {
        os << ",\"properties\":[";
        bool first = true;
        for (const auto& p : s.properties) {
            if (!first) {
                os << ",";
            }
            first = false;
            os << "{\"name\":" << quoted(p.name)
               << ",\"required\":" << (p.required ? "true" : "false") << ",\"type\":";
            write_schema(os, p.type);
            os << "}";
        }
        os << "]";
        if (s.additional_properties) {
            os << ",\"additionalProperties\":";
            write_schema(os, s.additional_properties);
        }
        break;
    }
    default:
        break;
    }
    if (!s.all_of.empty()) {
        os << ",\"allOf\":";
        write_schema_list(os, s.all_of);
    }
    if (!s.one_of.empty()) {
        os << ",\"oneOf\":";
        write_schema_list(os, s.one_of);
    }
    if (!s.any_of.empty()) {
        os << ",\"anyOf\":";
        write_schema_list(os, s.any_of);
    }
    if (!s.annotations.object.empty()) {
        os << ",\"annotations\":";
        write_value(os, s.annotations);
    }
    if (!s.subschemas.empty()) {
        os << ",\"subschemas\":{";
        bool first = true;
        for (const auto& sub : s.subschemas) {
            if (!first) {
                os << ",";
            }
            first = false;
            os << quoted(sub.keyword) << ":";
            write_schema(os, sub.type);
        }
        os << "}";
    }
    os << "}";
}

} // namespace

std::string dump_catalog(const apicat::openapi::catalog& cat) {
    std::ostringstream os;
    os << "{";
    os << "\"version\":" << quoted(cat.spec_version) << ",";
    os << "\"deprecatedSkipped\":" << cat.deprecated_skipped << ",";
    os << "\"methods\":[";
    bool first_method = true;
    for (const auto& m : cat.methods) {
        if (!first_method) {
            os << ",";
        }
        first_method = false;
        os << "{";
        os << "\"method\":" << quoted(apicat::http::method_to_string(m.verb)) << ",";
        os << "\"url\":" << quoted(m.url) << ",";
        os << "\"operationId\":";
        write_optional(os, m.operation_id);
        os << ",\"summary\":";
        write_optional(os, m.summary);
        os << ",\"description\":";
        write_optional(os, m.description);
        os << ",\"inputFormats\":";
        write_strings(os, m.input_formats);
        os << ",\"outputFormats\":";
        write_strings(os, m.output_formats);

        os << ",\"parameters\":";
        if (m.parameters) {
            os << "[";
            bool first_param = true;
            for (const auto& p : *m.parameters) {
                if (!first_param) {
                    os << ",";
                }
                first_param = false;
                os << "{";
                os << "\"name\":" << quoted(p.name) << ",";
                os << "\"in\":" << quoted(apicat::openapi::param_location_name(p.in)) << ",";
                os << "\"required\":" << (p.required ? "true" : "false") << ",";
                os << "\"deprecated\":" << (p.deprecated ? "true" : "false") << ",";
                os << "\"description\":";
                write_optional(os, p.description);
                os << ",\"type\":";
                write_schema(os, p.type);
                if (p.items) {
                    os << ",\"items\":";
                    write_schema(os, p.items);
                }
                if (p.pattern) {
                    os << ",\"pattern\":" << quoted(*p.pattern);
                }
                if (p.format) {
                    os << ",\"format\":" << quoted(*p.format);
                }
                if (p.max_length) {
                    os << ",\"maxLength\":" << *p.max_length;
                }
                if (p.minimum) {
                    os << ",\"minimum\":" << apicat::scalar_text(value::number_node(*p.minimum));
                }
                if (p.maximum) {
                    os << ",\"maximum\":" << apicat::scalar_text(value::number_node(*p.maximum));
                }
                os << "}";
            }
            os << "]";
        } else {
            os << "null";
        }

        os << ",\"requestBody\":";
        if (m.body) {
            os << "{\"description\":";
            write_optional(os, m.body->description);
            os << ",\"required\":" << (m.body->required ? "true" : "false");
            os << ",\"content\":";
            write_strings(os, m.body->media_types);
            os << ",\"schema\":";
            write_schema(os, m.body->schema);
            os << "}";
        } else {
            os << "null";
        }

        os << ",\"responses\":";
        if (m.responses) {
            os << "[";
            bool first_resp = true;
            for (const auto& r : *m.responses) {
                if (!first_resp) {
                    os << ",";
                }
                first_resp = false;
                os << "{";
                os << "\"code\":" << quoted(r.code) << ",";
                os << "\"status\":" << r.status << ",";
                os << "\"default\":" << (r.is_default ? "true" : "false") << ",";
                os << "\"description\":";
                write_optional(os, r.description);
                os << ",\"content\":";
                write_strings(os, r.media_types);
                os << ",\"returns\":";
                if (r.returns) {
                    os << "{\"shape\":"
                       << (r.returns->shape == apicat::openapi::response_shape::array ? "\"array\""
                                                                                     : "\"direct\"")
                       << ",\"schema\":";
                    write_schema(os, r.returns->schema);
                    os << "}";
                } else {
                    os << "null";
                }
                os << "}";
            }
            os << "]";
        } else {
            os << "null";
        }
        os << "}";
    }
    os << "]";
    os << "}";
    return os.str();
}

} // namespace apicat_dump
