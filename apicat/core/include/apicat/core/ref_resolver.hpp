#pragma once

#include "options.hpp"
#include "result.hpp"
#include "sanitizer.hpp"
#include "schema.hpp"
#include "value.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace apicat::openapi {

inline constexpr int kMaxSchemaDepth = 64;

// Resolves local JSON pointers ("#/definitions/Pet") against one document and
// builds sanitized schema trees. The document is never modified. Acyclic
// expansions are memoized per pointer and shared between calls, so a resolver
// must not be used from several threads.
class ref_resolver {
public:
    ref_resolver(const value& root,
                 const schema_sanitizer& sanitizer,
                 cycle_policy cycles = cycle_policy::represent) noexcept;

    // Raw addressed value, unsanitized.
    [[nodiscard]] result<const value*> lookup(std::string_view pointer,
                                              diagnostic* diag = nullptr) const;

    // Schema addressed by pointer, built with every nested pointer resolved.
    [[nodiscard]] result<schema_ptr> resolve(std::string_view pointer,
                                             diagnostic* diag = nullptr) const;

    // Inline schema; a bare {"$ref": ...} yields a reference node.
    [[nodiscard]] result<schema_ptr> build(const value& schema, diagnostic* diag = nullptr) const;

    [[nodiscard]] const value& root() const noexcept { return root_; }
    [[nodiscard]] const schema_sanitizer& sanitizer() const noexcept { return sanitizer_; }

private:
    static constexpr size_t kNoBackEdge = static_cast<size_t>(-1);

    struct walk_state {
        std::vector<std::string> stack; // pointers being expanded
        diagnostic* diag = nullptr;
        size_t lowest_back_edge = kNoBackEdge; // stack index of the outermost cycle target
        int deepest = 0;
    };

    struct memo_entry {
        schema_ptr node;
        int height = 0; // nesting levels below the pointer's own depth
    };

    result<schema_ptr> build_schema(const value& schema, walk_state& st, int depth) const;
    result<schema_ptr> build_reference(std::string_view pointer, walk_state& st, int depth) const;
    result<schema_ptr> expand_pointer(std::string_view pointer, walk_state& st, int depth) const;
    result<std::vector<schema_ptr>>
    build_members(const value& list, walk_state& st, int depth) const;
    result<void> build_subschemas(std::string_view keyword,
                                  const value& v,
                                  schema_node& node,
                                  walk_state& st,
                                  int depth) const;
    [[nodiscard]] const value* structural(const value& schema, std::string_view key) const noexcept;

    const value& root_;
    const schema_sanitizer& sanitizer_;
    cycle_policy cycles_;
    mutable std::map<std::string, memo_entry, std::less<>> memo_;
};

// Last segment of a pointer, unescaped ("#/definitions/Pet" -> "Pet").
std::string pointer_name(std::string_view pointer);

} // namespace apicat::openapi
