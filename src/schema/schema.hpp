#pragma once

#include "common/error.hpp"
#include "record/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdb::schema {

// ── Field types ───────────────────────────────────────────────────────────────

enum class FieldType : uint8_t {
    String  = 0,  // "string"
    Integer = 1,  // "int", "integer"
    Float   = 2,  // "float", "double"
    Boolean = 3,  // "bool", "boolean"
    Object  = 4,  // "object", "json": any value
    Unknown = 5,  // any other spelling
};

// Map a declared type spelling to a FieldType (case-sensitive).
[[nodiscard]] FieldType parse_field_type(std::string_view spelling) noexcept;

// ── Policy ────────────────────────────────────────────────────────────────────
//
// Both defaults are permissive: malformed `field:type` tokens are dropped
// while parsing, and fields declared with an unknown type accept any value.

struct SchemaPolicy {
    bool skip_malformed_tokens = true;
    bool accept_unknown_types  = true;

    [[nodiscard]] static SchemaPolicy permissive() { return {}; }
    [[nodiscard]] static SchemaPolicy strict() { return {false, false}; }
};

struct FieldDef {
    std::string name;
    std::string type_name;  // as declared, e.g. "int"
    FieldType   type;
};

// ── SchemaDef ─────────────────────────────────────────────────────────────────

struct SchemaDef {
    std::string           name;
    std::string           definition;  // original definition string
    std::vector<FieldDef> fields;      // declaration order, unique names

    [[nodiscard]] const FieldDef* find(std::string_view field) const noexcept;
};

// Parse a whitespace-separated list of `field:type` tokens.
// With policy.skip_malformed_tokens == false, the first malformed token fails
// with InvalidInput.  A repeated field name replaces the earlier type.
[[nodiscard]] Result<SchemaDef> define_schema(std::string name,
                                              std::string definition,
                                              const SchemaPolicy& policy = {});

// ── Validation ────────────────────────────────────────────────────────────────

struct ValidationError {
    std::string field;
    std::string expected_type;
    std::string actual_value;  // compact JSON of the offending value

    [[nodiscard]] std::string message() const;
};

// Check every field present in both `schema` and `record` against its
// declared type.  Stops at the first mismatch.  A non-object record has no
// fields and therefore always passes.
[[nodiscard]] std::optional<ValidationError> validate(const SchemaDef& schema,
                                                      const record::Value& record,
                                                      const SchemaPolicy& policy = {});

} // namespace sdb::schema
