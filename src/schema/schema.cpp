#include "schema/schema.hpp"

#include <cmath>
#include <format>

namespace sdb::schema {

FieldType parse_field_type(std::string_view spelling) noexcept {
    if (spelling == "string")                           return FieldType::String;
    if (spelling == "int"    || spelling == "integer")  return FieldType::Integer;
    if (spelling == "float"  || spelling == "double")   return FieldType::Float;
    if (spelling == "bool"   || spelling == "boolean")  return FieldType::Boolean;
    if (spelling == "object" || spelling == "json")     return FieldType::Object;
    return FieldType::Unknown;
}

const FieldDef* SchemaDef::find(std::string_view field) const noexcept {
    for (const auto& f : fields) {
        if (f.name == field) {
            return &f;
        }
    }
    return nullptr;
}

// ── define_schema ─────────────────────────────────────────────────────────────

Result<SchemaDef> define_schema(std::string name,
                                std::string definition,
                                const SchemaPolicy& policy) {
    SchemaDef def;
    def.name = std::move(name);

    std::string_view remaining{definition};
    while (!remaining.empty()) {
        const auto start = remaining.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(start);

        const auto end = remaining.find_first_of(" \t\r\n");
        const std::string_view token = remaining.substr(0, end);
        remaining = (end == std::string_view::npos) ? std::string_view{}
                                                    : remaining.substr(end);

        // Exactly one colon with a non-empty field name.
        const auto colon = token.find(':');
        const bool malformed = colon == std::string_view::npos ||
                               colon == 0 ||
                               token.find(':', colon + 1) != std::string_view::npos;
        if (malformed) {
            if (policy.skip_malformed_tokens) {
                continue;
            }
            return Error::invalid_input(
                std::format("malformed schema token '{}' (expected field:type)", token));
        }

        FieldDef field{
            .name      = std::string(token.substr(0, colon)),
            .type_name = std::string(token.substr(colon + 1)),
            .type      = parse_field_type(token.substr(colon + 1)),
        };

        bool replaced = false;
        for (auto& existing : def.fields) {
            if (existing.name == field.name) {
                existing = field;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            def.fields.push_back(std::move(field));
        }
    }

    def.definition = std::move(definition);
    return def;
}

// ── validate ──────────────────────────────────────────────────────────────────

namespace {

bool matches(FieldType type, const record::Value& value, const SchemaPolicy& policy) {
    using record::ValueType;

    switch (type) {
        case FieldType::String:
            return value.type() == ValueType::String;
        case FieldType::Integer:
            if (value.type() == ValueType::Integer) {
                return true;
            }
            if (const auto* d = value.get_if<double>()) {
                return std::isfinite(*d) && std::trunc(*d) == *d;
            }
            return false;
        case FieldType::Float:
            return value.type() == ValueType::Integer || value.type() == ValueType::Float;
        case FieldType::Boolean:
            return value.type() == ValueType::Boolean;
        case FieldType::Object:
            return true;
        case FieldType::Unknown:
            return policy.accept_unknown_types;
    }
    return false;
}

} // anonymous namespace

std::string ValidationError::message() const {
    return std::format("field '{}' type validation failed: expected {}, got {}",
                       field, expected_type, actual_value);
}

std::optional<ValidationError> validate(const SchemaDef& schema,
                                        const record::Value& record,
                                        const SchemaPolicy& policy) {
    const auto* fields = record.get_if<record::Object>();
    if (fields == nullptr) {
        return std::nullopt;
    }

    for (const auto& field : schema.fields) {
        auto it = fields->find(field.name);
        if (it == fields->end()) {
            continue;
        }
        if (!matches(field.type, it->second, policy)) {
            return ValidationError{
                .field         = field.name,
                .expected_type = field.type_name,
                .actual_value  = record::dump(it->second),
            };
        }
    }
    return std::nullopt;
}

} // namespace sdb::schema
