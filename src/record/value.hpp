#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sdb::record {

// ── Value ─────────────────────────────────────────────────────────────────────
//
// Tagged-union value tree holding the contents of one record.  Objects keep
// their fields in lexicographic order, which is the order every scan over a
// record (validation, key extraction, serialisation) observes.

struct Value;

using Array  = std::vector<Value>;
using Object = std::map<std::string, Value, std::less<>>;

enum class ValueType : uint8_t {
    Null    = 0,
    Boolean = 1,
    Integer = 2,
    Float   = 3,
    String  = 4,
    Array   = 5,
    Object  = 6,
};

// Human-readable name of `type` ("null", "boolean", "integer", …).
[[nodiscard]] std::string_view type_name(ValueType type) noexcept;

struct Value {
    // Alternative order matches ValueType.
    using Storage =
        std::variant<std::nullptr_t, bool, int64_t, double, std::string, Array, Object>;

    Storage data;

    Value() : data(nullptr) {}
    Value(std::nullptr_t) : data(nullptr) {}
    Value(bool b) : data(b) {}
    Value(int i) : data(static_cast<int64_t>(i)) {}
    Value(int64_t i) : data(i) {}
    Value(double d) : data(d) {}
    Value(const char* s) : data(std::string(s)) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(Array a) : data(std::move(a)) {}
    Value(Object o) : data(std::move(o)) {}

    [[nodiscard]] ValueType type() const noexcept {
        return static_cast<ValueType>(data.index());
    }

    [[nodiscard]] bool is_object() const noexcept { return type() == ValueType::Object; }

    // Typed access; nullptr when the value holds another alternative.
    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }
    template <typename T>
    [[nodiscard]] T* get_if() noexcept { return std::get_if<T>(&data); }

    bool operator==(const Value& other) const = default;
};

// ── JSON conversion ───────────────────────────────────────────────────────────
//
// ADL hooks for nlohmann::json, so `json j = value;` and `j.get<Value>()` work.
// Unsigned integers above INT64_MAX degrade to Float.

void to_json(nlohmann::json& j, const Value& value);
void from_json(const nlohmann::json& j, Value& value);

// Deepest accepted nesting of arrays and objects.
inline constexpr std::size_t kMaxNestingDepth = 128;

// Parse JSON text.  Returns nullopt on malformed input or input nested deeper
// than kMaxNestingDepth (never throws).
[[nodiscard]] std::optional<Value> parse(std::string_view text);

// Compact JSON text of `value`.
[[nodiscard]] std::string dump(const Value& value);

} // namespace sdb::record
