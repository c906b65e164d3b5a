#include "record/value.hpp"

#include <limits>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace sdb::record {

std::string_view type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::Null:    return "null";
        case ValueType::Boolean: return "boolean";
        case ValueType::Integer: return "integer";
        case ValueType::Float:   return "float";
        case ValueType::String:  return "string";
        case ValueType::Array:   return "array";
        case ValueType::Object:  return "object";
    }
    return "unknown";
}

// ── to_json ───────────────────────────────────────────────────────────────────

void to_json(nlohmann::json& j, const Value& value) {
    std::visit(
        [&j](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                j = nullptr;
            } else if constexpr (std::is_same_v<T, Array>) {
                j = nlohmann::json::array();
                for (const auto& element : v) {
                    j.push_back(element);
                }
            } else if constexpr (std::is_same_v<T, Object>) {
                j = nlohmann::json::object();
                for (const auto& [name, field] : v) {
                    j[name] = field;
                }
            } else {
                j = v;
            }
        },
        value.data);
}

// ── from_json ─────────────────────────────────────────────────────────────────

void from_json(const nlohmann::json& j, Value& value) {
    using vt = nlohmann::json::value_t;

    switch (j.type()) {
        case vt::boolean:
            value = j.get<bool>();
            return;
        case vt::number_integer:
            value = j.get<int64_t>();
            return;
        case vt::number_unsigned: {
            const auto u = j.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                value = static_cast<int64_t>(u);
            } else {
                value = static_cast<double>(u);
            }
            return;
        }
        case vt::number_float:
            value = j.get<double>();
            return;
        case vt::string:
            value = j.get<std::string>();
            return;
        case vt::array: {
            Array array;
            array.reserve(j.size());
            for (const auto& element : j) {
                array.push_back(element.get<Value>());
            }
            value = std::move(array);
            return;
        }
        case vt::object: {
            Object object;
            for (const auto& [name, field] : j.items()) {
                object.emplace(name, field.get<Value>());
            }
            value = std::move(object);
            return;
        }
        case vt::null:
        case vt::binary:
        case vt::discarded:
            value = nullptr;
            return;
    }
}

// ── parse / dump ──────────────────────────────────────────────────────────────

std::optional<Value> parse(std::string_view text) {
    // Conversion to Value recurses per level, so cap the depth while
    // nlohmann's (iterative) parser is still running.
    bool too_deep = false;
    auto limit_depth = [&too_deep](int depth, nlohmann::json::parse_event_t event,
                                   nlohmann::json& /*parsed*/) {
        using event_t = nlohmann::json::parse_event_t;
        if ((event == event_t::object_start || event == event_t::array_start) &&
            static_cast<std::size_t>(depth) >= kMaxNestingDepth) {
            too_deep = true;
        }
        return !too_deep;
    };

    auto j = nlohmann::json::parse(text, limit_depth, /*allow_exceptions=*/false);
    if (too_deep || j.is_discarded()) {
        return std::nullopt;
    }
    return j.get<Value>();
}

std::string dump(const Value& value) {
    const nlohmann::json j = value;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace sdb::record
