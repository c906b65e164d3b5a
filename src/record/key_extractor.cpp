#include "record/key_extractor.hpp"

#include <array>
#include <format>

namespace sdb::record {

namespace {

constexpr std::array<std::string_view, 3> kKeyFields{"id", "name", "key"};

std::string stringify(const Value& value) {
    if (const auto* s = value.get_if<std::string>()) {
        return *s;
    }
    return dump(value);
}

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string pick_key(const Value& record, std::string_view raw_input) {
    const auto* fields = record.get_if<Object>();
    if (fields == nullptr || fields->empty()) {
        return std::string(trim(raw_input));
    }

    for (auto name : kKeyFields) {
        if (auto it = fields->find(name); it != fields->end()) {
            return stringify(it->second);
        }
    }

    for (const auto& [name, value] : *fields) {
        if (const auto* s = value.get_if<std::string>()) {
            return *s;
        }
    }

    return fields->begin()->first;
}

} // anonymous namespace

Result<std::string> extract_key(const Value& record, std::string_view raw_input) {
    auto key = pick_key(record, raw_input);
    if (key.empty()) {
        return Error::key_extraction_failed(
            std::format("could not extract a valid key from record data: {}",
                        trim(raw_input)));
    }
    return key;
}

} // namespace sdb::record
