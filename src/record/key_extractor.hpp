#pragma once

#include "common/error.hpp"
#include "record/value.hpp"

#include <string>
#include <string_view>

namespace sdb::record {

// ── Key extraction ────────────────────────────────────────────────────────────
//
// Derives the permanent key of a record, schema-independently, in priority
// order:
//   1. field "id", 2. field "name", 3. field "key"
//      (non-string values are stringified as compact JSON);
//   4. the first textual field, in lexicographic field order;
//   5. the lexicographically first field name;
//   6. `raw_input` (trimmed) when the record has no fields at all.
//
// Fails with KeyExtractionFailed if the result is empty.
[[nodiscard]] Result<std::string> extract_key(const Value& record,
                                              std::string_view raw_input);

} // namespace sdb::record
