#pragma once

#include "index/partial_key_index.hpp"
#include "persistence/persistence.hpp"
#include "record/value.hpp"
#include "schema/schema.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sdb {

// A record together with its derived key.
struct StoredRecord {
    std::string   key;
    record::Value value;

    bool operator==(const StoredRecord&) const = default;
};

// ── DatabaseState ────────────────────────────────────────────────────────────
//
// The unit of isolation: schema definitions, one record map per schema and
// one partial-key index per schema, for a single database.
//
// Every mutation keeps the record map and its index in step, so for each
// schema the index holds exactly the keys of its record map.
//
// Not thread-safe; owned and serialised by StorageEngine.

class DatabaseState {
public:
    DatabaseState() = default;

    // Rebuild a state (including indexes) from a persisted snapshot.
    // Record blobs that are not valid JSON are kept as string values.
    [[nodiscard]] static DatabaseState from_snapshot(const persistence::Snapshot& snapshot);

    // Full snapshot of this state, in normal form.
    [[nodiscard]] persistence::Snapshot to_snapshot() const;

    // ── Schemas ──────────────────────────────────────────────────────────────

    [[nodiscard]] const schema::SchemaDef* find_schema(std::string_view name) const;

    // Upsert `def`; ensures an (empty) record map and index exist for it.
    void put_schema(schema::SchemaDef def);

    // Sorted schema names.
    [[nodiscard]] std::vector<std::string> schema_names() const;

    // ── Records ──────────────────────────────────────────────────────────────

    [[nodiscard]] const record::Value* find_record(std::string_view schema,
                                                   const std::string& key) const;

    // Insert or fully replace the record under `key`.
    void put_record(const std::string& schema, const std::string& key, record::Value value);

    // Remove the record under exactly `key`. Returns false if it was absent.
    bool erase_record(const std::string& schema, const std::string& key);

    // Full keys of `schema` starting with `partial` (see PartialKeyIndex::lookup).
    [[nodiscard]] std::vector<std::string> lookup_partial(const std::string& schema,
                                                          std::string_view partial) const;

    // All records of `schema`, sorted by key.
    [[nodiscard]] std::vector<StoredRecord> records(const std::string& schema) const;

    [[nodiscard]] const index::PartialKeyIndex* partial_key_index(const std::string& schema) const;

    // Drop every schema, record and index.
    void clear();

private:
    std::map<std::string, schema::SchemaDef, std::less<>> schemas_;
    std::unordered_map<std::string, std::unordered_map<std::string, record::Value>> records_;
    std::unordered_map<std::string, index::PartialKeyIndex> partial_keys_;
};

} // namespace sdb
