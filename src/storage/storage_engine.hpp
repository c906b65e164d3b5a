#pragma once

#include "common/error.hpp"
#include "index/partial_key_index.hpp"
#include "persistence/persistence.hpp"
#include "persistence/snapshot_file.hpp"
#include "schema/schema.hpp"
#include "storage/database_state.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sdb {

// ── EngineOptions ────────────────────────────────────────────────────────────

struct EngineOptions {
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    std::filesystem::path root             = "dbs";      // one subdirectory per database
    std::string           default_database = "default";
    std::string           file_name        = persistence::SnapshotFile::kFilename;
    schema::SchemaPolicy  schema_policy;

    // Source of the created_at / updated_at stamps.
    Clock clock = [] { return std::chrono::system_clock::now(); };
};

// ── StorageEngine ────────────────────────────────────────────────────────────
//
// Owns the current database (schemas, records, partial-key indexes), the name
// of that database and the persistence adapter.  Every mutation flushes the
// entire current database through the adapter before returning.
//
// Concurrency model:
//   - get_schema() / list_schemas() / get_record() / list_records() /
//     current_database() acquire a shared (read) lock.
//   - create_schema() / add_record() / delete_record() / use_database() /
//     wipe_database() acquire an exclusive (write) lock for their full
//     duration, flush included.
//
// Durability: a failed flush is reported as IOError but the in-memory
// mutation stays applied (memory may be ahead of disk).  Retrying the same
// add/delete is safe: both are keyed upserts/removals.

class StorageEngine {
public:
    // Suffix given to a snapshot file that failed to load.
    static constexpr const char* kQuarantineSuffix = ".corrupt";

    // Loads (or initialises) options.default_database.
    StorageEngine(EngineOptions options,
                  std::unique_ptr<persistence::Persistence> persistence);

    StorageEngine(const StorageEngine&)            = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;

    // ── Schemas ──────────────────────────────────────────────────────────────

    // Upsert schema `name` from a `field:type ...` definition.  Existing
    // records are not revalidated.
    [[nodiscard]] Status create_schema(const std::string& name, const std::string& fields);

    // Definition string of `name`, or NotFound.
    [[nodiscard]] Result<std::string> get_schema(const std::string& name) const;

    // Sorted schema names of the current database.
    [[nodiscard]] std::vector<std::string> list_schemas() const;

    // ── Records ──────────────────────────────────────────────────────────────

    // Parse, validate, stamp and store `json` under `schema`.
    // Returns the derived key.
    [[nodiscard]] Result<std::string> add_record(const std::string& schema,
                                                 std::string_view json);

    // Exact key first, then a unique partial-key match.
    [[nodiscard]] Result<StoredRecord> get_record(const std::string& schema,
                                                  const std::string& key) const;

    // Exact key only.
    [[nodiscard]] Status delete_record(const std::string& schema, const std::string& key);

    // All records of `schema`, sorted by key.
    [[nodiscard]] Result<std::vector<StoredRecord>> list_records(const std::string& schema) const;

    // ── Databases ────────────────────────────────────────────────────────────

    // Flush and evict the current database, then load or initialise `name`.
    // Never fails: persistence problems are logged, and a snapshot that cannot
    // be loaded is renamed to <file>.corrupt before the database starts empty.
    void use_database(const std::string& name);

    // Sorted names of the databases under the storage root.
    [[nodiscard]] Result<std::vector<std::string>> list_databases() const;

    [[nodiscard]] std::string current_database() const;

    // Remove every schema and record of the current database and persist
    // the empty state.
    [[nodiscard]] Status wipe_database();

    // Copy of the partial-key index of `schema`, if the schema has one.
    [[nodiscard]] std::optional<index::PartialKeyIndex> partial_key_index(
        const std::string& schema) const;

private:
    [[nodiscard]] std::filesystem::path database_path(const std::string& name) const;

    // Both require the write lock (or exclusive access during construction).
    [[nodiscard]] Status flush_locked();
    void load_locked();

    // Rename an unloadable snapshot to <path>.corrupt so the next flush of the
    // (empty) state cannot overwrite it.
    void quarantine(const std::filesystem::path& path) const;

    EngineOptions options_;
    std::unique_ptr<persistence::Persistence> persistence_;

    mutable std::shared_mutex mutex_;
    std::string   current_;
    DatabaseState state_;
};

} // namespace sdb
