#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <system_error>

namespace sdb::persistence {

// Reserved schema name under which schema definitions are stored alongside
// records.  The engine refuses it as a user schema name.
static constexpr const char* kSchemaSection = "__schemas__";

// ── Snapshot ─────────────────────────────────────────────────────────────────
//
// Complete serialisable state of one database.  Record blobs are opaque to
// the persistence layer (the engine stores compact JSON text).
//
// Persistence stores exactly what it is given: load(save(s)) == s, including
// empty record maps and record maps without a schema definition.  Filling in
// missing record maps is the loader's job (DatabaseState::from_snapshot).

struct Snapshot {
    std::map<std::string, std::map<std::string, std::string>> records;
    std::map<std::string, std::string> schemas;

    [[nodiscard]] bool empty() const noexcept { return records.empty() && schemas.empty(); }

    bool operator==(const Snapshot&) const = default;
};

// ── Persistence ──────────────────────────────────────────────────────────────
//
// Abstract persistence boundary consumed by the StorageEngine.
//
// Implementations must be callable from one thread at a time (the engine's
// write lock provides this); they hold no per-database state.

class Persistence {
public:
    virtual ~Persistence() = default;

    // Atomically replace the contents of `path` with `snapshot`, creating the
    // parent directory if needed.  On failure the previous file is intact.
    [[nodiscard]] virtual std::error_code save(const std::filesystem::path& path,
                                               const Snapshot& snapshot) = 0;

    // Read `path` into `snapshot`.  A missing file yields an empty snapshot
    // and no error.
    [[nodiscard]] virtual std::error_code load(const std::filesystem::path& path,
                                               Snapshot& snapshot) = 0;
};

} // namespace sdb::persistence
