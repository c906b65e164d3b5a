#pragma once

#include "persistence/persistence.hpp"

#include <cstdint>
#include <filesystem>
#include <system_error>

namespace sdb::persistence {

// ── Snapshot file header constants ───────────────────────────────────────────

static constexpr char kSnapshotMagic[] = "SDBS";          // 4 bytes (no NUL)
static constexpr std::size_t kSnapshotMagicSize = 4;
static constexpr uint16_t kSnapshotVersion = 1;
static constexpr std::size_t kSnapshotHeaderSize =
    kSnapshotMagicSize + sizeof(uint16_t) + sizeof(uint32_t);  // 10 bytes

// ── SnapshotFile ─────────────────────────────────────────────────────────────
//
// File-backed Persistence.  Binary format:
//
//   [magic: "SDBS" (4B)][version: u16 LE = 1][payload_length: u32 LE]
//   [payload: SnapshotPayload protobuf (proto/snapshot.proto)]
//   [crc32: u32 LE]     // CRC of everything from magic through payload
//
// Payload entries are sorted by (schema, key) for deterministic output; the
// payload also lists every record-map schema so empty maps survive a reload.
// Atomic write: write to <path>.tmp, fsync, then rename.
//
// Thread-safety: no mutable state; concurrent calls on distinct paths are safe.

class SnapshotFile final : public Persistence {
public:
    // File name of a database snapshot inside its database directory.
    static constexpr const char* kFilename = "store.sdb";

    [[nodiscard]] std::error_code save(const std::filesystem::path& path,
                                       const Snapshot& snapshot) override;

    [[nodiscard]] std::error_code load(const std::filesystem::path& path,
                                       Snapshot& snapshot) override;
};

} // namespace sdb::persistence
