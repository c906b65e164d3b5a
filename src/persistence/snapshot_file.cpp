#include "persistence/snapshot_file.hpp"
#include "persistence/crc32.hpp"

#include "snapshot.pb.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace sdb::persistence {

namespace {

constexpr std::size_t kCrcSize = sizeof(uint32_t);

[[nodiscard]] std::error_code last_os_error() {
    return {errno, std::system_category()};
}

// Owns a POSIX file descriptor; closes it on scope exit.
class ScopedFd {
public:
    explicit ScopedFd(int fd) noexcept : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    ScopedFd(const ScopedFd&)            = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    [[nodiscard]] int  get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

private:
    int fd_;
};

// ── Little-endian encoding ───────────────────────────────────────────────────

template <typename T>
void put_le(std::vector<uint8_t>& out, T v) {
    static_assert(std::is_unsigned_v<T>);
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

template <typename T>
[[nodiscard]] T get_le(const uint8_t* in) {
    static_assert(std::is_unsigned_v<T>);
    T v = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        v |= static_cast<T>(static_cast<T>(in[i]) << (8 * i));
    }
    return v;
}

// ── Raw file I/O ─────────────────────────────────────────────────────────────

// Create/truncate `path`, write `bytes` in full and fsync.
[[nodiscard]] std::error_code write_synced(const std::filesystem::path& path,
                                           const std::vector<uint8_t>& bytes) {
    ScopedFd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (!fd.valid()) {
        return last_os_error();
    }

    std::size_t done = 0;
    while (done < bytes.size()) {
        const auto n = ::write(fd.get(), bytes.data() + done, bytes.size() - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_os_error();
        }
        done += static_cast<std::size_t>(n);
    }

    if (::fsync(fd.get()) != 0) {
        return last_os_error();
    }
    return {};
}

// Read the whole of `path` into `bytes`.
[[nodiscard]] std::error_code read_whole(const std::filesystem::path& path,
                                         std::vector<uint8_t>& bytes) {
    ScopedFd fd(::open(path.c_str(), O_RDONLY));
    if (!fd.valid()) {
        return last_os_error();
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        return last_os_error();
    }
    bytes.resize(static_cast<std::size_t>(st.st_size));

    std::size_t done = 0;
    while (done < bytes.size()) {
        const auto n = ::read(fd.get(), bytes.data() + done, bytes.size() - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_os_error();
        }
        if (n == 0) {
            return std::make_error_code(std::errc::io_error);  // file shrank
        }
        done += static_cast<std::size_t>(n);
    }
    return {};
}

// ── Framing ──────────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_frame(const std::string& payload) {
    std::vector<uint8_t> frame;
    frame.reserve(kSnapshotHeaderSize + payload.size() + kCrcSize);

    frame.insert(frame.end(), kSnapshotMagic, kSnapshotMagic + kSnapshotMagicSize);
    put_le<uint16_t>(frame, kSnapshotVersion);
    put_le<uint32_t>(frame, static_cast<uint32_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    put_le<uint32_t>(frame, crc32(frame.data(), frame.size()));
    return frame;
}

// Check magic, version, length and checksum of `frame`; on success `payload`
// and `payload_len` describe the embedded protobuf bytes.
[[nodiscard]] std::error_code decode_frame(const std::filesystem::path& path,
                                           const std::vector<uint8_t>& frame,
                                           const uint8_t*& payload,
                                           uint32_t& payload_len) {
    const auto corrupt = std::make_error_code(std::errc::invalid_argument);

    if (frame.size() < kSnapshotHeaderSize + kCrcSize) {
        spdlog::error("Snapshot: {} is truncated ({} bytes)", path.string(), frame.size());
        return corrupt;
    }
    if (std::memcmp(frame.data(), kSnapshotMagic, kSnapshotMagicSize) != 0) {
        spdlog::error("Snapshot: {} is not a schemadb snapshot", path.string());
        return corrupt;
    }

    const auto version = get_le<uint16_t>(frame.data() + kSnapshotMagicSize);
    if (version != kSnapshotVersion) {
        spdlog::error("Snapshot: {} has unsupported version {}", path.string(), version);
        return corrupt;
    }

    payload_len = get_le<uint32_t>(frame.data() + kSnapshotMagicSize + sizeof(uint16_t));
    const std::size_t covered = kSnapshotHeaderSize + payload_len;
    if (covered + kCrcSize != frame.size()) {
        spdlog::error("Snapshot: {} declares {} payload bytes but holds {}",
                      path.string(), payload_len, frame.size() - kSnapshotHeaderSize - kCrcSize);
        return corrupt;
    }

    const auto stored   = get_le<uint32_t>(frame.data() + covered);
    const auto computed = crc32(frame.data(), covered);
    if (stored != computed) {
        spdlog::error("Snapshot: {} checksum mismatch (stored={:#010x}, computed={:#010x})",
                      path.string(), stored, computed);
        return corrupt;
    }

    payload = frame.data() + kSnapshotHeaderSize;
    return {};
}

// Flatten `snapshot` into a payload sorted by (schema, key).
pb::SnapshotPayload to_payload(const Snapshot& snapshot) {
    using Ref = std::tuple<const std::string*, const std::string*, const std::string*>;

    std::vector<Ref> refs;
    for (const auto& [schema, records] : snapshot.records) {
        for (const auto& [key, blob] : records) {
            refs.emplace_back(&schema, &key, &blob);
        }
    }
    static const std::string section{kSchemaSection};
    for (const auto& [name, definition] : snapshot.schemas) {
        refs.emplace_back(&section, &name, &definition);
    }

    std::sort(refs.begin(), refs.end(), [](const Ref& a, const Ref& b) {
        return std::tie(*std::get<0>(a), *std::get<1>(a)) <
               std::tie(*std::get<0>(b), *std::get<1>(b));
    });

    pb::SnapshotPayload payload;
    for (const auto& [schema, _] : snapshot.records) {
        payload.add_record_schemas(schema);  // keeps empty record maps
    }
    payload.mutable_entries()->Reserve(static_cast<int>(refs.size()));
    for (const auto& [schema, key, value] : refs) {
        auto* entry = payload.add_entries();
        entry->set_schema(*schema);
        entry->set_key(*key);
        entry->set_value(*value);
    }
    return payload;
}

} // anonymous namespace

// ── SnapshotFile::save ───────────────────────────────────────────────────────

std::error_code SnapshotFile::save(const std::filesystem::path& path,
                                   const Snapshot& snapshot) {
    std::string payload;
    if (!to_payload(snapshot).SerializeToString(&payload)) {
        spdlog::error("Snapshot: could not serialise {}", path.string());
        return std::make_error_code(std::errc::invalid_argument);
    }
    const auto frame = encode_frame(payload);

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("Snapshot: cannot create {}: {}",
                          path.parent_path().string(), ec.message());
            return ec;
        }
    }

    // Never touch `path` until the replacement is complete on disk.
    auto staging = path;
    staging += ".tmp";

    auto ec = write_synced(staging, frame);
    if (!ec) {
        std::filesystem::rename(staging, path, ec);
    }
    if (ec) {
        spdlog::error("Snapshot: writing {} failed: {}", path.string(), ec.message());
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        return ec;
    }

    spdlog::debug("Snapshot: wrote {} ({} schemas, {} bytes)",
                  path.string(), snapshot.schemas.size(), frame.size());
    return {};
}

// ── SnapshotFile::load ───────────────────────────────────────────────────────

std::error_code SnapshotFile::load(const std::filesystem::path& path,
                                   Snapshot& snapshot) {
    snapshot = {};

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            spdlog::error("Snapshot: cannot stat {}: {}", path.string(), ec.message());
            return ec;
        }
        spdlog::debug("Snapshot: {} does not exist yet", path.string());
        return {};
    }

    std::vector<uint8_t> frame;
    if ((ec = read_whole(path, frame))) {
        spdlog::error("Snapshot: reading {} failed: {}", path.string(), ec.message());
        return ec;
    }

    const uint8_t* payload_bytes = nullptr;
    uint32_t payload_len = 0;
    if ((ec = decode_frame(path, frame, payload_bytes, payload_len))) {
        return ec;
    }

    pb::SnapshotPayload payload;
    if (!payload.ParseFromArray(payload_bytes, static_cast<int>(payload_len))) {
        spdlog::error("Snapshot: {} has a malformed payload", path.string());
        return std::make_error_code(std::errc::invalid_argument);
    }

    for (const auto& schema : payload.record_schemas()) {
        snapshot.records.try_emplace(schema);
    }
    for (const auto& entry : payload.entries()) {
        if (entry.schema() == kSchemaSection) {
            snapshot.schemas.insert_or_assign(entry.key(), entry.value());
        } else {
            snapshot.records[entry.schema()].insert_or_assign(entry.key(), entry.value());
        }
    }
    spdlog::debug("Snapshot: read {} ({} schemas, {} entries)",
                  path.string(), snapshot.schemas.size(), payload.entries_size());
    return {};
}

} // namespace sdb::persistence
