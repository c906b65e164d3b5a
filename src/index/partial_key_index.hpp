#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sdb::index {

// ── PartialKeyIndex ───────────────────────────────────────────────────────────
//
// Secondary lookup from a fixed-length key prefix to the set of full keys
// sharing it.  Buckets are keyed by the first kPrefixLength characters of a
// key (or the whole key if shorter).
//
// Invariant (maintained by the owner): every full key of the indexed record
// map is in bucket prefix(key), and every key in a bucket exists in the map.
//
// Not thread-safe; the owning StorageEngine serialises access.

class PartialKeyIndex {
public:
    static constexpr std::size_t kPrefixLength = 5;

    using Bucket = std::set<std::string>;

    PartialKeyIndex() = default;

    // Build an index over `keys` from scratch.
    [[nodiscard]] static PartialKeyIndex rebuild(const std::vector<std::string>& keys);

    // Bucket name for `key`.
    [[nodiscard]] static std::string_view prefix(std::string_view key) noexcept;

    // Adds `key` to its bucket.  Idempotent.
    void insert(const std::string& key);

    // Removes `key` from its bucket.  The bucket is kept even when it becomes
    // empty; lookup treats empty buckets as "no match".
    void remove(const std::string& key);

    // Full keys that literally start with `partial`, sorted.
    //   - empty partial         → no matches
    //   - len >= kPrefixLength  → single bucket prefix(partial)
    //   - len <  kPrefixLength  → every bucket whose name is a prefix of
    //                             `partial` or vice versa
    [[nodiscard]] std::vector<std::string> lookup(std::string_view partial) const;

    [[nodiscard]] const std::unordered_map<std::string, Bucket>& buckets() const noexcept {
        return buckets_;
    }

    // Total number of indexed keys.
    [[nodiscard]] std::size_t size() const noexcept;

    // Equivalence over non-empty buckets, so an incrementally maintained index
    // compares equal to one rebuilt from the same key set.
    bool operator==(const PartialKeyIndex& other) const;

private:
    std::unordered_map<std::string, Bucket> buckets_;
};

} // namespace sdb::index
