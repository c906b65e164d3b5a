#include "index/partial_key_index.hpp"

#include <algorithm>

namespace sdb::index {

PartialKeyIndex PartialKeyIndex::rebuild(const std::vector<std::string>& keys) {
    PartialKeyIndex index;
    for (const auto& key : keys) {
        index.insert(key);
    }
    return index;
}

std::string_view PartialKeyIndex::prefix(std::string_view key) noexcept {
    return key.substr(0, std::min(key.size(), kPrefixLength));
}

void PartialKeyIndex::insert(const std::string& key) {
    buckets_[std::string(prefix(key))].insert(key);
}

void PartialKeyIndex::remove(const std::string& key) {
    auto it = buckets_.find(std::string(prefix(key)));
    if (it != buckets_.end()) {
        it->second.erase(key);
    }
}

std::vector<std::string> PartialKeyIndex::lookup(std::string_view partial) const {
    std::vector<std::string> matches;
    if (partial.empty()) {
        return matches;
    }

    auto collect = [&](const Bucket& bucket) {
        for (const auto& key : bucket) {
            if (key.starts_with(partial)) {
                matches.push_back(key);
            }
        }
    };

    if (partial.size() >= kPrefixLength) {
        auto it = buckets_.find(std::string(prefix(partial)));
        if (it != buckets_.end()) {
            collect(it->second);
        }
        return matches;  // already sorted: a single std::set
    }

    // Short query: fan out over every bucket that could hold a match.
    for (const auto& [name, bucket] : buckets_) {
        if (name.starts_with(partial) || partial.starts_with(name)) {
            collect(bucket);
        }
    }
    std::sort(matches.begin(), matches.end());
    return matches;
}

std::size_t PartialKeyIndex::size() const noexcept {
    std::size_t total = 0;
    for (const auto& [_, bucket] : buckets_) {
        total += bucket.size();
    }
    return total;
}

bool PartialKeyIndex::operator==(const PartialKeyIndex& other) const {
    auto covered = [](const PartialKeyIndex& a, const PartialKeyIndex& b) {
        for (const auto& [name, bucket] : a.buckets_) {
            if (bucket.empty()) {
                continue;
            }
            auto it = b.buckets_.find(name);
            if (it == b.buckets_.end() || it->second != bucket) {
                return false;
            }
        }
        return true;
    };
    return covered(*this, other) && covered(other, *this);
}

} // namespace sdb::index
