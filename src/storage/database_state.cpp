#include "storage/database_state.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace sdb {

DatabaseState DatabaseState::from_snapshot(const persistence::Snapshot& snapshot) {
    DatabaseState state;

    // Stored definitions were accepted once already; re-parse them leniently
    // so a later policy change cannot make a database unloadable.
    for (const auto& [name, definition] : snapshot.schemas) {
        auto parsed = schema::define_schema(name, definition, schema::SchemaPolicy::permissive());
        if (auto* def = std::get_if<schema::SchemaDef>(&parsed)) {
            state.schemas_.insert_or_assign(name, std::move(*def));
        }
    }

    for (const auto& [schema_name, blobs] : snapshot.records) {
        auto& records = state.records_[schema_name];
        std::vector<std::string> keys;
        keys.reserve(blobs.size());

        for (const auto& [key, blob] : blobs) {
            auto value = record::parse(blob);
            if (!value) {
                spdlog::warn("Record {}/{} is not valid JSON; keeping it as text",
                             schema_name, key);
                value = record::Value{blob};
            }
            records.insert_or_assign(key, std::move(*value));
            keys.push_back(key);
        }
        state.partial_keys_[schema_name] = index::PartialKeyIndex::rebuild(keys);
    }

    for (const auto& [name, _] : state.schemas_) {
        state.records_.try_emplace(name);
        state.partial_keys_.try_emplace(name);
    }
    return state;
}

persistence::Snapshot DatabaseState::to_snapshot() const {
    persistence::Snapshot snapshot;
    for (const auto& [name, def] : schemas_) {
        snapshot.schemas.emplace(name, def.definition);
    }
    for (const auto& [schema_name, records] : records_) {
        auto& blobs = snapshot.records[schema_name];
        for (const auto& [key, value] : records) {
            blobs.emplace(key, record::dump(value));
        }
    }
    return snapshot;
}

// ── Schemas ──────────────────────────────────────────────────────────────────

const schema::SchemaDef* DatabaseState::find_schema(std::string_view name) const {
    auto it = schemas_.find(name);
    return it == schemas_.end() ? nullptr : &it->second;
}

void DatabaseState::put_schema(schema::SchemaDef def) {
    const std::string name = def.name;
    schemas_.insert_or_assign(name, std::move(def));
    records_.try_emplace(name);
    partial_keys_.try_emplace(name);
}

std::vector<std::string> DatabaseState::schema_names() const {
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& [name, _] : schemas_) {
        names.push_back(name);
    }
    return names;
}

// ── Records ──────────────────────────────────────────────────────────────────

const record::Value* DatabaseState::find_record(std::string_view schema,
                                                const std::string& key) const {
    auto it = records_.find(std::string(schema));
    if (it == records_.end()) {
        return nullptr;
    }
    auto rec = it->second.find(key);
    return rec == it->second.end() ? nullptr : &rec->second;
}

void DatabaseState::put_record(const std::string& schema, const std::string& key,
                               record::Value value) {
    records_[schema].insert_or_assign(key, std::move(value));
    partial_keys_[schema].insert(key);
}

bool DatabaseState::erase_record(const std::string& schema, const std::string& key) {
    auto it = records_.find(schema);
    if (it == records_.end() || it->second.erase(key) == 0) {
        return false;
    }
    partial_keys_[schema].remove(key);
    return true;
}

std::vector<std::string> DatabaseState::lookup_partial(const std::string& schema,
                                                       std::string_view partial) const {
    auto it = partial_keys_.find(schema);
    if (it == partial_keys_.end()) {
        return {};
    }
    return it->second.lookup(partial);
}

std::vector<StoredRecord> DatabaseState::records(const std::string& schema) const {
    std::vector<StoredRecord> result;
    auto it = records_.find(schema);
    if (it == records_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (const auto& [key, value] : it->second) {
        result.push_back({key, value});
    }
    std::sort(result.begin(), result.end(),
              [](const StoredRecord& a, const StoredRecord& b) { return a.key < b.key; });
    return result;
}

const index::PartialKeyIndex* DatabaseState::partial_key_index(const std::string& schema) const {
    auto it = partial_keys_.find(schema);
    return it == partial_keys_.end() ? nullptr : &it->second;
}

void DatabaseState::clear() {
    schemas_.clear();
    records_.clear();
    partial_keys_.clear();
}

} // namespace sdb
