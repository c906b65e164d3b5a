#include "storage/storage_engine.hpp"

#include "record/key_extractor.hpp"
#include "record/value.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace sdb {

namespace {

std::string format_candidates(const std::vector<std::string>& keys) {
    std::string out = "[";
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += keys[i];
    }
    out += ']';
    return out;
}

Error schema_not_found(const std::string& name) {
    return Error::not_found(std::format("schema '{}' does not exist", name));
}

// RFC 3339, UTC, second precision: 2024-05-01T12:00:00Z
std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(tp));
}

} // anonymous namespace

StorageEngine::StorageEngine(EngineOptions options,
                             std::unique_ptr<persistence::Persistence> persistence)
    : options_(std::move(options))
    , persistence_(std::move(persistence))
    , current_(options_.default_database)
{
    if (!persistence_) {
        throw std::invalid_argument("StorageEngine requires a persistence adapter");
    }
    load_locked();
}

// ── Schemas ──────────────────────────────────────────────────────────────────

Status StorageEngine::create_schema(const std::string& name, const std::string& fields) {
    if (name.empty()) {
        return Error::invalid_input("schema name must not be empty");
    }
    if (name == persistence::kSchemaSection) {
        return Error::invalid_input(std::format("schema name '{}' is reserved", name));
    }

    auto parsed = schema::define_schema(name, fields, options_.schema_policy);
    if (auto* err = std::get_if<Error>(&parsed)) {
        return std::move(*err);
    }

    std::unique_lock lock(mutex_);
    state_.put_schema(std::move(std::get<schema::SchemaDef>(parsed)));
    spdlog::debug("[{}] schema {} defined as '{}'", current_, name, fields);
    return flush_locked();
}

Result<std::string> StorageEngine::get_schema(const std::string& name) const {
    std::shared_lock lock(mutex_);
    const auto* def = state_.find_schema(name);
    if (def == nullptr) {
        return schema_not_found(name);
    }
    return def->definition;
}

std::vector<std::string> StorageEngine::list_schemas() const {
    std::shared_lock lock(mutex_);
    return state_.schema_names();
}

// ── Records ──────────────────────────────────────────────────────────────────

Result<std::string> StorageEngine::add_record(const std::string& schema,
                                              std::string_view json) {
    std::unique_lock lock(mutex_);

    const auto* def = state_.find_schema(schema);
    if (def == nullptr) {
        return schema_not_found(schema);
    }

    auto parsed = record::parse(json);
    if (!parsed) {
        return Error::invalid_input(std::format("invalid JSON format: {}", json));
    }
    auto* fields = parsed->get_if<record::Object>();
    if (fields == nullptr) {
        return Error::invalid_input(std::format(
            "record must be a JSON object, got {}", record::type_name(parsed->type())));
    }

    // The key derives from the fields as supplied, before stamping.
    auto key = record::extract_key(*parsed, json);
    if (auto* err = std::get_if<Error>(&key)) {
        return std::move(*err);
    }

    const auto now = format_timestamp(options_.clock());
    fields->insert_or_assign("created_at", record::Value{now});
    fields->insert_or_assign("updated_at", record::Value{now});

    if (auto failure = schema::validate(*def, *parsed, options_.schema_policy)) {
        return Error::validation_failed(
            std::format("record validation failed: {}", failure->message()));
    }

    auto& full_key = std::get<std::string>(key);
    state_.put_record(schema, full_key, std::move(*parsed));
    spdlog::debug("[{}] record {}/{} stored", current_, schema, full_key);

    if (auto err = flush_locked()) {
        return std::move(*err);
    }
    return std::move(full_key);
}

Result<StoredRecord> StorageEngine::get_record(const std::string& schema,
                                               const std::string& key) const {
    std::shared_lock lock(mutex_);

    if (state_.find_schema(schema) == nullptr) {
        return schema_not_found(schema);
    }

    if (const auto* exact = state_.find_record(schema, key)) {
        return StoredRecord{key, *exact};
    }

    auto matches = state_.lookup_partial(schema, key);
    if (matches.size() == 1) {
        if (const auto* rec = state_.find_record(schema, matches.front())) {
            return StoredRecord{matches.front(), *rec};
        }
    } else if (matches.size() > 1) {
        auto message = std::format("multiple records match partial key '{}' in schema '{}': {}",
                                   key, schema, format_candidates(matches));
        return Error::ambiguous_key(std::move(message), std::move(matches));
    }

    return Error::not_found(
        std::format("record with key '{}' does not exist in schema '{}'", key, schema));
}

Status StorageEngine::delete_record(const std::string& schema, const std::string& key) {
    std::unique_lock lock(mutex_);

    if (state_.find_schema(schema) == nullptr) {
        return schema_not_found(schema);
    }
    if (!state_.erase_record(schema, key)) {
        return Error::not_found(
            std::format("record with key '{}' does not exist in schema '{}'", key, schema));
    }
    spdlog::debug("[{}] record {}/{} deleted", current_, schema, key);
    return flush_locked();
}

Result<std::vector<StoredRecord>> StorageEngine::list_records(const std::string& schema) const {
    std::shared_lock lock(mutex_);
    if (state_.find_schema(schema) == nullptr) {
        return schema_not_found(schema);
    }
    return state_.records(schema);
}

// ── Databases ────────────────────────────────────────────────────────────────

void StorageEngine::use_database(const std::string& name) {
    std::unique_lock lock(mutex_);

    if (auto err = flush_locked()) {
        spdlog::error("[{}] flush before switching to {} failed: {}",
                      current_, name, err->message);
    }

    spdlog::info("Switching database {} -> {}", current_, name);
    state_.clear();
    current_ = name;
    load_locked();
}

Result<std::vector<std::string>> StorageEngine::list_databases() const {
    namespace fs = std::filesystem;

    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::exists(options_.root, ec)) {
        if (ec) {
            return Error::io_error("failed to read storage directory", ec);
        }
        return names;
    }

    fs::directory_iterator it(options_.root, ec);
    if (ec) {
        return Error::io_error("failed to read storage directory", ec);
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string StorageEngine::current_database() const {
    std::shared_lock lock(mutex_);
    return current_;
}

Status StorageEngine::wipe_database() {
    std::unique_lock lock(mutex_);
    state_.clear();
    spdlog::info("[{}] database wiped", current_);
    return flush_locked();
}

std::optional<index::PartialKeyIndex> StorageEngine::partial_key_index(
    const std::string& schema) const {
    std::shared_lock lock(mutex_);
    if (const auto* idx = state_.partial_key_index(schema)) {
        return *idx;
    }
    return std::nullopt;
}

// ── Private ──────────────────────────────────────────────────────────────────

std::filesystem::path StorageEngine::database_path(const std::string& name) const {
    return options_.root / name / options_.file_name;
}

Status StorageEngine::flush_locked() {
    const auto path = database_path(current_);
    if (auto ec = persistence_->save(path, state_.to_snapshot())) {
        spdlog::error("[{}] failed to persist {}: {}", current_, path.string(), ec.message());
        return Error::io_error(std::format("failed to persist database '{}'", current_), ec);
    }
    return std::nullopt;
}

void StorageEngine::quarantine(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return;
    }

    auto aside = path;
    aside += kQuarantineSuffix;
    std::filesystem::rename(path, aside, ec);
    if (ec) {
        spdlog::error("[{}] could not move {} aside ({}); the next write will replace it",
                      current_, path.string(), ec.message());
        return;
    }
    spdlog::warn("[{}] unreadable snapshot kept as {}", current_, aside.string());
}

void StorageEngine::load_locked() {
    const auto path = database_path(current_);

    std::error_code dir_ec;
    std::filesystem::create_directories(path.parent_path(), dir_ec);
    if (dir_ec) {
        spdlog::warn("[{}] could not create {}: {}", current_,
                     path.parent_path().string(), dir_ec.message());
    }

    persistence::Snapshot snapshot;
    if (auto ec = persistence_->load(path, snapshot)) {
        spdlog::error("[{}] failed to load {}: {}; starting empty",
                      current_, path.string(), ec.message());
        quarantine(path);
        state_ = DatabaseState{};
        return;
    }

    state_ = DatabaseState::from_snapshot(snapshot);
    spdlog::info("[{}] loaded {} schemas from {}", current_,
                 snapshot.schemas.size(), path.string());
}

} // namespace sdb
