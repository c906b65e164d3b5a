#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace sdb {

// ── Error taxonomy ───────────────────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    NotFound            = 0,  // schema or record absent
    InvalidInput        = 1,  // malformed JSON, bad schema name or token
    ValidationFailed    = 2,  // type mismatch against the schema
    AmbiguousKey        = 3,  // partial lookup resolved to >1 candidate
    KeyExtractionFailed = 4,  // no usable identity in a new record
    IOError             = 5,  // persistence read/write failure
};

// Stable lower-case name of `kind` ("not_found", "io_error", …).
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// ── Error ────────────────────────────────────────────────────────────────────
//
// Returned to the immediate caller of every engine operation.  `candidates`
// is only populated for AmbiguousKey (sorted full keys).

struct Error {
    ErrorKind                kind;
    std::string              message;
    std::vector<std::string> candidates;

    [[nodiscard]] static Error not_found(std::string message) {
        return {ErrorKind::NotFound, std::move(message), {}};
    }
    [[nodiscard]] static Error invalid_input(std::string message) {
        return {ErrorKind::InvalidInput, std::move(message), {}};
    }
    [[nodiscard]] static Error validation_failed(std::string message) {
        return {ErrorKind::ValidationFailed, std::move(message), {}};
    }
    [[nodiscard]] static Error key_extraction_failed(std::string message) {
        return {ErrorKind::KeyExtractionFailed, std::move(message), {}};
    }
    [[nodiscard]] static Error ambiguous_key(std::string message,
                                             std::vector<std::string> candidates) {
        return {ErrorKind::AmbiguousKey, std::move(message), std::move(candidates)};
    }

    // Wrap a persistence error code, prefixed with what was being done.
    [[nodiscard]] static Error io_error(std::string_view context,
                                        const std::error_code& ec);
};

// Result of an operation that produces a value.
template <typename T>
using Result = std::variant<T, Error>;

// Result of an operation that produces nothing: nullopt on success.
using Status = std::optional<Error>;

} // namespace sdb
