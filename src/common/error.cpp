#include "common/error.hpp"

#include <format>

namespace sdb {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:            return "not_found";
        case ErrorKind::InvalidInput:        return "invalid_input";
        case ErrorKind::ValidationFailed:    return "validation_failed";
        case ErrorKind::AmbiguousKey:        return "ambiguous_key";
        case ErrorKind::KeyExtractionFailed: return "key_extraction_failed";
        case ErrorKind::IOError:             return "io_error";
    }
    return "unknown";
}

Error Error::io_error(std::string_view context, const std::error_code& ec) {
    return {ErrorKind::IOError, std::format("{}: {}", context, ec.message()), {}};
}

} // namespace sdb
