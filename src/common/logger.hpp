#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace sdb {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger ("schemadb", colored, on stderr so that
// command output on stdout stays clean).
// Idempotent: a second call only adjusts the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::warn);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace sdb
