#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

namespace sdb {

// ── CliConfig ─────────────────────────────────────────────────────────────────
// Full configuration for one schemadb invocation.
// Populated by parse_config() from CLI arguments and an optional INI file.

struct CliConfig {
    std::string data_dir;       // Storage root: one subdirectory per database
    std::string database;       // Database selected at startup
    std::string log_level;      // spdlog level string
    bool        strict_schema;  // Reject malformed tokens and unknown types

    std::vector<std::string> command;  // verb + args; empty → interactive session

    // Set when --help was given; holds the rendered option descriptions.
    std::optional<std::string> help_text;
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a CliConfig.
//
// On success: returns a fully validated CliConfig.
// On error  : throws std::runtime_error with a human-readable message.
//
// Options given on the command line take precedence over those read from the
// file named by --config.
//
// Validates:
//   - data_dir is not empty
//   - database is a valid database name (see is_valid_database_name)
//   - log_level is one of trace|debug|info|warn|error|critical|off

[[nodiscard]] CliConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate an options_description with the options accepted both on the
// command line and in a config file.  Exposed for testing and help-text
// generation.

void add_options(boost::program_options::options_description& desc);

// A database name must be non-empty, must not be "." or "..", and must not
// contain a path separator.
[[nodiscard]] bool is_valid_database_name(std::string_view name) noexcept;

} // namespace sdb
