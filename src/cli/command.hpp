#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sdb::cli {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of a single schemadb command.  Each command type is a
// plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct ListSchemasCmd {};

struct ShowSchemaCmd {
    std::string name;
};

struct CreateSchemaCmd {
    std::string name;
    std::string fields;  // "field:type field:type ..."
};

struct AddCmd {
    std::string schema;
    std::string json;
};

struct GetCmd {
    std::string schema;
    std::string key;  // exact or partial
};

struct DeleteCmd {
    std::string schema;
    std::string key;  // exact only
};

struct ListCmd {
    std::string schema;
};

struct UseCmd {
    std::string database;
};

struct DbsCmd {};
struct WipeCmd {};
struct HelpCmd {};
struct QuitCmd {};  // interactive sessions only

using Command = std::variant<ListSchemasCmd, ShowSchemaCmd, CreateSchemaCmd, AddCmd, GetCmd,
                             DeleteCmd, ListCmd, UseCmd, DbsCmd, WipeCmd, HelpCmd, QuitCmd>;

struct ParseError {
    std::string message;
};

// Parse a command given as separate arguments (argv form).  The verb is
// case-insensitive.  For `add` and `schema <name> <fields...>` the trailing
// arguments are joined with single spaces.
[[nodiscard]] std::variant<Command, ParseError> parse_args(const std::vector<std::string>& args);

// Parse one line of an interactive session.  For add/get/view/delete/schema
// the remainder of the line after the schema name is one argument, so JSON
// and keys may contain spaces.  Also recognises quit/exit.
[[nodiscard]] std::variant<Command, ParseError> parse_line(std::string_view line);

// Usage text listing every command.
[[nodiscard]] std::string usage();

} // namespace sdb::cli
