#include "cli/command.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace sdb::cli {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

// Split `line` on the first run of whitespace, returning {head, rest}.
// If there is no whitespace, rest is empty.
std::pair<std::string_view, std::string_view> split_once(std::string_view line) {
    line = trim(line);
    const auto pos = line.find_first_of(kWhitespace);
    if (pos == std::string_view::npos) {
        return {line, {}};
    }
    return {line.substr(0, pos), trim(line.substr(pos + 1))};
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string join(const std::vector<std::string>& args, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i) {
        if (i > from) {
            out += ' ';
        }
        out += args[i];
    }
    return out;
}

// Verbs whose last argument is the remainder of an interactive line.
bool takes_tail(std::string_view verb) {
    return verb == "add" || verb == "get" || verb == "view" || verb == "delete" ||
           verb == "schema";
}

} // namespace

// ── parse_args ────────────────────────────────────────────────────────────────

std::variant<Command, ParseError> parse_args(const std::vector<std::string>& args) {
    if (args.empty()) {
        return ParseError{"empty command"};
    }

    const auto verb  = to_lower(args[0]);
    const auto nargs = args.size() - 1;

    // ── schema [name [fields...]] ─────────────────────────────────────────────
    if (verb == "schema") {
        if (nargs == 0) {
            return ListSchemasCmd{};
        }
        if (nargs == 1) {
            return ShowSchemaCmd{args[1]};
        }
        return CreateSchemaCmd{args[1], join(args, 2)};
    }

    // ── add <schema> <json> ───────────────────────────────────────────────────
    if (verb == "add") {
        if (nargs < 2) {
            return ParseError{"usage: add <schema> <record_data>"};
        }
        return AddCmd{args[1], join(args, 2)};
    }

    // ── get|view|delete <schema> <key> ────────────────────────────────────────
    if (verb == "get" || verb == "view" || verb == "delete") {
        if (nargs != 2) {
            return ParseError{"usage: " + verb + " <schema> <key>"};
        }
        if (verb == "delete") {
            return DeleteCmd{args[1], args[2]};
        }
        return GetCmd{args[1], args[2]};
    }

    // ── list <schema> ─────────────────────────────────────────────────────────
    if (verb == "list") {
        if (nargs != 1) {
            return ParseError{"usage: list <schema>"};
        }
        return ListCmd{args[1]};
    }

    // ── use <database> ────────────────────────────────────────────────────────
    if (verb == "use") {
        if (nargs != 1) {
            return ParseError{"usage: use <database_name>"};
        }
        return UseCmd{args[1]};
    }

    // ── argument-less commands ────────────────────────────────────────────────
    if (verb == "dbs" || verb == "wipe" || verb == "drop" || verb == "help") {
        if (nargs != 0) {
            return ParseError{verb + " takes no arguments"};
        }
        if (verb == "dbs") {
            return DbsCmd{};
        }
        if (verb == "help") {
            return HelpCmd{};
        }
        return WipeCmd{};
    }

    return ParseError{"unknown command: " + args[0]};
}

// ── parse_line ────────────────────────────────────────────────────────────────

std::variant<Command, ParseError> parse_line(std::string_view line) {
    auto [verb_tok, rest] = split_once(line);
    if (verb_tok.empty()) {
        return ParseError{"empty command"};
    }

    const auto verb = to_lower(verb_tok);
    if (verb == "quit" || verb == "exit") {
        if (!rest.empty()) {
            return ParseError{verb + " takes no arguments"};
        }
        return QuitCmd{};
    }

    std::vector<std::string> args{std::string(verb_tok)};
    if (takes_tail(verb)) {
        auto [first, tail] = split_once(rest);
        if (!first.empty()) {
            args.emplace_back(first);
        }
        if (!tail.empty()) {
            args.emplace_back(tail);
        }
    } else {
        while (!rest.empty()) {
            auto [token, remaining] = split_once(rest);
            args.emplace_back(token);
            rest = remaining;
        }
    }
    return parse_args(args);
}

// ── usage ─────────────────────────────────────────────────────────────────────

std::string usage() {
    return
        "Usage:\n"
        "  schemadb schema                              - List schemas\n"
        "  schemadb schema <schema_name>                - View a schema\n"
        "  schemadb schema <schema_name> <field:type>...- Create or replace a schema\n"
        "  schemadb add <schema> <record_data>          - Add a record\n"
        "  schemadb get <schema> <key>                  - Get a record (exact or partial key)\n"
        "  schemadb view <schema> <key>                 - Same as get\n"
        "  schemadb delete <schema> <key>               - Delete a record (exact key)\n"
        "  schemadb list <schema>                       - List all records of a schema\n"
        "  schemadb use <database_name>                 - Switch to a different database\n"
        "  schemadb dbs                                 - List all available databases\n"
        "  schemadb wipe|drop                           - Wipe the current database\n"
        "\n"
        "Examples:\n"
        "  schemadb schema User name:string age:int email:string\n"
        "  schemadb add User '{\"name\":\"Alice\", \"age\":30}'\n"
        "  schemadb get User Ali\n"
        "  schemadb -d my_database list User\n"
        "\n"
        "Put -- before the command when an argument starts with '-':\n"
        "  schemadb -- delete Account -1\n";
}

} // namespace sdb::cli
