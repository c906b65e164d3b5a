#include "cli/dispatcher.hpp"

#include "common/cli_config.hpp"
#include "record/value.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace sdb::cli {

Dispatcher::Dispatcher(StorageEngine& engine, std::ostream& out)
    : engine_(engine)
    , out_(out)
{
}

int Dispatcher::fail(const Error& err) {
    spdlog::debug("command failed [{}]: {}", to_string(err.kind), err.message);
    return fail(err.message);
}

int Dispatcher::fail(std::string_view message) {
    out_ << "Error: " << message << '\n';
    return 1;
}

// ── execute ───────────────────────────────────────────────────────────────────

int Dispatcher::execute(const Command& cmd) {
    return std::visit(
        [this](const auto& c) -> int {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, ListSchemasCmd>) {
                const auto names = engine_.list_schemas();
                if (names.empty()) {
                    out_ << "No schemas defined\n";
                } else {
                    out_ << "Defined schemas:\n";
                    for (const auto& name : names) {
                        out_ << "  " << name << '\n';
                    }
                }
                return 0;
            } else if constexpr (std::is_same_v<T, ShowSchemaCmd>) {
                auto def = engine_.get_schema(c.name);
                if (auto* err = std::get_if<Error>(&def)) {
                    return fail(*err);
                }
                out_ << "Schema '" << c.name << "': " << std::get<std::string>(def) << '\n';
                return 0;
            } else if constexpr (std::is_same_v<T, CreateSchemaCmd>) {
                if (auto err = engine_.create_schema(c.name, c.fields)) {
                    return fail(*err);
                }
                out_ << "Schema '" << c.name << "' created successfully\n";
                return 0;
            } else if constexpr (std::is_same_v<T, AddCmd>) {
                auto key = engine_.add_record(c.schema, c.json);
                if (auto* err = std::get_if<Error>(&key)) {
                    return fail(*err);
                }
                out_ << "Record added successfully (key: " << std::get<std::string>(key) << ")\n";
                return 0;
            } else if constexpr (std::is_same_v<T, GetCmd>) {
                auto rec = engine_.get_record(c.schema, c.key);
                if (auto* err = std::get_if<Error>(&rec)) {
                    return fail(*err);
                }
                out_ << record::dump(std::get<StoredRecord>(rec).value) << '\n';
                return 0;
            } else if constexpr (std::is_same_v<T, DeleteCmd>) {
                if (auto err = engine_.delete_record(c.schema, c.key)) {
                    return fail(*err);
                }
                out_ << "Record deleted successfully\n";
                return 0;
            } else if constexpr (std::is_same_v<T, ListCmd>) {
                auto records = engine_.list_records(c.schema);
                if (auto* err = std::get_if<Error>(&records)) {
                    return fail(*err);
                }
                for (const auto& rec : std::get<std::vector<StoredRecord>>(records)) {
                    out_ << record::dump(rec.value) << '\n';
                }
                return 0;
            } else if constexpr (std::is_same_v<T, UseCmd>) {
                if (!is_valid_database_name(c.database)) {
                    return fail("invalid database name '" + c.database + "'");
                }
                engine_.use_database(c.database);
                out_ << "Switched to database '" << c.database << "'\n";
                return 0;
            } else if constexpr (std::is_same_v<T, DbsCmd>) {
                auto dbs = engine_.list_databases();
                if (auto* err = std::get_if<Error>(&dbs)) {
                    return fail(*err);
                }
                const auto& names = std::get<std::vector<std::string>>(dbs);
                if (names.empty()) {
                    out_ << "No databases found\n";
                } else {
                    out_ << "Available databases:\n";
                    for (const auto& name : names) {
                        out_ << "  " << name << '\n';
                    }
                }
                return 0;
            } else if constexpr (std::is_same_v<T, WipeCmd>) {
                if (auto err = engine_.wipe_database()) {
                    return fail(*err);
                }
                out_ << "Database wiped successfully\n";
                return 0;
            } else if constexpr (std::is_same_v<T, HelpCmd>) {
                out_ << usage();
                return 0;
            } else if constexpr (std::is_same_v<T, QuitCmd>) {
                return 0;
            }
        },
        cmd);
}

// ── run_session ───────────────────────────────────────────────────────────────

int Dispatcher::run_session(std::istream& in, std::string_view prompt) {
    int last = 0;
    std::string line;
    while (true) {
        if (!prompt.empty()) {
            out_ << prompt << std::flush;
        }
        if (!std::getline(in, line)) {
            break;
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        auto parsed = parse_line(line);
        if (auto* err = std::get_if<ParseError>(&parsed)) {
            last = fail(err->message);
            continue;
        }

        const auto& cmd = std::get<Command>(parsed);
        if (std::holds_alternative<QuitCmd>(cmd)) {
            break;
        }
        last = execute(cmd);
    }
    return last;
}

} // namespace sdb::cli
