#include "cli/command.hpp"
#include "cli/dispatcher.hpp"
#include "common/cli_config.hpp"
#include "common/logger.hpp"
#include "persistence/snapshot_file.hpp"
#include "storage/storage_engine.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <variant>

#include <unistd.h>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    sdb::CliConfig cfg;
    try {
        cfg = sdb::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    if (cfg.help_text) {
        fprintf(stdout, "%s\n%s", cfg.help_text->c_str(), sdb::cli::usage().c_str());
        return 0;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    sdb::init_default_logger(sdb::parse_log_level(cfg.log_level));

    spdlog::debug("schemadb starting – data_dir={} database={} strict_schema={}",
                  cfg.data_dir, cfg.database, cfg.strict_schema);

    // ── Engine ───────────────────────────────────────────────────────────────
    sdb::EngineOptions options;
    options.root             = cfg.data_dir;
    options.default_database = cfg.database;
    options.schema_policy    = cfg.strict_schema ? sdb::schema::SchemaPolicy::strict()
                                                 : sdb::schema::SchemaPolicy::permissive();

    std::unique_ptr<sdb::StorageEngine> engine;
    try {
        engine = std::make_unique<sdb::StorageEngine>(
            std::move(options), std::make_unique<sdb::persistence::SnapshotFile>());
    } catch (const std::exception& ex) {
        spdlog::error("schemadb: failed to open storage at {}: {}", cfg.data_dir, ex.what());
        return 1;
    }

    sdb::cli::Dispatcher dispatcher(*engine, std::cout);

    // ── Interactive session ──────────────────────────────────────────────────
    if (cfg.command.empty()) {
        const bool tty = ::isatty(STDIN_FILENO) != 0;
        if (tty) {
            fprintf(stdout, "schemadb – database '%s' under %s. "
                    "Type 'help' for commands, Ctrl+D to quit.\n",
                    cfg.database.c_str(), cfg.data_dir.c_str());
            fflush(stdout);
        }
        return dispatcher.run_session(std::cin, tty ? "> " : "");
    }

    // ── One-shot command ─────────────────────────────────────────────────────
    auto parsed = sdb::cli::parse_args(cfg.command);
    if (auto* err = std::get_if<sdb::cli::ParseError>(&parsed)) {
        std::cout << "Error: " << err->message << '\n' << sdb::cli::usage();
        return 1;
    }
    return dispatcher.execute(std::get<sdb::cli::Command>(parsed));
}
