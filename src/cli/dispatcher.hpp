#pragma once

#include "cli/command.hpp"
#include "storage/storage_engine.hpp"

#include <iosfwd>

namespace sdb::cli {

// ── Dispatcher ────────────────────────────────────────────────────────────────
//
// Executes parsed commands against a StorageEngine and renders their result
// on `out`: one line per item, errors as a single "Error: <message>" line.
//
// Thread-safety: the engine is thread-safe; `out` is not synchronised.

class Dispatcher {
public:
    Dispatcher(StorageEngine& engine, std::ostream& out);

    // Run `cmd`.  Returns the process exit code: 0 on success, 1 on any
    // reported error.
    int execute(const Command& cmd);

    // Read commands from `in` line by line until EOF or quit/exit.  Prints
    // `prompt` before each line when non-empty.  Returns the exit code of
    // the last executed command (0 if none).
    int run_session(std::istream& in, std::string_view prompt = {});

private:
    int fail(const Error& err);
    int fail(std::string_view message);

    StorageEngine& engine_;
    std::ostream&  out_;
};

} // namespace sdb::cli
