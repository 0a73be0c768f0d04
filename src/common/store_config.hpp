#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <spdlog/logger.h>

namespace diskmap {

// ── LockMode ──────────────────────────────────────────────────────────────────
// How advisory lock acquisition behaves under contention.

enum class LockMode : uint8_t {
    Blocking    = 0,  // wait until the lock is granted
    NonBlocking = 1,  // fail immediately with Error::CannotGetLock
};

// ── StoreOptions ──────────────────────────────────────────────────────────────
// Runtime knobs of one store handle.  Copied along with the handle.

struct StoreOptions {
    LockMode lock_mode      = LockMode::Blocking;
    bool     strict_listing = false;  // fail get_keys() on unreadable entries instead of skipping
    bool     sync_writes    = false;  // fdatasync each written file before unlocking

    // Logger for this store; spdlog's default logger when null.
    std::shared_ptr<spdlog::logger> logger;
};

// ── CliConfig ─────────────────────────────────────────────────────────────────
// Full configuration for one diskmap-cli invocation.
// Populated by parse_cli() from command-line arguments.

struct CliConfig {
    std::string              directory;   // Store directory
    bool                     fresh;       // Wipe the directory before opening
    std::string              log_level;   // spdlog level string
    StoreOptions             options;     // Store knobs (logger left unset)
    std::string              command;     // insert|get|overwrite|alter-add|delete|keys|len|contains|dump|clear
    std::vector<std::string> args;        // Command arguments
};

// ── parse_lock_mode ───────────────────────────────────────────────────────────
// "blocking" or "nonblocking"; throws std::runtime_error otherwise.

[[nodiscard]] LockMode parse_lock_mode(std::string_view s);

// ── parse_cli ─────────────────────────────────────────────────────────────────
// Parse CLI arguments into a CliConfig.
//
// On success: returns a fully validated CliConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (including for --help, whose message is the help text).
//
// Validates:
//   - --dir is present and non-empty
//   - --lock-mode is blocking|nonblocking
//   - command is known and has the right number of arguments

[[nodiscard]] CliConfig parse_cli(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with diskmap-cli
// options.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace diskmap
