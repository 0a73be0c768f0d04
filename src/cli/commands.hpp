#pragma once

#include "common/store_config.hpp"
#include "storage/disk_map.hpp"

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace diskmap::cli {

// Store type behind diskmap-cli: string keys, arbitrary JSON values.
using JsonMap = DiskMap<std::string, nlohmann::json>;

// Exit codes.
inline constexpr int kExitOk         = 0;
inline constexpr int kExitStoreError = 1;
inline constexpr int kExitUsage      = 2;

// Command-line text → stored value.  Valid JSON is stored as parsed,
// anything else as a JSON string.
[[nodiscard]] nlohmann::json parse_value(const std::string& text);

// Run cfg.command against `map`.  Results go to `out`, diagnostics to `err`.
// Returns one of the exit codes above.
[[nodiscard]] int run_command(
    const CliConfig& cfg,
    const JsonMap& map,
    std::ostream& out,
    std::ostream& err);

} // namespace diskmap::cli
