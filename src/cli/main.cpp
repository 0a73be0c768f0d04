#include "cli/commands.hpp"
#include "common/logger.hpp"
#include "common/store_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <iostream>
#include <stdexcept>

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    diskmap::CliConfig cfg;
    try {
        cfg = diskmap::parse_cli(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return diskmap::cli::kExitUsage;
    }

    diskmap::init_default_logger(diskmap::parse_log_level(cfg.log_level));

    diskmap::cli::JsonMap map;
    auto ec = cfg.fresh
        ? diskmap::cli::JsonMap::open_new(cfg.directory, map, cfg.options)
        : diskmap::cli::JsonMap::open(cfg.directory, map, cfg.options);
    if (ec) {
        fprintf(stderr, "error: open '%s': %s\n", cfg.directory.c_str(), ec.message().c_str());
        return diskmap::cli::kExitStoreError;
    }

    try {
        return diskmap::cli::run_command(cfg, map, std::cout, std::cerr);
    } catch (const std::exception& ex) {
        spdlog::error("diskmap-cli: exception: {}", ex.what());
        return diskmap::cli::kExitStoreError;
    }
}
