#include "common/store_config.hpp"

#include <cstddef>
#include <format>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace diskmap {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

struct CommandSpec {
    std::string_view name;
    std::size_t      arg_count;
    std::string_view usage;
};

constexpr CommandSpec kCommands[] = {
    {"insert",    2, "insert KEY JSON"},
    {"get",       1, "get KEY"},
    {"overwrite", 2, "overwrite KEY JSON"},
    {"alter-add", 2, "alter-add KEY N"},
    {"delete",    1, "delete KEY"},
    {"contains",  1, "contains KEY"},
    {"keys",      0, "keys"},
    {"len",       0, "len"},
    {"dump",      0, "dump"},
    {"clear",     0, "clear"},
};

// Validate the fully populated CliConfig.
void validate(const CliConfig& cfg) {
    if (cfg.directory.empty()) {
        throw std::runtime_error("--dir must not be empty");
    }

    for (const auto& spec : kCommands) {
        if (spec.name != cfg.command) continue;
        if (cfg.args.size() != spec.arg_count) {
            throw std::runtime_error(
                std::format("Wrong number of arguments for '{}' (usage: {})",
                            cfg.command, spec.usage));
        }
        return;
    }
    throw std::runtime_error(std::format("Unknown command '{}'", cfg.command));
}

} // anonymous namespace

LockMode parse_lock_mode(std::string_view s) {
    if (s == "blocking")    return LockMode::Blocking;
    if (s == "nonblocking") return LockMode::NonBlocking;
    throw std::runtime_error(
        std::format("--lock-mode must be 'blocking' or 'nonblocking', got '{}'", s));
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("dir,d",
            po::value<std::string>()->required(),
            "Store directory (created if absent)")
        ("fresh",
            po::bool_switch()->default_value(false),
            "Wipe the store directory before running the command")
        ("lock-mode",
            po::value<std::string>()->default_value("blocking"),
            "Lock acquisition: blocking|nonblocking")
        ("strict-listing",
            po::bool_switch()->default_value(false),
            "Fail enumeration on unreadable directory entries instead of skipping them")
        ("sync",
            po::bool_switch()->default_value(false),
            "fdatasync every written entry")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical")
        ("command",
            po::value<std::string>()->required(),
            "insert|get|overwrite|alter-add|delete|contains|keys|len|dump|clear")
        ("args",
            po::value<std::vector<std::string>>()->default_value({}, ""),
            "Command arguments");
}

// ── parse_cli ─────────────────────────────────────────────────────────────────

CliConfig parse_cli(int argc, char* argv[]) {
    po::options_description desc("diskmap-cli options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: diskmap-cli --dir DIR [options] COMMAND [ARGS...]\n"
                << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::format("Argument error: {}", e.what()));
    }

    CliConfig cfg;
    cfg.directory              = vm["dir"].as<std::string>();
    cfg.fresh                  = vm["fresh"].as<bool>();
    cfg.log_level              = vm["log-level"].as<std::string>();
    cfg.options.lock_mode      = parse_lock_mode(vm["lock-mode"].as<std::string>());
    cfg.options.strict_listing = vm["strict-listing"].as<bool>();
    cfg.options.sync_writes    = vm["sync"].as<bool>();
    cfg.command                = vm["command"].as<std::string>();
    cfg.args                   = vm["args"].as<std::vector<std::string>>();

    validate(cfg);
    return cfg;
}

} // namespace diskmap
