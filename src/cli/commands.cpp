#include "cli/commands.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace diskmap::cli {

namespace {

int report(const std::error_code& ec, const std::string& what, std::ostream& err) {
    err << "error: " << what << ": " << ec.message() << '\n';
    return kExitStoreError;
}

// Integer JSON number as int64_t; false for unsigned values past its range.
bool to_int64(const nlohmann::json& number, std::int64_t& out) {
    if (number.is_number_unsigned()) {
        auto u = number.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return false;
        }
        out = static_cast<std::int64_t>(u);
        return true;
    }
    out = number.get<std::int64_t>();
    return true;
}

} // anonymous namespace

nlohmann::json parse_value(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return nlohmann::json(text);
    }
    return parsed;
}

int run_command(
    const CliConfig& cfg,
    const JsonMap& map,
    std::ostream& out,
    std::ostream& err)
{
    const auto& cmd  = cfg.command;
    const auto& args = cfg.args;

    spdlog::debug("diskmap-cli: {} ({} args) on {}", cmd, args.size(), map.directory().string());

    if (cmd == "insert") {
        if (auto ec = map.insert(args[0], parse_value(args[1]))) {
            return report(ec, "insert '" + args[0] + "'", err);
        }
        out << "OK\n";
        return kExitOk;
    }

    if (cmd == "get") {
        nlohmann::json value;
        if (auto ec = map.get(args[0], value)) {
            return report(ec, "get '" + args[0] + "'", err);
        }
        out << value.dump() << '\n';
        return kExitOk;
    }

    if (cmd == "overwrite") {
        if (auto ec = map.overwrite(args[0], parse_value(args[1]))) {
            return report(ec, "overwrite '" + args[0] + "'", err);
        }
        out << "OK\n";
        return kExitOk;
    }

    if (cmd == "alter-add") {
        const auto delta = parse_value(args[1]);
        if (!delta.is_number()) {
            err << "error: alter-add needs a numeric amount, got " << args[1] << '\n';
            return kExitUsage;
        }

        std::int64_t int_delta = 0;
        if (delta.is_number_integer() && !to_int64(delta, int_delta)) {
            err << "error: alter-add amount out of range: " << args[1] << '\n';
            return kExitUsage;
        }

        auto add = [&](nlohmann::json current) -> nlohmann::json {
            if (!current.is_number()) {
                throw std::runtime_error("stored value is not a number: " + current.dump());
            }
            if (current.is_number_integer() && delta.is_number_integer()) {
                std::int64_t lhs = 0;
                std::int64_t sum = 0;
                if (!to_int64(current, lhs) || __builtin_add_overflow(lhs, int_delta, &sum)) {
                    throw std::overflow_error(
                        "sum of " + current.dump() + " and " + delta.dump() + " overflows");
                }
                return sum;
            }
            return current.get<double>() + delta.get<double>();
        };

        try {
            if (auto ec = map.alter_with_default(args[0], nlohmann::json(0), add)) {
                return report(ec, "alter-add '" + args[0] + "'", err);
            }
        } catch (const std::overflow_error& e) {
            err << "error: alter-add '" << args[0] << "': " << e.what() << '\n';
            return kExitUsage;
        } catch (const std::runtime_error& e) {
            err << "error: alter-add '" << args[0] << "': " << e.what() << '\n';
            return kExitStoreError;
        }

        nlohmann::json value;
        if (auto ec = map.get(args[0], value)) {
            return report(ec, "get '" + args[0] + "'", err);
        }
        out << value.dump() << '\n';
        return kExitOk;
    }

    if (cmd == "delete") {
        if (auto ec = map.del(args[0])) {
            return report(ec, "delete '" + args[0] + "'", err);
        }
        out << "DELETED\n";
        return kExitOk;
    }

    if (cmd == "contains") {
        bool present = false;
        if (auto ec = map.contains_key(args[0], present)) {
            return report(ec, "contains", err);
        }
        out << (present ? "true" : "false") << '\n';
        return kExitOk;
    }

    if (cmd == "keys") {
        std::vector<std::string> keys;
        if (auto ec = map.get_keys(keys)) {
            return report(ec, "keys", err);
        }
        for (const auto& k : keys) {
            out << k << '\n';
        }
        return kExitOk;
    }

    if (cmd == "len") {
        std::size_t n = 0;
        if (auto ec = map.len(n)) {
            return report(ec, "len", err);
        }
        out << n << '\n';
        return kExitOk;
    }

    if (cmd == "dump") {
        std::vector<std::pair<std::string, nlohmann::json>> entries;
        if (auto ec = map.as_vec(entries)) {
            return report(ec, "dump", err);
        }
        nlohmann::json obj = nlohmann::json::object();
        for (auto& [k, v] : entries) {
            obj[k] = std::move(v);
        }
        out << obj.dump(2) << '\n';
        return kExitOk;
    }

    if (cmd == "clear") {
        if (auto ec = map.clear()) {
            return report(ec, "clear", err);
        }
        out << "OK\n";
        return kExitOk;
    }

    err << "error: unknown command '" << cmd << "'\n";
    return kExitUsage;
}

} // namespace diskmap::cli
