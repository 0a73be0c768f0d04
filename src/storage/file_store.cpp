#include "storage/file_store.hpp"
#include "persistence/locked_file.hpp"
#include "storage/error.hpp"

#include <cerrno>
#include <utility>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace diskmap {

using persistence::LockedFile;
using persistence::LockKind;
using persistence::OpenMode;

FileStore::FileStore(std::filesystem::path directory, StoreOptions options)
    : directory_(std::move(directory)), options_(std::move(options)) {}

spdlog::logger& FileStore::log() const {
    return options_.logger ? *options_.logger : *spdlog::default_logger_raw();
}

// ── Lifecycle ────────────────────────────────────────────────────────────────

std::error_code FileStore::open(
    const std::filesystem::path& directory,
    FileStore& out,
    StoreOptions options)
{
    FileStore store(directory, std::move(options));

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        store.log().error("cannot create store directory {}: {}",
                          directory.string(), ec.message());
        return Error::CannotOpenDirectory;
    }
    if (!std::filesystem::is_directory(directory, ec)) {
        store.log().error("store path {} is not a directory", directory.string());
        return Error::CannotOpenDirectory;
    }

    store.log().info("store opened at {}", directory.string());
    out = std::move(store);
    return {};
}

std::error_code FileStore::open_new(
    const std::filesystem::path& directory,
    FileStore& out,
    StoreOptions options)
{
    std::error_code ec;
    auto removed = std::filesystem::remove_all(directory, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        auto& logger = options.logger ? *options.logger : *spdlog::default_logger_raw();
        logger.error("cannot wipe store directory {}: {}",
                     directory.string(), ec.message());
        return Error::CannotOpenDirectory;
    }
    if (removed > 0) {
        auto& logger = options.logger ? *options.logger : *spdlog::default_logger_raw();
        logger.info("wiped {} entries under {}", removed, directory.string());
    }

    return open(directory, out, std::move(options));
}

bool FileStore::unbound(std::string_view op) const {
    if (!directory_.empty()) return false;
    log().error("{}: store is not open", op);
    return true;
}

// ── Key-to-path derivation ───────────────────────────────────────────────────

bool FileStore::is_valid_name(std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string_view::npos &&
           name.find('\0') == std::string_view::npos;
}

std::filesystem::path FileStore::path_for(std::string_view name) const {
    return directory_ / std::filesystem::path(name);
}

// ── Entry operations ─────────────────────────────────────────────────────────

std::error_code FileStore::insert(
    std::string_view name,
    const Bytes& data,
    bool* already_exists) const
{
    if (already_exists) *already_exists = false;

    if (unbound("insert")) return Error::CannotOpenDirectory;
    if (!is_valid_name(name)) {
        log().warn("insert: invalid entry name '{}'", name);
        return Error::CannotOpenFile;
    }
    const auto path = path_for(name);

    // The entry is filled while still unnamed and linked into place only once
    // complete, so no reader or alterer can ever see it empty.
    LockedFile file;
    if (auto ec = file.open(directory_, OpenMode::Anonymous)) {
        if (ec == std::errc::operation_not_supported || ec == std::errc::is_a_directory) {
            log().debug("insert: no O_TMPFILE support under {}, creating in place",
                        directory_.string());
            return insert_in_place(name, data, already_exists);
        }
        log().warn("insert: cannot create {}: {}", path.string(), ec.message());
        return Error::CannotOpenFile;
    }

    if (auto ec = file.lock(LockKind::Exclusive, blocking())) {
        log().warn("insert: cannot lock new entry for {}: {}", path.string(), ec.message());
        return Error::CannotGetLock;
    }

    if (auto ec = file.write_all(data)) {
        log().error("insert: write for {} failed: {}", path.string(), ec.message());
        return Error::CannotInsert;
    }

    if (options_.sync_writes) {
        if (auto ec = file.sync()) {
            log().error("insert: sync for {} failed: {}", path.string(), ec.message());
            return Error::CannotInsert;
        }
    }

    if (auto ec = file.link_to(path)) {
        if (ec == std::errc::file_exists) {
            if (already_exists) *already_exists = true;
            log().debug("insert: entry '{}' already exists", name);
        } else {
            log().warn("insert: cannot link {}: {}", path.string(), ec.message());
        }
        return Error::CannotOpenFile;
    }

    return {};
}

std::error_code FileStore::insert_in_place(
    std::string_view name,
    const Bytes& data,
    bool* already_exists) const
{
    const auto path = path_for(name);

    LockedFile file;
    if (auto ec = file.open(path, OpenMode::CreateNew)) {
        if (ec == std::errc::file_exists) {
            if (already_exists) *already_exists = true;
            log().debug("insert: entry '{}' already exists", name);
        } else {
            log().warn("insert: cannot create {}: {}", path.string(), ec.message());
        }
        return Error::CannotOpenFile;
    }

    // From here on the file is ours; drop it again if it cannot be filled so
    // that no empty entry is left behind.
    auto discard = [&] {
        file.close();
        if (::unlink(path.c_str()) != 0) {
            log().warn("insert: cannot discard partial entry {}: {}",
                       path.string(), std::error_code(errno, std::system_category()).message());
        }
    };

    if (auto ec = file.lock(LockKind::Exclusive, blocking())) {
        log().warn("insert: cannot lock {}: {}", path.string(), ec.message());
        discard();
        return Error::CannotGetLock;
    }

    if (auto ec = file.write_all(data)) {
        log().error("insert: write to {} failed: {}", path.string(), ec.message());
        discard();
        return Error::CannotInsert;
    }

    if (options_.sync_writes) {
        if (auto ec = file.sync()) {
            log().error("insert: sync of {} failed: {}", path.string(), ec.message());
            discard();
            return Error::CannotInsert;
        }
    }

    return {};
}

std::error_code FileStore::read(std::string_view name, Bytes& out) const {
    if (unbound("get")) return Error::CannotOpenDirectory;
    if (!is_valid_name(name)) {
        log().warn("get: invalid entry name '{}'", name);
        return Error::CannotOpenFile;
    }
    const auto path = path_for(name);

    LockedFile file;
    if (auto ec = file.open(path, OpenMode::Read)) {
        log().debug("get: cannot open {}: {}", path.string(), ec.message());
        return Error::CannotOpenFile;
    }

    if (auto ec = file.lock(LockKind::Shared, blocking())) {
        log().debug("get: cannot lock {}: {}", path.string(), ec.message());
        return Error::CannotGetLock;
    }

    if (auto ec = file.read_all(out)) {
        log().warn("get: read of {} failed: {}", path.string(), ec.message());
        return Error::CannotReadFromFile;
    }

    return {};
}

std::error_code FileStore::alter(std::string_view name, const Transform& transform) const {
    if (unbound("alter")) return Error::CannotOpenDirectory;
    if (!is_valid_name(name)) {
        log().warn("alter: invalid entry name '{}'", name);
        return Error::CannotOpenFile;
    }
    const auto path = path_for(name);

    LockedFile file;
    if (auto ec = file.open(path, OpenMode::ReadWrite)) {
        log().debug("alter: cannot open {}: {}", path.string(), ec.message());
        return Error::CannotOpenFile;
    }

    if (auto ec = file.lock(LockKind::Exclusive, blocking())) {
        log().debug("alter: cannot lock {}: {}", path.string(), ec.message());
        return Error::CannotGetLock;
    }

    Bytes current;
    if (auto ec = file.read_all(current)) {
        log().warn("alter: read of {} failed: {}", path.string(), ec.message());
        return Error::CannotReadFromFile;
    }

    Bytes replacement;
    if (auto ec = transform(current, replacement)) {
        log().debug("alter: transform of '{}' rejected: {}", name, ec.message());
        return ec;
    }

    if (auto ec = file.truncate()) {
        log().error("alter: truncate of {} failed: {}", path.string(), ec.message());
        return Error::CannotAlterFile;
    }
    if (auto ec = file.write_all(replacement)) {
        log().error("alter: write to {} failed: {}", path.string(), ec.message());
        return Error::CannotAlterFile;
    }
    if (options_.sync_writes) {
        if (auto ec = file.sync()) {
            log().error("alter: sync of {} failed: {}", path.string(), ec.message());
            return Error::CannotAlterFile;
        }
    }

    return {};
}

std::error_code FileStore::overwrite(std::string_view name, const Bytes& data) const {
    if (unbound("overwrite")) return Error::CannotOpenDirectory;
    if (!is_valid_name(name)) {
        log().warn("overwrite: invalid entry name '{}'", name);
        return Error::CannotOpenFile;
    }
    const auto path = path_for(name);

    // Truncate only once the exclusive lock is held, never via O_TRUNC.
    LockedFile file;
    if (auto ec = file.open(path, OpenMode::Write)) {
        log().debug("overwrite: cannot open {}: {}", path.string(), ec.message());
        return Error::CannotOpenFile;
    }

    if (auto ec = file.lock(LockKind::Exclusive, blocking())) {
        log().debug("overwrite: cannot lock {}: {}", path.string(), ec.message());
        return Error::CannotGetLock;
    }

    if (auto ec = file.truncate()) {
        log().error("overwrite: truncate of {} failed: {}", path.string(), ec.message());
        return Error::CannotAlterFile;
    }
    if (auto ec = file.write_all(data)) {
        log().error("overwrite: write to {} failed: {}", path.string(), ec.message());
        return Error::CannotAlterFile;
    }
    if (options_.sync_writes) {
        if (auto ec = file.sync()) {
            log().error("overwrite: sync of {} failed: {}", path.string(), ec.message());
            return Error::CannotAlterFile;
        }
    }

    return {};
}

std::error_code FileStore::remove(std::string_view name) const {
    if (unbound("delete")) return Error::CannotOpenDirectory;
    if (!is_valid_name(name)) {
        log().warn("delete: invalid entry name '{}'", name);
        return Error::CannotDeleteFile;
    }
    const auto path = path_for(name);

    if (::unlink(path.c_str()) != 0) {
        std::error_code ec(errno, std::system_category());
        log().debug("delete: cannot unlink {}: {}", path.string(), ec.message());
        return Error::CannotDeleteFile;
    }
    return {};
}

// ── Enumeration ──────────────────────────────────────────────────────────────

std::error_code FileStore::list(std::vector<std::string>& names) const {
    names.clear();
    if (unbound("list")) return Error::CannotOpenDirectory;

    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        log().error("cannot list {}: {}", directory_.string(), ec.message());
        return Error::CannotOpenDirectory;
    }

    // On an iteration error increment() leaves `it` at end with `ec` set.
    for (auto end = std::filesystem::directory_iterator{}; it != end; it.increment(ec)) {
        std::error_code entry_ec;
        bool regular = it->is_regular_file(entry_ec);
        if (entry_ec) {
            if (options_.strict_listing) {
                log().error("cannot stat {}: {}", it->path().string(), entry_ec.message());
                return Error::CannotOpenDirectory;
            }
            log().warn("skipping unreadable entry {}: {}",
                       it->path().string(), entry_ec.message());
            continue;
        }
        if (!regular) {
            log().debug("skipping non-regular entry {}", it->path().string());
            continue;
        }

        names.push_back(it->path().filename().string());
    }

    if (ec) {
        if (options_.strict_listing) {
            log().error("listing of {} aborted: {}", directory_.string(), ec.message());
            return Error::CannotOpenDirectory;
        }
        log().warn("listing of {} cut short: {}", directory_.string(), ec.message());
    }

    return {};
}

} // namespace diskmap
