#pragma once

#include "common/store_config.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace diskmap {

// ── FileStore ────────────────────────────────────────────────────────────────
//
// Untyped storage engine behind DiskMap.  Every entry is one regular file
// `<directory>/<name>` whose content is an opaque byte string.  Names are the
// already-rendered key strings; FileStore never interprets them beyond
// checking that they form a single path component.
//
// Locking discipline (flock(2), advisory):
//   - insert()    writes an unnamed O_TMPFILE under LOCK_EX, then links it
//                 to its name; an existing name makes the link fail.
//   - read()      holds LOCK_SH while reading.
//   - alter()     opens once read-write and holds LOCK_EX across
//                 read → transform → truncate → write.
//   - overwrite() holds LOCK_EX across truncate → write.
//   - remove()    takes no lock.
//
// All errors are reported as diskmap::Error codes; the OS cause is logged.
//
// Thread-safety: a FileStore is an immutable value (path + options).  Copies
// may be used concurrently from any number of threads or processes.

class FileStore {
public:
    using Bytes = std::vector<uint8_t>;

    // Produces the replacement content of an entry from its current content.
    // A non-empty return aborts the alter before anything is written.
    using Transform = std::function<std::error_code(const Bytes& current, Bytes& replacement)>;

    // Unbound until open()/open_new(); every operation on an unbound store
    // fails with Error::CannotOpenDirectory.
    FileStore() = default;

    // Creates `directory` (and missing parents) and binds `out` to it.
    // Error::CannotOpenDirectory if it cannot be created or is not a directory.
    [[nodiscard]] static std::error_code open(
        const std::filesystem::path& directory,
        FileStore& out,
        StoreOptions options = {});

    // Recursively removes `directory` if present, then open().
    // A failed removal is reported as Error::CannotOpenDirectory.
    [[nodiscard]] static std::error_code open_new(
        const std::filesystem::path& directory,
        FileStore& out,
        StoreOptions options = {});

    // True if `name` can be used as a single file-name component.
    [[nodiscard]] static bool is_valid_name(std::string_view name);

    // `<directory>/<name>`.  Pure.
    [[nodiscard]] std::filesystem::path path_for(std::string_view name) const;

    // Create-only write.  `already_exists` (optional) is set when the failure
    // was caused by an existing entry.
    [[nodiscard]] std::error_code insert(
        std::string_view name,
        const Bytes& data,
        bool* already_exists = nullptr) const;

    // Reads the whole entry under a shared lock.
    [[nodiscard]] std::error_code read(std::string_view name, Bytes& out) const;

    // Atomic read-modify-write under one exclusive lock.
    [[nodiscard]] std::error_code alter(std::string_view name, const Transform& transform) const;

    // Replaces the content of an existing entry.
    [[nodiscard]] std::error_code overwrite(std::string_view name, const Bytes& data) const;

    // Unlinks the entry.
    [[nodiscard]] std::error_code remove(std::string_view name) const;

    // Names of all entries, in directory enumeration order.
    [[nodiscard]] std::error_code list(std::vector<std::string>& names) const;

    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }
    [[nodiscard]] const StoreOptions& options() const { return options_; }

    // Logger in use (options().logger or spdlog's default).
    [[nodiscard]] spdlog::logger& log() const;

private:
    FileStore(std::filesystem::path directory, StoreOptions options);

    // O_EXCL create followed by LOCK_EX, for file systems without O_TMPFILE.
    // A reader can see the entry empty between the two steps.
    [[nodiscard]] std::error_code insert_in_place(
        std::string_view name,
        const Bytes& data,
        bool* already_exists) const;

    // True (and logged) if no directory is bound yet.
    bool unbound(std::string_view op) const;

    [[nodiscard]] bool blocking() const { return options_.lock_mode == LockMode::Blocking; }

    std::filesystem::path directory_;
    StoreOptions options_;
};

} // namespace diskmap
