#pragma once

#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace diskmap::persistence {

// ── Open / lock modes ────────────────────────────────────────────────────────

enum class OpenMode : uint8_t {
    CreateNew = 0,  // O_WRONLY | O_CREAT | O_EXCL – fails if the file exists
    Read      = 1,  // O_RDONLY
    ReadWrite = 2,  // O_RDWR, no creation, no truncation
    Write     = 3,  // O_WRONLY, no creation, no truncation
    Anonymous = 4,  // O_RDWR | O_TMPFILE on a directory; unnamed until link_to()
};

enum class LockKind : uint8_t {
    Shared    = 0,  // LOCK_SH
    Exclusive = 1,  // LOCK_EX
};

// ── LockedFile ───────────────────────────────────────────────────────────────
//
// Owning wrapper around a POSIX file descriptor carrying an optional flock(2)
// advisory lock.  The lock belongs to the open file description, so two
// LockedFile instances on the same path contend with each other even inside
// one process.  Closing the descriptor (destructor, close(), move-assign)
// releases the lock.
//
// All fallible calls return the raw OS error as a system_category
// error_code; mapping to the store's taxonomy happens one layer up.
//
// Thread-safety: NOT thread-safe. One instance per operation.

class LockedFile {
public:
    LockedFile() = default;
    ~LockedFile();

    LockedFile(const LockedFile&) = delete;
    LockedFile& operator=(const LockedFile&) = delete;
    LockedFile(LockedFile&& other) noexcept;
    LockedFile& operator=(LockedFile&& other) noexcept;

    // Opens `path` with `mode`.  Any previously held descriptor is closed first.
    [[nodiscard]] std::error_code open(const std::filesystem::path& path, OpenMode mode);

    // Gives an Anonymous file the name `path`.  Fails with
    // std::errc::file_exists if `path` is already taken; the file then stays
    // unnamed and vanishes on close().
    [[nodiscard]] std::error_code link_to(const std::filesystem::path& path);

    // Acquire an advisory lock.  With `blocking == false` a contended lock
    // yields std::errc::operation_would_block.  EINTR is retried.
    [[nodiscard]] std::error_code lock(LockKind kind, bool blocking);

    // Read from the current offset to end of file.
    [[nodiscard]] std::error_code read_all(std::vector<uint8_t>& out);

    // Write the whole buffer at the current offset.
    [[nodiscard]] std::error_code write_all(const std::vector<uint8_t>& data);

    // Truncate to zero length and rewind to offset 0.
    [[nodiscard]] std::error_code truncate();

    // fdatasync the descriptor.
    [[nodiscard]] std::error_code sync();

    void close();

    [[nodiscard]] bool is_open() const { return fd_ != -1; }
    [[nodiscard]] bool is_locked() const { return locked_; }

private:
    int  fd_     = -1;
    bool locked_ = false;
};

} // namespace diskmap::persistence
