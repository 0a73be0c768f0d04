#include "persistence/locked_file.hpp"

#include <cerrno>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace diskmap::persistence {

namespace {

constexpr mode_t kFileMode = 0644;

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

int open_flags(OpenMode mode) {
    switch (mode) {
        case OpenMode::CreateNew: return O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC;
        case OpenMode::Read:      return O_RDONLY | O_CLOEXEC;
        case OpenMode::ReadWrite: return O_RDWR | O_CLOEXEC;
        case OpenMode::Write:     return O_WRONLY | O_CLOEXEC;
        case OpenMode::Anonymous: return O_RDWR | O_TMPFILE | O_CLOEXEC;
    }
    return O_RDONLY | O_CLOEXEC;
}

} // anonymous namespace

LockedFile::~LockedFile() {
    close();
}

LockedFile::LockedFile(LockedFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      locked_(std::exchange(other.locked_, false)) {}

LockedFile& LockedFile::operator=(LockedFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_     = std::exchange(other.fd_, -1);
        locked_ = std::exchange(other.locked_, false);
    }
    return *this;
}

std::error_code LockedFile::open(const std::filesystem::path& path, OpenMode mode) {
    close();

    int fd = ::open(path.c_str(), open_flags(mode), kFileMode);
    if (fd < 0) {
        return make_errno_error();
    }
    fd_ = fd;
    return {};
}

std::error_code LockedFile::link_to(const std::filesystem::path& path) {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    // linkat(AT_EMPTY_PATH) needs CAP_DAC_READ_SEARCH; the /proc alias does not.
    const std::string alias = "/proc/self/fd/" + std::to_string(fd_);
    if (::linkat(AT_FDCWD, alias.c_str(), AT_FDCWD, path.c_str(), AT_SYMLINK_FOLLOW) != 0) {
        return make_errno_error();
    }
    return {};
}

std::error_code LockedFile::lock(LockKind kind, bool blocking) {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    int op = (kind == LockKind::Exclusive) ? LOCK_EX : LOCK_SH;
    if (!blocking) op |= LOCK_NB;

    while (::flock(fd_, op) != 0) {
        if (errno == EINTR) continue;
        if (errno == EWOULDBLOCK) {
            return std::make_error_code(std::errc::operation_would_block);
        }
        return make_errno_error();
    }
    locked_ = true;
    return {};
}

std::error_code LockedFile::read_all(std::vector<uint8_t>& out) {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    out.clear();
    uint8_t buf[8192];
    while (true) {
        auto n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        if (n == 0) break;
        out.insert(out.end(), buf, buf + n);
    }
    return {};
}

std::error_code LockedFile::write_all(const std::vector<uint8_t>& data) {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    const uint8_t* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        auto n = ::write(fd_, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code LockedFile::truncate() {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    if (::ftruncate(fd_, 0) < 0) {
        return make_errno_error();
    }
    if (::lseek(fd_, 0, SEEK_SET) < 0) {
        return make_errno_error();
    }
    return {};
}

std::error_code LockedFile::sync() {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }
    return {};
}

void LockedFile::close() {
    if (fd_ != -1) {
        // Closing the last descriptor of the open file description drops the flock.
        ::close(fd_);
        fd_ = -1;
    }
    locked_ = false;
}

} // namespace diskmap::persistence
