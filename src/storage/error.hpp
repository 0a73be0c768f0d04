#pragma once

#include <system_error>

namespace diskmap {

// ── Error ─────────────────────────────────────────────────────────────────────
//
// Flat failure taxonomy shared by every DiskMap operation.  Operations return
// a std::error_code whose category is error_category(); an empty error_code
// means success.

enum class Error {
    CannotOpenDirectory = 1,
    CannotOpenFile,
    CannotReadFromFile,
    CannotInsert,
    CannotAlterFile,
    CannotDeleteFile,
    CannotGetLock,
};

[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Error e) noexcept;

} // namespace diskmap

namespace std {

template <>
struct is_error_code_enum<diskmap::Error> : true_type {};

} // namespace std
