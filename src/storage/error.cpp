#include "storage/error.hpp"

#include <string>

namespace diskmap {

namespace {

class DiskMapErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "diskmap"; }

    std::string message(int ev) const override {
        switch (static_cast<Error>(ev)) {
            case Error::CannotOpenDirectory: return "cannot open directory";
            case Error::CannotOpenFile:      return "cannot open file";
            case Error::CannotReadFromFile:  return "cannot read from file";
            case Error::CannotInsert:        return "cannot insert";
            case Error::CannotAlterFile:     return "cannot alter file";
            case Error::CannotDeleteFile:    return "cannot delete file";
            case Error::CannotGetLock:       return "cannot get lock";
        }
        return "unknown diskmap error";
    }
};

} // anonymous namespace

const std::error_category& error_category() noexcept {
    static const DiskMapErrorCategory category;
    return category;
}

std::error_code make_error_code(Error e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace diskmap
