#include "errors.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstring>

IoError io_error_from_errno(const std::string& context) {
    int err = errno;
    return IoError(fmt::format("{}: {}", context, std::strerror(err)));
}
