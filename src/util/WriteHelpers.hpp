#pragma once

#include <unistd.h>

#include <cerrno>
#include <cstddef>

namespace util {

inline auto read_with_retry(int fd, void* buffer, size_t size) -> ssize_t {
    while (true) {
        const auto result = ::read(fd, buffer, size);
        if (result < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        return result;
    }
}

// Loops over short writes; returns false with errno set on failure.
inline auto write_all(int fd, const void* buffer, size_t size) -> bool {
    const auto* bytes = static_cast<const std::byte*>(buffer);
    size_t written = 0;
    while (written < size) {
        const auto result = ::write(fd, bytes + written, size - written);
        if (result < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(result);
    }
    return true;
}

} // namespace util
