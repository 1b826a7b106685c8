/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors
 */

#pragma once

#include "util/Error.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <expected>
#include <filesystem>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Owns a POSIX file descriptor and closes it on destruction
 *
 * Move-only. The local copy path reads and writes through these so that an
 * early return on a failed read or write never leaks a descriptor.
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() {
        reset();
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    /**
     * @brief open(2) a path with O_CLOEXEC added to @p flags
     * @return Owned descriptor, or an Error mapped from errno
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path, int flags, mode_t mode = 0644)
        -> std::expected<FileDescriptor, Error> {
        int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
        if (fd < 0) {
            return std::unexpected(error_from_errno("Failed to open " + path.string(), errno));
        }
        return FileDescriptor(fd);
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Give up ownership without closing
     */
    [[nodiscard]] auto release() noexcept -> int { return std::exchange(fd_, -1); }

    /**
     * @brief Close the current descriptor (if any) and adopt @p fd
     */
    void reset(int fd = -1) noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /**
     * @brief close(2) explicitly so that deferred write errors are reported
     */
    auto close() -> std::expected<void, Error> {
        if (!is_valid()) {
            return {};
        }
        int fd = std::exchange(fd_, -1);
        if (::close(fd) != 0) {
            return std::unexpected(error_from_errno("Failed to close file", errno));
        }
        return {};
    }

private:
    int fd_ = -1;
};

}  // namespace util
