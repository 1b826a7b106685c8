/**
 * @file Error.hpp
 * @brief Error value carried by std::expected across the transfer core
 *
 * Every fallible primitive (filesystem helpers, backend transports, trash
 * handling) returns std::expected<T, util::Error>. The ErrorKind lets the
 * orchestration layer decide between retrying, short-circuiting and simply
 * recording a per-file failure.
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace util {

/**
 * @enum ErrorKind
 * @brief Classification of a failure, independent of the backend that produced it
 */
enum class ErrorKind {
    NOT_FOUND,                      ///< Source or target does not exist
    ALREADY_EXISTS,                 ///< Destination collision
    PERMISSION_DENIED,              ///< Access refused by the backend
    BACKEND_UNSUPPORTED_OPERATION,  ///< e.g. soft delete on a network backend
    TRANSIENT_IO,                   ///< Busy/locked/timeout, worth retrying
    AUTHENTICATION_REQUIRED,        ///< Caller must re-authenticate; aborts the operation
    UNKNOWN                         ///< Anything else, message preserved
};

/**
 * @struct Error
 * @brief An error message with an optional errno-style code and a kind
 */
struct Error {
    std::string message;
    int code = 0;
    ErrorKind kind = ErrorKind::UNKNOWN;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0, ErrorKind err_kind = ErrorKind::UNKNOWN)
        : message(std::move(msg)), code(err_code), kind(err_kind) {}

    Error(std::string msg, ErrorKind err_kind) : message(std::move(msg)), kind(err_kind) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    [[nodiscard]] auto is_retryable() const -> bool {
        return kind == ErrorKind::TRANSIENT_IO || kind == ErrorKind::UNKNOWN ||
               kind == ErrorKind::PERMISSION_DENIED;
    }
};

/**
 * @brief Map an errno value to an ErrorKind
 */
[[nodiscard]] inline auto kind_from_errno(int err) -> ErrorKind {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::NOT_FOUND;
        case EEXIST:
        case ENOTEMPTY:
            return ErrorKind::ALREADY_EXISTS;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorKind::PERMISSION_DENIED;
        case EBUSY:
        case EAGAIN:
        case ETXTBSY:
        case EINTR:
        case ETIMEDOUT:
            return ErrorKind::TRANSIENT_IO;
        default:
            return ErrorKind::UNKNOWN;
    }
}

/**
 * @brief Build an Error from errno, keeping the caller's context in front
 * @param context What was being attempted, e.g. "Failed to open photo.jpg"
 * @param err errno value
 */
[[nodiscard]] inline auto error_from_errno(std::string_view context, int err) -> Error {
    return Error{std::string(context) + ": " + std::strerror(err), err, kind_from_errno(err)};
}

/**
 * @brief Build an Error from a std::error_code produced by std::filesystem
 */
[[nodiscard]] inline auto error_from_code(std::string_view context, const std::error_code& ec)
    -> Error {
    const int err = ec.category() == std::generic_category() || ec.category() == std::system_category()
                        ? ec.value()
                        : 0;
    return Error{std::string(context) + ": " + ec.message(), ec.value(), kind_from_errno(err)};
}

[[nodiscard]] inline auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::NOT_FOUND:
            return "NotFound";
        case ErrorKind::ALREADY_EXISTS:
            return "AlreadyExists";
        case ErrorKind::PERMISSION_DENIED:
            return "PermissionDenied";
        case ErrorKind::BACKEND_UNSUPPORTED_OPERATION:
            return "BackendUnsupportedOperation";
        case ErrorKind::TRANSIENT_IO:
            return "TransientIO";
        case ErrorKind::AUTHENTICATION_REQUIRED:
            return "AuthenticationRequired";
        case ErrorKind::UNKNOWN:
            return "Unknown";
    }
    return "Unknown";
}

}  // namespace util
