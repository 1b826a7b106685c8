/**
 * @file ProtocolClassifier.hpp
 * @brief Locator -> BackendType mapping and scheme-aware path helpers
 *
 * A locator is an opaque string: either a plain filesystem path or
 * "<scheme>://<body>" with scheme smb, sftp, ftp, cloud or content. The
 * helpers in namespace protocol are pure; ProtocolClassifier adds a
 * thread-safe memo for hot loops over large selections.
 */

#pragma once

#include "models/BackendType.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace protocol {

/**
 * @brief Backend of a locator
 *
 * Accepts "smb://x", "smb:/x" and "/smb://x", case-insensitively.
 * Anything without a recognized scheme is LOCAL.
 */
[[nodiscard]] auto classify(std::string_view locator) -> BackendType;

/**
 * @brief Rewrite a locator into canonical "scheme://body" form
 *
 * Plain paths are returned unchanged.
 */
[[nodiscard]] auto normalize_locator(std::string_view locator) -> std::string;

/**
 * @brief Last path segment ("share/dir/a.jpg" -> "a.jpg")
 */
[[nodiscard]] auto file_name(std::string_view locator) -> std::string;

/**
 * @brief Locator of the containing directory
 *
 * For a remote locator without a path ("smb://host") the locator itself is returned.
 */
[[nodiscard]] auto parent(std::string_view locator) -> std::string;

/**
 * @brief Append a file name to a directory locator
 */
[[nodiscard]] auto join(std::string_view directory, std::string_view name) -> std::string;

/**
 * @brief Same locator with the last segment replaced by @p new_name
 */
[[nodiscard]] auto replace_file_name(std::string_view locator, std::string_view new_name)
    -> std::string;

/**
 * @brief "scheme://host[:port]" of a remote locator, "local" for plain paths
 *
 * Connection limits are accounted per host key.
 */
[[nodiscard]] auto host_key(std::string_view locator) -> std::string;

}  // namespace protocol

/**
 * @class ProtocolClassifier
 * @brief Memoizing wrapper around protocol::classify
 *
 * The cache is dropped wholesale once it holds max_entries locators.
 */
class ProtocolClassifier {
public:
    explicit ProtocolClassifier(size_t max_entries = 4096);

    [[nodiscard]] auto classify(std::string_view locator) -> BackendType;

    [[nodiscard]] auto cached_entries() const -> size_t;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, BackendType> cache_;
    size_t max_entries_;
};
