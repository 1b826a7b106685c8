/**
 * @file LocalFileSystem.hpp
 * @brief Filesystem primitives used by the handlers and the trash manager
 *
 * All functions report failures as util::Error with the errno mapped to an
 * ErrorKind; nothing here throws.
 */

#pragma once

#include "models/ProgressTypes.hpp"
#include "services/ILocalFileSystem.hpp"
#include "util/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>

namespace local_fs {

/**
 * @brief true if anything (file, directory, dangling symlink) exists at @p path
 */
[[nodiscard]] auto exists(const std::filesystem::path& path) -> bool;

[[nodiscard]] auto is_directory(const std::filesystem::path& path) -> bool;

/**
 * @brief Size of a regular file, 0 for anything else
 */
[[nodiscard]] auto file_size(const std::filesystem::path& path) -> uint64_t;

/**
 * @brief Copy bytes from @p source to @p destination
 *
 * Without @p overwrite the destination is created with O_EXCL, so an
 * existing file is never touched. A partially written destination is
 * removed on failure. Directories are copied recursively without byte
 * progress.
 *
 * @return Bytes copied
 */
auto copy_file(const std::filesystem::path& source, const std::filesystem::path& destination,
               bool overwrite, size_t buffer_size, const TransferProgressCallback& progress)
    -> std::expected<uint64_t, util::Error>;

/**
 * @brief rename(2); fails with EXDEV across filesystems
 */
auto rename_path(const std::filesystem::path& from, const std::filesystem::path& to)
    -> std::expected<void, util::Error>;

/**
 * @brief Delete a file, or a directory recursively
 */
auto remove_path(const std::filesystem::path& path) -> std::expected<void, util::Error>;

auto ensure_directory(const std::filesystem::path& path) -> std::expected<void, util::Error>;

/**
 * @brief ILocalFileSystem forwarding to the functions above
 */
class NativeFileSystem : public ILocalFileSystem {
public:
    auto copy_file(const std::filesystem::path& source, const std::filesystem::path& destination,
                   bool overwrite, size_t buffer_size, const TransferProgressCallback& progress)
        -> std::expected<uint64_t, util::Error> override;

    auto rename_path(const std::filesystem::path& from, const std::filesystem::path& to)
        -> std::expected<void, util::Error> override;

    auto remove_path(const std::filesystem::path& path) -> std::expected<void, util::Error> override;
};

[[nodiscard]] auto native_file_system() -> std::shared_ptr<ILocalFileSystem>;

}  // namespace local_fs
