/**
 * @file ILocalFileSystem.hpp
 * @brief Mutating local filesystem calls used by TransferBridge and TrashManager
 */

#pragma once

#include "models/ProgressTypes.hpp"
#include "util/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>

class ILocalFileSystem {
public:
    virtual ~ILocalFileSystem() = default;

    virtual auto copy_file(const std::filesystem::path& source,
                           const std::filesystem::path& destination, bool overwrite,
                           size_t buffer_size, const TransferProgressCallback& progress)
        -> std::expected<uint64_t, util::Error> = 0;

    virtual auto rename_path(const std::filesystem::path& from, const std::filesystem::path& to)
        -> std::expected<void, util::Error> = 0;

    virtual auto remove_path(const std::filesystem::path& path)
        -> std::expected<void, util::Error> = 0;
};
