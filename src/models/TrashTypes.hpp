/**
 * @file TrashTypes.hpp
 * @brief Records of soft-deleted files
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

/**
 * @struct TrashedFile
 * @brief A file moved into a trash directory; restore() moves it back
 */
struct TrashedFile {
    std::string original_path;
    std::string trash_path;
    std::chrono::system_clock::time_point deleted_at;

    auto operator==(const TrashedFile&) const -> bool = default;
};

/**
 * @struct TrashBatchResult
 * @brief Outcome of moving a set of files to trash
 */
struct TrashBatchResult {
    std::vector<TrashedFile> trashed;       ///< Input order is not preserved
    std::vector<std::string> errors;        ///< One rendered FileError per failed file
    std::vector<std::string> trash_directories;
};
