/**
 * @file OperationTypes.hpp
 * @brief The four file operations a caller can submit
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @struct CopyOperation
 * @brief Copy every source into the destination directory
 */
struct CopyOperation {
    std::vector<std::string> sources;
    std::string destination;  ///< Directory locator
    bool overwrite = false;
    std::optional<std::string> source_credentials_id;  ///< Credentials for reading the sources

    auto operator==(const CopyOperation&) const -> bool = default;
};

/**
 * @struct MoveOperation
 * @brief Same shape as CopyOperation; sources are removed after transfer
 */
struct MoveOperation {
    std::vector<std::string> sources;
    std::string destination;
    bool overwrite = false;
    std::optional<std::string> source_credentials_id;

    auto operator==(const MoveOperation&) const -> bool = default;
};

/**
 * @struct RenameOperation
 * @brief Rename a single file within its parent
 */
struct RenameOperation {
    std::string file;
    std::string new_name;  ///< Bare name, no separators

    auto operator==(const RenameOperation&) const -> bool = default;
};

/**
 * @struct DeleteOperation
 * @brief Delete files; soft delete moves them into a trash directory instead
 */
struct DeleteOperation {
    std::vector<std::string> files;
    bool soft_delete = true;

    auto operator==(const DeleteOperation&) const -> bool = default;
};

using Operation = std::variant<CopyOperation, MoveOperation, RenameOperation, DeleteOperation>;

/**
 * @brief "Copy", "Move", "Rename" or "Delete"
 */
[[nodiscard]] auto operation_name(const Operation& operation) -> std::string_view;

/**
 * @brief Number of input items; the Starting progress event carries this
 */
[[nodiscard]] auto operation_item_count(const Operation& operation) -> size_t;

/**
 * @brief Every locator the operation touches, in input order (destination last)
 */
[[nodiscard]] auto operation_locators(const Operation& operation) -> std::vector<std::string>;
