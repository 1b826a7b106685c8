/**
 * @file FileError.hpp
 * @brief Per-file failure record collected by the operation handlers
 */

#pragma once

#include "util/Error.hpp"

#include <string>
#include <utility>

/**
 * @struct FileError
 * @brief One failed item of a multi-file operation
 *
 * render() produces the multi-line form stored in a result's error list:
 * @code
 * photo.jpg already exists in /dst
 *   From: /src/photo.jpg
 *   To: /dst/photo.jpg
 * @endcode
 * Deletes carry only a source path and render "Path:" instead.
 */
struct FileError {
    util::ErrorKind kind = util::ErrorKind::UNKNOWN;
    std::string file_name;
    std::string source_path;
    std::string destination_path;  ///< Empty for deletes and renames
    std::string message;           ///< Starts with the file name

    [[nodiscard]] auto render() const -> std::string {
        std::string text = message;
        if (destination_path.empty()) {
            if (!source_path.empty()) {
                text += "\n  Path: " + source_path;
            }
            return text;
        }
        text += "\n  From: " + source_path;
        text += "\n  To: " + destination_path;
        return text;
    }

    /**
     * @brief Wrap a primitive's error, prefixing the file name unless already present
     */
    [[nodiscard]] static auto from_error(const util::Error& error, std::string name,
                                         std::string source, std::string destination = {})
        -> FileError {
        std::string message = error.message.rfind(name, 0) == 0 ? error.message
                                                                 : name + ": " + error.message;
        return FileError{error.kind, std::move(name), std::move(source), std::move(destination),
                         std::move(message)};
    }
};
