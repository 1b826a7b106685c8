/**
 * @file OperationPolicy.hpp
 * @brief Up-front validation of operations before dispatch
 */

#pragma once

#include "models/OperationTypes.hpp"
#include "services/ProtocolClassifier.hpp"
#include "util/Error.hpp"
#include "util/Overloaded.hpp"

#include <fmt/format.h>

#include <expected>
#include <string>

namespace operation_policy {

// Trash directories only exist on the local filesystem.
inline auto validate_soft_delete(const DeleteOperation& operation)
    -> std::expected<void, util::Error> {
    if (!operation.soft_delete) {
        return {};
    }
    for (const auto& file : operation.files) {
        auto backend = protocol::classify(file);
        if (backend != BackendType::LOCAL) {
            return std::unexpected(util::Error{
                fmt::format("Soft delete is only supported for local files: {} is on {} storage", file,
                            backend_name(backend)),
                util::ErrorKind::BACKEND_UNSUPPORTED_OPERATION});
        }
    }
    return {};
}

inline auto validate_new_name(const std::string& new_name) -> std::expected<void, util::Error> {
    if (new_name.empty() || new_name == "." || new_name == "..") {
        return std::unexpected(util::Error{fmt::format("Invalid file name: '{}'", new_name)});
    }
    if (new_name.find('/') != std::string::npos || new_name.find('\0') != std::string::npos) {
        return std::unexpected(
            util::Error{fmt::format("Invalid file name: '{}' contains a path separator", new_name)});
    }
    return {};
}

inline auto validate_operation(const Operation& operation) -> std::expected<void, util::Error> {
    return std::visit(
        util::Overloaded{
            [](const CopyOperation& op) -> std::expected<void, util::Error> {
                if (op.destination.empty()) {
                    return std::unexpected(util::Error{"Destination is empty"});
                }
                return {};
            },
            [](const MoveOperation& op) -> std::expected<void, util::Error> {
                if (op.destination.empty()) {
                    return std::unexpected(util::Error{"Destination is empty"});
                }
                return {};
            },
            [](const RenameOperation& op) -> std::expected<void, util::Error> {
                if (op.file.empty()) {
                    return std::unexpected(util::Error{"File path is empty"});
                }
                return validate_new_name(op.new_name);
            },
            [](const DeleteOperation& op) { return validate_soft_delete(op); },
        },
        operation);
}

} // namespace operation_policy
