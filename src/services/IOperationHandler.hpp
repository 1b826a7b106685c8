/**
 * @file IOperationHandler.hpp
 * @brief Interface for executing operations against one backend
 */

#pragma once

#include "models/BackendType.hpp"
#include "models/OperationResult.hpp"
#include "models/OperationTypes.hpp"
#include "models/ProgressTypes.hpp"

#include <atomic>
#include <string>

/**
 * @class IOperationHandler
 * @brief Executes Copy/Move/Rename/Delete for the backend the router picked
 *
 * Handlers never throw for per-file problems: every failed item becomes
 * one entry in the result's error list. cancel_requested is observed
 * between files.
 */
class IOperationHandler {
public:
    virtual ~IOperationHandler() = default;

    [[nodiscard]] virtual auto backend() const -> BackendType = 0;

    virtual auto copy(const CopyOperation& operation, const ProgressCallback& progress,
                      const std::atomic<bool>& cancel_requested) -> OperationResult = 0;

    virtual auto move(const MoveOperation& operation, const ProgressCallback& progress,
                      const std::atomic<bool>& cancel_requested) -> OperationResult = 0;

    virtual auto rename(const RenameOperation& operation) -> OperationResult = 0;

    virtual auto remove(const DeleteOperation& operation, const ProgressCallback& progress,
                        const std::atomic<bool>& cancel_requested) -> OperationResult = 0;

    /**
     * @brief Whether @p locator currently exists (used to plan undo)
     */
    [[nodiscard]] virtual auto exists(const std::string& locator) -> bool = 0;
};
