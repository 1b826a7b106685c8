/**
 * @file IFileOperationService.hpp
 * @brief Facade for executing file operations across storage backends
 */

#pragma once

#include "models/OperationHistory.hpp"
#include "models/OperationResult.hpp"
#include "models/OperationTypes.hpp"
#include "services/ProgressChannel.hpp"

#include <future>
#include <memory>
#include <optional>

class TrashManager;

/**
 * @class IFileOperationService
 * @brief Abstract interface for the operation facade
 *
 * At most one operation runs at a time; a submission while another is in
 * flight completes immediately with a FailureResult.
 */
class IFileOperationService {
public:
    virtual ~IFileOperationService() = default;

    /**
     * @brief Run an operation and wait for its result
     */
    virtual auto execute(const Operation& operation) -> OperationResult = 0;

    /**
     * @brief Run an operation on the worker thread
     */
    virtual auto execute_async(const Operation& operation) -> std::future<OperationResult> = 0;

    /**
     * @brief Run an operation on the worker thread, streaming progress
     *
     * The channel yields exactly one ProgressStarting first, any number of
     * ProgressProcessing samples, and exactly one ProgressCompleted before it
     * closes.
     */
    virtual auto execute_with_progress(const Operation& operation)
        -> std::shared_ptr<ProgressChannel> = 0;

    /**
     * @brief Ask the running operation to stop before its next file
     * @return true if an operation was running
     */
    virtual auto cancel_current_operation() -> bool = 0;

    [[nodiscard]] virtual auto is_operation_in_progress() const -> bool = 0;

    [[nodiscard]] virtual auto can_undo() const -> bool = 0;

    /**
     * @brief Revert the last operation
     * @return Result of the reverting operation, or std::nullopt if nothing is undoable
     */
    virtual auto undo() -> std::optional<OperationResult> = 0;

    [[nodiscard]] virtual auto get_last_operation() const -> std::optional<OperationHistory> = 0;

    virtual void clear_history() = 0;

    [[nodiscard]] virtual auto trash_manager() const -> std::shared_ptr<TrashManager> = 0;
};
