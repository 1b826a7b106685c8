/**
 * @file UndoHistory.hpp
 * @brief Single-slot memory of the last operation and undo planning
 */

#pragma once

#include "models/OperationHistory.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class UndoHistory {
public:
    using ExistsPredicate = std::function<bool(const std::string&)>;

    /**
     * @brief Replace the slot with @p operation and its result
     */
    void record(Operation operation, OperationResult result);

    [[nodiscard]] auto last() const -> std::optional<OperationHistory>;

    void clear();

    /**
     * @brief A slot exists and holds an undoable operation
     */
    [[nodiscard]] auto can_undo() const -> bool;

    /**
     * @brief Delete is never undoable; neither is anything that produced nothing
     */
    [[nodiscard]] static auto is_undoable(const OperationHistory& entry) -> bool;

    /**
     * @brief Operations that revert @p entry
     *
     * - Copy: hard delete of the produced files that still exist.
     * - Move: move the produced files that still exist back to their original
     *   parent with overwrite; one operation per distinct parent.
     * - Rename: rename back if the renamed file still exists.
     *
     * @return Empty when there is nothing to revert
     */
    [[nodiscard]] static auto plan_undo(const OperationHistory& entry, const ExistsPredicate& exists)
        -> std::vector<Operation>;

    /**
     * @brief Fold the results of several undo steps into one
     */
    [[nodiscard]] static auto combine(const std::vector<std::pair<Operation, OperationResult>>& steps)
        -> std::optional<OperationResult>;

private:
    mutable std::mutex mutex_;
    std::optional<OperationHistory> last_;
};
