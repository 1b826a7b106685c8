/**
 * @file LocalOperationHandler.hpp
 * @brief Handler for the local filesystem and scoped document trees
 */

#pragma once

#include "services/BaseOperationHandler.hpp"
#include "services/TrashManager.hpp"

#include <memory>

/**
 * @class LocalOperationHandler
 * @brief LOCAL and SCOPED locators; the only handler that supports soft delete
 *
 * Plain paths go through the filesystem directly. Scoped locators use the
 * SCOPED transport from the registry via the TransferBridge.
 */
class LocalOperationHandler : public BaseOperationHandler {
public:
    LocalOperationHandler(TransferSettings settings, std::shared_ptr<TransferBridge> bridge,
                          std::shared_ptr<TrashManager> trash_manager);

    auto remove(const DeleteOperation& operation, const ProgressCallback& progress,
                const std::atomic<bool>& cancel_requested) -> OperationResult override;

private:
    auto soft_delete(const DeleteOperation& operation, const ProgressCallback& progress,
                     const std::atomic<bool>& cancel_requested) -> OperationResult;

    std::shared_ptr<TrashManager> trash_manager_;
};
