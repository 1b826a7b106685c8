#include "services/LocalOperationHandler.hpp"

#include "services/OperationPolicy.hpp"
#include "util/Logger.hpp"

#include <fmt/format.h>

#include <utility>

LocalOperationHandler::LocalOperationHandler(TransferSettings settings,
                                             std::shared_ptr<TransferBridge> bridge,
                                             std::shared_ptr<TrashManager> trash_manager)
    : BaseOperationHandler(BackendType::LOCAL, std::move(settings), std::move(bridge)),
      trash_manager_(std::move(trash_manager)) {}

auto LocalOperationHandler::remove(const DeleteOperation& operation,
                                   const ProgressCallback& progress,
                                   const std::atomic<bool>& cancel_requested) -> OperationResult {
    if (operation.soft_delete) {
        return soft_delete(operation, progress, cancel_requested);
    }

    LOG_INFO(component(), fmt::format("Deleting {} item(s)", operation.files.size()));
    return run_deletes(operation, progress, cancel_requested,
                       [this](const std::string& locator) { return bridge().remove(locator); });
}

auto LocalOperationHandler::soft_delete(const DeleteOperation& operation,
                                        const ProgressCallback& progress,
                                        const std::atomic<bool>& cancel_requested)
    -> OperationResult {
    // Scoped locators have no trash; nothing is deleted if any is present.
    if (auto allowed = operation_policy::validate_soft_delete(operation); !allowed) {
        LOG_WARNING(component(), allowed.error().message);
        return FailureResult{allowed.error().message, allowed.error().kind};
    }

    if (!trash_manager_) {
        return FailureResult{"Trash is not available",
                             util::ErrorKind::BACKEND_UNSUPPORTED_OPERATION};
    }

    auto batch = trash_manager_->move_to_trash(operation.files, progress, cancel_requested);

    std::vector<std::string> trashed_paths;
    std::vector<std::string> original_paths;
    trashed_paths.reserve(batch.trashed.size());
    original_paths.reserve(batch.trashed.size());
    for (const auto& file : batch.trashed) {
        trashed_paths.push_back(file.trash_path);
        original_paths.push_back(file.original_path);
    }

    return build_result(operation, operation.files.size(), std::move(trashed_paths),
                        std::move(original_paths), std::move(batch.errors),
                        util::ErrorKind::UNKNOWN);
}
