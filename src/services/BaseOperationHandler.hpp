/**
 * @file BaseOperationHandler.hpp
 * @brief Per-file loops, move strategy and result aggregation shared by all handlers
 */

#pragma once

#include "models/FileError.hpp"
#include "models/TransferSettings.hpp"
#include "services/IOperationHandler.hpp"
#include "services/ProgressReporter.hpp"
#include "services/TransferBridge.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * @class BaseOperationHandler
 * @brief Implements the aggregation rules; subclasses decide how deletes run
 *
 * - Copy/Move run sequentially in input order and fail fast per file.
 * - A destination collision without overwrite fails only that item, before
 *   any byte is written.
 * - Move renames when source and destination share a backend and host and
 *   the destination is free; otherwise it copies and then deletes the source.
 * - Deletes run in concurrent batches with per-file retry.
 * - All items succeeded: Success. Some: PartialSuccess with every error.
 *   None: Failure.
 * - An AUTHENTICATION_REQUIRED error aborts the whole operation.
 */
class BaseOperationHandler : public IOperationHandler {
public:
    BaseOperationHandler(BackendType backend, TransferSettings settings,
                         std::shared_ptr<TransferBridge> bridge);

    [[nodiscard]] auto backend() const -> BackendType override { return backend_; }

    auto copy(const CopyOperation& operation, const ProgressCallback& progress,
              const std::atomic<bool>& cancel_requested) -> OperationResult override;

    auto move(const MoveOperation& operation, const ProgressCallback& progress,
              const std::atomic<bool>& cancel_requested) -> OperationResult override;

    auto rename(const RenameOperation& operation) -> OperationResult override;

    [[nodiscard]] auto exists(const std::string& locator) -> bool override;

protected:
    /// Transfer one source; returns the locator it produced
    using TransferStep =
        std::function<std::expected<std::string, FileError>(const std::string&, ProgressReporter&)>;

    /// Delete one locator (a single attempt; retry is applied by run_deletes)
    using DeleteStep = std::function<std::expected<void, util::Error>(const std::string&)>;

    auto run_transfers(const Operation& operation, const std::vector<std::string>& sources,
                       const ProgressCallback& progress, const std::atomic<bool>& cancel_requested,
                       const TransferStep& step) -> OperationResult;

    auto run_deletes(const DeleteOperation& operation, const ProgressCallback& progress,
                     const std::atomic<bool>& cancel_requested, const DeleteStep& step)
        -> OperationResult;

    auto copy_item(const std::string& source, const std::string& destination, bool overwrite,
                   ProgressReporter& reporter) -> std::expected<std::string, FileError>;

    auto move_item(const std::string& source, const std::string& destination, bool overwrite,
                   ProgressReporter& reporter) -> std::expected<std::string, FileError>;

    [[nodiscard]] auto build_result(const Operation& operation, size_t total,
                                    std::vector<std::string> produced,
                                    std::vector<std::string> sources,
                                    std::vector<std::string> errors,
                                    util::ErrorKind first_error_kind) const -> OperationResult;

    /**
     * @brief Provider reported in AuthenticationRequiredResult
     */
    [[nodiscard]] virtual auto provider_name() const -> std::string;

    [[nodiscard]] auto settings() const -> const TransferSettings& { return settings_; }
    [[nodiscard]] auto bridge() const -> TransferBridge& { return *bridge_; }
    [[nodiscard]] auto component() const -> const std::string& { return component_; }

    static auto cancelled_error(const std::string& locator) -> FileError;

private:
    struct TransferPlan {
        std::string name;
        std::string target;
        bool target_exists = false;
    };

    auto plan_transfer(const std::string& source, const std::string& destination, bool overwrite)
        -> std::expected<TransferPlan, FileError>;

    BackendType backend_;
    TransferSettings settings_;
    std::shared_ptr<TransferBridge> bridge_;
    std::string component_;
};
