#pragma once

#include "models/TransferSettings.hpp"
#include "services/IFileOperationService.hpp"
#include "services/OperationRouter.hpp"
#include "services/TrashManager.hpp"
#include "services/UndoHistory.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

class FileOperationService : public IFileOperationService {
public:
    FileOperationService(std::shared_ptr<OperationRouter> router,
                         std::shared_ptr<TrashManager> trash_manager, TransferSettings settings = {});
    ~FileOperationService() override;

    FileOperationService(const FileOperationService&) = delete;
    FileOperationService& operator=(const FileOperationService&) = delete;

    auto execute(const Operation& operation) -> OperationResult override;
    auto execute_async(const Operation& operation) -> std::future<OperationResult> override;
    auto execute_with_progress(const Operation& operation)
        -> std::shared_ptr<ProgressChannel> override;

    auto cancel_current_operation() -> bool override;
    [[nodiscard]] auto is_operation_in_progress() const -> bool override;

    [[nodiscard]] auto can_undo() const -> bool override;
    auto undo() -> std::optional<OperationResult> override;
    [[nodiscard]] auto get_last_operation() const -> std::optional<OperationHistory> override;
    void clear_history() override;

    [[nodiscard]] auto trash_manager() const -> std::shared_ptr<TrashManager> override;

private:
    static constexpr auto SHUTDOWN_TIMEOUT = std::chrono::seconds{5};

    struct ThreadState {
        std::atomic<bool> cancel_requested{false};
        std::atomic<bool> operation_in_progress{false};
    };

    using CompletionCallback = std::function<void(OperationResult)>;

    /**
     * @brief Claim the worker and run @p operation on it
     * @return false if another operation is in flight (nothing was started)
     */
    auto start(const Operation& operation, ProgressCallback progress, CompletionCallback on_complete)
        -> bool;

    /**
     * @brief Validate, dispatch and record one operation (worker thread)
     */
    auto run_operation(const Operation& operation, const ProgressCallback& progress,
                       const std::atomic<bool>& cancel_requested) -> OperationResult;

    [[nodiscard]] static auto busy_result() -> OperationResult;

    std::shared_ptr<OperationRouter> router_;
    std::shared_ptr<TrashManager> trash_manager_;
    TransferSettings settings_;
    UndoHistory history_;

    std::shared_ptr<ThreadState> state_;
    std::thread worker_thread_;
    mutable std::mutex thread_mutex_;  // Protects worker_thread_
};
