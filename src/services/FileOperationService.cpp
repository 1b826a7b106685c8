#include "services/FileOperationService.hpp"

#include "services/OperationPolicy.hpp"
#include "util/Logger.hpp"
#include "util/Overloaded.hpp"

#include <fmt/format.h>

#include <utility>

namespace {

constexpr std::string_view COMPONENT = "FileOperationService";

void log_outcome(const Operation& operation, const OperationResult& result) {
    const auto summary = fmt::format("{}: {}", operation_name(operation), describe_result(result));
    std::visit(util::Overloaded{
                   [&](const SuccessResult&) { LOG_INFO(COMPONENT, summary); },
                   [&](const PartialSuccessResult&) { LOG_WARNING(COMPONENT, summary); },
                   [&](const FailureResult&) { LOG_ERROR(COMPONENT, summary); },
                   [&](const AuthenticationRequiredResult&) { LOG_WARNING(COMPONENT, summary); },
               },
               result);
}

}  // namespace

FileOperationService::FileOperationService(std::shared_ptr<OperationRouter> router,
                                           std::shared_ptr<TrashManager> trash_manager,
                                           TransferSettings settings)
    : router_(std::move(router)),
      trash_manager_(std::move(trash_manager)),
      settings_(std::move(settings)),
      state_(std::make_shared<ThreadState>()) {}

FileOperationService::~FileOperationService() {
    if (state_->operation_in_progress.load()) {
        state_->cancel_requested.store(true);

        auto start = std::chrono::steady_clock::now();
        while (state_->operation_in_progress.load()) {
            if (std::chrono::steady_clock::now() - start >= SHUTDOWN_TIMEOUT) {
                LOG_ERROR(COMPONENT, fmt::format("Shutdown - operation did not stop within {}s of "
                                                 "cancellation, waiting for it to finish",
                                                 SHUTDOWN_TIMEOUT.count()));
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{50});
        }
    }

    // Always join: a detached worker could still be writing files at exit.
    std::lock_guard lock(thread_mutex_);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

auto FileOperationService::busy_result() -> OperationResult {
    return FailureResult{"Another operation is already in progress"};
}

auto FileOperationService::start(const Operation& operation, ProgressCallback progress,
                                 CompletionCallback on_complete) -> bool {
    bool idle = false;
    if (!state_->operation_in_progress.compare_exchange_strong(idle, true)) {
        LOG_WARNING(COMPONENT, fmt::format("{} rejected: another operation is in progress",
                                           operation_name(operation)));
        return false;
    }

    std::lock_guard lock(thread_mutex_);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    state_->cancel_requested.store(false);

    worker_thread_ = std::thread([this, operation, progress = std::move(progress),
                                  on_complete = std::move(on_complete), state = state_]() {
        auto result = run_operation(operation, progress, state->cancel_requested);
        state->operation_in_progress.store(false);
        on_complete(std::move(result));
    });
    return true;
}

auto FileOperationService::run_operation(const Operation& operation,
                                         const ProgressCallback& progress,
                                         const std::atomic<bool>& cancel_requested)
    -> OperationResult {
    LOG_INFO(COMPONENT, fmt::format("{} of {} item(s) started", operation_name(operation),
                                    operation_item_count(operation)));

    OperationResult result = FailureResult{"Operation did not run"};

    if (auto valid = operation_policy::validate_operation(operation); !valid) {
        result = FailureResult{valid.error().message, valid.error().kind};
    } else if (!router_) {
        result = FailureResult{"No operation router configured"};
    } else {
        try {
            result = router_->dispatch(operation, progress, cancel_requested);
        } catch (const std::exception& e) {
            LOG_ERROR(COMPONENT, fmt::format("Unexpected error: {}", e.what()));
            result = FailureResult{e.what()};
        }
    }

    log_outcome(operation, result);
    history_.record(operation, result);
    return result;
}

auto FileOperationService::execute(const Operation& operation) -> OperationResult {
    return execute_async(operation).get();
}

auto FileOperationService::execute_async(const Operation& operation)
    -> std::future<OperationResult> {
    auto promise = std::make_shared<std::promise<OperationResult>>();
    auto future = promise->get_future();

    const bool started = start(operation, {}, [promise](OperationResult result) {
        promise->set_value(std::move(result));
    });
    if (!started) {
        promise->set_value(busy_result());
    }
    return future;
}

auto FileOperationService::execute_with_progress(const Operation& operation)
    -> std::shared_ptr<ProgressChannel> {
    auto channel = std::make_shared<ProgressChannel>(settings_.progress_channel_capacity);

    channel->send_control(ProgressStarting{operation, operation_item_count(operation)});

    auto on_complete = [channel](OperationResult result) {
        channel->send_control(ProgressCompleted{std::move(result)});
        channel->close();
    };

    const bool started = start(
        operation,
        [channel](const ProgressProcessing& event) { channel->try_send(event); },
        on_complete);
    if (!started) {
        on_complete(busy_result());
    }
    return channel;
}

auto FileOperationService::cancel_current_operation() -> bool {
    if (state_->operation_in_progress.load()) {
        LOG_INFO(COMPONENT, "Cancellation requested");
        state_->cancel_requested.store(true);
        return true;
    }
    return false;
}

auto FileOperationService::is_operation_in_progress() const -> bool {
    return state_->operation_in_progress.load();
}

auto FileOperationService::can_undo() const -> bool {
    return history_.can_undo();
}

auto FileOperationService::undo() -> std::optional<OperationResult> {
    auto last = history_.last();
    if (!last) {
        return std::nullopt;
    }

    auto steps = UndoHistory::plan_undo(*last, [this](const std::string& locator) {
        auto handler = router_ ? router_->handler_for_locator(locator) : nullptr;
        return handler && handler->exists(locator);
    });
    if (steps.empty()) {
        LOG_INFO(COMPONENT, "Nothing to undo for " + std::string(operation_name(last->operation)));
        return std::nullopt;
    }

    LOG_INFO(COMPONENT, "Undoing " + std::string(operation_name(last->operation)));

    std::vector<std::pair<Operation, OperationResult>> results;
    for (const auto& step : steps) {
        results.emplace_back(step, execute(step));
    }
    return UndoHistory::combine(results);
}

auto FileOperationService::get_last_operation() const -> std::optional<OperationHistory> {
    return history_.last();
}

void FileOperationService::clear_history() {
    history_.clear();
}

auto FileOperationService::trash_manager() const -> std::shared_ptr<TrashManager> {
    return trash_manager_;
}
