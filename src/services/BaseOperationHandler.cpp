#include "services/BaseOperationHandler.hpp"

#include "services/BatchRunner.hpp"
#include "services/LocalFileSystem.hpp"
#include "services/OperationPolicy.hpp"
#include "services/ProtocolClassifier.hpp"
#include "util/Logger.hpp"
#include "util/Retry.hpp"

#include <fmt/format.h>

#include <cctype>
#include <mutex>
#include <optional>

namespace {

auto join_errors(const std::vector<std::string>& errors) -> std::string {
    std::string joined;
    for (const auto& error : errors) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error;
    }
    return joined;
}

auto lowercase_name(std::string_view name) -> std::string {
    std::string lowered(name);
    for (auto& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lowered;
}

}  // namespace

BaseOperationHandler::BaseOperationHandler(BackendType backend, TransferSettings settings,
                                           std::shared_ptr<TransferBridge> bridge)
    : backend_(backend),
      settings_(std::move(settings)),
      bridge_(std::move(bridge)),
      component_(std::string(backend_name(backend)) + "Handler") {}

auto BaseOperationHandler::copy(const CopyOperation& operation, const ProgressCallback& progress,
                                const std::atomic<bool>& cancel_requested) -> OperationResult {
    LOG_INFO(component_, fmt::format("Copy of {} item(s) to {}", operation.sources.size(),
                                      operation.destination));
    return run_transfers(operation, operation.sources, progress, cancel_requested,
                         [&](const std::string& source, ProgressReporter& reporter) {
                             return copy_item(source, operation.destination, operation.overwrite,
                                              reporter);
                         });
}

auto BaseOperationHandler::move(const MoveOperation& operation, const ProgressCallback& progress,
                                const std::atomic<bool>& cancel_requested) -> OperationResult {
    LOG_INFO(component_, fmt::format("Move of {} item(s) to {}", operation.sources.size(),
                                      operation.destination));
    return run_transfers(operation, operation.sources, progress, cancel_requested,
                         [&](const std::string& source, ProgressReporter& reporter) {
                             return move_item(source, operation.destination, operation.overwrite,
                                              reporter);
                         });
}

auto BaseOperationHandler::exists(const std::string& locator) -> bool {
    auto found = bridge_->exists(locator);
    return found && *found;
}

auto BaseOperationHandler::rename(const RenameOperation& operation) -> OperationResult {
    const auto name = protocol::file_name(operation.file);

    if (auto valid = operation_policy::validate_new_name(operation.new_name); !valid) {
        return FailureResult{valid.error().message, valid.error().kind};
    }

    auto fail = [this, &name, &operation](const util::Error& error) -> OperationResult {
        if (error.kind == util::ErrorKind::AUTHENTICATION_REQUIRED) {
            return AuthenticationRequiredResult{provider_name(), error.message};
        }
        LOG_WARNING(component_, fmt::format("Rename of {} failed: {}", operation.file, error.message));
        return FailureResult{FileError::from_error(error, name, operation.file).render(),
                             error.kind};
    };

    auto source_exists = bridge_->exists(operation.file);
    if (!source_exists) {
        return fail(source_exists.error());
    }
    if (!*source_exists) {
        return fail(util::Error{name + " not found", util::ErrorKind::NOT_FOUND});
    }

    const auto new_path = protocol::replace_file_name(protocol::normalize_locator(operation.file),
                                                      operation.new_name);
    if (new_path == protocol::normalize_locator(operation.file)) {
        return SuccessResult{1, operation, {new_path}, {operation.file}};
    }

    auto target_exists = bridge_->exists(new_path);
    if (!target_exists) {
        return fail(target_exists.error());
    }
    if (*target_exists) {
        return fail(util::Error{fmt::format("{} already exists in {}", operation.new_name,
                                            protocol::parent(operation.file)),
                                util::ErrorKind::ALREADY_EXISTS});
    }

    if (auto renamed = bridge_->rename(operation.file, new_path); !renamed) {
        return fail(renamed.error());
    }

    LOG_INFO(component_, fmt::format("Renamed {} to {}", operation.file, operation.new_name));
    return SuccessResult{1, operation, {new_path}, {operation.file}};
}

auto BaseOperationHandler::plan_transfer(const std::string& source, const std::string& destination,
                                         bool overwrite) -> std::expected<TransferPlan, FileError> {
    TransferPlan plan;
    plan.name = protocol::file_name(source);
    plan.target = protocol::join(destination, plan.name);

    auto error = [&](util::ErrorKind kind, std::string message) {
        return std::unexpected(FileError{kind, plan.name, source, plan.target, std::move(message)});
    };

    auto source_exists = bridge_->exists(source);
    if (!source_exists) {
        return std::unexpected(
            FileError::from_error(source_exists.error(), plan.name, source, plan.target));
    }
    if (!*source_exists) {
        return error(util::ErrorKind::NOT_FOUND, plan.name + " not found");
    }

    if (protocol::normalize_locator(source) == protocol::normalize_locator(plan.target)) {
        return error(util::ErrorKind::ALREADY_EXISTS,
                     fmt::format("{} is already in {}", plan.name, destination));
    }

    auto target_exists = bridge_->exists(plan.target);
    if (!target_exists) {
        return std::unexpected(
            FileError::from_error(target_exists.error(), plan.name, source, plan.target));
    }
    plan.target_exists = *target_exists;

    if (plan.target_exists && !overwrite) {
        return error(util::ErrorKind::ALREADY_EXISTS,
                     fmt::format("{} already exists in {}", plan.name, destination));
    }

    if (protocol::classify(destination) == BackendType::LOCAL) {
        if (auto created = local_fs::ensure_directory(destination); !created) {
            return std::unexpected(
                FileError::from_error(created.error(), plan.name, source, plan.target));
        }
    }

    return plan;
}

auto BaseOperationHandler::copy_item(const std::string& source, const std::string& destination,
                                     bool overwrite, ProgressReporter& reporter)
    -> std::expected<std::string, FileError> {
    auto plan = plan_transfer(source, destination, overwrite);
    if (!plan) {
        return std::unexpected(plan.error());
    }

    auto copied = bridge_->transfer(source, plan->target, overwrite, reporter.as_transfer_callback());
    if (!copied) {
        return std::unexpected(FileError::from_error(copied.error(), plan->name, source, plan->target));
    }

    LOG_DEBUG(component_, fmt::format("Copied {} ({} bytes)", source, *copied));
    return plan->target;
}

auto BaseOperationHandler::move_item(const std::string& source, const std::string& destination,
                                     bool overwrite, ProgressReporter& reporter)
    -> std::expected<std::string, FileError> {
    auto plan = plan_transfer(source, destination, overwrite);
    if (!plan) {
        return std::unexpected(plan.error());
    }

    // Never rename over an existing file; that path always copies.
    if (!plan->target_exists && TransferBridge::supports_direct_rename(source, plan->target)) {
        auto renamed = bridge_->rename(source, plan->target);
        if (renamed) {
            reporter.report(0, 0);
            LOG_DEBUG(component_, "Moved " + source + " by rename");
            return plan->target;
        }
        if (renamed.error().kind == util::ErrorKind::AUTHENTICATION_REQUIRED) {
            return std::unexpected(
                FileError::from_error(renamed.error(), plan->name, source, plan->target));
        }
        LOG_DEBUG(component_, fmt::format("Rename of {} failed ({}), falling back to copy and delete",
                                          source, renamed.error().message));
    }

    auto copied = bridge_->transfer(source, plan->target, overwrite, reporter.as_transfer_callback());
    if (!copied) {
        return std::unexpected(FileError::from_error(copied.error(), plan->name, source, plan->target));
    }

    if (auto removed = bridge_->remove(source); !removed) {
        return std::unexpected(FileError{
            removed.error().kind, plan->name, source, plan->target,
            fmt::format("{}: Failed to delete source after copy: {}", plan->name,
                        removed.error().message)});
    }

    return plan->target;
}

auto BaseOperationHandler::provider_name() const -> std::string {
    return std::string(backend_name(backend_));
}

auto BaseOperationHandler::cancelled_error(const std::string& locator) -> FileError {
    auto name = protocol::file_name(locator);
    return FileError{util::ErrorKind::UNKNOWN, name, locator, {}, name + ": Operation cancelled"};
}

auto BaseOperationHandler::build_result(const Operation& operation, size_t total,
                                        std::vector<std::string> produced,
                                        std::vector<std::string> sources,
                                        std::vector<std::string> errors,
                                        util::ErrorKind first_error_kind) const -> OperationResult {
    const auto name = std::string(operation_name(operation));

    if (errors.empty()) {
        LOG_INFO(component_, fmt::format("{} completed: {} item(s)", name, total));
        return SuccessResult{total, operation, std::move(produced), std::move(sources)};
    }

    const size_t failed = errors.size();
    const size_t processed = total - failed;

    if (processed > 0) {
        LOG_WARNING(component_, fmt::format("{} partially completed: {} succeeded, {} failed", name,
                                            processed, failed));
        return PartialSuccessResult{processed, failed, std::move(errors), std::move(produced),
                                    std::move(sources)};
    }

    LOG_ERROR(component_, fmt::format("{} failed for all {} item(s)", name, total));
    return FailureResult{fmt::format("All {} operations failed: {}", lowercase_name(name),
                                     join_errors(errors)),
                         first_error_kind};
}

auto BaseOperationHandler::run_transfers(const Operation& operation,
                                         const std::vector<std::string>& sources,
                                         const ProgressCallback& progress,
                                         const std::atomic<bool>& cancel_requested,
                                         const TransferStep& step) -> OperationResult {
    const size_t total = sources.size();
    std::vector<std::string> produced;
    std::vector<std::string> transferred;
    std::vector<std::string> errors;
    std::optional<util::ErrorKind> first_error_kind;

    ProgressReporter reporter(progress, settings_.progress_interval);

    for (size_t i = 0; i < total; ++i) {
        if (cancel_requested.load()) {
            LOG_INFO(component_, fmt::format("Cancelled with {} item(s) remaining", total - i));
            for (size_t j = i; j < total; ++j) {
                errors.push_back(cancelled_error(sources[j]).render());
            }
            first_error_kind = first_error_kind.value_or(util::ErrorKind::UNKNOWN);
            break;
        }

        const auto& source = sources[i];
        reporter.begin_item(protocol::file_name(source), i, total);

        auto outcome = step(source, reporter);
        if (outcome) {
            produced.push_back(std::move(*outcome));
            transferred.push_back(source);
            continue;
        }

        const auto& error = outcome.error();
        if (error.kind == util::ErrorKind::AUTHENTICATION_REQUIRED) {
            LOG_WARNING(component_, "Authentication required: " + error.message);
            return AuthenticationRequiredResult{provider_name(), error.message};
        }

        LOG_WARNING(component_, fmt::format("Failed to process {}: {}", source, error.message));
        first_error_kind = first_error_kind.value_or(error.kind);
        errors.push_back(error.render());
    }

    return build_result(operation, total, std::move(produced), std::move(transferred),
                        std::move(errors), first_error_kind.value_or(util::ErrorKind::UNKNOWN));
}

auto BaseOperationHandler::run_deletes(const DeleteOperation& operation,
                                       const ProgressCallback& progress,
                                       const std::atomic<bool>& cancel_requested,
                                       const DeleteStep& step) -> OperationResult {
    const auto& files = operation.files;
    const size_t total = files.size();

    std::mutex mutex;
    std::vector<std::string> deleted;
    std::vector<std::string> errors;
    std::optional<util::ErrorKind> first_error_kind;
    std::optional<util::Error> auth_failure;
    std::atomic<bool> aborted{false};

    const util::RetryPolicy retry{settings_.delete_max_attempts, settings_.delete_backoff_step};

    auto work = [&](size_t index) {
        const auto& locator = files[index];
        const auto name = protocol::file_name(locator);

        auto outcome = util::retry_with_backoff<void>(
            retry, [&]() { return step(locator); },
            [this, &name](int attempt, const util::Error& error) {
                LOG_WARNING(component_, fmt::format("Retrying delete of {} (attempt {} failed): {}",
                                                    name, attempt, error.message));
            });

        std::lock_guard lock(mutex);
        if (outcome) {
            deleted.push_back(locator);
        } else if (outcome.error().kind == util::ErrorKind::AUTHENTICATION_REQUIRED) {
            if (!auth_failure) {
                auth_failure = outcome.error();
            }
            aborted.store(true);
        } else {
            LOG_WARNING(component_,
                        fmt::format("Failed to delete {}: {}", locator, outcome.error().message));
            first_error_kind = first_error_kind.value_or(outcome.error().kind);
            errors.push_back(FileError::from_error(outcome.error(), name, locator).render());
        }

        if (progress) {
            progress(ProgressProcessing{.current_item = name, .index = index, .total = total});
        }
    };

    const size_t started = run_in_batches(
        total, BatchPolicy{settings_.delete_batch_size, settings_.delete_batch_pause}, work,
        [&] { return cancel_requested.load() || aborted.load(); });

    if (auth_failure) {
        LOG_WARNING(component_, "Authentication required: " + auth_failure->message);
        return AuthenticationRequiredResult{provider_name(), auth_failure->message};
    }

    for (size_t i = started; i < total; ++i) {
        errors.push_back(cancelled_error(files[i]).render());
        first_error_kind = first_error_kind.value_or(util::ErrorKind::UNKNOWN);
    }

    auto deleted_sources = deleted;
    return build_result(operation, total, std::move(deleted), std::move(deleted_sources),
                        std::move(errors), first_error_kind.value_or(util::ErrorKind::UNKNOWN));
}
