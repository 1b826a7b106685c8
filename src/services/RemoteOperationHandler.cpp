#include "services/RemoteOperationHandler.hpp"

#include "services/OperationPolicy.hpp"
#include "services/ProtocolClassifier.hpp"
#include "util/Logger.hpp"

#include <fmt/format.h>

#include <set>
#include <utility>

RemoteOperationHandler::RemoteOperationHandler(BackendType backend, TransferSettings settings,
                                               std::shared_ptr<TransferBridge> bridge,
                                               std::shared_ptr<ICredentialsProvider> credentials)
    : BaseOperationHandler(backend, std::move(settings), std::move(bridge)),
      credentials_(std::move(credentials)) {}

auto RemoteOperationHandler::apply_source_credentials(
    const std::optional<std::string>& credentials_id, const std::vector<std::string>& sources)
    -> std::optional<OperationResult> {
    if (!credentials_id) {
        return std::nullopt;
    }

    std::optional<Credentials> credentials;
    if (credentials_) {
        credentials = credentials_->lookup(*credentials_id);
    }
    if (!credentials) {
        LOG_WARNING(component(), fmt::format("Credentials '{}' could not be resolved", *credentials_id));
        return AuthenticationRequiredResult{
            provider_name(), fmt::format("Credentials '{}' are not available", *credentials_id)};
    }

    std::set<std::string> hosts;
    for (const auto& source : sources) {
        if (protocol::classify(source) == BackendType::LOCAL) {
            continue;
        }
        if (hosts.insert(protocol::host_key(source)).second) {
            bridge().use_credentials(source, *credentials);
        }
    }
    return std::nullopt;
}

auto RemoteOperationHandler::copy(const CopyOperation& operation, const ProgressCallback& progress,
                                  const std::atomic<bool>& cancel_requested) -> OperationResult {
    if (auto rejected = apply_source_credentials(operation.source_credentials_id, operation.sources)) {
        return *rejected;
    }
    return BaseOperationHandler::copy(operation, progress, cancel_requested);
}

auto RemoteOperationHandler::move(const MoveOperation& operation, const ProgressCallback& progress,
                                  const std::atomic<bool>& cancel_requested) -> OperationResult {
    if (auto rejected = apply_source_credentials(operation.source_credentials_id, operation.sources)) {
        return *rejected;
    }
    return BaseOperationHandler::move(operation, progress, cancel_requested);
}

auto RemoteOperationHandler::remove(const DeleteOperation& operation,
                                    const ProgressCallback& progress,
                                    const std::atomic<bool>& cancel_requested) -> OperationResult {
    if (operation.soft_delete) {
        auto rejected = operation_policy::validate_soft_delete(operation);
        std::string message = rejected
                                  ? fmt::format("Soft delete is not supported on {} storage",
                                                provider_name())
                                  : rejected.error().message;
        LOG_WARNING(component(), message);
        return FailureResult{std::move(message), util::ErrorKind::BACKEND_UNSUPPORTED_OPERATION};
    }

    LOG_INFO(component(), fmt::format("Deleting {} item(s)", operation.files.size()));
    return run_deletes(operation, progress, cancel_requested,
                       [this](const std::string& locator) { return bridge().remove(locator); });
}
