/**
 * @file RemoteOperationHandler.hpp
 * @brief Handler for one network backend (SMB, SFTP, FTP or CLOUD)
 */

#pragma once

#include "services/BaseOperationHandler.hpp"
#include "services/ICredentialsProvider.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @class RemoteOperationHandler
 * @brief Runs operations routed to a network backend
 *
 * The router also sends mixed selections here (e.g. a copy from SFTP to
 * SMB), so every item may involve a different backend; the TransferBridge
 * stages those through a local temporary file. Soft delete is refused.
 */
class RemoteOperationHandler : public BaseOperationHandler {
public:
    RemoteOperationHandler(BackendType backend, TransferSettings settings,
                           std::shared_ptr<TransferBridge> bridge,
                           std::shared_ptr<ICredentialsProvider> credentials);

    auto copy(const CopyOperation& operation, const ProgressCallback& progress,
              const std::atomic<bool>& cancel_requested) -> OperationResult override;

    auto move(const MoveOperation& operation, const ProgressCallback& progress,
              const std::atomic<bool>& cancel_requested) -> OperationResult override;

    auto remove(const DeleteOperation& operation, const ProgressCallback& progress,
                const std::atomic<bool>& cancel_requested) -> OperationResult override;

private:
    /**
     * @brief Apply source_credentials_id to the transports of the sources
     * @return AuthenticationRequiredResult if the id cannot be resolved
     */
    auto apply_source_credentials(const std::optional<std::string>& credentials_id,
                                  const std::vector<std::string>& sources)
        -> std::optional<OperationResult>;

    std::shared_ptr<ICredentialsProvider> credentials_;
};
