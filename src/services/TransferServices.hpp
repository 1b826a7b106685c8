/**
 * @file TransferServices.hpp
 * @brief Registers the transfer core in a di::Container
 */

#pragma once

#include "di/Container.hpp"
#include "models/TransferSettings.hpp"
#include "services/IBackendTransport.hpp"
#include "services/ICredentialsProvider.hpp"

#include <memory>
#include <vector>

/**
 * @brief Wire every core service into @p container
 *
 * Registers ProtocolClassifier, TransportRegistry (pre-filled with
 * @p transports), ConnectionThrottle, StagingArea, TransferBridge,
 * TrashManager, the LOCAL handler and one RemoteOperationHandler per network
 * backend, OperationRouter and IFileOperationService. All are singletons.
 *
 * @param credentials May be nullptr; operations carrying a
 *        source_credentials_id then fail with AuthenticationRequired
 */
void configure_transfer_services(di::Container& container, const TransferSettings& settings,
                                 const std::vector<std::shared_ptr<IBackendTransport>>& transports,
                                 std::shared_ptr<ICredentialsProvider> credentials);
