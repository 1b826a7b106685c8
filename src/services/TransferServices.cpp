#include "services/TransferServices.hpp"

#include "services/ConnectionThrottle.hpp"
#include "services/FileOperationService.hpp"
#include "services/LocalFileSystem.hpp"
#include "services/LocalOperationHandler.hpp"
#include "services/OperationRouter.hpp"
#include "services/ProtocolClassifier.hpp"
#include "services/RemoteOperationHandler.hpp"
#include "services/StagingArea.hpp"
#include "services/TransferBridge.hpp"
#include "services/TransportRegistry.hpp"
#include "services/TrashManager.hpp"
#include "util/Logger.hpp"

#include <fmt/format.h>

#include <array>

void configure_transfer_services(di::Container& container, const TransferSettings& settings,
                                 const std::vector<std::shared_ptr<IBackendTransport>>& transports,
                                 std::shared_ptr<ICredentialsProvider> credentials) {
    auto registry = std::make_shared<TransportRegistry>();
    for (const auto& transport : transports) {
        registry->register_transport(transport);
    }
    container.register_instance<TransportRegistry>(registry);

    if (credentials) {
        container.register_instance<ICredentialsProvider>(std::move(credentials));
    }

    container.register_instance<ILocalFileSystem>(local_fs::native_file_system());

    container.register_factory<ProtocolClassifier>(
        [](di::Container&) { return std::make_shared<ProtocolClassifier>(); });

    container.register_factory<ConnectionThrottle>([settings](di::Container&) {
        return std::make_shared<ConnectionThrottle>(settings.connection_limits);
    });

    container.register_factory<StagingArea>([settings](di::Container&) {
        return std::make_shared<StagingArea>(settings.staging_directory);
    });

    container.register_factory<TransferBridge>([settings](di::Container& c) {
        return std::make_shared<TransferBridge>(c.resolve<TransportRegistry>(),
                                                c.resolve<ConnectionThrottle>(),
                                                c.resolve<StagingArea>(), settings,
                                                c.resolve<ILocalFileSystem>());
    });

    container.register_factory<TrashManager>([settings](di::Container& c) {
        return std::make_shared<TrashManager>(settings, c.resolve<ILocalFileSystem>());
    });

    container.register_factory<OperationRouter>([settings](di::Container& c) {
        auto router = std::make_shared<OperationRouter>(c.resolve<ProtocolClassifier>());
        auto bridge = c.resolve<TransferBridge>();
        auto provider = c.try_resolve<ICredentialsProvider>();

        router->register_handler(
            std::make_shared<LocalOperationHandler>(settings, bridge, c.resolve<TrashManager>()));

        constexpr std::array network_backends = {BackendType::SMB, BackendType::SFTP,
                                                 BackendType::FTP, BackendType::CLOUD};
        for (auto backend : network_backends) {
            router->register_handler(
                std::make_shared<RemoteOperationHandler>(backend, settings, bridge, provider));
        }
        return router;
    });

    container.register_factory<IFileOperationService>([settings](di::Container& c) {
        return std::make_shared<FileOperationService>(c.resolve<OperationRouter>(),
                                                      c.resolve<TrashManager>(), settings);
    });

    LOG_DEBUG("TransferServices",
              fmt::format("Registered core services with {} transport(s)", transports.size()));
}
