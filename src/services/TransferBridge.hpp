/**
 * @file TransferBridge.hpp
 * @brief Backend-agnostic file primitives over local paths and transports
 *
 * Every locator is served either by the local filesystem or by the
 * transport registered for its backend. Transfers between two different
 * transports (or within one transport, which has no server-side copy) are
 * staged through a local temporary file. Each transport call holds a
 * ConnectionThrottle permit for the locator's (backend, host).
 */

#pragma once

#include "models/TransferSettings.hpp"
#include "services/ConnectionThrottle.hpp"
#include "services/IBackendTransport.hpp"
#include "services/ILocalFileSystem.hpp"
#include "services/StagingArea.hpp"
#include "services/TransportRegistry.hpp"
#include "util/Error.hpp"

#include <expected>
#include <memory>
#include <string>

class TransferBridge {
public:
    TransferBridge(std::shared_ptr<TransportRegistry> transports,
                   std::shared_ptr<ConnectionThrottle> throttle,
                   std::shared_ptr<StagingArea> staging, TransferSettings settings,
                   std::shared_ptr<ILocalFileSystem> file_system = nullptr);

    /**
     * @return Whether something exists at @p locator; transport errors other
     *         than NOT_FOUND are returned as errors
     */
    auto exists(const std::string& locator) -> std::expected<bool, util::Error>;

    /**
     * @brief Copy the bytes of @p source to @p target
     * @return Bytes transferred
     */
    auto transfer(const std::string& source, const std::string& target, bool overwrite,
                  const TransferProgressCallback& progress) -> std::expected<uint64_t, util::Error>;

    auto remove(const std::string& locator) -> std::expected<void, util::Error>;

    /**
     * @brief rename(2) locally, or a server-side rename on the same transport
     */
    auto rename(const std::string& from, const std::string& to) -> std::expected<void, util::Error>;

    /**
     * @brief Whether rename() can move @p from to @p to without copying
     */
    [[nodiscard]] static auto supports_direct_rename(const std::string& from, const std::string& to)
        -> bool;

    void use_credentials(const std::string& locator, const Credentials& credentials);

private:
    auto transport_for(BackendType backend) const
        -> std::expected<std::shared_ptr<IBackendTransport>, util::Error>;

    auto download_to_file(const std::string& source, const std::filesystem::path& target,
                          const TransferProgressCallback& progress)
        -> std::expected<uint64_t, util::Error>;

    auto upload_from_file(const std::filesystem::path& source, const std::string& target,
                          const TransferProgressCallback& progress)
        -> std::expected<uint64_t, util::Error>;

    std::shared_ptr<TransportRegistry> transports_;
    std::shared_ptr<ConnectionThrottle> throttle_;
    std::shared_ptr<StagingArea> staging_;
    std::shared_ptr<ILocalFileSystem> file_system_;
    TransferSettings settings_;
};
