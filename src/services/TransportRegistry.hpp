/**
 * @file TransportRegistry.hpp
 * @brief BackendType -> transport lookup shared by all handlers
 */

#pragma once

#include "services/IBackendTransport.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <vector>

class TransportRegistry {
public:
    TransportRegistry() = default;

    /**
     * @brief Register (or replace) the transport for transport->backend()
     */
    void register_transport(std::shared_ptr<IBackendTransport> transport);

    /**
     * @return Registered transport, or nullptr
     */
    [[nodiscard]] auto find(BackendType backend) const -> std::shared_ptr<IBackendTransport>;

    [[nodiscard]] auto contains(BackendType backend) const -> bool;

    [[nodiscard]] auto registered_backends() const -> std::vector<BackendType>;

private:
    mutable std::mutex mutex_;
    std::map<BackendType, std::shared_ptr<IBackendTransport>> transports_;
};
