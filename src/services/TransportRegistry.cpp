#include "services/TransportRegistry.hpp"

#include "util/Logger.hpp"

void TransportRegistry::register_transport(std::shared_ptr<IBackendTransport> transport) {
    if (!transport) {
        return;
    }
    const auto backend = transport->backend();
    std::lock_guard lock(mutex_);
    transports_[backend] = std::move(transport);
    LOG_DEBUG("TransportRegistry",
              std::string("Registered transport for ") + std::string(backend_name(backend)));
}

auto TransportRegistry::find(BackendType backend) const -> std::shared_ptr<IBackendTransport> {
    std::lock_guard lock(mutex_);
    auto it = transports_.find(backend);
    return it == transports_.end() ? nullptr : it->second;
}

auto TransportRegistry::contains(BackendType backend) const -> bool {
    std::lock_guard lock(mutex_);
    return transports_.contains(backend);
}

auto TransportRegistry::registered_backends() const -> std::vector<BackendType> {
    std::lock_guard lock(mutex_);
    std::vector<BackendType> backends;
    backends.reserve(transports_.size());
    for (const auto& [backend, transport] : transports_) {
        backends.push_back(backend);
    }
    return backends;
}
