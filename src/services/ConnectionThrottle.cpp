#include "services/ConnectionThrottle.hpp"

#include <utility>

ConnectionThrottle::Permit::~Permit() {
    release();
}

ConnectionThrottle::Permit::Permit(Permit&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)), key_(std::move(other.key_)) {}

auto ConnectionThrottle::Permit::operator=(Permit&& other) noexcept -> Permit& {
    if (this != &other) {
        release();
        owner_ = std::exchange(other.owner_, nullptr);
        key_ = std::move(other.key_);
    }
    return *this;
}

void ConnectionThrottle::Permit::release() {
    if (owner_ != nullptr) {
        std::exchange(owner_, nullptr)->release_slot(key_);
    }
}

ConnectionThrottle::ConnectionThrottle(std::map<BackendType, int> limits)
    : limits_(std::move(limits)) {}

auto ConnectionThrottle::make_key(BackendType backend, const std::string& host_key)
    -> std::string {
    return std::string(backend_name(backend)) + "|" + host_key;
}

auto ConnectionThrottle::limit_for(BackendType backend) const -> int {
    auto it = limits_.find(backend);
    if (it == limits_.end() || it->second < 1) {
        return 1;
    }
    return it->second;
}

auto ConnectionThrottle::acquire(BackendType backend, const std::string& host_key) -> Permit {
    const int limit = limit_for(backend);
    auto key = make_key(backend, host_key);

    std::unique_lock lock(mutex_);
    slot_freed_.wait(lock, [&] { return active_[key] < limit; });
    ++active_[key];
    return Permit(this, std::move(key));
}

auto ConnectionThrottle::try_acquire(BackendType backend, const std::string& host_key)
    -> std::optional<Permit> {
    const int limit = limit_for(backend);
    auto key = make_key(backend, host_key);

    std::lock_guard lock(mutex_);
    if (active_[key] >= limit) {
        return std::nullopt;
    }
    ++active_[key];
    return Permit(this, std::move(key));
}

auto ConnectionThrottle::active_count(BackendType backend, const std::string& host_key) const
    -> int {
    std::lock_guard lock(mutex_);
    auto it = active_.find(make_key(backend, host_key));
    return it == active_.end() ? 0 : it->second;
}

void ConnectionThrottle::release_slot(const std::string& key) {
    {
        std::lock_guard lock(mutex_);
        auto it = active_.find(key);
        if (it != active_.end() && it->second > 0) {
            --it->second;
        }
    }
    slot_freed_.notify_all();
}
