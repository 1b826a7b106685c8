/**
 * @file ConnectionThrottle.hpp
 * @brief Per (backend, host) concurrency limiter
 *
 * Handlers take a Permit around every transport call. Limits are per
 * backend type and accounted per host key, so two SMB servers each get
 * their own budget.
 */

#pragma once

#include "models/BackendType.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

class ConnectionThrottle {
public:
    /**
     * @class Permit
     * @brief RAII slot; released on destruction
     */
    class Permit {
    public:
        Permit() = default;
        ~Permit();

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;

        [[nodiscard]] auto is_held() const -> bool { return owner_ != nullptr; }

        void release();

    private:
        friend class ConnectionThrottle;
        Permit(ConnectionThrottle* owner, std::string key) : owner_(owner), key_(std::move(key)) {}

        ConnectionThrottle* owner_ = nullptr;
        std::string key_;
    };

    explicit ConnectionThrottle(std::map<BackendType, int> limits);

    ConnectionThrottle(const ConnectionThrottle&) = delete;
    ConnectionThrottle& operator=(const ConnectionThrottle&) = delete;

    /**
     * @brief Block until a slot for (backend, host_key) is free
     */
    [[nodiscard]] auto acquire(BackendType backend, const std::string& host_key) -> Permit;

    /**
     * @return A permit, or std::nullopt if the limit is reached
     */
    [[nodiscard]] auto try_acquire(BackendType backend, const std::string& host_key)
        -> std::optional<Permit>;

    [[nodiscard]] auto active_count(BackendType backend, const std::string& host_key) const -> int;

    /**
     * @brief Limit for @p backend; backends without a configured limit get 1
     */
    [[nodiscard]] auto limit_for(BackendType backend) const -> int;

private:
    [[nodiscard]] static auto make_key(BackendType backend, const std::string& host_key)
        -> std::string;
    void release_slot(const std::string& key);

    std::map<BackendType, int> limits_;
    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    std::map<std::string, int> active_;
};
