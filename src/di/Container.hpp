/**
 * @file Container.hpp
 * @brief Lightweight dependency injection container
 *
 * Header-only, type-indexed registry of service factories with singleton
 * and transient lifetimes. Factories receive the container so a service
 * can resolve its own dependencies when it is first created.
 */

#pragma once

#include <any>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <unordered_map>

namespace di {

/**
 * @enum Lifetime
 * @brief Specifies the lifetime of a registered service
 */
enum class Lifetime {
    SINGLETON,  ///< Single instance shared across all resolutions
    TRANSIENT   ///< New instance created on each resolution
};

/**
 * @class Container
 * @brief Lightweight dependency injection container
 *
 * @example
 * ```cpp
 * di::Container container;
 * container.register_instance<TransportRegistry>(registry);
 * container.register_factory<IFileOperationService>([](di::Container& c) {
 *     return std::make_shared<FileOperationService>(c.resolve<OperationRouter>(),
 *                                                   c.resolve<TrashManager>());
 * });
 * auto service = container.resolve<IFileOperationService>();
 * ```
 */
class Container {
public:
    template<typename Interface>
    using Factory = std::function<std::shared_ptr<Interface>(Container&)>;

    Container() = default;
    ~Container() = default;

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;
    Container(Container&&) = delete;
    Container& operator=(Container&&) = delete;

    /**
     * @brief Register a default-constructible implementation for an interface
     */
    template<typename Interface, typename Implementation = Interface>
    void register_type(Lifetime lifetime = Lifetime::SINGLETON) {
        static_assert(std::is_base_of_v<Interface, Implementation>,
                      "Implementation must derive from Interface");

        register_factory<Interface>(
            [](Container&) -> std::shared_ptr<Interface> {
                return std::make_shared<Implementation>();
            },
            lifetime);
    }

    /**
     * @brief Register a factory; it may resolve other services from the container
     */
    template<typename Interface>
    void register_factory(Factory<Interface> factory, Lifetime lifetime = Lifetime::SINGLETON) {
        std::lock_guard lock(mutex_);
        registrations_[std::type_index(typeid(Interface))] = Registration{
            .factory = [factory = std::move(factory)](Container& container) -> std::any {
                return factory(container);
            },
            .lifetime = lifetime,
            .instance = std::any{}};
    }

    /**
     * @brief Register an existing instance as a singleton
     */
    template<typename Interface>
    void register_instance(std::shared_ptr<Interface> instance) {
        std::lock_guard lock(mutex_);
        registrations_[std::type_index(typeid(Interface))] = Registration{
            .factory = nullptr, .lifetime = Lifetime::SINGLETON, .instance = std::move(instance)};
    }

    /**
     * @brief Resolve a registered service
     * @throws std::runtime_error if the type is not registered
     */
    template<typename Interface>
    [[nodiscard]] auto resolve() -> std::shared_ptr<Interface> {
        auto instance = try_resolve<Interface>();
        if (!instance) {
            throw std::runtime_error(std::string("Type not registered: ") +
                                     typeid(Interface).name());
        }
        return instance;
    }

    /**
     * @brief Resolve a service, or nullptr if it is not registered
     */
    template<typename Interface>
    [[nodiscard]] auto try_resolve() -> std::shared_ptr<Interface> {
        // Recursive: factories resolve their dependencies through this container.
        std::lock_guard lock(mutex_);

        auto it = registrations_.find(std::type_index(typeid(Interface)));
        if (it == registrations_.end()) {
            return nullptr;
        }

        auto& registration = it->second;
        if (registration.lifetime == Lifetime::SINGLETON && registration.instance.has_value()) {
            return std::any_cast<std::shared_ptr<Interface>>(registration.instance);
        }
        if (!registration.factory) {
            return nullptr;
        }

        auto factory = registration.factory;
        auto instance = std::any_cast<std::shared_ptr<Interface>>(factory(*this));

        // The map may have been modified by nested registrations; look up again.
        auto cached = registrations_.find(std::type_index(typeid(Interface)));
        if (cached != registrations_.end() && cached->second.lifetime == Lifetime::SINGLETON) {
            cached->second.instance = instance;
        }
        return instance;
    }

    template<typename Interface>
    [[nodiscard]] auto is_registered() const -> bool {
        std::lock_guard lock(mutex_);
        return registrations_.contains(std::type_index(typeid(Interface)));
    }

    /**
     * @brief Clear all registrations and cached instances
     */
    void clear() {
        std::lock_guard lock(mutex_);
        registrations_.clear();
    }

    [[nodiscard]] auto size() const -> size_t {
        std::lock_guard lock(mutex_);
        return registrations_.size();
    }

private:
    struct Registration {
        std::function<std::any(Container&)> factory;
        Lifetime lifetime;
        std::any instance;
    };

    std::unordered_map<std::type_index, Registration> registrations_;
    mutable std::recursive_mutex mutex_;
};

}  // namespace di
