#pragma once

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>

#include "hrec/common.hpp"

namespace hrec::di {

/**
 * @brief Service lifetime options
 */
enum class ServiceLifetime {
    Singleton,  // Created on first resolve, then shared
    Transient   // New instance created each time
};

/**
 * @brief Exception thrown when service resolution fails
 */
class ServiceResolutionException : public std::exception {
public:
    explicit ServiceResolutionException(std::string message)
        : message_(std::move(message)) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

private:
    std::string message_;
};

/**
 * @brief Interface for service registration and resolution
 */
class IServiceContainer {
public:
    virtual ~IServiceContainer() = default;

    /**
     * @brief Register a service with a factory function
     */
    template<typename TInterface>
    void registerFactory(std::function<std::shared_ptr<TInterface>()> factory,
                         ServiceLifetime lifetime = ServiceLifetime::Singleton) {
        registerServiceImpl(
            std::type_index(typeid(TInterface)),
            [factory = std::move(factory)]() -> std::shared_ptr<void> {
                return std::static_pointer_cast<void>(factory());
            },
            lifetime
        );
    }

    /**
     * @brief Register an existing instance as a singleton
     */
    template<typename TInterface>
    void registerInstance(std::shared_ptr<TInterface> instance) {
        registerInstanceImpl(std::type_index(typeid(TInterface)),
                             std::static_pointer_cast<void>(std::move(instance)));
    }

    /**
     * @brief Resolve a service instance
     * @throws ServiceResolutionException when the service is unknown or its
     * factory fails
     */
    template<typename T>
    std::shared_ptr<T> resolve() {
        auto result = std::static_pointer_cast<T>(resolveImpl(std::type_index(typeid(T))));
        if (!result) {
            throw ServiceResolutionException(
                "Failed to resolve service: " + std::string(typeid(T).name()));
        }
        return result;
    }

    /**
     * @brief Resolve a service, reporting failure as an error
     */
    template<typename T>
    Result<std::shared_ptr<T>> tryResolve() {
        try {
            return resolve<T>();
        } catch (const ServiceResolutionException& e) {
            return std::unexpected(makeError(ErrorCode::kInvalidState, e.what()));
        }
    }

    template<typename T>
    bool isRegistered() const {
        return isRegisteredImpl(std::type_index(typeid(T)));
    }

protected:
    virtual void registerServiceImpl(std::type_index type,
                                     std::function<std::shared_ptr<void>()> factory,
                                     ServiceLifetime lifetime) = 0;

    virtual void registerInstanceImpl(std::type_index type,
                                      std::shared_ptr<void> instance) = 0;

    virtual std::shared_ptr<void> resolveImpl(std::type_index type) = 0;

    virtual bool isRegisteredImpl(std::type_index type) const = 0;
};

/**
 * @brief Map-backed container; not thread-safe, resolve from one thread
 *
 * A factory that resolves its own service, directly or through another
 * factory, fails with ServiceResolutionException instead of recursing.
 */
class ServiceContainer : public IServiceContainer {
public:
    ServiceContainer() = default;
    ~ServiceContainer() override = default;

    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

protected:
    void registerServiceImpl(std::type_index type,
                             std::function<std::shared_ptr<void>()> factory,
                             ServiceLifetime lifetime) override;

    void registerInstanceImpl(std::type_index type,
                              std::shared_ptr<void> instance) override;

    std::shared_ptr<void> resolveImpl(std::type_index type) override;

    bool isRegisteredImpl(std::type_index type) const override;

private:
    struct Registration {
        std::function<std::shared_ptr<void>()> factory;  // Empty for registered instances
        bool shared = true;                              // Singleton lifetime
        bool resolving = false;                          // Factory currently running
        std::shared_ptr<void> instance;
    };

    std::shared_ptr<void> create(std::type_index type);

    std::unordered_map<std::type_index, Registration> registrations_;
};

} // namespace hrec::di
