#include "hrec/di/service_container.hpp"

namespace hrec::di {

namespace {

std::string serviceName(std::type_index type) {
    return type.name();
}

}  // namespace

void ServiceContainer::registerServiceImpl(std::type_index type,
                                           std::function<std::shared_ptr<void>()> factory,
                                           ServiceLifetime lifetime) {
    Registration registration;
    registration.factory = std::move(factory);
    registration.shared = lifetime == ServiceLifetime::Singleton;
    registrations_[type] = std::move(registration);
}

void ServiceContainer::registerInstanceImpl(std::type_index type,
                                            std::shared_ptr<void> instance) {
    if (!instance) {
        throw ServiceResolutionException("Cannot register an empty instance of " +
                                         serviceName(type));
    }

    Registration registration;
    registration.instance = std::move(instance);
    registrations_[type] = std::move(registration);
}

std::shared_ptr<void> ServiceContainer::resolveImpl(std::type_index type) {
    auto it = registrations_.find(type);
    if (it == registrations_.end()) {
        throw ServiceResolutionException("Service not registered: " + serviceName(type));
    }

    if (it->second.instance) {
        return it->second.instance;
    }
    return create(type);
}

std::shared_ptr<void> ServiceContainer::create(std::type_index type) {
    auto& registration = registrations_.at(type);
    if (!registration.factory) {
        throw ServiceResolutionException("No factory available for service: " + serviceName(type));
    }
    if (registration.resolving) {
        throw ServiceResolutionException("Circular dependency while resolving " + serviceName(type));
    }

    // The factory may register services, so the map is looked up again afterwards
    auto factory = registration.factory;
    registration.resolving = true;

    std::shared_ptr<void> created;
    try {
        created = factory();
    } catch (const ServiceResolutionException&) {
        registrations_.at(type).resolving = false;
        throw;
    } catch (const std::exception& e) {
        registrations_.at(type).resolving = false;
        throw ServiceResolutionException("Factory for " + serviceName(type) + " failed: " + e.what());
    }

    auto& current = registrations_.at(type);
    current.resolving = false;

    if (!created) {
        throw ServiceResolutionException("Factory for " + serviceName(type) + " returned nothing");
    }
    if (current.shared) {
        current.instance = created;
    }
    return created;
}

bool ServiceContainer::isRegisteredImpl(std::type_index type) const {
    return registrations_.count(type) > 0;
}

}  // namespace hrec::di
