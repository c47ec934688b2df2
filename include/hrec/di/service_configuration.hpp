#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "hrec/config/config.hpp"
#include "hrec/di/service_container.hpp"

namespace hrec::di {

/**
 * @brief Registers the application services in a container
 *
 * Services: Config, AttachmentNamer, AttachmentStore, UserDirectory. All are
 * singletons; the store and the directory are built from the Config.
 */
class ServiceConfiguration {
public:
    /**
     * @brief Register every service around an already loaded configuration
     */
    static Result<void> configureServices(std::shared_ptr<IServiceContainer> container,
                                          std::shared_ptr<hrec::config::Config> config);

    /**
     * @brief Load the configuration file (the XDG default when no path is
     * given); a missing file yields the defaults
     */
    static Result<std::shared_ptr<hrec::config::Config>> loadConfig(
        const std::optional<std::filesystem::path>& config_path);

private:
    static Result<void> configureStorage(std::shared_ptr<IServiceContainer> container);
};

/**
 * @brief Factory for creating configured service containers
 */
class ServiceContainerFactory {
public:
    static Result<std::shared_ptr<IServiceContainer>> createProductionContainer(
        const std::optional<std::filesystem::path>& config_path = std::nullopt);

    /**
     * @brief Container around a configuration built in code
     */
    static Result<std::shared_ptr<IServiceContainer>> createContainer(
        std::shared_ptr<hrec::config::Config> config);
};

} // namespace hrec::di
