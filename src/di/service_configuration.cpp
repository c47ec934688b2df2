#include "hrec/di/service_configuration.hpp"

#include "hrec/store/attachment_namer.hpp"
#include "hrec/store/filesystem_attachment_store.hpp"
#include "hrec/store/user_directory.hpp"

namespace hrec::di {

namespace {

constexpr std::uintmax_t kBytesPerMb = 1024 * 1024;

}  // namespace

Result<void> ServiceConfiguration::configureServices(
    std::shared_ptr<IServiceContainer> container,
    std::shared_ptr<hrec::config::Config> config) {

    auto validate_result = config->validate();
    if (!validate_result.has_value()) {
        return validate_result;
    }

    container->registerInstance<hrec::config::Config>(std::move(config));

    return configureStorage(container);
}

Result<std::shared_ptr<hrec::config::Config>> ServiceConfiguration::loadConfig(
    const std::optional<std::filesystem::path>& config_path) {

    auto config = std::make_shared<hrec::config::Config>();
    auto path = config_path.value_or(hrec::config::Config::defaultConfigPath());

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto load_result = config->load(path);
        if (!load_result.has_value()) {
            return std::unexpected(load_result.error());
        }
    } else {
        // Saved here by "config set"
        config->setConfigPath(path);
    }

    return config;
}

Result<void> ServiceConfiguration::configureStorage(
    std::shared_ptr<IServiceContainer> container) {

    // Factories live inside the container they resolve from
    IServiceContainer* services = container.get();

    container->registerFactory<hrec::store::AttachmentNamer>(
        [services]() -> std::shared_ptr<hrec::store::AttachmentNamer> {
            auto config = services->resolve<hrec::config::Config>();

            hrec::store::AttachmentNamer::Config namer_config;
            namer_config.max_total_length = config->attachments.max_name_length;

            return std::make_shared<hrec::store::AttachmentNamer>(namer_config);
        },
        ServiceLifetime::Singleton
    );

    container->registerFactory<hrec::store::AttachmentStore>(
        [services]() -> std::shared_ptr<hrec::store::AttachmentStore> {
            auto config = services->resolve<hrec::config::Config>();
            auto namer = services->resolve<hrec::store::AttachmentNamer>();

            hrec::store::FilesystemAttachmentStore::Config store_config;
            store_config.archive_root = config->archive_root;
            store_config.max_file_size = config->attachments.max_file_size_mb * kBytesPerMb;
            store_config.auto_create_dirs = true;

            return std::make_shared<hrec::store::FilesystemAttachmentStore>(store_config, *namer);
        },
        ServiceLifetime::Singleton
    );

    container->registerFactory<hrec::store::UserDirectory>(
        [services]() -> std::shared_ptr<hrec::store::UserDirectory> {
            auto config = services->resolve<hrec::config::Config>();
            auto store = services->resolve<hrec::store::AttachmentStore>();

            hrec::store::DatabaseOptions options;
            options.journal_mode = config->performance.sqlite_journal_mode;
            options.synchronous = config->performance.sqlite_synchronous;

            return std::make_shared<hrec::store::UserDirectory>(config->data_dir, *store, options);
        },
        ServiceLifetime::Singleton
    );

    return {};
}

Result<std::shared_ptr<IServiceContainer>> ServiceContainerFactory::createProductionContainer(
    const std::optional<std::filesystem::path>& config_path) {

    auto config = ServiceConfiguration::loadConfig(config_path);
    if (!config.has_value()) {
        return std::unexpected(config.error());
    }

    return createContainer(*config);
}

Result<std::shared_ptr<IServiceContainer>> ServiceContainerFactory::createContainer(
    std::shared_ptr<hrec::config::Config> config) {

    auto container = std::make_shared<ServiceContainer>();

    auto configure_result = ServiceConfiguration::configureServices(container, std::move(config));
    if (!configure_result.has_value()) {
        return std::unexpected(configure_result.error());
    }

    return container;
}

} // namespace hrec::di
