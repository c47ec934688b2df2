#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "hrec/di/service_configuration.hpp"
#include "hrec/di/service_container.hpp"
#include "hrec/store/filesystem_attachment_store.hpp"
#include "hrec/store/user_directory.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

namespace hrec::di {

namespace {

struct Counter {
  int value = 0;
};

}  // namespace

TEST(ServiceContainerTest, SingletonIsCreatedOnce) {
  ServiceContainer container;
  int created = 0;
  container.registerFactory<Counter>([&created]() {
    ++created;
    return std::make_shared<Counter>();
  });

  auto first = container.resolve<Counter>();
  auto second = container.resolve<Counter>();
  EXPECT_EQ(first, second);
  EXPECT_EQ(created, 1);
}

TEST(ServiceContainerTest, TransientIsCreatedEachTime) {
  ServiceContainer container;
  container.registerFactory<Counter>([]() { return std::make_shared<Counter>(); },
                                     ServiceLifetime::Transient);

  EXPECT_NE(container.resolve<Counter>(), container.resolve<Counter>());
}

TEST(ServiceContainerTest, UnknownServiceThrowsOrReportsError) {
  ServiceContainer container;
  EXPECT_FALSE(container.isRegistered<Counter>());
  EXPECT_THROW(container.resolve<Counter>(), ServiceResolutionException);
  EXPECT_ERROR(container.tryResolve<Counter>(), ErrorCode::kInvalidState);
}

TEST(ServiceContainerTest, RegisteredInstanceIsReturned) {
  ServiceContainer container;
  auto counter = std::make_shared<Counter>();
  counter->value = 7;
  container.registerInstance<Counter>(counter);

  EXPECT_TRUE(container.isRegistered<Counter>());
  EXPECT_EQ(container.resolve<Counter>()->value, 7);
}

TEST(ServiceContainerTest, SelfResolvingFactoryIsReported) {
  ServiceContainer container;
  container.registerFactory<Counter>([&container]() { return container.resolve<Counter>(); });

  EXPECT_ERROR(container.tryResolve<Counter>(), ErrorCode::kInvalidState);
  // The failed attempt leaves the registration usable for a later override
  container.registerFactory<Counter>([]() { return std::make_shared<Counter>(); });
  EXPECT_NE(container.resolve<Counter>(), nullptr);
}

TEST(ServiceContainerTest, FactoryFailureBecomesResolutionError) {
  ServiceContainer container;
  container.registerFactory<Counter>([]() -> std::shared_ptr<Counter> {
    throw std::runtime_error("archive unavailable");
  });

  try {
    container.resolve<Counter>();
    FAIL() << "Expected ServiceResolutionException";
  } catch (const ServiceResolutionException& e) {
    EXPECT_NE(std::string(e.what()).find("archive unavailable"), std::string::npos);
  }
}

TEST(ServiceContainerTest, EmptyInstanceIsRejected) {
  ServiceContainer container;
  EXPECT_THROW(container.registerInstance<Counter>(nullptr), ServiceResolutionException);
  EXPECT_FALSE(container.isRegistered<Counter>());
}

TEST(ServiceConfigurationTest, WiresStoreFromConfig) {
  hrec::test::TempDirectory temp_dir;
  auto config = std::make_shared<hrec::config::Config>();
  config->data_dir = temp_dir.path() / "data";
  config->archive_root = temp_dir.path() / "archive";
  config->attachments.max_name_length = 40;
  config->attachments.max_file_size_mb = 2;

  auto container = ServiceContainerFactory::createContainer(config);
  ASSERT_OK(container);

  auto store = (*container)->resolve<hrec::store::AttachmentStore>();
  auto* filesystem_store = dynamic_cast<hrec::store::FilesystemAttachmentStore*>(store.get());
  ASSERT_NE(filesystem_store, nullptr);
  EXPECT_EQ(filesystem_store->config().archive_root, temp_dir.path() / "archive");
  EXPECT_EQ(filesystem_store->config().max_file_size, 2u * 1024 * 1024);
  EXPECT_EQ(filesystem_store->namer().config().max_total_length, 40);

  auto users = (*container)->resolve<hrec::store::UserDirectory>();
  EXPECT_EQ(users->dataDir(), temp_dir.path() / "data");
}

TEST(ServiceConfigurationTest, InvalidConfigIsRejected) {
  auto config = std::make_shared<hrec::config::Config>();
  config->logging.level = "chatty";
  EXPECT_ERROR(ServiceContainerFactory::createContainer(config), ErrorCode::kConfigError);
}

TEST(ServiceConfigurationTest, MissingConfigFileGivesDefaults) {
  hrec::test::TempDirectory temp_dir;
  auto path = temp_dir.path() / "none" / "config.toml";

  auto config = ServiceConfiguration::loadConfig(path);
  ASSERT_OK(config);
  EXPECT_EQ((*config)->configPath(), path);
  EXPECT_EQ((*config)->attachments.max_name_length, 100);
}

}  // namespace hrec::di
