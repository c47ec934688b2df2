#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

#include "hrec/store/filesystem_attachment_store.hpp"
#include "hrec/store/user_directory.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

namespace hrec::store {

class UserDirectoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<hrec::test::TempDirectory>();
    data_dir_ = temp_dir_->path() / "data";
    archive_root_ = temp_dir_->path() / "archive";

    FilesystemAttachmentStore::Config config;
    config.archive_root = archive_root_;
    store_ = std::make_unique<FilesystemAttachmentStore>(config, AttachmentNamer{});
    users_ = std::make_unique<UserDirectory>(data_dir_, *store_);
  }

  void addAttachment(const std::string& user) {
    auto repo = users_->open(user);
    ASSERT_OK(repo);
    auto visit = (*repo)->createVisit(hrec::test::makeVisit("2024-06-01"));
    ASSERT_OK(visit);
    auto file = temp_dir_->createFile("incoming/" + user + ".pdf", user);
    ASSERT_OK((*repo)->createAttachment(visit->id, file));
  }

  std::unique_ptr<hrec::test::TempDirectory> temp_dir_;
  std::filesystem::path data_dir_;
  std::filesystem::path archive_root_;
  std::unique_ptr<FilesystemAttachmentStore> store_;
  std::unique_ptr<UserDirectory> users_;
};

TEST_F(UserDirectoryTest, NoUsersBeforeDataDirectoryExists) {
  auto users = users_->listUsers();
  ASSERT_OK(users);
  EXPECT_TRUE(users->empty());
}

TEST_F(UserDirectoryTest, CreateListsSortedUsers) {
  ASSERT_OK(users_->createUser("zoe"));
  ASSERT_OK(users_->createUser("alice"));

  EXPECT_TRUE(std::filesystem::exists(data_dir_ / "alice.sqlite"));
  EXPECT_TRUE(users_->exists("alice"));

  auto users = users_->listUsers();
  ASSERT_OK(users);
  EXPECT_EQ(*users, (std::vector<std::string>{"alice", "zoe"}));
}

TEST_F(UserDirectoryTest, CreateExistingUserFails) {
  ASSERT_OK(users_->createUser("alice"));
  EXPECT_ERROR(users_->createUser("alice"), ErrorCode::kAlreadyExists);
}

TEST_F(UserDirectoryTest, RejectsNamesThatAreNotDirectorySegments) {
  EXPECT_ERROR(users_->createUser(""), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(users_->createUser("../escape"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(users_->createUser("a:b"), ErrorCode::kInvalidArgument);
  EXPECT_FALSE(users_->exists("../escape"));
}

TEST_F(UserDirectoryTest, OpenUnknownUserFails) {
  EXPECT_ERROR(users_->open("ghost"), ErrorCode::kNotFound);
}

TEST_F(UserDirectoryTest, RecordsPersistAcrossOpens) {
  ASSERT_OK(users_->createUser("alice"));
  {
    auto repo = users_->open("alice");
    ASSERT_OK(repo);
    ASSERT_OK((*repo)->createVisit(hrec::test::makeVisit("2024-06-01")));
  }

  auto repo = users_->open("alice");
  ASSERT_OK(repo);
  EXPECT_EQ((*repo)->user(), "alice");
  auto visits = (*repo)->listVisits({});
  ASSERT_OK(visits);
  EXPECT_EQ(visits->size(), 1u);
}

TEST_F(UserDirectoryTest, DeleteUserRemovesDatabaseAndArchive) {
  ASSERT_OK(users_->createUser("alice"));
  ASSERT_OK(users_->createUser("bob"));
  addAttachment("alice");
  addAttachment("bob");

  ASSERT_OK(users_->deleteUser("alice"));

  EXPECT_FALSE(users_->exists("alice"));
  EXPECT_FALSE(std::filesystem::exists(data_dir_ / "alice.sqlite-wal"));
  EXPECT_FALSE(std::filesystem::exists(archive_root_ / "alice"));
  EXPECT_TRUE(users_->exists("bob"));
  EXPECT_TRUE(std::filesystem::exists(archive_root_ / "bob"));
}

TEST_F(UserDirectoryTest, DeleteUserCanKeepArchive) {
  ASSERT_OK(users_->createUser("alice"));
  addAttachment("alice");

  ASSERT_OK(users_->deleteUser("alice", false));
  EXPECT_FALSE(users_->exists("alice"));
  EXPECT_EQ(hrec::test::countFiles(archive_root_ / "alice"), 1u);
}

TEST_F(UserDirectoryTest, DeleteUnknownUserFails) {
  EXPECT_ERROR(users_->deleteUser("ghost"), ErrorCode::kNotFound);
}

}  // namespace hrec::store
