#include <gtest/gtest.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "hrec/cli/application.hpp"
#include "hrec/di/service_configuration.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

namespace hrec::cli {

class CliTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<hrec::test::TempDirectory>();

    auto config = std::make_shared<hrec::config::Config>();
    config->data_dir = temp_dir_->path() / "data";
    config->archive_root = temp_dir_->path() / "archive";
    config->logging.file = "";
    config->setConfigPath(temp_dir_->path() / "config.toml");

    auto container = hrec::di::ServiceContainerFactory::createContainer(config);
    ASSERT_TRUE(container.has_value()) << container.error().message();
    container_ = *container;
  }

  void TearDown() override {
    container_.reset();
    temp_dir_.reset();
  }

  struct RunResult {
    int exit_code;
    std::string out;
    std::string err;
  };

  // Each invocation gets a fresh Application, as a new process would
  RunResult run(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("hrec"));
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }

    std::ostringstream out;
    std::ostringstream err;
    std::streambuf* orig_cout = std::cout.rdbuf(out.rdbuf());
    std::streambuf* orig_cerr = std::cerr.rdbuf(err.rdbuf());

    Application app(container_);
    int code = app.run(static_cast<int>(argv.size()), argv.data());

    std::cout.rdbuf(orig_cout);
    std::cerr.rdbuf(orig_cerr);
    return {code, out.str(), err.str()};
  }

  nlohmann::json runJson(const std::vector<std::string>& args) {
    std::vector<std::string> full = {"--json", "--user", "alice"};
    full.insert(full.end(), args.begin(), args.end());
    auto result = run(full);
    EXPECT_EQ(result.exit_code, 0) << result.out << result.err;
    return nlohmann::json::parse(result.out, nullptr, false);
  }

  std::filesystem::path archive() const { return temp_dir_->path() / "archive"; }

  std::unique_ptr<hrec::test::TempDirectory> temp_dir_;
  std::shared_ptr<hrec::di::IServiceContainer> container_;
};

TEST_F(CliTest, UserLifecycle) {
  auto created = run({"user", "create", "alice"});
  EXPECT_EQ(created.exit_code, 0) << created.err;
  EXPECT_NE(created.out.find("Created user: alice"), std::string::npos);

  auto duplicate = run({"user", "create", "alice"});
  EXPECT_EQ(duplicate.exit_code, 1);
  EXPECT_NE(duplicate.err.find("Error: User already exists"), std::string::npos);

  auto listed = run({"--json", "user", "list"});
  ASSERT_EQ(listed.exit_code, 0);
  auto users = nlohmann::json::parse(listed.out);
  EXPECT_EQ(users["users"], nlohmann::json::array({"alice"}));

  auto deleted = run({"user", "delete", "alice"});
  EXPECT_EQ(deleted.exit_code, 0) << deleted.err;
  EXPECT_FALSE(std::filesystem::exists(temp_dir_->path() / "data" / "alice.sqlite"));
}

TEST_F(CliTest, RecordLifecycle) {
  ASSERT_EQ(run({"user", "create", "alice"}).exit_code, 0);

  auto visit = runJson({"visit", "add", "--date", "2024-03-01", "--hospital", "City Hospital",
                        "--doctor", "Dr. Wang", "--diagnosis", "Gastritis"});
  ASSERT_TRUE(visit.contains("id"));
  auto visit_id = std::to_string(visit["id"].get<std::int64_t>());
  EXPECT_EQ(visit["hospital"], "City Hospital");

  auto report = temp_dir_->createFile("incoming/blood test.pdf", "%PDF");
  auto scan = temp_dir_->createFile("incoming/scan.png", "png");
  auto attached = runJson({"attach", "add", visit_id, report.string(), scan.string()});
  ASSERT_EQ(attached.size(), 2u);
  EXPECT_EQ(attached[0]["name"], "blood test.pdf");
  auto managed = archive() / attached[0]["path"].get<std::string>();
  EXPECT_TRUE(std::filesystem::exists(managed));

  auto shown = runJson({"visit", "show", visit_id});
  EXPECT_EQ(shown["attachments"].size(), 2u);

  auto listed = runJson({"visit", "list"});
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0]["diagnosis"], "Gastritis");

  auto removed = run({"--user", "alice", "visit", "delete", visit_id});
  EXPECT_EQ(removed.exit_code, 0) << removed.err;
  EXPECT_FALSE(std::filesystem::exists(managed));
  EXPECT_EQ(hrec::test::countFiles(archive()), 0u);

  auto missing = run({"--json", "--user", "alice", "visit", "show", visit_id});
  EXPECT_EQ(missing.exit_code, 1);
  auto error = nlohmann::json::parse(missing.out);
  EXPECT_EQ(error["code"], "Not found");
}

TEST_F(CliTest, EditChangesOnlyGivenFields) {
  ASSERT_EQ(run({"user", "create", "alice"}).exit_code, 0);
  auto visit = runJson({"visit", "add", "--date", "2024-03-01", "--hospital", "City Hospital",
                        "--doctor", "Dr. Wang"});
  auto visit_id = std::to_string(visit["id"].get<std::int64_t>());

  auto edited = runJson({"visit", "edit", visit_id, "--doctor", "Dr. Li"});
  EXPECT_EQ(edited["doctor"], "Dr. Li");
  EXPECT_EQ(edited["hospital"], "City Hospital");
}

TEST_F(CliTest, AttachToUnknownVisitFails) {
  ASSERT_EQ(run({"user", "create", "alice"}).exit_code, 0);
  auto file = temp_dir_->createFile("incoming/x.pdf", "x");

  auto result = run({"--user", "alice", "attach", "add", "99", file.string()});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.err.find("Visit record not found"), std::string::npos);
  EXPECT_EQ(hrec::test::countFiles(archive()), 0u);
}

TEST_F(CliTest, CommandsNeedAUser) {
  auto result = run({"visit", "list"});
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.err.find("No user selected"), std::string::npos);
}

TEST_F(CliTest, HistoryListsRecentValues) {
  ASSERT_EQ(run({"user", "create", "alice"}).exit_code, 0);
  runJson({"visit", "add", "--date", "2024-01-01", "--hospital", "City Hospital"});
  runJson({"visit", "add", "--date", "2024-01-02", "--hospital", "Union Clinic"});

  auto history = runJson({"history", "hospital"});
  EXPECT_EQ(history["values"], nlohmann::json::array({"Union Clinic", "City Hospital"}));

  auto bad = run({"--user", "alice", "history", "diagnosis"});
  EXPECT_EQ(bad.exit_code, 1);
}

TEST_F(CliTest, ExportWritesJsonAndAttachments) {
  ASSERT_EQ(run({"user", "create", "alice"}).exit_code, 0);
  auto visit = runJson({"visit", "add", "--date", "2024-03-01"});
  auto visit_id = std::to_string(visit["id"].get<std::int64_t>());
  auto file = temp_dir_->createFile("incoming/ecg.pdf", "ecg");
  runJson({"attach", "add", visit_id, file.string()});

  auto output = temp_dir_->path() / "export" / "records.json";
  auto bundle = temp_dir_->path() / "export" / "files";
  auto result = runJson({"export", "--output", output.string(), "--attachments-dir",
                         bundle.string()});
  EXPECT_EQ(result["visits"], 1);
  EXPECT_EQ(result["attachments_copied"], 1);

  auto document = nlohmann::json::parse(hrec::test::readFile(output));
  EXPECT_EQ(document["records"].size(), 1u);
  EXPECT_EQ(hrec::test::readFile(bundle / "ecg.pdf"), "ecg");
}

TEST_F(CliTest, DoctorFindsAndFixesOrphans) {
  ASSERT_EQ(run({"user", "create", "alice"}).exit_code, 0);
  temp_dir_->createFile("archive/alice/5_5_stray.pdf", "stray");

  auto check = run({"--user", "alice", "doctor"});
  EXPECT_EQ(check.exit_code, 1);
  EXPECT_NE(check.out.find("alice/5_5_stray.pdf"), std::string::npos);

  auto fixed = runJson({"doctor", "--fix"});
  EXPECT_EQ(fixed["removed"], 1);
  EXPECT_FALSE(std::filesystem::exists(archive() / "alice" / "5_5_stray.pdf"));
}

TEST_F(CliTest, ConfigSetPersists) {
  auto set = run({"config", "set", "defaults.user", "alice"});
  EXPECT_EQ(set.exit_code, 0) << set.err;

  hrec::config::Config reloaded;
  ASSERT_OK(reloaded.load(temp_dir_->path() / "config.toml"));
  EXPECT_EQ(reloaded.default_user, "alice");

  auto got = run({"config", "get", "defaults.user"});
  EXPECT_EQ(got.out, "alice\n");

  auto invalid = run({"config", "set", "attachments.max_name_length", "3"});
  EXPECT_EQ(invalid.exit_code, 1);

  auto unknown = run({"config", "set", "nope.key", "1"});
  EXPECT_EQ(unknown.exit_code, 1);
}

}  // namespace hrec::cli
