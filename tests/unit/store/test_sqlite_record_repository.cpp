#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include "hrec/store/filename_sanitizer.hpp"
#include "hrec/store/filesystem_attachment_store.hpp"
#include "hrec/store/sqlite_record_repository.hpp"
#include "mock_attachment_store.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

namespace hrec::store {

using ::testing::_;
using ::testing::Return;

namespace {

// Runs SQL through a second connection, as another process would
void execOnSideConnection(const std::filesystem::path& db_path, const std::string& sql) {
  sqlite3* db = nullptr;
  ASSERT_EQ(sqlite3_open(db_path.c_str(), &db), SQLITE_OK);
  char* message = nullptr;
  int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &message);
  std::string error = message ? message : "";
  sqlite3_free(message);
  sqlite3_close(db);
  ASSERT_EQ(rc, SQLITE_OK) << error;
}

// Reads a single integer through a second connection
std::int64_t countOnSideConnection(const std::filesystem::path& db_path, const std::string& sql) {
  sqlite3* db = nullptr;
  if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
    sqlite3_close(db);
    ADD_FAILURE() << "Cannot open " << db_path;
    return -1;
  }
  sqlite3_stmt* stmt = nullptr;
  std::int64_t value = -1;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK &&
      sqlite3_step(stmt) == SQLITE_ROW) {
    value = sqlite3_column_int64(stmt, 0);
  } else {
    ADD_FAILURE() << sqlite3_errmsg(db);
  }
  sqlite3_finalize(stmt);
  sqlite3_close(db);
  return value;
}

constexpr const char* kFailPathUpdates = R"(
CREATE TRIGGER fail_path_update BEFORE UPDATE ON attachment_records
BEGIN
  SELECT RAISE(ABORT, 'attachment path rejected');
END;
)";

}  // namespace

class SqliteRecordRepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<hrec::test::TempDirectory>();
    archive_root_ = temp_dir_->path() / "archive";
    db_path_ = temp_dir_->path() / "data" / "alice.sqlite";

    FilesystemAttachmentStore::Config config;
    config.archive_root = archive_root_;
    store_ = std::make_unique<FilesystemAttachmentStore>(config, AttachmentNamer{});

    repo_ = std::make_unique<SqliteRecordRepository>(db_path_, "alice", *store_);
    auto init = repo_->initialize();
    ASSERT_TRUE(init.has_value()) << init.error().message();
  }

  void TearDown() override {
    repo_.reset();
    store_.reset();
    temp_dir_.reset();
  }

  core::VisitRecord addVisit(const std::string& date,
                             const std::string& hospital = "City Hospital",
                             const std::string& doctor = "Dr. Wang") {
    auto created = repo_->createVisit(hrec::test::makeVisit(date, hospital, doctor));
    EXPECT_TRUE(created.has_value()) << created.error().message();
    return created.value_or(core::VisitRecord{});
  }

  std::filesystem::path source(const std::string& name, const std::string& content = "data") {
    return temp_dir_->createFile("incoming/" + name, content);
  }

  std::size_t archivedFiles() const {
    return hrec::test::countFiles(archive_root_);
  }

  std::unique_ptr<hrec::test::TempDirectory> temp_dir_;
  std::filesystem::path archive_root_;
  std::filesystem::path db_path_;
  std::unique_ptr<FilesystemAttachmentStore> store_;
  std::unique_ptr<SqliteRecordRepository> repo_;
};

// Visits

TEST_F(SqliteRecordRepositoryTest, CreateVisitAssignsIdAndTimestamps) {
  auto visit = hrec::test::makeVisit("2024-03-01");
  visit.hospital = "  City Hospital  ";

  auto created = repo_->createVisit(visit);
  ASSERT_OK(created);
  EXPECT_GT(created->id, 0);
  EXPECT_EQ(created->hospital, "City Hospital");
  EXPECT_FALSE(created->created_at.empty());
  EXPECT_FALSE(created->updated_at.empty());

  auto loaded = repo_->getVisit(created->id);
  ASSERT_OK(loaded);
  EXPECT_EQ(loaded->date, "2024-03-01");
  EXPECT_EQ(loaded->diagnosis, "Gastritis");
}

TEST_F(SqliteRecordRepositoryTest, CreateVisitRejectsBadDate) {
  EXPECT_ERROR(repo_->createVisit(hrec::test::makeVisit("")), ErrorCode::kValidationError);
  EXPECT_ERROR(repo_->createVisit(hrec::test::makeVisit("2024-02-30")),
               ErrorCode::kValidationError);
  EXPECT_ERROR(repo_->createVisit(hrec::test::makeVisit("03/01/2024")),
               ErrorCode::kValidationError);
}

TEST_F(SqliteRecordRepositoryTest, UpdateVisitChangesFields) {
  auto visit = addVisit("2024-03-01");
  visit.diagnosis = "Reflux";
  visit.medication = "Omeprazole";

  auto updated = repo_->updateVisit(visit);
  ASSERT_OK(updated);
  EXPECT_EQ(updated->diagnosis, "Reflux");
  EXPECT_EQ(updated->medication, "Omeprazole");
  EXPECT_EQ(updated->created_at, visit.created_at);
}

TEST_F(SqliteRecordRepositoryTest, UpdateUnknownVisitFails) {
  auto visit = hrec::test::makeVisit("2024-03-01");
  visit.id = 999;
  EXPECT_ERROR(repo_->updateVisit(visit), ErrorCode::kNotFound);

  visit.id = 0;
  EXPECT_ERROR(repo_->updateVisit(visit), ErrorCode::kInvalidArgument);
}

TEST_F(SqliteRecordRepositoryTest, GetUnknownVisitFails) {
  EXPECT_ERROR(repo_->getVisit(42), ErrorCode::kNotFound);
}

TEST_F(SqliteRecordRepositoryTest, ListVisitsNewestFirstWithFilters) {
  auto jan = addVisit("2024-01-10", "City Hospital");
  auto mar = addVisit("2024-03-05", "Union Clinic");
  auto feb = addVisit("2024-02-20", "City Hospital");

  auto all = repo_->listVisits({});
  ASSERT_OK(all);
  ASSERT_EQ(all->size(), 3u);
  EXPECT_EQ((*all)[0].id, mar.id);
  EXPECT_EQ((*all)[1].id, feb.id);
  EXPECT_EQ((*all)[2].id, jan.id);

  VisitFilter range;
  range.since = "2024-02-01";
  range.until = "2024-03-01";
  auto in_range = repo_->listVisits(range);
  ASSERT_OK(in_range);
  ASSERT_EQ(in_range->size(), 1u);
  EXPECT_EQ((*in_range)[0].id, feb.id);

  VisitFilter by_hospital;
  by_hospital.hospital = "City Hospital";
  by_hospital.limit = 1;
  auto limited = repo_->listVisits(by_hospital);
  ASSERT_OK(limited);
  ASSERT_EQ(limited->size(), 1u);
  EXPECT_EQ((*limited)[0].id, feb.id);
}

TEST_F(SqliteRecordRepositoryTest, ListVisitsRejectsMalformedBounds) {
  VisitFilter filter;
  filter.since = "yesterday";
  EXPECT_ERROR(repo_->listVisits(filter), ErrorCode::kInvalidArgument);
}

TEST_F(SqliteRecordRepositoryTest, UninitializedRepositoryReportsState) {
  SqliteRecordRepository closed(temp_dir_->path() / "other.sqlite", "bob", *store_);
  EXPECT_ERROR(closed.getVisit(1), ErrorCode::kInvalidState);
  EXPECT_ERROR(closed.listVisits({}), ErrorCode::kInvalidState);
}

TEST_F(SqliteRecordRepositoryTest, RejectsUnknownJournalMode) {
  DatabaseOptions options;
  options.journal_mode = "WAL; DROP TABLE visit_records";
  SqliteRecordRepository repo(temp_dir_->path() / "bad.sqlite", "bob", *store_, options);
  EXPECT_ERROR(repo.initialize(), ErrorCode::kConfigError);
}

// Attachments

TEST_F(SqliteRecordRepositoryTest, CreateAttachmentStoresFileAndRow) {
  auto visit = addVisit("2024-03-01");

  auto attachment = repo_->createAttachment(visit.id, source("blood test.pdf", "pdf"));
  ASSERT_OK(attachment);
  EXPECT_EQ(attachment->visit_record_id, visit.id);
  EXPECT_EQ(attachment->file_path, "alice/" + std::to_string(visit.id) + "_" +
                                       std::to_string(attachment->id) + "_blood test.pdf");
  EXPECT_EQ(attachment->displayName(), "blood test.pdf");
  EXPECT_TRUE(store_->exists(attachment->file_path));

  auto loaded = repo_->getAttachment(attachment->id);
  ASSERT_OK(loaded);
  EXPECT_EQ(loaded->file_path, attachment->file_path);
}

TEST_F(SqliteRecordRepositoryTest, SameNameTwiceGivesTwoFiles) {
  auto visit = addVisit("2024-03-01");
  auto first = repo_->createAttachment(visit.id, source("scan.jpg"));
  auto second = repo_->createAttachment(visit.id, source("scan.jpg"));
  ASSERT_OK(first);
  ASSERT_OK(second);

  EXPECT_NE(first->file_path, second->file_path);
  EXPECT_EQ(archivedFiles(), 2u);

  auto list = repo_->listAttachments(visit.id);
  ASSERT_OK(list);
  ASSERT_EQ(list->size(), 2u);
  EXPECT_EQ((*list)[0].id, first->id);
  EXPECT_EQ((*list)[1].id, second->id);
}

TEST_F(SqliteRecordRepositoryTest, CreateAttachmentForUnknownVisitFails) {
  EXPECT_ERROR(repo_->createAttachment(77, source("a.pdf")), ErrorCode::kNotFound);
  EXPECT_EQ(archivedFiles(), 0u);
}

TEST_F(SqliteRecordRepositoryTest, CreateAttachmentWithMissingSourceLeavesNothing) {
  auto visit = addVisit("2024-03-01");

  EXPECT_ERROR(repo_->createAttachment(visit.id, temp_dir_->path() / "missing.pdf"),
               ErrorCode::kSourceNotFound);
  EXPECT_EQ(archivedFiles(), 0u);

  auto list = repo_->listAllAttachments();
  ASSERT_OK(list);
  EXPECT_TRUE(list->empty());
}

TEST_F(SqliteRecordRepositoryTest, DatabaseFailureAfterStoreRemovesFile) {
  auto visit = addVisit("2024-03-01");
  execOnSideConnection(db_path_, kFailPathUpdates);

  auto result = repo_->createAttachment(visit.id, source("report.pdf"));
  EXPECT_ERROR(result, ErrorCode::kConstraintViolation);
  EXPECT_EQ(archivedFiles(), 0u);

  auto list = repo_->listAllAttachments();
  ASSERT_OK(list);
  EXPECT_TRUE(list->empty());
}

TEST_F(SqliteRecordRepositoryTest, LongNameIsTruncatedOnDisk) {
  auto visit = addVisit("2024-03-01");
  std::string base = "体检报告_" + std::string(120, 'x');

  auto attachment = repo_->createAttachment(visit.id, source(base + ".pdf"));
  ASSERT_OK(attachment);

  auto length = FilenameSanitizer::codePointLength(attachment->fileName());
  ASSERT_OK(length);
  EXPECT_EQ(*length, 100u);
  EXPECT_TRUE(attachment->fileName().ends_with(".pdf"));
  EXPECT_TRUE(store_->exists(attachment->file_path));
}

TEST_F(SqliteRecordRepositoryTest, DeleteAttachmentRemovesRowAndFile) {
  auto visit = addVisit("2024-03-01");
  auto attachment = repo_->createAttachment(visit.id, source("xray.png"));
  ASSERT_OK(attachment);

  ASSERT_OK(repo_->deleteAttachment(attachment->id));
  EXPECT_FALSE(store_->exists(attachment->file_path));
  EXPECT_ERROR(repo_->getAttachment(attachment->id), ErrorCode::kNotFound);

  EXPECT_ERROR(repo_->deleteAttachment(attachment->id), ErrorCode::kNotFound);
}

TEST_F(SqliteRecordRepositoryTest, DeleteAttachmentWithFileAlreadyGoneSucceeds) {
  auto visit = addVisit("2024-03-01");
  auto attachment = repo_->createAttachment(visit.id, source("xray.png"));
  ASSERT_OK(attachment);
  std::filesystem::remove(archive_root_ / attachment->file_path);

  EXPECT_OK(repo_->deleteAttachment(attachment->id));
}

TEST_F(SqliteRecordRepositoryTest, ReplaceAttachmentKeepsSingleFile) {
  auto visit = addVisit("2024-03-01");
  auto attachment = repo_->createAttachment(visit.id, source("old.pdf", "old"));
  ASSERT_OK(attachment);

  auto replaced = repo_->replaceAttachment(attachment->id, source("new.pdf", "new"));
  ASSERT_OK(replaced);
  EXPECT_EQ(replaced->id, attachment->id);
  EXPECT_EQ(replaced->displayName(), "new.pdf");
  EXPECT_FALSE(store_->exists(attachment->file_path));
  EXPECT_EQ(hrec::test::readFile(archive_root_ / replaced->file_path), "new");
  EXPECT_EQ(archivedFiles(), 1u);
}

TEST_F(SqliteRecordRepositoryTest, ReplaceWithSameNameOverwrites) {
  auto visit = addVisit("2024-03-01");
  auto attachment = repo_->createAttachment(visit.id, source("report.pdf", "v1"));
  ASSERT_OK(attachment);

  auto updated_source = temp_dir_->createFile("newer/report.pdf", "v2");
  auto replaced = repo_->replaceAttachment(attachment->id, updated_source);
  ASSERT_OK(replaced);
  EXPECT_EQ(replaced->file_path, attachment->file_path);
  EXPECT_EQ(hrec::test::readFile(archive_root_ / replaced->file_path), "v2");
  EXPECT_EQ(archivedFiles(), 1u);
}

TEST_F(SqliteRecordRepositoryTest, ReplaceWithSameNameKeepsOriginalWhenRowUpdateFails) {
  auto visit = addVisit("2024-03-01");
  auto attachment = repo_->createAttachment(visit.id, source("report.pdf", "v1"));
  ASSERT_OK(attachment);
  execOnSideConnection(db_path_, kFailPathUpdates);

  auto updated_source = temp_dir_->createFile("newer/report.pdf", "v2");
  EXPECT_ERROR(repo_->replaceAttachment(attachment->id, updated_source),
               ErrorCode::kConstraintViolation);

  EXPECT_EQ(hrec::test::readFile(archive_root_ / attachment->file_path), "v1");
  EXPECT_EQ(archivedFiles(), 1u);
  auto report = repo_->findOrphans();
  ASSERT_OK(report);
  EXPECT_TRUE(report->clean());
}

TEST_F(SqliteRecordRepositoryTest, ReplaceWithNewNameKeepsOriginalWhenRowUpdateFails) {
  auto visit = addVisit("2024-03-01");
  auto attachment = repo_->createAttachment(visit.id, source("old.pdf", "old"));
  ASSERT_OK(attachment);
  execOnSideConnection(db_path_, kFailPathUpdates);

  EXPECT_ERROR(repo_->replaceAttachment(attachment->id, source("new.pdf", "new")),
               ErrorCode::kConstraintViolation);

  EXPECT_EQ(hrec::test::readFile(archive_root_ / attachment->file_path), "old");
  EXPECT_EQ(archivedFiles(), 1u);
}

TEST_F(SqliteRecordRepositoryTest, ReplaceWithMissingSourceKeepsOriginal) {
  auto visit = addVisit("2024-03-01");
  auto attachment = repo_->createAttachment(visit.id, source("keep.pdf", "keep"));
  ASSERT_OK(attachment);

  EXPECT_ERROR(repo_->replaceAttachment(attachment->id, temp_dir_->path() / "nope.pdf"),
               ErrorCode::kSourceNotFound);
  EXPECT_EQ(hrec::test::readFile(archive_root_ / attachment->file_path), "keep");
}

TEST_F(SqliteRecordRepositoryTest, DeleteVisitCascadesToAttachments) {
  auto visit = addVisit("2024-03-01");
  auto other = addVisit("2024-03-02");
  std::vector<std::string> paths;
  for (const auto* name : {"a.pdf", "b.png", "c.txt"}) {
    auto attachment = repo_->createAttachment(visit.id, source(name));
    ASSERT_OK(attachment);
    paths.push_back(attachment->file_path);
  }
  auto kept = repo_->createAttachment(other.id, source("d.pdf"));
  ASSERT_OK(kept);

  ASSERT_OK(repo_->deleteVisit(visit.id));

  EXPECT_ERROR(repo_->getVisit(visit.id), ErrorCode::kNotFound);
  auto remaining = repo_->listAttachments(visit.id);
  ASSERT_OK(remaining);
  EXPECT_TRUE(remaining->empty());
  for (const auto& path : paths) {
    EXPECT_FALSE(store_->exists(path)) << path;
  }

  EXPECT_TRUE(store_->exists(kept->file_path));
  EXPECT_EQ(archivedFiles(), 1u);
}

TEST_F(SqliteRecordRepositoryTest, DeleteUnknownVisitFails) {
  EXPECT_ERROR(repo_->deleteVisit(5), ErrorCode::kNotFound);
}

// History

TEST_F(SqliteRecordRepositoryTest, FieldHistoryIsDistinctAndRecentFirst) {
  addVisit("2024-01-01", "City Hospital", "Dr. Wang");
  addVisit("2024-01-02", "Union Clinic", "Dr. Li");
  addVisit("2024-01-03", "City Hospital", "Dr. Zhang");
  auto blank = hrec::test::makeVisit("2024-01-04", "", "");
  ASSERT_OK(repo_->createVisit(blank));

  auto hospitals = repo_->fieldHistory(HistoryField::kHospital);
  ASSERT_OK(hospitals);
  EXPECT_EQ(*hospitals, (std::vector<std::string>{"City Hospital", "Union Clinic"}));

  auto doctors = repo_->fieldHistory(HistoryField::kDoctor, 2);
  ASSERT_OK(doctors);
  EXPECT_EQ(*doctors, (std::vector<std::string>{"Dr. Zhang", "Dr. Li"}));
}

TEST_F(SqliteRecordRepositoryTest, DoctorsByHospital) {
  addVisit("2024-01-01", "City Hospital", "Dr. Wang");
  addVisit("2024-01-02", "Union Clinic", "Dr. Li");
  addVisit("2024-01-03", "City Hospital", "Dr. Zhang");
  addVisit("2024-01-04", "City Hospital", "Dr. Wang");

  auto doctors = repo_->doctorsByHospital("City Hospital");
  ASSERT_OK(doctors);
  EXPECT_EQ(*doctors, (std::vector<std::string>{"Dr. Wang", "Dr. Zhang"}));

  auto none = repo_->doctorsByHospital("Nowhere");
  ASSERT_OK(none);
  EXPECT_TRUE(none->empty());
}

TEST(HistoryFieldTest, ParsesNames) {
  EXPECT_EQ(historyFieldFromString("hospital"), HistoryField::kHospital);
  EXPECT_EQ(historyFieldFromString("organ-system"), HistoryField::kOrganSystem);
  EXPECT_EQ(historyFieldFromString("organ_system"), HistoryField::kOrganSystem);
  EXPECT_FALSE(historyFieldFromString("diagnosis").has_value());
  EXPECT_EQ(historyFieldToString(HistoryField::kDepartment), "department");
}

// Maintenance

TEST_F(SqliteRecordRepositoryTest, FindOrphansReportsBothDirections) {
  auto visit = addVisit("2024-03-01");
  auto present = repo_->createAttachment(visit.id, source("present.pdf"));
  auto vanished = repo_->createAttachment(visit.id, source("vanished.pdf"));
  ASSERT_OK(present);
  ASSERT_OK(vanished);
  std::filesystem::remove(archive_root_ / vanished->file_path);
  temp_dir_->createFile("archive/alice/9_9_stray.pdf", "stray");

  auto report = repo_->findOrphans();
  ASSERT_OK(report);
  EXPECT_FALSE(report->clean());
  EXPECT_EQ(report->orphaned_files, (std::vector<std::string>{"alice/9_9_stray.pdf"}));
  ASSERT_EQ(report->missing_files.size(), 1u);
  EXPECT_EQ(report->missing_files[0].id, vanished->id);

  auto removed = repo_->removeOrphanedFiles();
  ASSERT_OK(removed);
  EXPECT_EQ(*removed, 1u);
  EXPECT_FALSE(std::filesystem::exists(archive_root_ / "alice" / "9_9_stray.pdf"));
  EXPECT_TRUE(store_->exists(present->file_path));
}

// Durability

TEST_F(SqliteRecordRepositoryTest, AttachmentWritesAreCommittedOnReturn) {
  auto visit = addVisit("2024-03-01");
  auto attachment = repo_->createAttachment(visit.id, source("ecg.pdf"));
  ASSERT_OK(attachment);

  EXPECT_EQ(countOnSideConnection(db_path_, "SELECT COUNT(*) FROM attachment_records"), 1);
  EXPECT_TRUE(store_->exists(attachment->file_path));

  ASSERT_OK(repo_->deleteAttachment(attachment->id));

  EXPECT_EQ(countOnSideConnection(db_path_, "SELECT COUNT(*) FROM attachment_records"), 0);
  EXPECT_FALSE(store_->exists(attachment->file_path));

  auto report = repo_->findOrphans();
  ASSERT_OK(report);
  EXPECT_TRUE(report->clean());
}

TEST_F(SqliteRecordRepositoryTest, VisitDeletionIsCommittedOnReturn) {
  auto visit = addVisit("2024-03-01");
  ASSERT_OK(repo_->createAttachment(visit.id, source("a.pdf")));
  ASSERT_OK(repo_->createAttachment(visit.id, source("b.pdf")));

  ASSERT_OK(repo_->deleteVisit(visit.id));

  EXPECT_EQ(countOnSideConnection(db_path_, "SELECT COUNT(*) FROM visit_records"), 0);
  EXPECT_EQ(countOnSideConnection(db_path_, "SELECT COUNT(*) FROM attachment_records"), 0);
  EXPECT_EQ(archivedFiles(), 0u);
}

// Store interaction, with the archive replaced by a mock

class RepositoryStoreInteractionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<hrec::test::TempDirectory>();
    source_ = temp_dir_->createFile("scan.pdf", "scan");
    repo_ = std::make_unique<SqliteRecordRepository>(temp_dir_->path() / "alice.sqlite", "alice",
                                                     store_);
    auto init = repo_->initialize();
    ASSERT_TRUE(init.has_value()) << init.error().message();

    auto visit = repo_->createVisit(hrec::test::makeVisit("2024-05-01"));
    ASSERT_TRUE(visit.has_value());
    visit_id_ = visit->id;
  }

  Result<core::AttachmentRecord> attach(const std::string& managed_path) {
    EXPECT_CALL(store_, store("alice", visit_id_, _, source_))
        .WillOnce(Return(Result<std::string>(managed_path)));
    return repo_->createAttachment(visit_id_, source_);
  }

  static Result<std::optional<std::string>> setAsideAs(const std::string& path) {
    return std::optional<std::string>(path);
  }

  std::unique_ptr<hrec::test::TempDirectory> temp_dir_;
  std::filesystem::path source_;
  ::testing::NiceMock<hrec::test::MockAttachmentStore> store_;
  std::unique_ptr<SqliteRecordRepository> repo_;
  core::VisitRecordId visit_id_ = 0;
};

TEST_F(RepositoryStoreInteractionTest, UnknownVisitNeverReachesStore) {
  EXPECT_CALL(store_, store(_, _, _, _)).Times(0);
  EXPECT_ERROR(repo_->createAttachment(visit_id_ + 100, source_), ErrorCode::kNotFound);
}

TEST_F(RepositoryStoreInteractionTest, StoreFailureLeavesNoRow) {
  EXPECT_CALL(store_, store(_, _, _, _))
      .WillOnce(Return(Result<std::string>(
          std::unexpected(makeError(ErrorCode::kStoreIoError, "disk full")))));

  EXPECT_ERROR(repo_->createAttachment(visit_id_, source_), ErrorCode::kStoreIoError);

  auto list = repo_->listAllAttachments();
  ASSERT_OK(list);
  EXPECT_TRUE(list->empty());
}

TEST_F(RepositoryStoreInteractionTest, FailedRemoveKeepsRow) {
  auto attachment = attach("alice/1_1_scan.pdf");
  ASSERT_OK(attachment);

  EXPECT_CALL(store_, remove("alice/1_1_scan.pdf"))
      .WillOnce(Return(Result<void>(
          std::unexpected(makeError(ErrorCode::kStoreIoError, "permission denied")))));

  EXPECT_ERROR(repo_->deleteAttachment(attachment->id), ErrorCode::kStoreIoError);
  EXPECT_OK(repo_->getAttachment(attachment->id));
}

TEST_F(RepositoryStoreInteractionTest, CascadeStopsAtFirstFailedRemove) {
  auto first = attach("alice/1_1_scan.pdf");
  auto second = attach("alice/1_2_scan.pdf");
  ASSERT_OK(first);
  ASSERT_OK(second);

  EXPECT_CALL(store_, remove("alice/1_1_scan.pdf")).WillOnce(Return(Result<void>()));
  EXPECT_CALL(store_, remove("alice/1_2_scan.pdf"))
      .WillOnce(Return(Result<void>(
          std::unexpected(makeError(ErrorCode::kStoreIoError, "busy")))));

  EXPECT_ERROR(repo_->deleteVisit(visit_id_), ErrorCode::kStoreIoError);

  EXPECT_OK(repo_->getVisit(visit_id_));
  EXPECT_ERROR(repo_->getAttachment(first->id), ErrorCode::kNotFound);
  EXPECT_OK(repo_->getAttachment(second->id));
}

TEST_F(RepositoryStoreInteractionTest, ReplaceRemovesPreviousFileAfterCommit) {
  auto attachment = attach("alice/1_1_scan.pdf");
  ASSERT_OK(attachment);

  auto replacement = temp_dir_->createFile("lab.pdf", "lab");
  ::testing::InSequence sequence;
  EXPECT_CALL(store_, setAside("alice/1_1_scan.pdf"))
      .WillOnce(Return(setAsideAs("alice/.hrec.old.100001")));
  EXPECT_CALL(store_, store("alice", visit_id_, attachment->id, replacement))
      .WillOnce(Return(Result<std::string>("alice/1_1_lab.pdf")));
  EXPECT_CALL(store_, remove("alice/.hrec.old.100001")).WillOnce(Return(Result<void>()));
  EXPECT_CALL(store_, restore(_, _)).Times(0);

  auto replaced = repo_->replaceAttachment(attachment->id, replacement);
  ASSERT_OK(replaced);
  EXPECT_EQ(replaced->file_path, "alice/1_1_lab.pdf");
}

TEST_F(RepositoryStoreInteractionTest, FailedReplaceRestoresPreviousFile) {
  auto attachment = attach("alice/1_1_scan.pdf");
  ASSERT_OK(attachment);

  auto replacement = temp_dir_->createFile("newer/scan.pdf", "newer");
  ::testing::InSequence sequence;
  EXPECT_CALL(store_, setAside("alice/1_1_scan.pdf"))
      .WillOnce(Return(setAsideAs("alice/.hrec.old.100002")));
  EXPECT_CALL(store_, store("alice", visit_id_, attachment->id, replacement))
      .WillOnce(Return(Result<std::string>(
          std::unexpected(makeError(ErrorCode::kStoreIoError, "disk full")))));
  EXPECT_CALL(store_, restore("alice/.hrec.old.100002", "alice/1_1_scan.pdf"))
      .WillOnce(Return(Result<void>()));
  EXPECT_CALL(store_, remove(_)).Times(0);

  EXPECT_ERROR(repo_->replaceAttachment(attachment->id, replacement), ErrorCode::kStoreIoError);

  auto loaded = repo_->getAttachment(attachment->id);
  ASSERT_OK(loaded);
  EXPECT_EQ(loaded->file_path, "alice/1_1_scan.pdf");
}

}  // namespace hrec::store
