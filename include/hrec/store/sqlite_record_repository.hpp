#pragma once

#include <sqlite3.h>
#include <filesystem>
#include <mutex>

#include "hrec/store/attachment_store.hpp"
#include "hrec/store/record_repository.hpp"

namespace hrec::store {

struct DatabaseOptions {
  std::string journal_mode = "WAL";    // DELETE, TRUNCATE, PERSIST, MEMORY, WAL, OFF
  std::string synchronous = "NORMAL";  // OFF, NORMAL, FULL, EXTRA
};

bool isValidJournalMode(const std::string& mode);
bool isValidSynchronousMode(const std::string& mode);

// One SQLite database per user. The store is not owned and must outlive
// the repository.
class SqliteRecordRepository : public RecordRepository {
 public:
  SqliteRecordRepository(std::filesystem::path db_path, std::string user,
                         AttachmentStore& store);
  SqliteRecordRepository(std::filesystem::path db_path, std::string user,
                         AttachmentStore& store, DatabaseOptions options);
  ~SqliteRecordRepository() override;

  SqliteRecordRepository(const SqliteRecordRepository&) = delete;
  SqliteRecordRepository& operator=(const SqliteRecordRepository&) = delete;

  Result<void> initialize() override;

  const std::string& user() const override { return user_; }
  const std::filesystem::path& databasePath() const { return db_path_; }

  // Visit records
  Result<hrec::core::VisitRecord> createVisit(const hrec::core::VisitRecord& visit) override;
  Result<hrec::core::VisitRecord> updateVisit(const hrec::core::VisitRecord& visit) override;
  Result<hrec::core::VisitRecord> getVisit(hrec::core::VisitRecordId id) override;
  Result<std::vector<hrec::core::VisitRecord>> listVisits(const VisitFilter& filter) override;
  Result<void> deleteVisit(hrec::core::VisitRecordId id) override;

  // Attachments
  Result<hrec::core::AttachmentRecord> createAttachment(
      hrec::core::VisitRecordId visit_record_id,
      const std::filesystem::path& source_file) override;
  Result<void> deleteAttachment(hrec::core::AttachmentId id) override;
  Result<hrec::core::AttachmentRecord> replaceAttachment(
      hrec::core::AttachmentId id,
      const std::filesystem::path& new_source) override;
  Result<hrec::core::AttachmentRecord> getAttachment(hrec::core::AttachmentId id) override;
  Result<std::vector<hrec::core::AttachmentRecord>> listAttachments(
      hrec::core::VisitRecordId visit_record_id) override;
  Result<std::vector<hrec::core::AttachmentRecord>> listAllAttachments() override;

  // History
  Result<std::vector<std::string>> fieldHistory(HistoryField field,
                                                std::size_t limit = 5) override;
  Result<std::vector<std::string>> doctorsByHospital(const std::string& hospital,
                                                     std::size_t limit = 5) override;

  // Maintenance
  Result<OrphanReport> findOrphans() override;
  Result<std::size_t> removeOrphanedFiles() override;

 private:
  // Database management
  Result<void> configureDatabase();
  Result<void> createTables();
  Result<void> prepareStatements();
  void finalizeStatements();
  Result<void> requireOpen() const;

  // One BEGIN IMMEDIATE ... COMMIT per write operation. Callers hold db_mutex_.
  Result<void> beginWrite();
  Result<void> commitWrite();
  void rollbackWrite();

  // Unlocked helpers; callers hold db_mutex_
  Result<hrec::core::VisitRecord> getVisitLocked(hrec::core::VisitRecordId id);
  Result<bool> visitExistsLocked(hrec::core::VisitRecordId id);
  Result<hrec::core::AttachmentRecord> getAttachmentLocked(hrec::core::AttachmentId id);
  Result<std::vector<hrec::core::AttachmentRecord>> listAttachmentsLocked(
      hrec::core::VisitRecordId visit_record_id);
  Result<std::vector<hrec::core::AttachmentRecord>> listAllAttachmentsLocked();
  Result<void> deleteAttachmentRowLocked(hrec::core::AttachmentId id);
  Result<void> setAttachmentPathLocked(hrec::core::AttachmentId id, const std::string& path);
  Result<OrphanReport> findOrphansLocked();
  Result<std::vector<std::string>> collectStrings(sqlite3_stmt* stmt, const std::string& operation);

  // Undo a store() whose row could not be persisted
  void discardStoredFile(const std::string& relative_path);
  void restoreSetAside(const std::optional<std::string>& aside, const std::string& relative_path);

  // Error handling
  Error makeSqliteError(const std::string& operation);
  Result<void> checkSqliteResult(int result, const std::string& operation);

  std::filesystem::path db_path_;
  std::string user_;
  AttachmentStore& store_;
  DatabaseOptions options_;

  sqlite3* db_ = nullptr;
  std::mutex db_mutex_;

  // Prepared statements for common operations
  sqlite3_stmt* stmt_insert_visit_ = nullptr;
  sqlite3_stmt* stmt_update_visit_ = nullptr;
  sqlite3_stmt* stmt_get_visit_ = nullptr;
  sqlite3_stmt* stmt_visit_exists_ = nullptr;
  sqlite3_stmt* stmt_delete_visit_ = nullptr;
  sqlite3_stmt* stmt_insert_attachment_ = nullptr;
  sqlite3_stmt* stmt_set_attachment_path_ = nullptr;
  sqlite3_stmt* stmt_get_attachment_ = nullptr;
  sqlite3_stmt* stmt_list_attachments_ = nullptr;
  sqlite3_stmt* stmt_list_all_attachments_ = nullptr;
  sqlite3_stmt* stmt_delete_attachment_ = nullptr;
  sqlite3_stmt* stmt_doctors_by_hospital_ = nullptr;

  bool in_write_ = false;  // Write transaction in progress
};

}  // namespace hrec::store
