#include "hrec/store/sqlite_record_repository.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <set>

#include <spdlog/spdlog.h>

#include "hrec/util/filesystem.hpp"
#include "hrec/util/time.hpp"

namespace hrec::store {

namespace sql {

constexpr const char* kCreateVisitTable = R"(
CREATE TABLE IF NOT EXISTS visit_records (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  date TEXT NOT NULL,
  hospital TEXT,
  department TEXT,
  doctor TEXT,
  organ_system TEXT,
  reason TEXT,
  diagnosis TEXT,
  medication TEXT,
  remark TEXT,
  created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
  updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
)";

constexpr const char* kCreateAttachmentTable = R"(
CREATE TABLE IF NOT EXISTS attachment_records (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  visit_record_id INTEGER NOT NULL,
  file_path TEXT NOT NULL,
  FOREIGN KEY (visit_record_id) REFERENCES visit_records(id) ON DELETE CASCADE
);
)";

constexpr const char* kCreateIndexes = R"(
CREATE INDEX IF NOT EXISTS idx_visit_records_date ON visit_records(date);
CREATE INDEX IF NOT EXISTS idx_attachment_records_visit ON attachment_records(visit_record_id);
)";

constexpr const char* kVisitColumns =
    "id, date, hospital, department, doctor, organ_system, reason, diagnosis, "
    "medication, remark, created_at, updated_at";

}  // namespace sql

namespace {

constexpr int kBusyTimeoutMs = 5000;

// Resets a cached statement when entering and leaving a scope
class StatementReset {
 public:
  explicit StatementReset(sqlite3_stmt* stmt) : stmt_(stmt) {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }
  ~StatementReset() { sqlite3_reset(stmt_); }

  StatementReset(const StatementReset&) = delete;
  StatementReset& operator=(const StatementReset&) = delete;

 private:
  sqlite3_stmt* stmt_;
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

std::string columnText(sqlite3_stmt* stmt, int column) {
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
  return text ? std::string(text) : std::string();
}

void bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
  sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

// Binds date..remark starting at parameter 1
void bindVisitFields(sqlite3_stmt* stmt, const hrec::core::VisitRecord& visit) {
  bindText(stmt, 1, visit.date);
  bindText(stmt, 2, visit.hospital);
  bindText(stmt, 3, visit.department);
  bindText(stmt, 4, visit.doctor);
  bindText(stmt, 5, visit.organ_system);
  bindText(stmt, 6, visit.reason);
  bindText(stmt, 7, visit.diagnosis);
  bindText(stmt, 8, visit.medication);
  bindText(stmt, 9, visit.remark);
}

hrec::core::VisitRecord readVisit(sqlite3_stmt* stmt) {
  hrec::core::VisitRecord visit;
  visit.id = sqlite3_column_int64(stmt, 0);
  visit.date = columnText(stmt, 1);
  visit.hospital = columnText(stmt, 2);
  visit.department = columnText(stmt, 3);
  visit.doctor = columnText(stmt, 4);
  visit.organ_system = columnText(stmt, 5);
  visit.reason = columnText(stmt, 6);
  visit.diagnosis = columnText(stmt, 7);
  visit.medication = columnText(stmt, 8);
  visit.remark = columnText(stmt, 9);
  visit.created_at = columnText(stmt, 10);
  visit.updated_at = columnText(stmt, 11);
  return visit;
}

hrec::core::AttachmentRecord readAttachment(sqlite3_stmt* stmt) {
  hrec::core::AttachmentRecord attachment;
  attachment.id = sqlite3_column_int64(stmt, 0);
  attachment.visit_record_id = sqlite3_column_int64(stmt, 1);
  attachment.file_path = columnText(stmt, 2);
  return attachment;
}

const char* historyColumn(HistoryField field) {
  switch (field) {
    case HistoryField::kHospital: return "hospital";
    case HistoryField::kDepartment: return "department";
    case HistoryField::kDoctor: return "doctor";
    case HistoryField::kOrganSystem: return "organ_system";
  }
  return "hospital";
}

template <std::size_t N>
bool contains(const std::array<const char*, N>& values, const std::string& value) {
  return std::any_of(values.begin(), values.end(),
                     [&value](const char* candidate) { return value == candidate; });
}

}  // namespace

std::string_view historyFieldToString(HistoryField field) {
  return historyColumn(field);
}

std::optional<HistoryField> historyFieldFromString(const std::string& name) {
  if (name == "hospital") return HistoryField::kHospital;
  if (name == "department") return HistoryField::kDepartment;
  if (name == "doctor") return HistoryField::kDoctor;
  if (name == "organ_system" || name == "organ-system") return HistoryField::kOrganSystem;
  return std::nullopt;
}

bool isValidJournalMode(const std::string& mode) {
  static constexpr std::array<const char*, 6> kModes = {
      "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};
  return contains(kModes, mode);
}

bool isValidSynchronousMode(const std::string& mode) {
  static constexpr std::array<const char*, 4> kModes = {"OFF", "NORMAL", "FULL", "EXTRA"};
  return contains(kModes, mode);
}

SqliteRecordRepository::SqliteRecordRepository(std::filesystem::path db_path, std::string user,
                                               AttachmentStore& store)
    : SqliteRecordRepository(std::move(db_path), std::move(user), store, DatabaseOptions{}) {
}

SqliteRecordRepository::SqliteRecordRepository(std::filesystem::path db_path, std::string user,
                                               AttachmentStore& store, DatabaseOptions options)
    : db_path_(std::move(db_path)),
      user_(std::move(user)),
      store_(store),
      options_(std::move(options)) {
}

SqliteRecordRepository::~SqliteRecordRepository() {
  finalizeStatements();
  if (db_) {
    sqlite3_close(db_);
  }
}

Result<void> SqliteRecordRepository::initialize() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (db_) {
    return {};
  }

  auto parent = db_path_.parent_path();
  if (!parent.empty()) {
    auto dir_result = hrec::util::FileSystem::createDirectories(parent);
    if (!dir_result.has_value()) {
      return dir_result;
    }
  }

  int result = sqlite3_open(db_path_.c_str(), &db_);
  if (result != SQLITE_OK) {
    auto error = makeSqliteError("Failed to open database " + db_path_.string());
    sqlite3_close(db_);
    db_ = nullptr;
    return std::unexpected(error);
  }

  sqlite3_busy_timeout(db_, kBusyTimeoutMs);

  auto config_result = configureDatabase();
  if (!config_result.has_value()) {
    return config_result;
  }

  auto tables_result = createTables();
  if (!tables_result.has_value()) {
    return tables_result;
  }

  auto prepare_result = prepareStatements();
  if (!prepare_result.has_value()) {
    return prepare_result;
  }

  spdlog::debug("Opened record database {}", db_path_.string());
  return {};
}

Result<void> SqliteRecordRepository::configureDatabase() {
  if (!isValidJournalMode(options_.journal_mode)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Unknown journal mode: " + options_.journal_mode));
  }
  if (!isValidSynchronousMode(options_.synchronous)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Unknown synchronous mode: " + options_.synchronous));
  }

  std::string pragmas = "PRAGMA journal_mode = " + options_.journal_mode + ";\n" +
                        "PRAGMA synchronous = " + options_.synchronous + ";\n" +
                        "PRAGMA foreign_keys = ON;\n";

  return checkSqliteResult(sqlite3_exec(db_, pragmas.c_str(), nullptr, nullptr, nullptr),
                           "Configure database pragmas");
}

Result<void> SqliteRecordRepository::createTables() {
  const char* schemas[] = {
    sql::kCreateVisitTable,
    sql::kCreateAttachmentTable,
    sql::kCreateIndexes
  };

  for (const char* schema : schemas) {
    auto result = checkSqliteResult(
        sqlite3_exec(db_, schema, nullptr, nullptr, nullptr),
        "Create database schema");
    if (!result.has_value()) {
      return result;
    }
  }

  return {};
}

Result<void> SqliteRecordRepository::prepareStatements() {
  struct Statement {
    std::string sql;
    sqlite3_stmt** stmt;
  };

  const std::string visit_columns = sql::kVisitColumns;

  Statement statements[] = {
    {
      R"(INSERT INTO visit_records
         (date, hospital, department, doctor, organ_system, reason, diagnosis, medication, remark)
         VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?))",
      &stmt_insert_visit_
    },
    {
      R"(UPDATE visit_records
         SET date = ?, hospital = ?, department = ?, doctor = ?, organ_system = ?,
             reason = ?, diagnosis = ?, medication = ?, remark = ?,
             updated_at = CURRENT_TIMESTAMP
         WHERE id = ?)",
      &stmt_update_visit_
    },
    {
      "SELECT " + visit_columns + " FROM visit_records WHERE id = ?",
      &stmt_get_visit_
    },
    {
      "SELECT 1 FROM visit_records WHERE id = ?",
      &stmt_visit_exists_
    },
    {
      "DELETE FROM visit_records WHERE id = ?",
      &stmt_delete_visit_
    },
    {
      "INSERT INTO attachment_records (visit_record_id, file_path) VALUES (?, '')",
      &stmt_insert_attachment_
    },
    {
      "UPDATE attachment_records SET file_path = ? WHERE id = ?",
      &stmt_set_attachment_path_
    },
    {
      "SELECT id, visit_record_id, file_path FROM attachment_records WHERE id = ?",
      &stmt_get_attachment_
    },
    {
      R"(SELECT id, visit_record_id, file_path FROM attachment_records
         WHERE visit_record_id = ? ORDER BY id ASC)",
      &stmt_list_attachments_
    },
    {
      "SELECT id, visit_record_id, file_path FROM attachment_records ORDER BY id ASC",
      &stmt_list_all_attachments_
    },
    {
      "DELETE FROM attachment_records WHERE id = ?",
      &stmt_delete_attachment_
    },
    {
      R"(SELECT doctor FROM visit_records
         WHERE hospital = ? AND doctor IS NOT NULL AND doctor != ''
         GROUP BY doctor
         ORDER BY MAX(updated_at) DESC, MAX(id) DESC
         LIMIT ?)",
      &stmt_doctors_by_hospital_
    }
  };

  for (const auto& stmt_def : statements) {
    int result = sqlite3_prepare_v2(db_, stmt_def.sql.c_str(), -1, stmt_def.stmt, nullptr);
    if (result != SQLITE_OK) {
      return std::unexpected(makeSqliteError("Failed to prepare statement"));
    }
  }

  return {};
}

void SqliteRecordRepository::finalizeStatements() {
  sqlite3_stmt** statements[] = {
    &stmt_insert_visit_, &stmt_update_visit_, &stmt_get_visit_, &stmt_visit_exists_,
    &stmt_delete_visit_, &stmt_insert_attachment_, &stmt_set_attachment_path_,
    &stmt_get_attachment_, &stmt_list_attachments_, &stmt_list_all_attachments_,
    &stmt_delete_attachment_, &stmt_doctors_by_hospital_
  };

  for (auto stmt : statements) {
    if (*stmt) {
      sqlite3_finalize(*stmt);
      *stmt = nullptr;
    }
  }
}

Result<void> SqliteRecordRepository::requireOpen() const {
  if (!db_) {
    return std::unexpected(makeError(ErrorCode::kInvalidState,
                                     "Record database is not initialized"));
  }
  return {};
}

// Visit records

Result<hrec::core::VisitRecord> SqliteRecordRepository::createVisit(
    const hrec::core::VisitRecord& visit) {
  auto record = visit;
  record.normalize();
  auto validation = record.validate();
  if (!validation.has_value()) {
    return std::unexpected(validation.error());
  }

  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }

  {
    StatementReset reset(stmt_insert_visit_);
    bindVisitFields(stmt_insert_visit_, record);
    if (sqlite3_step(stmt_insert_visit_) != SQLITE_DONE) {
      return std::unexpected(makeSqliteError("Failed to insert visit record"));
    }
  }

  auto id = sqlite3_last_insert_rowid(db_);
  spdlog::info("Created visit record {} for user '{}'", id, user_);
  return getVisitLocked(id);
}

Result<hrec::core::VisitRecord> SqliteRecordRepository::updateVisit(
    const hrec::core::VisitRecord& visit) {
  if (visit.id <= 0) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Visit record id is required"));
  }

  auto record = visit;
  record.normalize();
  auto validation = record.validate();
  if (!validation.has_value()) {
    return std::unexpected(validation.error());
  }

  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }

  {
    StatementReset reset(stmt_update_visit_);
    bindVisitFields(stmt_update_visit_, record);
    sqlite3_bind_int64(stmt_update_visit_, 10, record.id);
    if (sqlite3_step(stmt_update_visit_) != SQLITE_DONE) {
      return std::unexpected(makeSqliteError("Failed to update visit record"));
    }
  }

  if (sqlite3_changes(db_) == 0) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Visit record not found: " + std::to_string(record.id)));
  }

  spdlog::info("Updated visit record {}", record.id);
  return getVisitLocked(record.id);
}

Result<hrec::core::VisitRecord> SqliteRecordRepository::getVisit(hrec::core::VisitRecordId id) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }
  return getVisitLocked(id);
}

Result<std::vector<hrec::core::VisitRecord>> SqliteRecordRepository::listVisits(
    const VisitFilter& filter) {
  std::vector<std::string> conditions;
  std::vector<std::string> params;

  for (const auto& [bound, clause] : {std::pair{&filter.since, "date >= ?"},
                                      std::pair{&filter.until, "date <= ?"}}) {
    if (!bound->has_value()) {
      continue;
    }
    auto parsed = hrec::util::Time::parseDate(**bound);
    if (!parsed.has_value()) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument, parsed.error().message()));
    }
    conditions.push_back(clause);
    params.push_back(hrec::util::Time::formatDate(*parsed));
  }

  if (filter.hospital.has_value()) {
    conditions.push_back("hospital = ?");
    params.push_back(*filter.hospital);
  }

  std::string query = std::string("SELECT ") + sql::kVisitColumns + " FROM visit_records";
  for (std::size_t i = 0; i < conditions.size(); ++i) {
    query += (i == 0 ? " WHERE " : " AND ") + conditions[i];
  }
  query += " ORDER BY date DESC, id DESC";
  if (filter.limit.has_value()) {
    query += " LIMIT ?";
  }

  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, query.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return std::unexpected(makeSqliteError("Failed to prepare visit query"));
  }
  StatementPtr stmt(raw, &sqlite3_finalize);

  int index = 1;
  for (const auto& param : params) {
    bindText(stmt.get(), index++, param);
  }
  if (filter.limit.has_value()) {
    sqlite3_bind_int64(stmt.get(), index, static_cast<sqlite3_int64>(*filter.limit));
  }

  std::vector<hrec::core::VisitRecord> visits;
  while (true) {
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      return std::unexpected(makeSqliteError("Visit query failed"));
    }
    visits.push_back(readVisit(stmt.get()));
  }

  return visits;
}

Result<void> SqliteRecordRepository::deleteVisit(hrec::core::VisitRecordId id) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return open_check;
  }

  auto exists = visitExistsLocked(id);
  if (!exists.has_value()) {
    return std::unexpected(exists.error());
  }
  if (!*exists) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Visit record not found: " + std::to_string(id)));
  }

  auto attachments = listAttachmentsLocked(id);
  if (!attachments.has_value()) {
    return std::unexpected(attachments.error());
  }

  auto begin_result = beginWrite();
  if (!begin_result.has_value()) {
    return begin_result;
  }

  // Each row goes only after its file is gone, so a row never outlives its
  // file. A file that cannot be removed stops the cascade; the rows already
  // handled are still committed.
  std::optional<Error> store_failure;
  for (const auto& attachment : *attachments) {
    auto remove_result = store_.remove(attachment.file_path);
    if (!remove_result.has_value()) {
      store_failure = remove_result.error();
      break;
    }

    auto row_result = deleteAttachmentRowLocked(attachment.id);
    if (!row_result.has_value()) {
      spdlog::error("Managed file {} removed but its row could not be deleted: {}",
                    attachment.file_path, row_result.error().message());
      rollbackWrite();
      return row_result;
    }
  }

  if (!store_failure) {
    StatementReset reset(stmt_delete_visit_);
    sqlite3_bind_int64(stmt_delete_visit_, 1, id);
    if (sqlite3_step(stmt_delete_visit_) != SQLITE_DONE) {
      auto error = makeSqliteError("Failed to delete visit record");
      rollbackWrite();
      return std::unexpected(error);
    }
  }

  auto commit_result = commitWrite();
  if (!commit_result.has_value()) {
    rollbackWrite();
    return commit_result;
  }

  if (store_failure) {
    spdlog::warn("Visit record {} kept: {}", id, store_failure->message());
    return std::unexpected(makeError(ErrorCode::kStoreIoError, store_failure->message()));
  }

  spdlog::info("Deleted visit record {} with {} attachment(s)", id, attachments->size());
  return {};
}

// Attachments

Result<hrec::core::AttachmentRecord> SqliteRecordRepository::createAttachment(
    hrec::core::VisitRecordId visit_record_id,
    const std::filesystem::path& source_file) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }

  auto exists = visitExistsLocked(visit_record_id);
  if (!exists.has_value()) {
    return std::unexpected(exists.error());
  }
  if (!*exists) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Visit record not found: " + std::to_string(visit_record_id)));
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(source_file, ec)) {
    return std::unexpected(makeError(ErrorCode::kSourceNotFound,
                                     "Source file not found: " + source_file.string()));
  }

  auto begin_result = beginWrite();
  if (!begin_result.has_value()) {
    return std::unexpected(begin_result.error());
  }

  // Provisional row to obtain the attachment id
  {
    StatementReset reset(stmt_insert_attachment_);
    sqlite3_bind_int64(stmt_insert_attachment_, 1, visit_record_id);
    if (sqlite3_step(stmt_insert_attachment_) != SQLITE_DONE) {
      auto error = makeSqliteError("Failed to insert attachment record");
      rollbackWrite();
      return std::unexpected(error);
    }
  }
  hrec::core::AttachmentRecord attachment;
  attachment.id = sqlite3_last_insert_rowid(db_);
  attachment.visit_record_id = visit_record_id;

  auto stored = store_.store(user_, visit_record_id, attachment.id, source_file);
  if (!stored.has_value()) {
    rollbackWrite();
    return std::unexpected(stored.error());
  }
  attachment.file_path = *stored;

  auto path_result = setAttachmentPathLocked(attachment.id, attachment.file_path);
  if (!path_result.has_value()) {
    discardStoredFile(attachment.file_path);
    rollbackWrite();
    return std::unexpected(path_result.error());
  }

  auto commit_result = commitWrite();
  if (!commit_result.has_value()) {
    discardStoredFile(attachment.file_path);
    rollbackWrite();
    return std::unexpected(commit_result.error());
  }

  spdlog::info("Attached {} to visit record {} as {}", source_file.string(),
               visit_record_id, attachment.file_path);
  return attachment;
}

Result<void> SqliteRecordRepository::deleteAttachment(hrec::core::AttachmentId id) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return open_check;
  }

  auto attachment = getAttachmentLocked(id);
  if (!attachment.has_value()) {
    return std::unexpected(attachment.error());
  }

  auto begin_result = beginWrite();
  if (!begin_result.has_value()) {
    return begin_result;
  }

  auto row_result = deleteAttachmentRowLocked(id);
  if (!row_result.has_value()) {
    rollbackWrite();
    return row_result;
  }

  auto remove_result = store_.remove(attachment->file_path);
  if (!remove_result.has_value()) {
    rollbackWrite();
    return remove_result;
  }

  auto commit_result = commitWrite();
  if (!commit_result.has_value()) {
    spdlog::error("Managed file {} removed but deleting its row failed: {}",
                  attachment->file_path, commit_result.error().message());
    rollbackWrite();
    return commit_result;
  }

  spdlog::info("Deleted attachment {} ({})", id, attachment->file_path);
  return {};
}

Result<hrec::core::AttachmentRecord> SqliteRecordRepository::replaceAttachment(
    hrec::core::AttachmentId id,
    const std::filesystem::path& new_source) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }

  auto existing = getAttachmentLocked(id);
  if (!existing.has_value()) {
    return std::unexpected(existing.error());
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(new_source, ec)) {
    return std::unexpected(makeError(ErrorCode::kSourceNotFound,
                                     "Source file not found: " + new_source.string()));
  }

  auto begin_result = beginWrite();
  if (!begin_result.has_value()) {
    return std::unexpected(begin_result.error());
  }

  // The current file stays recoverable until the new path is committed
  auto aside = store_.setAside(existing->file_path);
  if (!aside.has_value()) {
    rollbackWrite();
    return std::unexpected(aside.error());
  }

  auto stored = store_.store(user_, existing->visit_record_id, id, new_source);
  if (!stored.has_value()) {
    restoreSetAside(*aside, existing->file_path);
    rollbackWrite();
    return std::unexpected(stored.error());
  }

  hrec::core::AttachmentRecord replaced = *existing;
  replaced.file_path = *stored;
  const bool path_changed = replaced.file_path != existing->file_path;

  auto path_result = setAttachmentPathLocked(id, replaced.file_path);
  if (!path_result.has_value()) {
    if (path_changed) {
      discardStoredFile(replaced.file_path);
    }
    restoreSetAside(*aside, existing->file_path);
    rollbackWrite();
    return std::unexpected(path_result.error());
  }

  auto commit_result = commitWrite();
  if (!commit_result.has_value()) {
    if (path_changed) {
      discardStoredFile(replaced.file_path);
    }
    restoreSetAside(*aside, existing->file_path);
    rollbackWrite();
    return std::unexpected(commit_result.error());
  }

  if (*aside) {
    auto remove_result = store_.remove(**aside);
    if (!remove_result.has_value()) {
      // Left behind as an orphan for doctor --fix
      spdlog::warn("Replaced attachment {} but could not remove {}: {}", id,
                   **aside, remove_result.error().message());
    }
  }

  spdlog::info("Replaced attachment {} with {}", id, replaced.file_path);
  return replaced;
}

Result<hrec::core::AttachmentRecord> SqliteRecordRepository::getAttachment(
    hrec::core::AttachmentId id) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }
  return getAttachmentLocked(id);
}

Result<std::vector<hrec::core::AttachmentRecord>> SqliteRecordRepository::listAttachments(
    hrec::core::VisitRecordId visit_record_id) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }
  return listAttachmentsLocked(visit_record_id);
}

Result<std::vector<hrec::core::AttachmentRecord>> SqliteRecordRepository::listAllAttachments() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }
  return listAllAttachmentsLocked();
}

// History

Result<std::vector<std::string>> SqliteRecordRepository::fieldHistory(HistoryField field,
                                                                      std::size_t limit) {
  const std::string column = historyColumn(field);
  const std::string query =
      "SELECT " + column + " FROM visit_records"
      " WHERE " + column + " IS NOT NULL AND " + column + " != ''"
      " GROUP BY " + column +
      " ORDER BY MAX(updated_at) DESC, MAX(id) DESC LIMIT ?";

  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, query.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return std::unexpected(makeSqliteError("Failed to prepare history query"));
  }
  StatementPtr stmt(raw, &sqlite3_finalize);
  sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));

  return collectStrings(stmt.get(), "History query failed");
}

Result<std::vector<std::string>> SqliteRecordRepository::doctorsByHospital(
    const std::string& hospital, std::size_t limit) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }

  StatementReset reset(stmt_doctors_by_hospital_);
  bindText(stmt_doctors_by_hospital_, 1, hospital);
  sqlite3_bind_int64(stmt_doctors_by_hospital_, 2, static_cast<sqlite3_int64>(limit));

  return collectStrings(stmt_doctors_by_hospital_, "Doctor history query failed");
}

// Maintenance

Result<OrphanReport> SqliteRecordRepository::findOrphans() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }
  return findOrphansLocked();
}

Result<std::size_t> SqliteRecordRepository::removeOrphanedFiles() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  auto open_check = requireOpen();
  if (!open_check.has_value()) {
    return std::unexpected(open_check.error());
  }

  auto report = findOrphansLocked();
  if (!report.has_value()) {
    return std::unexpected(report.error());
  }

  std::size_t removed = 0;
  for (const auto& path : report->orphaned_files) {
    auto remove_result = store_.remove(path);
    if (!remove_result.has_value()) {
      return std::unexpected(remove_result.error());
    }
    ++removed;
  }

  if (removed > 0) {
    spdlog::info("Removed {} orphaned file(s) of user '{}'", removed, user_);
  }
  return removed;
}

// Write units

Result<void> SqliteRecordRepository::beginWrite() {
  if (in_write_) {
    return std::unexpected(makeError(ErrorCode::kInvalidState, "Write already in progress"));
  }

  auto result = checkSqliteResult(
      sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr),
      "Begin write");
  if (result.has_value()) {
    in_write_ = true;
  }
  return result;
}

Result<void> SqliteRecordRepository::commitWrite() {
  auto result = checkSqliteResult(
      sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr),
      "Commit write");
  if (result.has_value()) {
    in_write_ = false;
  }
  return result;
}

void SqliteRecordRepository::rollbackWrite() {
  if (!in_write_) {
    return;
  }
  in_write_ = false;

  // SQLite may already have rolled the transaction back
  if (sqlite3_get_autocommit(db_) != 0) {
    return;
  }

  auto result = checkSqliteResult(
      sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr),
      "Rollback write");
  if (!result.has_value()) {
    spdlog::error("{}", result.error().message());
  }
}

// Unlocked helpers

Result<hrec::core::VisitRecord> SqliteRecordRepository::getVisitLocked(
    hrec::core::VisitRecordId id) {
  StatementReset reset(stmt_get_visit_);
  sqlite3_bind_int64(stmt_get_visit_, 1, id);

  int rc = sqlite3_step(stmt_get_visit_);
  if (rc == SQLITE_ROW) {
    return readVisit(stmt_get_visit_);
  }
  if (rc == SQLITE_DONE) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Visit record not found: " + std::to_string(id)));
  }
  return std::unexpected(makeSqliteError("Failed to load visit record"));
}

Result<bool> SqliteRecordRepository::visitExistsLocked(hrec::core::VisitRecordId id) {
  StatementReset reset(stmt_visit_exists_);
  sqlite3_bind_int64(stmt_visit_exists_, 1, id);

  int rc = sqlite3_step(stmt_visit_exists_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  return std::unexpected(makeSqliteError("Failed to look up visit record"));
}

Result<hrec::core::AttachmentRecord> SqliteRecordRepository::getAttachmentLocked(
    hrec::core::AttachmentId id) {
  StatementReset reset(stmt_get_attachment_);
  sqlite3_bind_int64(stmt_get_attachment_, 1, id);

  int rc = sqlite3_step(stmt_get_attachment_);
  if (rc == SQLITE_ROW) {
    return readAttachment(stmt_get_attachment_);
  }
  if (rc == SQLITE_DONE) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Attachment not found: " + std::to_string(id)));
  }
  return std::unexpected(makeSqliteError("Failed to load attachment"));
}

Result<std::vector<hrec::core::AttachmentRecord>> SqliteRecordRepository::listAttachmentsLocked(
    hrec::core::VisitRecordId visit_record_id) {
  StatementReset reset(stmt_list_attachments_);
  sqlite3_bind_int64(stmt_list_attachments_, 1, visit_record_id);

  std::vector<hrec::core::AttachmentRecord> attachments;
  while (true) {
    int rc = sqlite3_step(stmt_list_attachments_);
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      return std::unexpected(makeSqliteError("Attachment query failed"));
    }
    attachments.push_back(readAttachment(stmt_list_attachments_));
  }
  return attachments;
}

Result<std::vector<hrec::core::AttachmentRecord>>
SqliteRecordRepository::listAllAttachmentsLocked() {
  StatementReset reset(stmt_list_all_attachments_);

  std::vector<hrec::core::AttachmentRecord> attachments;
  while (true) {
    int rc = sqlite3_step(stmt_list_all_attachments_);
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      return std::unexpected(makeSqliteError("Attachment query failed"));
    }
    attachments.push_back(readAttachment(stmt_list_all_attachments_));
  }
  return attachments;
}

Result<void> SqliteRecordRepository::deleteAttachmentRowLocked(hrec::core::AttachmentId id) {
  StatementReset reset(stmt_delete_attachment_);
  sqlite3_bind_int64(stmt_delete_attachment_, 1, id);
  if (sqlite3_step(stmt_delete_attachment_) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to delete attachment record"));
  }
  return {};
}

Result<void> SqliteRecordRepository::setAttachmentPathLocked(hrec::core::AttachmentId id,
                                                             const std::string& path) {
  StatementReset reset(stmt_set_attachment_path_);
  bindText(stmt_set_attachment_path_, 1, path);
  sqlite3_bind_int64(stmt_set_attachment_path_, 2, id);
  if (sqlite3_step(stmt_set_attachment_path_) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to record attachment path"));
  }
  return {};
}

Result<OrphanReport> SqliteRecordRepository::findOrphansLocked() {
  auto attachments = listAllAttachmentsLocked();
  if (!attachments.has_value()) {
    return std::unexpected(attachments.error());
  }

  auto files = store_.listUserFiles(user_);
  if (!files.has_value()) {
    return std::unexpected(files.error());
  }

  OrphanReport report;
  std::set<std::string> known;
  for (const auto& attachment : *attachments) {
    known.insert(attachment.file_path);
    if (attachment.file_path.empty() || !store_.exists(attachment.file_path)) {
      report.missing_files.push_back(attachment);
    }
  }

  for (const auto& file : *files) {
    if (!known.contains(file)) {
      report.orphaned_files.push_back(file);
    }
  }

  return report;
}

Result<std::vector<std::string>> SqliteRecordRepository::collectStrings(
    sqlite3_stmt* stmt, const std::string& operation) {
  std::vector<std::string> values;
  while (true) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      return std::unexpected(makeSqliteError(operation));
    }
    values.push_back(columnText(stmt, 0));
  }
  return values;
}

void SqliteRecordRepository::discardStoredFile(const std::string& relative_path) {
  auto remove_result = store_.remove(relative_path);
  if (remove_result.has_value()) {
    spdlog::warn("Removed {} after the attachment row could not be saved", relative_path);
  } else {
    spdlog::error("Could not remove {} after the attachment row failed: {}",
                  relative_path, remove_result.error().message());
  }
}

void SqliteRecordRepository::restoreSetAside(const std::optional<std::string>& aside,
                                             const std::string& relative_path) {
  if (!aside) {
    return;
  }
  auto restore_result = store_.restore(*aside, relative_path);
  if (!restore_result.has_value()) {
    spdlog::error("Could not move {} back to {}: {}", *aside, relative_path,
                  restore_result.error().message());
  }
}

// Error handling

Error SqliteRecordRepository::makeSqliteError(const std::string& operation) {
  std::string message = operation;
  auto code = ErrorCode::kDatabaseError;
  if (db_) {
    message += ": " + std::string(sqlite3_errmsg(db_));
    if ((sqlite3_errcode(db_) & 0xff) == SQLITE_CONSTRAINT) {
      code = ErrorCode::kConstraintViolation;
    }
  }
  return makeError(code, message);
}

Result<void> SqliteRecordRepository::checkSqliteResult(int result, const std::string& operation) {
  if (result == SQLITE_OK || result == SQLITE_DONE || result == SQLITE_ROW) {
    return {};
  }
  return std::unexpected(makeSqliteError(operation));
}

}  // namespace hrec::store
