#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <vector>

#include "internal/util/buffer.hpp"

namespace draft::db::sqlite {

using draft::db::ErrorCode;
using draft::db::Result;

namespace {

const std::vector<std::string> kSchemaSql = {
    "CREATE TABLE IF NOT EXISTS drafts (id TEXT PRIMARY KEY, payload BLOB NOT NULL, version INTEGER NOT NULL, field_values TEXT NOT NULL, last_modified_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, status INTEGER NOT NULL, size_bytes INTEGER NOT NULL, checksum TEXT);",
    "CREATE TABLE IF NOT EXISTS versions (id TEXT PRIMARY KEY, document_id TEXT NOT NULL, version INTEGER NOT NULL, payload BLOB NOT NULL, field_values TEXT NOT NULL, created_at_ms INTEGER NOT NULL, size_bytes INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS change_log (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT UNIQUE, document_id TEXT NOT NULL, field_name TEXT NOT NULL, old_value TEXT, new_value TEXT NOT NULL, timestamp_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS storage_metadata (id TEXT PRIMARY KEY, total_size_bytes INTEGER NOT NULL, draft_count INTEGER NOT NULL, last_cleanup_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS drafts_by_status ON drafts(status);",
    "CREATE INDEX IF NOT EXISTS drafts_by_modified ON drafts(last_modified_ms);",
    "CREATE INDEX IF NOT EXISTS versions_by_document ON versions(document_id);",
    "CREATE INDEX IF NOT EXISTS versions_by_created ON versions(created_at_ms);",
    "CREATE INDEX IF NOT EXISTS change_log_by_document ON change_log(document_id);",
    "CREATE INDEX IF NOT EXISTS change_log_by_timestamp ON change_log(timestamp_ms);"};

constexpr const char* kDraftColumns   = "id,version,field_values,last_modified_ms,created_at_ms,status,size_bytes,checksum";
constexpr const char* kVersionColumns = "id,document_id,version,field_values,created_at_ms,size_bytes";

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

// Reads stop on the first non-row result; anything but DONE is an error.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBlob(sqlite3_stmt* st, int idx, const std::shared_ptr<arrow::Buffer>& buffer) {
  if (!buffer || buffer->size() == 0) {
    sqlite3_bind_zeroblob(st, idx, 0);
    return;
  }
  sqlite3_bind_blob64(st, idx, buffer->data(), static_cast<sqlite3_uint64>(buffer->size()), SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::shared_ptr<arrow::Buffer> ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return util::CopyBytes(data, static_cast<std::size_t>(size));
}

model::DraftStatus ColStatus(sqlite3_stmt* st, int col) {
  const auto status = draft::model::StatusFromInt(sqlite3_column_int(st, col));
  if (!status) {
    throw std::runtime_error("sqlite: invalid draft status " + std::to_string(sqlite3_column_int(st, col)));
  }
  return *status;
}

// Column order follows kDraftColumns; payload is appended last when loaded.
model::DraftRecord ReadDraft(sqlite3_stmt* st, bool with_payload) {
  model::DraftRecord r;
  r.id               = ColText(st, 0);
  r.version          = ColU64(st, 1);
  r.field_values     = draft::model::FieldValuesFromJson(ColText(st, 2));
  r.last_modified_ms = ColU64(st, 3);
  r.created_at_ms    = ColU64(st, 4);
  r.status           = ColStatus(st, 5);
  r.size_bytes       = ColU64(st, 6);
  r.checksum         = ColOptionalText(st, 7);
  if (with_payload) r.payload = ColBlob(st, 8);
  return r;
}

model::VersionRecord ReadVersion(sqlite3_stmt* st, bool with_payload) {
  model::VersionRecord r;
  r.id            = ColText(st, 0);
  r.document_id   = ColText(st, 1);
  r.version       = ColU64(st, 2);
  r.field_values  = draft::model::FieldValuesFromJson(ColText(st, 3));
  r.created_at_ms = ColU64(st, 4);
  r.size_bytes    = ColU64(st, 5);
  if (with_payload) r.payload = ColBlob(st, 6);
  return r;
}

model::ChangeLogRecord ReadChange(sqlite3_stmt* st) {
  model::ChangeLogRecord r;
  r.sequence    = ColU64(st, 0);
  r.id          = ColText(st, 1);
  r.document_id = ColText(st, 2);
  r.field_name  = ColText(st, 3);
  if (auto old_value = ColOptionalText(st, 4)) {
    r.old_value = draft::model::FieldValueFromJson(*old_value);
  }
  r.new_value    = draft::model::FieldValueFromJson(ColText(st, 5));
  r.timestamp_ms = ColU64(st, 6);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::EnsureSchema() {
  std::scoped_lock lock(db_->TxMutex());
  for (const auto& sql : kSchemaSql) {
    db_->Exec(sql);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Drafts
// ------------------------------------------------------------------

Result SqliteRepository::PutDraft(Transaction& t, const model::DraftRecord& r) {
  auto* db = TX(t).Handle();
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty draft id");

  auto st = Prepare(db,
                    "INSERT INTO drafts(id,payload,version,field_values,last_modified_ms,created_at_ms,status,size_bytes,checksum) "
                    "VALUES(?,?,?,?,?,?,?,?,?) "
                    "ON CONFLICT(id) DO UPDATE SET payload=excluded.payload, version=excluded.version, "
                    "field_values=excluded.field_values, last_modified_ms=excluded.last_modified_ms, "
                    "created_at_ms=excluded.created_at_ms, status=excluded.status, size_bytes=excluded.size_bytes, "
                    "checksum=excluded.checksum;");

  BindText(st.get(), 1, r.id);
  BindBlob(st.get(), 2, r.payload);
  BindU64(st.get(), 3, r.version);
  BindText(st.get(), 4, draft::model::ToJson(r.field_values));
  BindU64(st.get(), 5, r.last_modified_ms);
  BindU64(st.get(), 6, r.created_at_ms);
  sqlite3_bind_int(st.get(), 7, static_cast<int>(r.status));
  BindU64(st.get(), 8, r.size_bytes);
  BindOptionalText(st.get(), 9, r.checksum);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DraftRecord> SqliteRepository::GetDraft(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kDraftColumns + ",payload FROM drafts WHERE id=?;");
  BindText(st.get(), 1, id);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadDraft(st.get(), true);
}

std::vector<model::DraftRecord> SqliteRepository::ListDrafts(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kDraftColumns + " FROM drafts ORDER BY last_modified_ms ASC, id ASC;");

  std::vector<model::DraftRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadDraft(st.get(), false));
  }
  return out;
}

std::vector<model::DraftRecord> SqliteRepository::ListDraftsByStatus(Transaction& t, model::DraftStatus status) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kDraftColumns + " FROM drafts WHERE status=? ORDER BY last_modified_ms ASC, id ASC;");
  sqlite3_bind_int(st.get(), 1, static_cast<int>(status));

  std::vector<model::DraftRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadDraft(st.get(), false));
  }
  return out;
}

Result SqliteRepository::DeleteDraft(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM drafts WHERE id=?;");
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result SqliteRepository::PutVersion(Transaction& t, const model::VersionRecord& r) {
  auto* db = TX(t).Handle();
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty version id");

  auto st = Prepare(db,
                    "INSERT INTO versions(id,document_id,version,payload,field_values,created_at_ms,size_bytes) "
                    "VALUES(?,?,?,?,?,?,?) "
                    "ON CONFLICT(id) DO UPDATE SET document_id=excluded.document_id, version=excluded.version, "
                    "payload=excluded.payload, field_values=excluded.field_values, "
                    "created_at_ms=excluded.created_at_ms, size_bytes=excluded.size_bytes;");

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.document_id);
  BindU64(st.get(), 3, r.version);
  BindBlob(st.get(), 4, r.payload);
  BindText(st.get(), 5, draft::model::ToJson(r.field_values));
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.size_bytes);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::VersionRecord> SqliteRepository::GetVersion(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kVersionColumns + ",payload FROM versions WHERE id=?;");
  BindText(st.get(), 1, id);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadVersion(st.get(), true);
}

std::vector<model::VersionRecord> SqliteRepository::ListVersionsByDocument(Transaction& t, const std::string& document_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kVersionColumns + " FROM versions WHERE document_id=? ORDER BY version DESC;");
  BindText(st.get(), 1, document_id);

  std::vector<model::VersionRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadVersion(st.get(), false));
  }
  return out;
}

std::vector<model::VersionRecord> SqliteRepository::ListVersions(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kVersionColumns + " FROM versions ORDER BY created_at_ms ASC, document_id ASC, version ASC;");

  std::vector<model::VersionRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadVersion(st.get(), false));
  }
  return out;
}

Result SqliteRepository::DeleteVersion(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM versions WHERE id=?;");
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Change log
// ------------------------------------------------------------------

Result SqliteRepository::InsertChange(Transaction& t, model::ChangeLogRecord& r) {
  auto* db = TX(t).Handle();

  auto insert = Prepare(db, "INSERT INTO change_log(id,document_id,field_name,old_value,new_value,timestamp_ms) VALUES(?,?,?,?,?,?);");
  if (r.id.empty()) {
    sqlite3_bind_null(insert.get(), 1);
  } else {
    BindText(insert.get(), 1, r.id);
  }
  BindText(insert.get(), 2, r.document_id);
  BindText(insert.get(), 3, r.field_name);
  if (r.old_value) {
    BindText(insert.get(), 4, draft::model::ToJson(*r.old_value));
  } else {
    sqlite3_bind_null(insert.get(), 4);
  }
  BindText(insert.get(), 5, draft::model::ToJson(r.new_value));
  BindU64(insert.get(), 6, r.timestamp_ms);

  int rc = sqlite3_step(insert.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.id);
  auto result = Translate(db, rc);
  if (!result) return result;

  r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  if (!r.id.empty()) return Result::Ok();

  r.id        = ChangeId(r);
  auto update = Prepare(db, "UPDATE change_log SET id=? WHERE seq=?;");
  BindText(update.get(), 1, r.id);
  BindU64(update.get(), 2, r.sequence);
  return Translate(db, sqlite3_step(update.get()));
}

std::vector<model::ChangeLogRecord> SqliteRepository::ListChangesByDocument(Transaction& t, const std::string& document_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "SELECT seq,id,document_id,field_name,old_value,new_value,timestamp_ms FROM change_log "
                    "WHERE document_id=? ORDER BY timestamp_ms DESC, seq DESC;");
  BindText(st.get(), 1, document_id);

  std::vector<model::ChangeLogRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadChange(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteChange(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM change_log WHERE id=?;");
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Storage metadata
// ------------------------------------------------------------------

std::optional<model::StorageMetadataRecord> SqliteRepository::GetStorageMetadata(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT id,total_size_bytes,draft_count,last_cleanup_ms FROM storage_metadata WHERE id=?;");
  BindText(st.get(), 1, model::StorageMetadataRecord::kSingletonId);

  if (!StepRow(db, st.get())) return std::nullopt;

  model::StorageMetadataRecord r;
  r.id               = ColText(st.get(), 0);
  r.total_size_bytes = ColU64(st.get(), 1);
  r.draft_count      = ColU64(st.get(), 2);
  r.last_cleanup_ms  = ColU64(st.get(), 3);
  return r;
}

Result SqliteRepository::PutStorageMetadata(Transaction& t, const model::StorageMetadataRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO storage_metadata(id,total_size_bytes,draft_count,last_cleanup_ms) VALUES(?,?,?,?) "
                    "ON CONFLICT(id) DO UPDATE SET total_size_bytes=excluded.total_size_bytes, "
                    "draft_count=excluded.draft_count, last_cleanup_ms=excluded.last_cleanup_ms;");
  BindText(st.get(), 1, model::StorageMetadataRecord::kSingletonId);
  BindU64(st.get(), 2, r.total_size_bytes);
  BindU64(st.get(), 3, r.draft_count);
  BindU64(st.get(), 4, r.last_cleanup_ms);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

Result SqliteRepository::ClearAll(Transaction& t) {
  auto* db = TX(t).Handle();

  for (const char* sql : {"DELETE FROM drafts;", "DELETE FROM versions;", "DELETE FROM change_log;", "DELETE FROM storage_metadata;"}) {
    auto st = Prepare(db, sql);
    auto rc = Translate(db, sqlite3_step(st.get()));
    if (!rc) return rc;
  }
  return Result::Ok();
}

} // namespace draft::db::sqlite
