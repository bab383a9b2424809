#include "mip/store/sqlite_store.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace mip::store {

using ingest::RecordStatusUtils;

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS pending_records (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    source_path    TEXT    NOT NULL UNIQUE,
    filename       TEXT    NOT NULL,
    size_bytes     INTEGER NOT NULL CHECK (size_bytes >= 0),
    detected_at    INTEGER NOT NULL,
    status         TEXT    NOT NULL DEFAULT 'pending'
                   CHECK (status IN ('pending', 'processing', 'approved', 'rejected', 'failed')),
    error_message  TEXT,
    side_metadata  TEXT    NOT NULL DEFAULT '{}'
);
CREATE INDEX IF NOT EXISTS idx_pending_status ON pending_records (status);

CREATE TABLE IF NOT EXISTS terminal_records (
    id                 INTEGER PRIMARY KEY AUTOINCREMENT,
    source_path        TEXT    NOT NULL,
    original_filename  TEXT    NOT NULL,
    final_path         TEXT,
    final_filename     TEXT,
    size_bytes         INTEGER NOT NULL,
    detected_at        INTEGER NOT NULL,
    processed_at       INTEGER NOT NULL,
    action             TEXT    NOT NULL CHECK (action IN ('approved', 'rejected')),
    version_number     INTEGER NOT NULL DEFAULT 1 CHECK (version_number >= 1),
    renamer_output     TEXT    NOT NULL DEFAULT '',
    notes              TEXT    NOT NULL DEFAULT '',
    CHECK ((action = 'approved' AND final_path IS NOT NULL AND final_filename IS NOT NULL)
        OR (action = 'rejected' AND final_path IS NULL AND final_filename IS NULL))
);
CREATE INDEX IF NOT EXISTS idx_terminal_processed ON terminal_records (processed_at);
)SQL";

constexpr const char* kPendingColumns =
    "id, source_path, filename, size_bytes, detected_at, status, error_message, side_metadata";

constexpr const char* kTerminalColumns =
    "id, source_path, original_filename, final_path, final_filename, size_bytes, detected_at, "
    "processed_at, action, version_number, renamer_output, notes";

// Prepared statement owner; finalizes on scope exit
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool prepared() const { return rc_ == SQLITE_OK; }
    int prepare_rc() const { return rc_; }

    void bind_text(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind_optional_text(int idx, const std::optional<std::string>& value) {
        if (value) {
            bind_text(idx, *value);
        } else {
            sqlite3_bind_null(stmt_, idx);
        }
    }
    void bind_int64(int idx, std::int64_t value) {
        sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
    }

    int step() { return sqlite3_step(stmt_); }

    std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        return t ? reinterpret_cast<const char*>(t) : "";
    }
    std::optional<std::string> optional_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return text(col);
    }
    std::int64_t int64(int col) const {
        return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_OK;
};

PendingRecord read_pending(const Statement& st) {
    PendingRecord record;
    record.id = st.int64(0);
    record.source_path = st.text(1);
    record.filename = st.text(2);
    record.size_bytes = static_cast<std::uint64_t>(st.int64(3));
    record.detected_at = ingest::from_epoch_ms(st.int64(4));
    record.status = RecordStatusUtils::from_string(st.text(5)).value_or(RecordStatus::Pending);
    record.error_message = st.optional_text(6);
    record.side_metadata = st.text(7);
    return record;
}

TerminalRecord read_terminal(const Statement& st) {
    TerminalRecord record;
    record.id = st.int64(0);
    record.source_path = st.text(1);
    record.original_filename = st.text(2);
    record.final_path = st.optional_text(3);
    record.final_filename = st.optional_text(4);
    record.size_bytes = static_cast<std::uint64_t>(st.int64(5));
    record.detected_at = ingest::from_epoch_ms(st.int64(6));
    record.processed_at = ingest::from_epoch_ms(st.int64(7));
    record.action = RecordStatusUtils::disposition_from_string(st.text(8)).value_or(Disposition::Rejected);
    record.version_number = static_cast<std::uint32_t>(st.int64(9));
    record.renamer_output = st.text(10);
    record.notes = st.text(11);
    return record;
}

std::string not_found(std::int64_t id) {
    return "Record " + std::to_string(id) + " not found";
}

} // namespace

// ------------------------------------------------------------------
// SqliteDb
// ------------------------------------------------------------------

SqliteDb::SqliteDb(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        throw std::runtime_error("Failed to open database " + path_ + ": " + msg);
    }

    configure();
}

SqliteDb::~SqliteDb() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Status SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        return Fail<void>(ErrorCode::Store, msg);
    }
    return Done();
}

void SqliteDb::configure() {
    const char* pragmas[] = {
        "PRAGMA journal_mode=WAL;",   // readers proceed while a writer holds the lock
        "PRAGMA synchronous=NORMAL;",
        "PRAGMA foreign_keys=ON;",
        "PRAGMA temp_store=MEMORY;",
    };
    for (const char* pragma : pragmas) {
        if (auto status = exec(pragma); status.is_error()) {
            throw std::runtime_error(std::string(pragma) + " failed: " + status.error().message);
        }
    }

    if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
        throw std::runtime_error(std::string("busy_timeout: ") + sqlite3_errmsg(db_));
    }
}

// ------------------------------------------------------------------
// SqliteTransaction
// ------------------------------------------------------------------

SqliteTransaction::SqliteTransaction(SqliteDb& db) : db_(db) {
    began_ = db_.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
    if (!active()) {
        return;
    }
    if (auto status = db_.exec("ROLLBACK;"); status.is_error()) {
        spdlog::error("[Store] rollback failed: {}", status.error().message);
    }
}

Status SqliteTransaction::commit() {
    if (!active()) {
        return Fail<void>(ErrorCode::Store, "No active transaction");
    }
    auto status = db_.exec("COMMIT;");
    if (status.is_ok()) {
        finished_ = true;
    }
    return status;
}

// ------------------------------------------------------------------
// SqliteRecordStore
// ------------------------------------------------------------------

SqliteRecordStore::SqliteRecordStore(const std::string& path)
    : db_(std::make_unique<SqliteDb>(path)) {
    ensure_schema();
    spdlog::info("[Store] sqlite store ready path={}", path);
}

void SqliteRecordStore::ensure_schema() {
    if (auto status = db_->exec(kSchema); status.is_error()) {
        throw std::runtime_error("Failed to create schema: " + status.error().message);
    }
}

Error SqliteRecordStore::translate(int rc, const std::string& context) const {
    const std::string detail = context + ": " + sqlite3_errmsg(db_->handle());
    switch (rc & 0xff) {
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_UNIQUE) {
                return Error{ErrorCode::AlreadyTracked, detail};
            }
            return Error{ErrorCode::Store, detail};
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return Error{ErrorCode::Io, detail};
        default:
            return Error{ErrorCode::Store, detail};
    }
}

Outcome<PendingRecord> SqliteRecordStore::insert_pending(const PendingRecord& draft) {
    std::lock_guard lock(mutex_);

    SqliteTransaction tx(*db_);
    if (!tx.active()) {
        return Fail<PendingRecord>(ErrorCode::Store, tx.began().error().message);
    }

    Statement st(db_->handle(),
                 "INSERT INTO pending_records (source_path, filename, size_bytes, detected_at, status, side_metadata) "
                 "VALUES (?, ?, ?, ?, 'pending', ?);");
    if (!st.prepared()) {
        auto err = translate(st.prepare_rc(), "prepare insert");
        return Fail<PendingRecord>(err.code, err.message);
    }
    st.bind_text(1, draft.source_path);
    st.bind_text(2, draft.filename);
    st.bind_int64(3, static_cast<std::int64_t>(draft.size_bytes));
    st.bind_int64(4, ingest::to_epoch_ms(draft.detected_at));
    st.bind_text(5, draft.side_metadata.empty() ? "{}" : draft.side_metadata);

    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        const int extended = sqlite3_extended_errcode(db_->handle());
        auto err = translate(extended, "insert pending " + draft.source_path);
        return Fail<PendingRecord>(err.code, err.message);
    }

    PendingRecord record = draft;
    record.id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_->handle()));
    record.status = RecordStatus::Pending;
    record.error_message.reset();
    if (record.side_metadata.empty()) {
        record.side_metadata = "{}";
    }

    if (auto status = tx.commit(); status.is_error()) {
        return Fail<PendingRecord>(status.error().code, status.error().message);
    }
    return Ok<PendingRecord, Error>(std::move(record));
}

Outcome<PendingRecord> SqliteRecordStore::load_pending(std::int64_t id) const {
    Statement st(db_->handle(), std::string("SELECT ") + kPendingColumns + " FROM pending_records WHERE id = ?;");
    if (!st.prepared()) {
        auto err = translate(st.prepare_rc(), "prepare get");
        return Fail<PendingRecord>(err.code, err.message);
    }
    st.bind_int64(1, id);

    const int rc = st.step();
    if (rc == SQLITE_DONE) {
        return Fail<PendingRecord>(ErrorCode::NotFound, not_found(id));
    }
    if (rc != SQLITE_ROW) {
        auto err = translate(rc, "get pending");
        return Fail<PendingRecord>(err.code, err.message);
    }
    return Ok<PendingRecord, Error>(read_pending(st));
}

Outcome<PendingRecord> SqliteRecordStore::get_pending(std::int64_t id) const {
    std::lock_guard lock(mutex_);
    return load_pending(id);
}

Outcome<RecordStatus> SqliteRecordStore::current_status(std::int64_t id) const {
    auto record = load_pending(id);
    if (record.is_error()) {
        return Fail<RecordStatus>(record.error().code, record.error().message);
    }
    return Ok<RecordStatus, Error>(record.value().status);
}

Status SqliteRecordStore::transition(std::int64_t id, RecordStatus from, RecordStatus to,
                                     const std::optional<std::string>& error_message) {
    std::lock_guard lock(mutex_);

    SqliteTransaction tx(*db_);
    if (!tx.active()) {
        return tx.began();
    }

    Statement st(db_->handle(),
                 "UPDATE pending_records SET status = ?, error_message = ? WHERE id = ? AND status = ?;");
    if (!st.prepared()) {
        auto err = translate(st.prepare_rc(), "prepare transition");
        return Fail<void>(err.code, err.message);
    }
    st.bind_text(1, RecordStatusUtils::to_string(to));
    st.bind_optional_text(2, error_message);
    st.bind_int64(3, id);
    st.bind_text(4, RecordStatusUtils::to_string(from));

    if (const int rc = st.step(); rc != SQLITE_DONE) {
        auto err = translate(rc, "update status");
        return Fail<void>(err.code, err.message);
    }

    if (sqlite3_changes(db_->handle()) == 0) {
        auto current = current_status(id);
        if (current.is_error()) {
            return Fail<void>(current.error().code, current.error().message);
        }
        return Fail<void>(ErrorCode::InvalidState,
                          "Record " + std::to_string(id) + " is " + RecordStatusUtils::to_string(current.value()) +
                              ", expected " + RecordStatusUtils::to_string(from));
    }

    return tx.commit();
}

Status SqliteRecordStore::begin_processing(std::int64_t id) {
    return transition(id, RecordStatus::Pending, RecordStatus::Processing, std::nullopt);
}

Status SqliteRecordStore::mark_failed(std::int64_t id, const std::string& error_message) {
    return transition(id, RecordStatus::Processing, RecordStatus::Failed, error_message);
}

Status SqliteRecordStore::resubmit(std::int64_t id) {
    return transition(id, RecordStatus::Failed, RecordStatus::Pending, std::nullopt);
}

Outcome<TerminalRecord> SqliteRecordStore::complete(std::int64_t id, const Disposal& disposal) {
    std::lock_guard lock(mutex_);

    SqliteTransaction tx(*db_);
    if (!tx.active()) {
        return Fail<TerminalRecord>(ErrorCode::Store, tx.began().error().message);
    }

    auto pending = load_pending(id);
    if (pending.is_error()) {
        return Fail<TerminalRecord>(pending.error().code, pending.error().message);
    }
    if (auto guard = check_disposal(id, pending.value().status, disposal); guard.is_error()) {
        return Fail<TerminalRecord>(guard.error().code, guard.error().message);
    }

    const PendingRecord& source = pending.value();
    TerminalRecord terminal;
    terminal.source_path = source.source_path;
    terminal.original_filename = source.filename;
    terminal.final_path = disposal.final_path;
    terminal.final_filename = disposal.final_filename;
    terminal.size_bytes = source.size_bytes;
    terminal.detected_at = source.detected_at;
    terminal.processed_at = disposal.processed_at;
    terminal.action = disposal.action;
    terminal.version_number = disposal.version_number;
    terminal.renamer_output = disposal.renamer_output;
    terminal.notes = disposal.notes;

    {
        Statement insert(db_->handle(),
                         "INSERT INTO terminal_records (source_path, original_filename, final_path, final_filename, "
                         "size_bytes, detected_at, processed_at, action, version_number, renamer_output, notes) "
                         "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        if (!insert.prepared()) {
            auto err = translate(insert.prepare_rc(), "prepare terminal insert");
            return Fail<TerminalRecord>(err.code, err.message);
        }
        insert.bind_text(1, terminal.source_path);
        insert.bind_text(2, terminal.original_filename);
        insert.bind_optional_text(3, terminal.final_path);
        insert.bind_optional_text(4, terminal.final_filename);
        insert.bind_int64(5, static_cast<std::int64_t>(terminal.size_bytes));
        insert.bind_int64(6, ingest::to_epoch_ms(terminal.detected_at));
        insert.bind_int64(7, ingest::to_epoch_ms(terminal.processed_at));
        insert.bind_text(8, RecordStatusUtils::to_string(terminal.action));
        insert.bind_int64(9, terminal.version_number);
        insert.bind_text(10, terminal.renamer_output);
        insert.bind_text(11, terminal.notes);

        if (const int rc = insert.step(); rc != SQLITE_DONE) {
            auto err = translate(sqlite3_extended_errcode(db_->handle()), "insert terminal");
            return Fail<TerminalRecord>(ErrorCode::Store, err.message);
        }
        terminal.id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_->handle()));
    }

    {
        Statement remove(db_->handle(), "DELETE FROM pending_records WHERE id = ?;");
        if (!remove.prepared()) {
            auto err = translate(remove.prepare_rc(), "prepare pending delete");
            return Fail<TerminalRecord>(err.code, err.message);
        }
        remove.bind_int64(1, id);
        if (const int rc = remove.step(); rc != SQLITE_DONE) {
            auto err = translate(rc, "delete pending");
            return Fail<TerminalRecord>(err.code, err.message);
        }
    }

    if (auto status = tx.commit(); status.is_error()) {
        return Fail<TerminalRecord>(status.error().code, status.error().message);
    }
    return Ok<TerminalRecord, Error>(std::move(terminal));
}

Outcome<std::vector<PendingRecord>> SqliteRecordStore::list_by_status(RecordStatus status) const {
    std::lock_guard lock(mutex_);

    Statement st(db_->handle(), std::string("SELECT ") + kPendingColumns +
                                    " FROM pending_records WHERE status = ? ORDER BY detected_at DESC, id DESC;");
    if (!st.prepared()) {
        auto err = translate(st.prepare_rc(), "prepare list");
        return Fail<std::vector<PendingRecord>>(err.code, err.message);
    }
    st.bind_text(1, RecordStatusUtils::to_string(status));

    std::vector<PendingRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        records.push_back(read_pending(st));
    }
    if (rc != SQLITE_DONE) {
        auto err = translate(rc, "list pending");
        return Fail<std::vector<PendingRecord>>(err.code, err.message);
    }
    return Ok<std::vector<PendingRecord>, Error>(std::move(records));
}

Outcome<std::vector<TerminalRecord>> SqliteRecordStore::list_history(std::size_t limit) const {
    std::lock_guard lock(mutex_);

    Statement st(db_->handle(), std::string("SELECT ") + kTerminalColumns +
                                    " FROM terminal_records ORDER BY processed_at DESC, id DESC LIMIT ?;");
    if (!st.prepared()) {
        auto err = translate(st.prepare_rc(), "prepare history");
        return Fail<std::vector<TerminalRecord>>(err.code, err.message);
    }
    st.bind_int64(1, static_cast<std::int64_t>(limit));

    std::vector<TerminalRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        records.push_back(read_terminal(st));
    }
    if (rc != SQLITE_DONE) {
        auto err = translate(rc, "list history");
        return Fail<std::vector<TerminalRecord>>(err.code, err.message);
    }
    return Ok<std::vector<TerminalRecord>, Error>(std::move(records));
}

Outcome<RecordStats> SqliteRecordStore::stats() const {
    std::lock_guard lock(mutex_);

    RecordStats stats;
    {
        Statement st(db_->handle(), "SELECT status, COUNT(*) FROM pending_records GROUP BY status;");
        if (!st.prepared()) {
            auto err = translate(st.prepare_rc(), "prepare stats");
            return Fail<RecordStats>(err.code, err.message);
        }
        int rc = SQLITE_ROW;
        while ((rc = st.step()) == SQLITE_ROW) {
            const auto status = RecordStatusUtils::from_string(st.text(0));
            const auto count = static_cast<std::uint64_t>(st.int64(1));
            if (status == RecordStatus::Pending) {
                stats.pending = count;
            } else if (status == RecordStatus::Failed) {
                stats.failed = count;
            }
        }
        if (rc != SQLITE_DONE) {
            auto err = translate(rc, "pending stats");
            return Fail<RecordStats>(err.code, err.message);
        }
    }
    {
        Statement st(db_->handle(), "SELECT action, COUNT(*) FROM terminal_records GROUP BY action;");
        if (!st.prepared()) {
            auto err = translate(st.prepare_rc(), "prepare stats");
            return Fail<RecordStats>(err.code, err.message);
        }
        int rc = SQLITE_ROW;
        while ((rc = st.step()) == SQLITE_ROW) {
            const auto action = RecordStatusUtils::disposition_from_string(st.text(0));
            const auto count = static_cast<std::uint64_t>(st.int64(1));
            if (action == Disposition::Approved) {
                stats.approved = count;
            } else if (action == Disposition::Rejected) {
                stats.rejected = count;
            }
        }
        if (rc != SQLITE_DONE) {
            auto err = translate(rc, "terminal stats");
            return Fail<RecordStats>(err.code, err.message);
        }
    }
    stats.total = stats.approved + stats.rejected;
    return Ok<RecordStats, Error>(stats);
}

} // namespace mip::store
