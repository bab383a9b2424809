#pragma once

#include "mip/core/error.hpp"
#include "mip/store/record_store.hpp"

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace mip::store {

/*
  Thin RAII wrapper around a sqlite3 connection.
  The constructor opens, applies pragmas and throws std::runtime_error on
  failure; everything after construction reports through Status.
*/
class SqliteDb {
public:
    explicit SqliteDb(std::string path);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    Status exec(const std::string& sql);

private:
    void configure();

    sqlite3* db_ = nullptr;
    std::string path_;
};

/*
  BEGIN IMMEDIATE takes the write lock up front, so a transaction never
  fails halfway on lock upgrade. Rolls back on destruction unless committed.
*/
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDb& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    bool active() const { return began_.is_ok() && !finished_; }
    const Status& began() const { return began_; }

    Status commit();

private:
    SqliteDb& db_;
    Status began_;
    bool finished_ = false;
};

/**
 * @brief RecordStore on a SQLite file (WAL mode)
 *
 * The schema enforces UNIQUE(source_path) on pending records and CHECK
 * constraints on status, action and the approved/rejected field rules.
 * Calls are serialized on one connection; each mutation is one
 * BEGIN IMMEDIATE transaction.
 */
class SqliteRecordStore : public RecordStore {
public:
    /// Opens (creating if needed) the database and applies the schema
    explicit SqliteRecordStore(const std::string& path);

    Outcome<PendingRecord> insert_pending(const PendingRecord& draft) override;
    Outcome<PendingRecord> get_pending(std::int64_t id) const override;

    Status begin_processing(std::int64_t id) override;
    Status mark_failed(std::int64_t id, const std::string& error_message) override;
    Status resubmit(std::int64_t id) override;

    Outcome<TerminalRecord> complete(std::int64_t id, const Disposal& disposal) override;

    Outcome<std::vector<PendingRecord>> list_by_status(RecordStatus status) const override;
    Outcome<std::vector<TerminalRecord>> list_history(std::size_t limit = kDefaultHistoryLimit) const override;
    Outcome<RecordStats> stats() const override;

private:
    void ensure_schema();

    Status transition(std::int64_t id, RecordStatus from, RecordStatus to,
                      const std::optional<std::string>& error_message);
    Outcome<RecordStatus> current_status(std::int64_t id) const;
    Outcome<PendingRecord> load_pending(std::int64_t id) const;

    Error translate(int rc, const std::string& context) const;

    std::unique_ptr<SqliteDb> db_;
    mutable std::mutex mutex_;
};

} // namespace mip::store
