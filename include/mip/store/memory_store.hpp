#pragma once

/**
 * @file memory_store.hpp
 * @brief In-memory RecordStore with thread-safe operations
 *
 * WHY THIS FILE EXISTS:
 * Tests and single-process deployments ("mipd run" with store.backend =
 * memory) need a RecordStore that needs no database file. It behaves exactly
 * like the SQLite store, and the parity tests hold both to the same contract.
 *
 * DATA LAYOUT:
 * - pending_: id → PendingRecord (std::map keeps ids ordered)
 * - by_path_: source_path → id, the uniqueness index
 * - history_: TerminalRecords in insertion order, never mutated
 *
 * THREAD SAFETY PATTERN:
 * - Queries (get_pending, list_*, stats): std::shared_lock
 * - Mutations (insert, status changes, complete): std::unique_lock
 * Every guard check runs under the same lock as the write it protects, so
 * two threads racing begin_processing on one id cannot both win.
 *
 * NOT PERSISTENT:
 * Everything is lost on exit. Pending files are found again by the startup
 * scan; history is not.
 */

#include "mip/store/record_store.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace mip::store {

class MemoryRecordStore : public RecordStore {
public:
    MemoryRecordStore() = default;

    /**
     * Add a newly discovered file
     *
     * HOW IT WORKS:
     * 1. Exclusive lock
     * 2. source_path already indexed → AlreadyTracked, nothing changes
     * 3. Otherwise assign the next id, force status = pending, index the path
     */
    Outcome<PendingRecord> insert_pending(const PendingRecord& draft) override {
        std::unique_lock lock(mutex_);

        if (by_path_.count(draft.source_path) != 0) {
            return Fail<PendingRecord>(ErrorCode::AlreadyTracked, "Already tracked: " + draft.source_path);
        }

        PendingRecord record = draft;
        record.id = next_pending_id_++;
        record.status = RecordStatus::Pending;
        record.error_message.reset();

        by_path_[record.source_path] = record.id;
        pending_[record.id] = record;
        return Ok<PendingRecord, Error>(record);
    }

    Outcome<PendingRecord> get_pending(std::int64_t id) const override {
        std::shared_lock lock(mutex_);

        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return Fail<PendingRecord>(ErrorCode::NotFound, not_found(id));
        }
        return Ok<PendingRecord, Error>(it->second);
    }

    /**
     * Claim a record for approval
     *
     * WHY COMPARE-AND-SET:
     * Two approve requests for the same id can arrive together. Whoever
     * flips pending → processing first owns the transfer; the other one
     * sees processing and gets InvalidState.
     */
    Status begin_processing(std::int64_t id) override {
        return transition(id, RecordStatus::Pending, RecordStatus::Processing, std::nullopt);
    }

    Status mark_failed(std::int64_t id, const std::string& error_message) override {
        return transition(id, RecordStatus::Processing, RecordStatus::Failed, error_message);
    }

    Status resubmit(std::int64_t id) override {
        return transition(id, RecordStatus::Failed, RecordStatus::Pending, std::nullopt);
    }

    /**
     * Write the terminal record and drop the pending one
     *
     * Both happen under one exclusive lock, so no reader ever sees the
     * record in both places or in neither.
     */
    Outcome<TerminalRecord> complete(std::int64_t id, const Disposal& disposal) override {
        std::unique_lock lock(mutex_);

        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return Fail<TerminalRecord>(ErrorCode::NotFound, not_found(id));
        }
        if (auto guard = check_disposal(id, it->second.status, disposal); guard.is_error()) {
            return Fail<TerminalRecord>(guard.error().code, guard.error().message);
        }

        const PendingRecord& pending = it->second;
        TerminalRecord terminal;
        terminal.id = next_terminal_id_++;
        terminal.source_path = pending.source_path;
        terminal.original_filename = pending.filename;
        terminal.final_path = disposal.final_path;
        terminal.final_filename = disposal.final_filename;
        terminal.size_bytes = pending.size_bytes;
        terminal.detected_at = pending.detected_at;
        terminal.processed_at = disposal.processed_at;
        terminal.action = disposal.action;
        terminal.version_number = disposal.version_number;
        terminal.renamer_output = disposal.renamer_output;
        terminal.notes = disposal.notes;

        history_.push_back(terminal);
        by_path_.erase(pending.source_path);
        pending_.erase(it);
        return Ok<TerminalRecord, Error>(terminal);
    }

    Outcome<std::vector<PendingRecord>> list_by_status(RecordStatus status) const override {
        std::shared_lock lock(mutex_);

        std::vector<PendingRecord> result;
        for (const auto& [id, record] : pending_) {
            if (record.status == status) {
                result.push_back(record);
            }
        }
        std::sort(result.begin(), result.end(), [](const PendingRecord& a, const PendingRecord& b) {
            if (a.detected_at != b.detected_at) {
                return a.detected_at > b.detected_at;
            }
            return a.id > b.id;
        });
        return Ok<std::vector<PendingRecord>, Error>(std::move(result));
    }

    Outcome<std::vector<TerminalRecord>> list_history(std::size_t limit = kDefaultHistoryLimit) const override {
        std::shared_lock lock(mutex_);

        std::vector<TerminalRecord> result(history_.begin(), history_.end());
        std::sort(result.begin(), result.end(), [](const TerminalRecord& a, const TerminalRecord& b) {
            if (a.processed_at != b.processed_at) {
                return a.processed_at > b.processed_at;
            }
            return a.id > b.id;
        });
        if (result.size() > limit) {
            result.resize(limit);
        }
        return Ok<std::vector<TerminalRecord>, Error>(std::move(result));
    }

    Outcome<RecordStats> stats() const override {
        std::shared_lock lock(mutex_);

        RecordStats stats;
        for (const auto& [id, record] : pending_) {
            if (record.status == RecordStatus::Pending) {
                ++stats.pending;
            } else if (record.status == RecordStatus::Failed) {
                ++stats.failed;
            }
        }
        for (const auto& terminal : history_) {
            if (terminal.action == Disposition::Approved) {
                ++stats.approved;
            } else {
                ++stats.rejected;
            }
        }
        stats.total = stats.approved + stats.rejected;
        return Ok<RecordStats, Error>(stats);
    }

private:
    static std::string not_found(std::int64_t id) {
        return "Record " + std::to_string(id) + " not found";
    }

    Status transition(std::int64_t id, RecordStatus from, RecordStatus to,
                      const std::optional<std::string>& error_message) {
        std::unique_lock lock(mutex_);

        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return Fail<void>(ErrorCode::NotFound, not_found(id));
        }
        if (it->second.status != from) {
            return Fail<void>(ErrorCode::InvalidState,
                              "Record " + std::to_string(id) + " is " +
                                  ingest::RecordStatusUtils::to_string(it->second.status) + ", expected " +
                                  ingest::RecordStatusUtils::to_string(from));
        }

        it->second.status = to;
        it->second.error_message = error_message;
        return Done();
    }

    mutable std::shared_mutex mutex_;
    std::map<std::int64_t, PendingRecord> pending_;
    std::unordered_map<std::string, std::int64_t> by_path_;
    std::vector<TerminalRecord> history_;
    std::int64_t next_pending_id_ = 1;
    std::int64_t next_terminal_id_ = 1;
};

} // namespace mip::store
