#pragma once

#include "mip/core/error.hpp"
#include "mip/ingest/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mip::store {

using ingest::Disposition;
using ingest::PendingRecord;
using ingest::RecordStats;
using ingest::RecordStatus;
using ingest::TerminalRecord;
using ingest::Timestamp;

/**
 * @brief What the orchestrator decided for one pending record
 *
 * The store copies source_path, filename, size and detected_at from the
 * pending row itself, inside the same transaction that deletes it.
 */
struct Disposal {
    Disposition action = Disposition::Approved;
    std::optional<std::string> final_path;
    std::optional<std::string> final_filename;
    std::uint32_t version_number = 1;
    std::string renamer_output;
    std::string notes;
    Timestamp processed_at{};
};

/**
 * @brief Transactional home of pending and terminal records
 *
 * Every method is one atomic step and safe to call from any thread.
 *
 * Status guards live in the store so they are checked in the same
 * critical section as the write:
 * - begin_processing: pending → processing, InvalidState otherwise
 * - mark_failed:      processing → failed
 * - resubmit:         failed → pending, error_message cleared
 * - complete:         approved needs processing; rejected accepts any
 *                     status, so a record stranded in processing by a
 *                     crash can still be disposed of. Inserts the terminal
 *                     record and deletes the pending one, both or neither.
 *
 * A second insert_pending for the same source_path is AlreadyTracked.
 */
class RecordStore {
public:
    static constexpr std::size_t kDefaultHistoryLimit = 50;

    virtual ~RecordStore() = default;

    /// Stores a new pending record; id and status are assigned here
    virtual Outcome<PendingRecord> insert_pending(const PendingRecord& draft) = 0;

    virtual Outcome<PendingRecord> get_pending(std::int64_t id) const = 0;

    virtual Status begin_processing(std::int64_t id) = 0;
    virtual Status mark_failed(std::int64_t id, const std::string& error_message) = 0;
    virtual Status resubmit(std::int64_t id) = 0;

    virtual Outcome<TerminalRecord> complete(std::int64_t id, const Disposal& disposal) = 0;

    /// Records in status pending, newest detected first
    virtual Outcome<std::vector<PendingRecord>> list_pending() const {
        return list_by_status(RecordStatus::Pending);
    }

    virtual Outcome<std::vector<PendingRecord>> list_by_status(RecordStatus status) const = 0;

    /// Terminal records, most recently processed first
    virtual Outcome<std::vector<TerminalRecord>> list_history(std::size_t limit = kDefaultHistoryLimit) const = 0;

    virtual Outcome<RecordStats> stats() const = 0;
};

/**
 * @brief Shared guard check for complete(); NotFound is the caller's job
 */
inline Status check_disposal(std::int64_t id, RecordStatus current, const Disposal& disposal) {
    const std::string label = "Record " + std::to_string(id);
    if (disposal.action == Disposition::Approved) {
        if (current != RecordStatus::Processing) {
            return Fail<void>(ErrorCode::InvalidState,
                              label + " is " + ingest::RecordStatusUtils::to_string(current) + ", expected processing");
        }
        if (!disposal.final_path || !disposal.final_filename || disposal.version_number < 1) {
            return Fail<void>(ErrorCode::InvalidState, label + ": approval needs a final path, filename and version");
        }
    } else {
        if (disposal.final_path || disposal.final_filename) {
            return Fail<void>(ErrorCode::InvalidState, label + ": rejection cannot carry a final path");
        }
    }
    return Done();
}

} // namespace mip::store
