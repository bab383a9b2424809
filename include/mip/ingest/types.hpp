#pragma once

/**
 * @file types.hpp
 * @brief Record types shared by the ingest pipeline, the store and the API
 *
 * WHY THIS FILE EXISTS:
 * A discovered file moves through three representations: the facts the
 * validator reads off disk, the pending record that waits for a decision,
 * and the terminal record that preserves the decision forever. Every
 * component speaks in these structs, so they live in one place.
 *
 * STATE TRANSITIONS (PendingRecord::status):
 * Pending → Processing (approve started)
 * Processing → Approved (transfer committed, record moves to history)
 * Processing → Failed (renamer or transfer failed, record stays for inspection)
 * Failed → Pending (only through an explicit resubmit)
 *
 * Rejected/Approved never stay on a pending record for long: the same
 * transaction that writes the TerminalRecord deletes the pending row.
 */

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace mip::ingest {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief Facts the stability validator extracts from a candidate file
 */
struct FileFacts {
    std::string path;
    std::string filename;
    std::uint64_t size = 0;
    std::string extension;           ///< Including the leading dot, as found on disk
    std::time_t modified_time = 0;   ///< Unix epoch seconds
};

enum class RecordStatus {
    Pending,
    Processing,
    Approved,
    Rejected,
    Failed
};

enum class Disposition {
    Approved,
    Rejected
};

/**
 * @brief A discovered file awaiting a decision
 */
struct PendingRecord {
    std::int64_t id = 0;
    std::string source_path;          ///< Unique among pending records
    std::string filename;
    std::uint64_t size_bytes = 0;
    Timestamp detected_at{};
    RecordStatus status = RecordStatus::Pending;
    std::optional<std::string> error_message;  ///< Present only when status == Failed
    std::string side_metadata;        ///< Opaque JSON object text
};

/**
 * @brief Immutable history entry written once per disposed pending record
 */
struct TerminalRecord {
    std::int64_t id = 0;
    std::string source_path;
    std::string original_filename;
    std::optional<std::string> final_path;      ///< Null when rejected
    std::optional<std::string> final_filename;  ///< Null when rejected
    std::uint64_t size_bytes = 0;
    Timestamp detected_at{};
    Timestamp processed_at{};
    Disposition action = Disposition::Approved;
    std::uint32_t version_number = 1;
    std::string renamer_output;
    std::string notes;
};

struct RecordStats {
    std::uint64_t pending = 0;
    std::uint64_t failed = 0;
    std::uint64_t approved = 0;
    std::uint64_t rejected = 0;
    std::uint64_t total = 0;   ///< approved + rejected
};

/**
 * @brief String conversions used by the SQLite schema and the JSON API
 */
class RecordStatusUtils {
public:
    static std::string to_string(RecordStatus status) {
        switch (status) {
            case RecordStatus::Pending: return "pending";
            case RecordStatus::Processing: return "processing";
            case RecordStatus::Approved: return "approved";
            case RecordStatus::Rejected: return "rejected";
            case RecordStatus::Failed: return "failed";
        }
        return "pending";
    }

    static std::optional<RecordStatus> from_string(const std::string& text) {
        if (text == "pending") return RecordStatus::Pending;
        if (text == "processing") return RecordStatus::Processing;
        if (text == "approved") return RecordStatus::Approved;
        if (text == "rejected") return RecordStatus::Rejected;
        if (text == "failed") return RecordStatus::Failed;
        return std::nullopt;
    }

    static std::string to_string(Disposition action) {
        return action == Disposition::Approved ? "approved" : "rejected";
    }

    static std::optional<Disposition> disposition_from_string(const std::string& text) {
        if (text == "approved") return Disposition::Approved;
        if (text == "rejected") return Disposition::Rejected;
        return std::nullopt;
    }
};

inline std::int64_t to_epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_ms(std::int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace mip::ingest
