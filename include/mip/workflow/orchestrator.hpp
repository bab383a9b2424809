#pragma once

#include "mip/core/error.hpp"
#include "mip/ingest/renamer.hpp"
#include "mip/ingest/transfer.hpp"
#include "mip/ingest/version_resolver.hpp"
#include "mip/store/record_store.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mip::workflow {

/**
 * @brief Outcome of approve/reject/resubmit as reported to callers
 *
 * On failure, error holds a human readable reason and error_code the class
 * of failure (NotFound and InvalidState never touched the record).
 */
struct ActionResult {
    bool success = false;
    std::string original_filename;
    std::optional<std::string> final_filename;
    std::optional<std::string> final_path;
    std::uint32_t version_number = 0;
    std::string message;
    std::string error;
    std::optional<ErrorCode> error_code;
};

/**
 * @brief State machine that disposes of pending records
 *
 * approve: pending → processing → renamer → version → transfer → approved.
 * A renamer or transfer failure leaves the record in failed with the reason
 * in error_message. Only resubmit() puts it back to pending. When a
 * concurrent approval publishes the resolved name first, the version is
 * resolved again and the copy repeated, a bounded number of times.
 *
 * No store transaction is held across the renamer or the transfer. The
 * pending → processing flip is the claim; a concurrent second approve of
 * the same id loses it and gets InvalidState.
 *
 * reject: any status, including processing. A record left in processing by
 * a crash has no other way out. If an approval is still running, the reject
 * wins and the approval reports NotFound once its transfer is done.
 */
class Orchestrator {
public:
    Orchestrator(store::RecordStore& store,
                 ingest::Renamer& renamer,
                 ingest::TransferEngine& transfer,
                 ingest::VersionResolver resolver,
                 std::filesystem::path destination_dir);

    ActionResult approve(std::int64_t id, bool delete_source = false);
    ActionResult reject(std::int64_t id, bool delete_source = true);
    ActionResult resubmit(std::int64_t id);

    Outcome<std::vector<store::PendingRecord>> list_pending() const;
    Outcome<std::vector<store::PendingRecord>> list_failed() const;
    Outcome<std::vector<store::TerminalRecord>> list_history(
        std::size_t limit = store::RecordStore::kDefaultHistoryLimit) const;
    Outcome<store::RecordStats> stats() const;

    const std::filesystem::path& destination_dir() const noexcept { return destination_dir_; }

private:
    ActionResult fail_record(std::int64_t id, ActionResult result, const Error& error);
    void remove_source(const std::string& path) const;

    store::RecordStore& store_;
    ingest::Renamer& renamer_;
    ingest::TransferEngine& transfer_;
    ingest::VersionResolver resolver_;
    std::filesystem::path destination_dir_;
};

} // namespace mip::workflow
