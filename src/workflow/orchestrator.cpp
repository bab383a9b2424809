#include "mip/workflow/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace mip::workflow {

using ingest::RecordStatus;
using ingest::RecordStatusUtils;

namespace {

constexpr const char* kRejectedNote = "Rejected by user";
constexpr std::uint32_t kMaxNameRounds = 5;

ActionResult failure(const Error& error, std::string original_filename = {}) {
    ActionResult result;
    result.success = false;
    result.original_filename = std::move(original_filename);
    result.error = error.message;
    result.error_code = error.code;
    return result;
}

} // namespace

Orchestrator::Orchestrator(store::RecordStore& store,
                           ingest::Renamer& renamer,
                           ingest::TransferEngine& transfer,
                           ingest::VersionResolver resolver,
                           std::filesystem::path destination_dir)
    : store_(store),
      renamer_(renamer),
      transfer_(transfer),
      resolver_(std::move(resolver)),
      destination_dir_(std::move(destination_dir)) {}

ActionResult Orchestrator::approve(std::int64_t id, bool delete_source) {
    spdlog::info("[Workflow] approve requested id={} delete_source={}", id, delete_source);

    auto loaded = store_.get_pending(id);
    if (loaded.is_error()) {
        spdlog::warn("[Workflow] approve rejected id={} error={}", id, loaded.error().message);
        return failure(loaded.error());
    }
    const store::PendingRecord record = loaded.value();

    if (record.status != RecordStatus::Pending) {
        const Error error{ErrorCode::InvalidState,
                          "Record is not pending (status: " + RecordStatusUtils::to_string(record.status) + ")"};
        spdlog::warn("[Workflow] approve rejected id={} error={}", id, error.message);
        return failure(error, record.filename);
    }

    // Claim: the loser of a concurrent approve stops here
    if (auto claimed = store_.begin_processing(id); claimed.is_error()) {
        spdlog::warn("[Workflow] approve conflict id={} error={}", id, claimed.error().message);
        return failure(claimed.error(), record.filename);
    }

    ActionResult result;
    result.original_filename = record.filename;

    ingest::RenameOutcome renamed;
    ingest::Resolution resolution;
    std::string final_path;
    try {
        spdlog::info("[Workflow] id={} step 1/3: renamer", id);
        auto rename = renamer_.rename(record.source_path);
        if (rename.is_error()) {
            return fail_record(id, std::move(result), rename.error());
        }
        renamed = std::move(rename.value());

        // Another approval can publish the resolved name first; resolve again
        for (std::uint32_t round = 1;; ++round) {
            spdlog::info("[Workflow] id={} step 2/3: version check in {}", id, destination_dir_.string());
            resolution = resolver_.resolve(renamed.new_filename, destination_dir_);

            spdlog::info("[Workflow] id={} step 3/3: transfer as {}", id, resolution.filename);
            auto copied = transfer_.copy(record.source_path, destination_dir_, resolution.filename);
            if (copied.is_ok()) {
                final_path = copied.value();
                break;
            }
            if (copied.error().code != ErrorCode::DestinationExists || round >= kMaxNameRounds) {
                return fail_record(id, std::move(result), copied.error());
            }
            spdlog::warn("[Workflow] id={} name {} taken, resolving again ({}/{})", id, resolution.filename, round,
                         kMaxNameRounds);
        }
    } catch (const std::exception& e) {
        return fail_record(id, std::move(result), Error{ErrorCode::Io, std::string("Unexpected error: ") + e.what()});
    }

    store::Disposal disposal;
    disposal.action = store::Disposition::Approved;
    disposal.final_path = final_path;
    disposal.final_filename = resolution.filename;
    disposal.version_number = resolution.version;
    disposal.renamer_output = renamed.raw_output;
    disposal.processed_at = ingest::Clock::now();

    auto committed = store_.complete(id, disposal);
    if (committed.is_error() && committed.error().code == ErrorCode::NotFound) {
        // Rejected while the transfer ran; the rejection stands
        spdlog::warn("[Workflow] id={} was rejected during transfer, copy left at {}", id, final_path);
        result.success = false;
        result.final_path = final_path;
        result.error = "Record was rejected while being approved; copy left at " + final_path;
        result.error_code = ErrorCode::NotFound;
        return result;
    }
    if (committed.is_error()) {
        // The file is published but the history row is not; keep the record
        // visible as failed so an operator can reconcile it.
        spdlog::error("[Workflow] commit failed after transfer id={} final_path={} error={}", id, final_path,
                      committed.error().message);
        return fail_record(id, std::move(result),
                           Error{committed.error().code,
                                 "Transferred to " + final_path + " but commit failed: " + committed.error().message});
    }

    if (delete_source) {
        remove_source(record.source_path);
    }

    result.success = true;
    result.final_filename = resolution.filename;
    result.final_path = final_path;
    result.version_number = resolution.version;
    result.message = "Approved as " + resolution.filename;
    spdlog::info("[Workflow] approved id={} final={} version={}", id, resolution.filename, resolution.version);
    return result;
}

ActionResult Orchestrator::reject(std::int64_t id, bool delete_source) {
    spdlog::info("[Workflow] reject requested id={} delete_source={}", id, delete_source);

    auto loaded = store_.get_pending(id);
    if (loaded.is_error()) {
        spdlog::warn("[Workflow] reject failed id={} error={}", id, loaded.error().message);
        return failure(loaded.error());
    }
    const store::PendingRecord record = loaded.value();

    store::Disposal disposal;
    disposal.action = store::Disposition::Rejected;
    disposal.notes = kRejectedNote;
    disposal.processed_at = ingest::Clock::now();

    auto committed = store_.complete(id, disposal);
    if (committed.is_error()) {
        spdlog::warn("[Workflow] reject failed id={} error={}", id, committed.error().message);
        return failure(committed.error(), record.filename);
    }

    if (delete_source) {
        remove_source(record.source_path);
    }

    ActionResult result;
    result.success = true;
    result.original_filename = record.filename;
    result.message = "Rejected " + record.filename;
    spdlog::info("[Workflow] rejected id={} file={}", id, record.filename);
    return result;
}

ActionResult Orchestrator::resubmit(std::int64_t id) {
    auto loaded = store_.get_pending(id);
    if (loaded.is_error()) {
        return failure(loaded.error());
    }

    if (auto status = store_.resubmit(id); status.is_error()) {
        spdlog::warn("[Workflow] resubmit failed id={} error={}", id, status.error().message);
        return failure(status.error(), loaded.value().filename);
    }

    ActionResult result;
    result.success = true;
    result.original_filename = loaded.value().filename;
    result.message = "Record returned to pending";
    spdlog::info("[Workflow] resubmitted id={} file={}", id, result.original_filename);
    return result;
}

Outcome<std::vector<store::PendingRecord>> Orchestrator::list_pending() const {
    return store_.list_pending();
}

Outcome<std::vector<store::PendingRecord>> Orchestrator::list_failed() const {
    return store_.list_by_status(RecordStatus::Failed);
}

Outcome<std::vector<store::TerminalRecord>> Orchestrator::list_history(std::size_t limit) const {
    return store_.list_history(limit);
}

Outcome<store::RecordStats> Orchestrator::stats() const {
    return store_.stats();
}

ActionResult Orchestrator::fail_record(std::int64_t id, ActionResult result, const Error& error) {
    spdlog::error("[Workflow] approve failed id={} code={} error={}", id, to_string(error.code), error.message);

    if (auto marked = store_.mark_failed(id, error.message); marked.is_error()) {
        if (marked.error().code == ErrorCode::NotFound) {
            spdlog::warn("[Workflow] id={} was rejected during approval, failure not recorded", id);
        } else {
            spdlog::error("[Workflow] could not record failure id={} error={}", id, marked.error().message);
        }
    }

    result.success = false;
    result.error = error.message;
    result.error_code = error.code;
    return result;
}

void Orchestrator::remove_source(const std::string& path) const {
    if (auto removed = transfer_.delete_source(path); removed.is_error()) {
        spdlog::warn("[Workflow] source not deleted path={} error={}", path, removed.error().message);
    }
}

} // namespace mip::workflow
