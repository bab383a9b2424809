#pragma once

#include "mip/ingest/stability_validator.hpp"
#include "mip/store/record_store.hpp"
#include "mip/watch/event_source.hpp"
#include "mip/watch/work_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mip::watch {

struct DispatcherCounters {
    std::uint64_t submitted = 0;       ///< Paths accepted into the queue
    std::uint64_t coalesced = 0;       ///< Notifications folded into an in-flight path
    std::uint64_t inserted = 0;        ///< New pending records
    std::uint64_t already_tracked = 0;
    std::uint64_t not_valid = 0;
    std::uint64_t store_errors = 0;
};

/**
 * @brief Turns filesystem notifications into pending records
 *
 * Paths go through a WorkQueue to a fixed pool of workers, each running the
 * blocking stability check. A path is validated by at most one worker at a
 * time; a notification for a path already in flight only flags it for one
 * more pass if the current one does not produce a record.
 *
 * Insertion is idempotent: AlreadyTracked from the store is a no-op.
 */
class WatchDispatcher {
public:
    WatchDispatcher(ingest::StabilityValidator& validator, store::RecordStore& store, std::size_t workers);
    ~WatchDispatcher();

    WatchDispatcher(const WatchDispatcher&) = delete;
    WatchDispatcher& operator=(const WatchDispatcher&) = delete;

    void start();
    void stop();

    /// Route a source's notifications into submit()
    Status attach(EventSource& source);

    /**
     * @brief Queue a path for validation
     *
     * RETURNS: false when coalesced into an in-flight validation or when
     * the dispatcher is stopped
     */
    bool submit(const std::filesystem::path& path);

    /**
     * @brief Submit every regular file already under root
     *
     * RETURNS: number of paths queued
     */
    std::size_t scan_existing(const std::filesystem::path& root, bool recursive);

    /// Block until no path is queued or being validated
    bool wait_idle(std::chrono::milliseconds timeout);

    std::size_t in_flight() const;
    DispatcherCounters counters() const;

private:
    void worker_loop();
    // true when the path needs no further pass (recorded, tracked, or dropped)
    bool process(const std::filesystem::path& path);
    void finish(const std::string& key, bool settled);

    ingest::StabilityValidator& validator_;
    store::RecordStore& store_;
    std::size_t worker_count_;

    WorkQueue<std::filesystem::path> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, bool> in_flight_;   ///< path → renotified while in flight
    DispatcherCounters counters_;
};

} // namespace mip::watch
