#include "mip/watch/dispatcher.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <system_error>

namespace mip::watch {
namespace fs = std::filesystem;

namespace {

std::string side_metadata_for(const ingest::FileFacts& facts) {
    nlohmann::json meta;
    meta["extension"] = facts.extension;
    meta["modified_time"] = static_cast<std::int64_t>(facts.modified_time);
    return meta.dump();
}

} // namespace

WatchDispatcher::WatchDispatcher(ingest::StabilityValidator& validator,
                                 store::RecordStore& store,
                                 std::size_t workers)
    : validator_(validator), store_(store), worker_count_(workers == 0 ? 1 : workers) {}

WatchDispatcher::~WatchDispatcher() {
    stop();
}

void WatchDispatcher::start() {
    if (running_.exchange(true)) {
        return;
    }
    queue_.reopen();
    workers_.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    spdlog::info("[Dispatch] started workers={}", worker_count_);
}

void WatchDispatcher::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    {
        std::lock_guard lock(mutex_);
        in_flight_.clear();
    }
    idle_cv_.notify_all();
    spdlog::info("[Dispatch] stopped");
}

Status WatchDispatcher::attach(EventSource& source) {
    return source.start([this](const fs::path& path) { submit(path); });
}

bool WatchDispatcher::submit(const fs::path& path) {
    if (!running_.load()) {
        return false;
    }

    const std::string key = path.lexically_normal().string();
    {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = in_flight_.try_emplace(key, false);
        if (!inserted) {
            it->second = true;
            ++counters_.coalesced;
            return false;
        }
        ++counters_.submitted;
    }

    if (!queue_.push(fs::path(key))) {
        finish(key, true);
        return false;
    }
    spdlog::debug("[Dispatch] queued {}", key);
    return true;
}

std::size_t WatchDispatcher::scan_existing(const fs::path& root, bool recursive) {
    std::size_t queued = 0;
    std::error_code ec;

    auto visit = [&](const fs::directory_entry& entry) {
        std::error_code type_ec;
        if (entry.is_regular_file(type_ec) && submit(entry.path())) {
            ++queued;
        }
    };

    if (recursive) {
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            visit(*it);
        }
    } else {
        fs::directory_iterator it(root, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            visit(*it);
        }
    }
    if (ec) {
        spdlog::warn("[Dispatch] startup scan of {} incomplete: {}", root.string(), ec.message());
    }

    spdlog::info("[Dispatch] startup scan queued {} file(s) from {}", queued, root.string());
    return queued;
}

bool WatchDispatcher::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return in_flight_.empty(); });
}

std::size_t WatchDispatcher::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_.size();
}

DispatcherCounters WatchDispatcher::counters() const {
    std::lock_guard lock(mutex_);
    return counters_;
}

void WatchDispatcher::worker_loop() {
    while (auto path = queue_.pop()) {
        if (!running_.load()) {
            break;
        }
        const bool settled = process(*path);
        finish(path->string(), settled);
    }
}

bool WatchDispatcher::process(const fs::path& path) {
    auto facts = validator_.validate(path);
    if (!facts) {
        std::lock_guard lock(mutex_);
        ++counters_.not_valid;
        return false;
    }

    store::PendingRecord draft;
    draft.source_path = facts->path;
    draft.filename = facts->filename;
    draft.size_bytes = facts->size;
    draft.detected_at = ingest::Clock::now();
    draft.side_metadata = side_metadata_for(*facts);

    auto inserted = store_.insert_pending(draft);
    if (inserted.is_ok()) {
        std::lock_guard lock(mutex_);
        ++counters_.inserted;
        spdlog::info("[Dispatch] new pending record id={} file={}", inserted.value().id, facts->filename);
        return true;
    }

    std::lock_guard lock(mutex_);
    if (inserted.error().code == ErrorCode::AlreadyTracked) {
        ++counters_.already_tracked;
        spdlog::debug("[Dispatch] already tracked {}", facts->path);
        return true;
    }

    ++counters_.store_errors;
    spdlog::error("[Dispatch] failed to record {} error={}", facts->path, inserted.error().message);
    return true;
}

void WatchDispatcher::finish(const std::string& key, bool settled) {
    bool requeue = false;
    {
        std::lock_guard lock(mutex_);
        auto it = in_flight_.find(key);
        if (it == in_flight_.end()) {
            return;
        }
        if (it->second && !settled && running_.load()) {
            it->second = false;
            requeue = true;
        } else {
            in_flight_.erase(it);
        }
    }

    if (requeue) {
        spdlog::debug("[Dispatch] re-validating {} after newer notification", key);
        if (queue_.push(fs::path(key))) {
            return;
        }
        std::lock_guard lock(mutex_);
        in_flight_.erase(key);
    }
    idle_cv_.notify_all();
}

} // namespace mip::watch
