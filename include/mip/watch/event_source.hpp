#pragma once

#include "mip/core/error.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace mip::watch {

/**
 * @brief Push-based feed of candidate paths under a watched root
 *
 * Delivery is at-least-once: the same path may be reported many times
 * while it is being written. Callbacks run on the source's own thread and
 * must not block.
 */
class EventSource {
public:
    using PathCallback = std::function<void(const std::filesystem::path&)>;

    virtual ~EventSource() = default;

    virtual Status start(PathCallback callback) = 0;
    virtual void stop() = 0;
};

/**
 * @brief Linux inotify implementation
 *
 * Reports regular files on IN_CLOSE_WRITE, IN_CREATE, IN_MODIFY and
 * IN_MOVED_TO. With recursion enabled, directories created or moved in
 * later are watched too and the files already inside them are reported.
 */
class InotifyEventSource : public EventSource {
public:
    InotifyEventSource(std::filesystem::path root, bool recursive);
    ~InotifyEventSource() override;

    InotifyEventSource(const InotifyEventSource&) = delete;
    InotifyEventSource& operator=(const InotifyEventSource&) = delete;

    Status start(PathCallback callback) override;
    void stop() override;

    bool running() const { return running_.load(); }
    std::size_t watch_count() const;

private:
    Status add_watch(const std::filesystem::path& dir);
    void add_tree(const std::filesystem::path& dir, bool report_files);
    void watch_loop();
    void handle_event(int wd, std::uint32_t mask, const std::string& name);

    std::filesystem::path root_;
    bool recursive_;
    int inotify_fd_ = -1;

    PathCallback callback_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;
    std::unordered_map<int, std::filesystem::path> wd_to_path_;
};

} // namespace mip::watch
