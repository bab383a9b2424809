#include "mip/watch/event_source.hpp"

#include <spdlog/spdlog.h>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace mip::watch {
namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kWatchMask =
    IN_CLOSE_WRITE | IN_CREATE | IN_MODIFY | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF;

constexpr int kPollTimeoutMs = 200;

} // namespace

InotifyEventSource::InotifyEventSource(fs::path root, bool recursive)
    : root_(std::move(root)), recursive_(recursive) {}

InotifyEventSource::~InotifyEventSource() {
    stop();
}

Status InotifyEventSource::start(PathCallback callback) {
    if (running_.load()) {
        return Fail<void>(ErrorCode::InvalidState, "Event source already running");
    }

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return Fail<void>(ErrorCode::Configuration, "Watch root is not a directory: " + root_.string());
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        return Fail<void>(ErrorCode::Io, std::string("inotify_init1 failed: ") + std::strerror(errno));
    }

    callback_ = std::move(callback);

    if (auto added = add_watch(root_); added.is_error()) {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
        return added;
    }
    if (recursive_) {
        add_tree(root_, false);
    }

    running_ = true;
    thread_ = std::thread([this]() { watch_loop(); });

    spdlog::info("[Watch] watching {} recursive={} watches={}", root_.string(), recursive_, watch_count());
    return Done();
}

void InotifyEventSource::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (inotify_fd_ >= 0) {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    {
        std::lock_guard lock(mutex_);
        wd_to_path_.clear();
    }
    spdlog::info("[Watch] stopped watching {}", root_.string());
}

std::size_t InotifyEventSource::watch_count() const {
    std::lock_guard lock(mutex_);
    return wd_to_path_.size();
}

Status InotifyEventSource::add_watch(const fs::path& dir) {
    const int wd = inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
    if (wd < 0) {
        const std::string reason = std::strerror(errno);
        spdlog::warn("[Watch] cannot watch {} error={}", dir.string(), reason);
        return Fail<void>(ErrorCode::Io, "inotify_add_watch failed for " + dir.string() + ": " + reason);
    }
    std::lock_guard lock(mutex_);
    wd_to_path_[wd] = dir;
    return Done();
}

void InotifyEventSource::add_tree(const fs::path& dir, bool report_files) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("[Watch] cannot list {} error={}", dir.string(), ec.message());
        return;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("[Watch] listing interrupted under {} error={}", dir.string(), ec.message());
            break;
        }
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            // Failures are logged by add_watch; keep watching the rest
            (void)add_watch(it->path());
        } else if (report_files && it->is_regular_file(type_ec) && callback_) {
            callback_(it->path());
        }
    }
}

void InotifyEventSource::watch_loop() {
    alignas(struct inotify_event) char buffer[64 * 1024];

    while (running_.load()) {
        pollfd pfd{inotify_fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[Watch] poll failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t length = ::read(inotify_fd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            spdlog::error("[Watch] read failed: {}", std::strerror(errno));
            break;
        }

        for (ssize_t offset = 0; offset < length;) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(buffer + offset);
            if (event->mask & IN_Q_OVERFLOW) {
                spdlog::warn("[Watch] event queue overflow, some notifications were lost");
            } else {
                handle_event(event->wd, event->mask, event->len > 0 ? std::string(event->name) : std::string());
            }
            offset += static_cast<ssize_t>(sizeof(struct inotify_event) + event->len);
        }
    }
}

void InotifyEventSource::handle_event(int wd, std::uint32_t mask, const std::string& name) {
    fs::path dir;
    {
        std::lock_guard lock(mutex_);
        auto it = wd_to_path_.find(wd);
        if (it == wd_to_path_.end()) {
            return;
        }
        dir = it->second;
        if (mask & (IN_IGNORED | IN_DELETE_SELF | IN_MOVE_SELF)) {
            if (mask & IN_IGNORED) {
                wd_to_path_.erase(it);
            }
            return;
        }
    }

    if (name.empty()) {
        return;
    }
    const fs::path path = dir / name;

    if (mask & IN_ISDIR) {
        if (recursive_ && (mask & (IN_CREATE | IN_MOVED_TO))) {
            spdlog::debug("[Watch] new directory {}", path.string());
            if (add_watch(path).is_ok()) {
                add_tree(path, true);
            }
        }
        return;
    }

    spdlog::debug("[Watch] event mask={:#x} path={}", mask, path.string());
    if (callback_) {
        callback_(path);
    }
}

} // namespace mip::watch
