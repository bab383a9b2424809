#include "mip/ingest/transfer.hpp"

#include "mip/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace mip::ingest {
namespace fs = std::filesystem;

namespace {

constexpr std::uint64_t kProgressInterval = 100ULL * 1024 * 1024;

std::atomic<std::uint64_t> temp_sequence{0};

// Serializes check-then-rename on filesystems without hard links
std::mutex rename_fallback_mutex;

Status destination_taken(const fs::path& final_path) {
    return Fail<void>(ErrorCode::DestinationExists, "Destination already exists: " + final_path.string());
}

} // namespace

TransferOptions TransferOptions::from_config(const DestinationConfig& config) {
    TransferOptions options;
    options.chunk_size = config.chunk_size;
    options.max_attempts = config.max_attempts;
    options.backoff_base = config.backoff_base;
    options.temp_suffix = config.temp_suffix;
    if (config.verify_mount) {
        options.share_root = fs::path(config.mount_path);
    }
    return options;
}

TransferEngine::TransferEngine(TransferOptions options)
    : options_(std::move(options)),
      sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = TransferOptions::kDefaultChunkSize;
    }
    if (options_.max_attempts == 0) {
        options_.max_attempts = 1;
    }
}

Outcome<std::string> TransferEngine::copy(const fs::path& source,
                                          const fs::path& destination_dir,
                                          const std::string& filename) {
    if (auto probe = probe_share(destination_dir); probe.is_error()) {
        spdlog::error("[Transfer] {}", probe.error().message);
        return Fail<std::string>(probe.error().code, probe.error().message);
    }

    std::error_code ec;
    const auto source_size = fs::file_size(source, ec);
    if (ec) {
        return Fail<std::string>(ErrorCode::Io, "Cannot read source " + source.string() + ": " + ec.message());
    }

    fs::create_directories(destination_dir, ec);
    if (ec && !fs::is_directory(destination_dir)) {
        return Fail<std::string>(ErrorCode::Io,
                                 "Failed to create directory " + destination_dir.string() + ": " + ec.message());
    }

    const fs::path final_path = destination_dir / filename;
    const fs::path temp_path = temp_path_for(final_path);

    if (fs::exists(final_path, ec)) {
        spdlog::warn("[Transfer] destination already exists, not replacing path={}", final_path.string());
        const auto taken = destination_taken(final_path);
        return Fail<std::string>(taken.error().code, taken.error().message);
    }

    spdlog::info("[Transfer] copying {} ({}) -> {}", source.filename().string(), format_bytes(source_size),
                 final_path.string());

    std::string last_error;
    for (std::uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        Status step = stream_copy(source, temp_path, source_size);
        if (step.is_ok()) {
            step = verify_copy(source, temp_path);
        }
        if (step.is_ok()) {
            step = publish(temp_path, final_path);
            if (step.is_error() && step.error().code == ErrorCode::DestinationExists) {
                spdlog::warn("[Transfer] name taken during copy path={}", final_path.string());
                discard(temp_path);
                return Fail<std::string>(ErrorCode::DestinationExists, step.error().message);
            }
        }

        if (step.is_ok()) {
            spdlog::info("[Transfer] copied path={} attempts={}", final_path.string(), attempt);
            return Ok<std::string, Error>(final_path.string());
        }

        last_error = step.error().message;
        spdlog::warn("[Transfer] attempt {}/{} failed path={} error={}", attempt, options_.max_attempts,
                     final_path.string(), last_error);
        discard(temp_path);

        if (attempt < options_.max_attempts) {
            sleeper_(options_.backoff_base * (1LL << (attempt - 1)));
        }
    }

    spdlog::error("[Transfer] giving up path={} attempts={}", final_path.string(), options_.max_attempts);
    return Fail<std::string>(ErrorCode::TransferFailed,
                             "Copy failed after " + std::to_string(options_.max_attempts) + " attempts: " + last_error);
}

Status TransferEngine::delete_source(const fs::path& source) const {
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        spdlog::warn("[Transfer] source already gone path={}", source.string());
        return Fail<void>(ErrorCode::NotFound, "Source file not found: " + source.string());
    }
    if (!fs::remove(source, ec) || ec) {
        spdlog::error("[Transfer] failed to delete source path={} error={}", source.string(), ec.message());
        return Fail<void>(ErrorCode::Io, "Failed to delete " + source.string() + ": " + ec.message());
    }
    spdlog::info("[Transfer] deleted source path={}", source.string());
    return Done();
}

Status TransferEngine::verify_copy(const fs::path& source, const fs::path& temp) const {
    std::error_code ec;
    const auto source_size = fs::file_size(source, ec);
    if (ec) {
        return Fail<void>(ErrorCode::VerificationFailed, "Cannot stat source: " + ec.message());
    }
    const auto temp_size = fs::file_size(temp, ec);
    if (ec) {
        return Fail<void>(ErrorCode::VerificationFailed, "Cannot stat copy: " + ec.message());
    }
    if (source_size != temp_size) {
        return Fail<void>(ErrorCode::VerificationFailed,
                          "Size mismatch: source=" + std::to_string(source_size) +
                              " copy=" + std::to_string(temp_size));
    }
    return Done();
}

fs::path TransferEngine::temp_path_for(const fs::path& final_path) const {
    const auto sequence = temp_sequence.fetch_add(1);
    return final_path.parent_path() / (final_path.filename().string() + "." + std::to_string(::getpid()) + "-" +
                                       std::to_string(sequence) + options_.temp_suffix);
}

Status TransferEngine::publish(const fs::path& temp, const fs::path& final_path) {
    if (::link(temp.c_str(), final_path.c_str()) == 0) {
        discard(temp);
        return Done();
    }

    const int link_error = errno;
    if (link_error == EEXIST) {
        return destination_taken(final_path);
    }
    if (link_error != EPERM && link_error != EOPNOTSUPP && link_error != ENOSYS) {
        return Fail<void>(ErrorCode::Io, "Publish to final name failed: " + std::string(std::strerror(link_error)));
    }

    // No hard links on this share; only copies from this process can race here
    std::lock_guard lock(rename_fallback_mutex);
    std::error_code ec;
    if (fs::exists(final_path, ec)) {
        return destination_taken(final_path);
    }
    fs::rename(temp, final_path, ec);
    if (ec) {
        return Fail<void>(ErrorCode::Io, "Rename to final name failed: " + ec.message());
    }
    return Done();
}

Status TransferEngine::probe_share(const fs::path& destination_dir) const {
    std::error_code ec;
    fs::path root;
    if (options_.share_root) {
        root = *options_.share_root;
    } else {
        // Destination is created on first use; its parent must already be there
        root = destination_dir;
        if (!fs::exists(root, ec) && root.has_parent_path()) {
            root = root.parent_path();
        }
    }

    if (!fs::is_directory(root, ec)) {
        return Fail<void>(ErrorCode::ShareUnavailable, "Share not accessible: " + root.string());
    }
    fs::directory_iterator listing(root, ec);
    if (ec) {
        return Fail<void>(ErrorCode::ShareUnavailable,
                          "Share not listable: " + root.string() + " (" + ec.message() + ")");
    }
    return Done();
}

Status TransferEngine::stream_copy(const fs::path& source, const fs::path& temp, std::uint64_t source_size) const {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Fail<void>(ErrorCode::Io, "Failed to open source file: " + source.string());
    }
    std::ofstream output(temp, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Fail<void>(ErrorCode::Io, "Failed to open temp file: " + temp.string());
    }

    std::vector<char> buffer(options_.chunk_size);
    std::uint64_t copied = 0;
    std::uint64_t next_report = kProgressInterval;

    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto bytes_read = input.gcount();
        if (bytes_read <= 0) {
            break;
        }
        output.write(buffer.data(), bytes_read);
        if (!output) {
            return Fail<void>(ErrorCode::Io, "Write failed on " + temp.string());
        }

        copied += static_cast<std::uint64_t>(bytes_read);
        if (copied >= next_report) {
            spdlog::debug("[Transfer] progress {:.1f}% ({} / {})",
                          source_size ? 100.0 * static_cast<double>(copied) / static_cast<double>(source_size) : 100.0,
                          format_bytes(copied), format_bytes(source_size));
            next_report += kProgressInterval;
        }
    }
    if (input.bad()) {
        return Fail<void>(ErrorCode::Io, "Read failed on " + source.string());
    }

    if (auto closed = close_temp(output, temp); closed.is_error()) {
        return closed;
    }

    spdlog::debug("[Transfer] stream complete bytes={}", copied);
    return Done();
}

Status TransferEngine::close_temp(std::ofstream& output, const fs::path& temp) const {
    output.flush();
    if (!output) {
        return Fail<void>(ErrorCode::Io, "Flush failed on " + temp.string());
    }
    // Network shares may report a deferred write error only at close
    output.close();
    if (!output) {
        return Fail<void>(ErrorCode::Io, "Close failed on " + temp.string());
    }
    return Done();
}

void TransferEngine::discard(const fs::path& temp) {
    std::error_code ec;
    fs::remove(temp, ec);
    if (ec) {
        spdlog::warn("[Transfer] could not remove temp file path={} error={}", temp.string(), ec.message());
    }
}

} // namespace mip::ingest
