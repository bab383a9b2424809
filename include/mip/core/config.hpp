#pragma once

#include "mip/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mip {

struct WatcherConfig {
    std::string download_folder;
    bool watch_recursive = true;
    std::uint64_t min_file_size_mb = 500;
    std::chrono::milliseconds stable_interval{std::chrono::seconds(30)};
    std::vector<std::string> supported_extensions{".mkv", ".mp4", ".avi", ".m4v", ".mov", ".wmv", ".flv"};
    std::vector<std::string> exclude_patterns{"*.part", "*.tmp", "*.downloading"};
    std::size_t workers = 4;
    bool scan_on_start = true;

    std::uint64_t min_file_size_bytes() const { return min_file_size_mb * 1024 * 1024; }
};

struct DestinationConfig {
    std::string mount_path;
    std::string target_folder = "Movies";
    bool verify_mount = true;
    std::size_t chunk_size = 1024 * 1024;
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds backoff_base{std::chrono::seconds(1)};
    std::string temp_suffix = ".tmp";

    std::filesystem::path target_directory() const {
        return std::filesystem::path(mount_path) / target_folder;
    }
};

struct RenamerConfig {
    std::string executable_path = "mnamer";
    bool batch_mode = true;
    std::string media_type = "movie";
    std::string movie_format = "{name} ({year})";
    std::vector<std::string> extra_args{"--no-cache"};
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};
};

struct VersioningConfig {
    bool enabled = true;
    std::string format = ".v{number}";
    bool check_similar = true;
    double similarity_threshold = 0.9;
};

enum class StoreBackend {
    Sqlite,
    Memory
};

struct StoreConfig {
    StoreBackend backend = StoreBackend::Sqlite;
    std::string path = "/var/lib/mip/mip.db";
};

struct ApiConfig {
    std::string host = "0.0.0.0";
    std::uint16_t port = 8080;
    std::size_t threads = 2;
    std::size_t approval_workers = 4;  ///< Approvals run here, off the io threads
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;                 ///< Empty disables the file sink
    std::size_t max_size_mb = 10;
    std::size_t backup_count = 5;
    std::string pattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";
};

/**
 * @brief Root configuration for the daemon
 *
 * Loaded from YAML; every section except watcher.download_folder and
 * destination.mount_path has usable defaults.
 */
struct Config {
    WatcherConfig watcher;
    DestinationConfig destination;
    RenamerConfig renamer;
    VersioningConfig versioning;
    StoreConfig store;
    ApiConfig api;
    LoggingConfig logging;
};

class ConfigLoader {
public:
    /**
     * @brief Parse and validate a YAML document from disk
     *
     * Returns ErrorCode::Configuration for unreadable files, malformed YAML,
     * wrong value types, or values that fail validation.
     */
    static Outcome<Config> load_file(const std::filesystem::path& path);

    /**
     * @brief Same as load_file, from in-memory YAML text
     */
    static Outcome<Config> load_string(const std::string& yaml_text);

    /**
     * @brief First existing file among the standard locations
     *
     * config/config.yaml, /etc/mip/config.yaml, $HOME/.config/mip/config.yaml
     */
    static std::optional<std::filesystem::path> find_default();

    static Status validate(const Config& config);
};

} // namespace mip
