#include "mip/core/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <system_error>

namespace mip {
namespace fs = std::filesystem;

namespace {

template<typename T>
void read(const YAML::Node& section, const char* key, T& out) {
    if (section && section[key]) {
        out = section[key].template as<T>();
    }
}

void read_ms(const YAML::Node& section, const char* key, std::chrono::milliseconds& out) {
    if (section && section[key]) {
        const double seconds = section[key].as<double>();
        out = std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
    }
}

StoreBackend parse_backend(const std::string& text) {
    if (text == "memory") {
        return StoreBackend::Memory;
    }
    if (text == "sqlite") {
        return StoreBackend::Sqlite;
    }
    throw YAML::Exception(YAML::Mark::null_mark(), "store.backend must be 'sqlite' or 'memory', got '" + text + "'");
}

Config from_yaml(const YAML::Node& root) {
    Config config;

    const auto watcher = root["watcher"];
    read(watcher, "download_folder", config.watcher.download_folder);
    read(watcher, "watch_recursive", config.watcher.watch_recursive);
    read(watcher, "min_file_size_mb", config.watcher.min_file_size_mb);
    read_ms(watcher, "stable_time_seconds", config.watcher.stable_interval);
    read(watcher, "supported_extensions", config.watcher.supported_extensions);
    read(watcher, "exclude_patterns", config.watcher.exclude_patterns);
    read(watcher, "workers", config.watcher.workers);
    read(watcher, "scan_on_start", config.watcher.scan_on_start);

    const auto destination = root["destination"];
    read(destination, "mount_path", config.destination.mount_path);
    read(destination, "target_folder", config.destination.target_folder);
    read(destination, "verify_mount", config.destination.verify_mount);
    if (destination && destination["chunk_size_kb"]) {
        config.destination.chunk_size = destination["chunk_size_kb"].as<std::size_t>() * 1024;
    }
    read(destination, "max_attempts", config.destination.max_attempts);
    read_ms(destination, "backoff_seconds", config.destination.backoff_base);
    read(destination, "temp_suffix", config.destination.temp_suffix);

    const auto renamer = root["renamer"];
    read(renamer, "executable_path", config.renamer.executable_path);
    read(renamer, "batch_mode", config.renamer.batch_mode);
    read(renamer, "media_type", config.renamer.media_type);
    read(renamer, "movie_format", config.renamer.movie_format);
    read(renamer, "extra_args", config.renamer.extra_args);
    read_ms(renamer, "timeout_seconds", config.renamer.timeout);

    const auto versioning = root["versioning"];
    read(versioning, "enabled", config.versioning.enabled);
    read(versioning, "format", config.versioning.format);
    read(versioning, "check_similar", config.versioning.check_similar);
    read(versioning, "similarity_threshold", config.versioning.similarity_threshold);

    const auto store = root["store"];
    if (store && store["backend"]) {
        config.store.backend = parse_backend(store["backend"].as<std::string>());
    }
    read(store, "path", config.store.path);

    const auto api = root["api"];
    read(api, "host", config.api.host);
    read(api, "port", config.api.port);
    read(api, "threads", config.api.threads);
    read(api, "approval_workers", config.api.approval_workers);

    const auto logging = root["logging"];
    read(logging, "level", config.logging.level);
    read(logging, "file", config.logging.file);
    read(logging, "max_size_mb", config.logging.max_size_mb);
    read(logging, "backup_count", config.logging.backup_count);
    read(logging, "pattern", config.logging.pattern);

    return config;
}

Outcome<Config> parse_and_validate(const YAML::Node& root) {
    Config config;
    try {
        config = from_yaml(root);
    } catch (const YAML::Exception& e) {
        return Fail<Config>(ErrorCode::Configuration, std::string("Invalid configuration value: ") + e.what());
    }

    if (auto valid = ConfigLoader::validate(config); valid.is_error()) {
        return Fail<Config>(valid.error().code, valid.error().message);
    }
    return Ok<Config, Error>(std::move(config));
}

} // namespace

Outcome<Config> ConfigLoader::load_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Fail<Config>(ErrorCode::Configuration, "Config file not found: " + path.string());
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Fail<Config>(ErrorCode::Configuration, "Failed to load YAML config " + path.string() + ": " + e.what());
    }
    return parse_and_validate(root);
}

Outcome<Config> ConfigLoader::load_string(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Fail<Config>(ErrorCode::Configuration, std::string("Failed to parse YAML config: ") + e.what());
    }
    return parse_and_validate(root);
}

std::optional<fs::path> ConfigLoader::find_default() {
    std::vector<fs::path> candidates{"config/config.yaml", "/etc/mip/config.yaml"};
    if (const char* home = std::getenv("HOME")) {
        candidates.push_back(fs::path(home) / ".config" / "mip" / "config.yaml");
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

Status ConfigLoader::validate(const Config& config) {
    std::error_code ec;

    if (config.watcher.download_folder.empty()) {
        return Fail<void>(ErrorCode::Configuration, "watcher.download_folder is required");
    }
    if (!fs::exists(config.watcher.download_folder, ec)) {
        return Fail<void>(ErrorCode::Configuration, "Download folder does not exist: " + config.watcher.download_folder);
    }
    if (!fs::is_directory(config.watcher.download_folder, ec)) {
        return Fail<void>(ErrorCode::Configuration, "Download folder is not a directory: " + config.watcher.download_folder);
    }
    if (config.watcher.workers == 0) {
        return Fail<void>(ErrorCode::Configuration, "watcher.workers must be > 0");
    }
    if (config.watcher.supported_extensions.empty()) {
        return Fail<void>(ErrorCode::Configuration, "watcher.supported_extensions must not be empty");
    }

    if (config.destination.mount_path.empty()) {
        return Fail<void>(ErrorCode::Configuration, "destination.mount_path is required");
    }
    if (config.destination.chunk_size == 0) {
        return Fail<void>(ErrorCode::Configuration, "destination.chunk_size_kb must be > 0");
    }
    if (config.destination.max_attempts == 0) {
        return Fail<void>(ErrorCode::Configuration, "destination.max_attempts must be > 0");
    }
    if (config.destination.temp_suffix.empty()) {
        return Fail<void>(ErrorCode::Configuration, "destination.temp_suffix must not be empty");
    }

    if (config.renamer.executable_path.empty()) {
        return Fail<void>(ErrorCode::Configuration, "renamer.executable_path is required");
    }
    if (config.renamer.timeout.count() <= 0) {
        return Fail<void>(ErrorCode::Configuration, "renamer.timeout_seconds must be > 0");
    }

    if (config.versioning.format.find("{number}") == std::string::npos) {
        return Fail<void>(ErrorCode::Configuration, "versioning.format must contain {number}");
    }
    if (config.versioning.similarity_threshold <= 0.0 || config.versioning.similarity_threshold > 1.0) {
        return Fail<void>(ErrorCode::Configuration, "versioning.similarity_threshold must be in (0, 1]");
    }

    if (config.store.backend == StoreBackend::Sqlite && config.store.path.empty()) {
        return Fail<void>(ErrorCode::Configuration, "store.path is required for the sqlite backend");
    }
    if (config.api.threads == 0) {
        return Fail<void>(ErrorCode::Configuration, "api.threads must be > 0");
    }
    if (config.api.approval_workers == 0) {
        return Fail<void>(ErrorCode::Configuration, "api.approval_workers must be > 0");
    }

    return Done();
}

} // namespace mip
