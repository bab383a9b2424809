#include "mip/ingest/stability_validator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>
#include <thread>

namespace mip::ingest {
namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::time_t to_time_t(fs::file_time_type time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        time - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(system_time);
}

} // namespace

bool glob_match(const std::string& pattern, const std::string& name) {
    if (pattern.empty()) {
        return false;
    }
    if (pattern.front() == '*') {
        return ends_with(name, pattern.substr(1));
    }
    if (pattern.back() == '*') {
        return name.compare(0, pattern.size() - 1, pattern, 0, pattern.size() - 1) == 0 &&
               name.size() >= pattern.size() - 1;
    }
    return pattern == name;
}

StabilityValidator::StabilityValidator(WatcherConfig config)
    : config_(std::move(config)),
      sleeper_([](std::chrono::milliseconds interval) { std::this_thread::sleep_for(interval); }) {
    extensions_.reserve(config_.supported_extensions.size());
    for (const auto& ext : config_.supported_extensions) {
        extensions_.push_back(to_lower(ext));
    }
}

bool StabilityValidator::matches_exclusion(const std::string& filename) const {
    return std::any_of(config_.exclude_patterns.begin(), config_.exclude_patterns.end(),
                       [&](const std::string& pattern) { return glob_match(pattern, filename); });
}

bool StabilityValidator::has_supported_extension(const fs::path& path) const {
    const auto ext = to_lower(path.extension().string());
    if (ext.empty()) {
        return false;
    }
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

std::optional<FileFacts> StabilityValidator::validate(const fs::path& path) const {
    std::error_code ec;

    // status() follows symlinks; a loop or dangling link reports an error
    const auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        spdlog::debug("[Validate] not a regular file path={}", path.string());
        return std::nullopt;
    }

    const std::string filename = path.filename().string();
    if (matches_exclusion(filename)) {
        spdlog::debug("[Validate] excluded by pattern path={}", path.string());
        return std::nullopt;
    }

    if (!has_supported_extension(path)) {
        spdlog::debug("[Validate] unsupported extension path={}", path.string());
        return std::nullopt;
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        spdlog::debug("[Validate] size unavailable path={} error={}", path.string(), ec.message());
        return std::nullopt;
    }
    if (size < config_.min_file_size_bytes()) {
        spdlog::debug("[Validate] too small path={} size={} min={}", path.string(), size,
                      config_.min_file_size_bytes());
        return std::nullopt;
    }

    if (!is_stable(path, size)) {
        spdlog::debug("[Validate] still being written path={}", path.string());
        return std::nullopt;
    }

    const auto write_time = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }

    FileFacts facts;
    facts.path = path.string();
    facts.filename = filename;
    facts.size = size;
    facts.extension = path.extension().string();
    facts.modified_time = to_time_t(write_time);

    spdlog::info("[Validate] passed path={} size={}", facts.path, facts.size);
    return facts;
}

bool StabilityValidator::is_stable(const fs::path& path, std::uint64_t first_sample) const {
    sleeper_(config_.stable_interval);

    std::error_code ec;
    const auto second_sample = fs::file_size(path, ec);
    if (ec) {
        return false;
    }
    return first_sample == second_sample;
}

} // namespace mip::ingest
