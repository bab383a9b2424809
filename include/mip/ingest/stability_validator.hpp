#pragma once

#include "mip/core/config.hpp"
#include "mip/ingest/types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mip::ingest {

/**
 * @brief Decides whether a discovered path is a complete, processable file
 *
 * Checks run in order and stop at the first failure:
 * regular file → exclusion glob → supported extension → minimum size →
 * size stable across the configured interval.
 *
 * The stability check sleeps on the calling thread. Call validate() from a
 * worker, never from the thread that delivers filesystem events.
 *
 * A negative answer is not an error: files that are too small, still
 * growing or gone by the time we look are expected and skipped quietly.
 */
class StabilityValidator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit StabilityValidator(WatcherConfig config);

    /**
     * @brief Replace the sleep used between size samples (tests only)
     */
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    std::optional<FileFacts> validate(const std::filesystem::path& path) const;

    bool matches_exclusion(const std::string& filename) const;
    bool has_supported_extension(const std::filesystem::path& path) const;

    const WatcherConfig& config() const noexcept { return config_; }

private:
    bool is_stable(const std::filesystem::path& path, std::uint64_t first_sample) const;

    WatcherConfig config_;
    std::vector<std::string> extensions_;  ///< Lower-cased copy of the supported set
    Sleeper sleeper_;
};

/**
 * @brief Minimal glob: "*suffix", "prefix*" or exact equality
 */
bool glob_match(const std::string& pattern, const std::string& name);

} // namespace mip::ingest
