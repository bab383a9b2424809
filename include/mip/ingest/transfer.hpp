#pragma once

#include "mip/core/config.hpp"
#include "mip/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

namespace mip::ingest {

struct TransferOptions {
    static constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

    std::size_t chunk_size = kDefaultChunkSize;
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds backoff_base{std::chrono::seconds(1)};
    std::string temp_suffix = ".tmp";

    /// Root probed before copying; unset probes the destination directory (or its parent)
    std::optional<std::filesystem::path> share_root;

    static TransferOptions from_config(const DestinationConfig& config);
};

/**
 * @brief Copies a file into a destination directory, all or nothing
 *
 * Bytes go to "<filename>.<pid>-<seq><temp_suffix>" next to the final
 * name, get verified, then are linked into place. Every call writes its
 * own temp file, and publishing never replaces an existing file, so two
 * copies racing for one name cannot overwrite each other: the loser gets
 * DestinationExists. A reader of the destination directory either sees
 * the complete file under its final name or nothing; the temporary file
 * never outlives copy().
 *
 * Verification compares sizes only. Content hashing is not done.
 */
class TransferEngine {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit TransferEngine(TransferOptions options = {});
    virtual ~TransferEngine() = default;

    /**
     * @brief Copy source into destination_dir/filename
     *
     * @return final destination path
     *
     * Errors:
     * - ShareUnavailable: share root missing or not listable (no retry)
     * - TransferFailed: every attempt failed; message carries the last cause
     * - DestinationExists: the final name is taken, before or during the copy (no retry)
     * - Io: source missing, or destination directory cannot be created
     */
    Outcome<std::string> copy(const std::filesystem::path& source,
                              const std::filesystem::path& destination_dir,
                              const std::string& filename);

    /**
     * @brief Remove the source file after a committed disposition
     *
     * Failure is reported, never thrown; callers log it and move on.
     */
    Status delete_source(const std::filesystem::path& source) const;

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    const TransferOptions& options() const noexcept { return options_; }

protected:
    /// Size comparison between the source and the freshly written temp file
    virtual Status verify_copy(const std::filesystem::path& source,
                               const std::filesystem::path& temp) const;

    /// Flush and close the temp file; either one failing fails the attempt
    virtual Status close_temp(std::ofstream& output, const std::filesystem::path& temp) const;

private:
    Status probe_share(const std::filesystem::path& destination_dir) const;
    std::filesystem::path temp_path_for(const std::filesystem::path& final_path) const;
    static Status publish(const std::filesystem::path& temp, const std::filesystem::path& final_path);
    Status stream_copy(const std::filesystem::path& source,
                       const std::filesystem::path& temp,
                       std::uint64_t source_size) const;
    static void discard(const std::filesystem::path& temp);

    TransferOptions options_;
    Sleeper sleeper_;
};

} // namespace mip::ingest
