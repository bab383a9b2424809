#pragma once

#include "mip/core/config.hpp"
#include "mip/core/error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mip::ingest {

struct RenameOutcome {
    std::string new_filename;   ///< Basename only, sanitized
    std::string raw_output;     ///< Combined stdout/stderr, kept for audit
};

/**
 * @brief Proposes a canonical filename for a media file
 *
 * The orchestrator only sees this interface, so the text-scraping contract
 * of the external tool can be swapped for a structured one without
 * touching the workflow.
 */
class Renamer {
public:
    virtual ~Renamer() = default;

    /**
     * @brief Ask for the new filename of the file at path
     *
     * Any failure (missing file, tool not found, non-zero exit, timeout,
     * output without a recognizable new name) is ErrorCode::RenamerFailed.
     */
    virtual Outcome<RenameOutcome> rename(const std::filesystem::path& path) = 0;
};

/**
 * @brief Runs an mnamer-compatible command and scrapes its output
 *
 * Command line: <exe> [--batch] --media <type> [--movie-format <fmt>]
 * <extra args...> <path>, stdin closed, stdout and stderr merged. The child
 * is killed once the configured timeout elapses.
 */
class ExternalRenamer : public Renamer {
public:
    explicit ExternalRenamer(RenamerConfig config);

    Outcome<RenameOutcome> rename(const std::filesystem::path& path) override;

    std::vector<std::string> build_arguments(const std::filesystem::path& path) const;

private:
    RenamerConfig config_;
};

/**
 * @brief Extract the proposed filename from renamer output
 *
 * The first line holding "->" or "→" wins and the text after its last
 * arrow is taken. Failing that, the first line containing "renamed to"
 * (any case) and the text after it. Surrounding whitespace and quotes are
 * trimmed and only the basename is kept.
 */
std::optional<std::string> parse_renamer_output(const std::string& output);

/**
 * @brief Make a proposed name safe to create in the destination directory
 *
 * Keeps the basename, replaces <>:"/\|?* and control characters with '_',
 * strips leading and trailing spaces and dots. Empty result is nullopt.
 */
std::optional<std::string> sanitize_filename(const std::string& name);

} // namespace mip::ingest
