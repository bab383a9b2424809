#pragma once

#include "mip/core/config.hpp"

#include <cstdint>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace mip::ingest {

struct Resolution {
    std::string filename;
    std::uint32_t version = 1;
};

/**
 * @brief Picks a collision-free destination filename for a candidate
 *
 * Base names are compared with the extension and any trailing version
 * suffix removed. A match is either equal ignoring case or, with
 * similarity enabled, at least similarity_threshold alike. The new file
 * gets the version after the highest one found among the matches.
 *
 * A destination that cannot be listed is treated as empty. This keeps
 * approvals moving during a transient unmount at the cost of possibly
 * reusing a name; the transfer engine will warn if that happens.
 */
class VersionResolver {
public:
    explicit VersionResolver(VersioningConfig config);

    Resolution resolve(const std::string& candidate, const std::filesystem::path& destination_dir) const;

    /**
     * @brief Resolve against an explicit listing of destination filenames
     */
    Resolution resolve_against(const std::string& candidate, const std::vector<std::string>& existing) const;

    std::string base_name(const std::string& filename) const;

    /// Version encoded at the end of the stem, 1 when there is none
    std::uint32_t extract_version(const std::string& filename) const;

    /// "Name.ext" -> "Name<suffix for version>.ext"
    std::string add_suffix(const std::string& filename, std::uint32_t version) const;

    const VersioningConfig& config() const noexcept { return config_; }

private:
    std::vector<std::string> list_destination(const std::filesystem::path& destination_dir) const;
    bool matches(const std::string& candidate_base, const std::string& existing_base) const;

    VersioningConfig config_;
    std::regex suffix_pattern_;   ///< Template anchored at end of stem, number captured
};

/**
 * @brief Ratcliff/Obershelp similarity: 2*M / (|a| + |b|)
 *
 * M is the total length of the matching blocks found by taking the longest
 * common substring and recursing on both sides of it. Two empty strings
 * are identical (1.0). Comparison is byte-wise and case-sensitive; callers
 * lower-case first when they want otherwise.
 */
double similarity_ratio(const std::string& a, const std::string& b);

} // namespace mip::ingest
