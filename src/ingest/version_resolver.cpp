#include "mip/ingest/version_resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <system_error>
#include <tuple>

namespace mip::ingest {
namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string escape_regex(const std::string& literal) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (char c : literal) {
        if (special.find(c) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

std::regex build_suffix_pattern(const std::string& format) {
    const auto pos = format.find("{number}");
    const std::string prefix = format.substr(0, pos);
    const std::string suffix = pos == std::string::npos ? "" : format.substr(pos + 8);
    return std::regex(escape_regex(prefix) + "([0-9]+)" + escape_regex(suffix) + "$");
}

// (start in a, start in b, length) of the longest common block in the
// given ranges. Ties go to the earliest start in a, then in b.
std::tuple<std::size_t, std::size_t, std::size_t> longest_match(
    const std::string& a, std::size_t alo, std::size_t ahi,
    const std::string& b, std::size_t blo, std::size_t bhi) {

    std::size_t best_i = alo;
    std::size_t best_j = blo;
    std::size_t best_size = 0;

    // run[j + 1] = length of the common run ending at a[i], b[j]
    std::vector<std::size_t> run(bhi - blo + 1, 0);
    std::vector<std::size_t> next(bhi - blo + 1, 0);

    for (std::size_t i = alo; i < ahi; ++i) {
        std::fill(next.begin(), next.end(), 0);
        for (std::size_t j = blo; j < bhi; ++j) {
            if (a[i] != b[j]) {
                continue;
            }
            const std::size_t k = run[j - blo] + 1;
            next[j - blo + 1] = k;
            if (k > best_size) {
                best_i = i + 1 - k;
                best_j = j + 1 - k;
                best_size = k;
            }
        }
        std::swap(run, next);
    }
    return {best_i, best_j, best_size};
}

std::size_t matched_characters(const std::string& a, const std::string& b) {
    struct Range {
        std::size_t alo, ahi, blo, bhi;
    };

    std::size_t total = 0;
    std::vector<Range> stack{{0, a.size(), 0, b.size()}};
    while (!stack.empty()) {
        const Range r = stack.back();
        stack.pop_back();

        const auto [i, j, k] = longest_match(a, r.alo, r.ahi, b, r.blo, r.bhi);
        if (k == 0) {
            continue;
        }
        total += k;
        if (r.alo < i && r.blo < j) {
            stack.push_back({r.alo, i, r.blo, j});
        }
        if (i + k < r.ahi && j + k < r.bhi) {
            stack.push_back({i + k, r.ahi, j + k, r.bhi});
        }
    }
    return total;
}

} // namespace

double similarity_ratio(const std::string& a, const std::string& b) {
    const std::size_t length = a.size() + b.size();
    if (length == 0) {
        return 1.0;
    }
    return 2.0 * static_cast<double>(matched_characters(a, b)) / static_cast<double>(length);
}

VersionResolver::VersionResolver(VersioningConfig config)
    : config_(std::move(config)),
      suffix_pattern_(build_suffix_pattern(config_.format)) {}

std::string VersionResolver::base_name(const std::string& filename) const {
    const std::string stem = fs::path(filename).stem().string();
    return trim(std::regex_replace(stem, suffix_pattern_, ""));
}

std::uint32_t VersionResolver::extract_version(const std::string& filename) const {
    const std::string stem = fs::path(filename).stem().string();
    std::smatch match;
    if (!std::regex_search(stem, match, suffix_pattern_)) {
        return 1;
    }
    try {
        const unsigned long parsed = std::stoul(match[1].str());
        return parsed == 0 ? 1 : static_cast<std::uint32_t>(parsed);
    } catch (const std::out_of_range&) {
        return 1;
    }
}

std::string VersionResolver::add_suffix(const std::string& filename, std::uint32_t version) const {
    const fs::path path(filename);
    std::string rendered = config_.format;
    rendered.replace(rendered.find("{number}"), 8, std::to_string(version));
    return path.stem().string() + rendered + path.extension().string();
}

bool VersionResolver::matches(const std::string& candidate_base, const std::string& existing_base) const {
    const std::string lhs = to_lower(candidate_base);
    const std::string rhs = to_lower(existing_base);
    if (lhs == rhs) {
        return true;
    }
    if (!config_.check_similar) {
        return false;
    }
    const double ratio = similarity_ratio(lhs, rhs);
    if (ratio >= config_.similarity_threshold) {
        spdlog::debug("[Version] similar name candidate={} existing={} ratio={:.2f}",
                      candidate_base, existing_base, ratio);
        return true;
    }
    return false;
}

Resolution VersionResolver::resolve_against(const std::string& candidate,
                                            const std::vector<std::string>& existing) const {
    const std::string candidate_base = base_name(candidate);

    bool found = false;
    std::uint32_t highest = 0;
    for (const auto& name : existing) {
        if (!matches(candidate_base, base_name(name))) {
            continue;
        }
        found = true;
        highest = std::max(highest, extract_version(name));
    }

    if (!found) {
        return Resolution{candidate, 1};
    }
    const std::uint32_t next = highest + 1;
    return Resolution{add_suffix(candidate, next), next};
}

Resolution VersionResolver::resolve(const std::string& candidate, const fs::path& destination_dir) const {
    if (!config_.enabled) {
        return Resolution{candidate, 1};
    }

    auto resolution = resolve_against(candidate, list_destination(destination_dir));
    if (resolution.version > 1) {
        spdlog::info("[Version] existing versions found candidate={} final={} version={}",
                     candidate, resolution.filename, resolution.version);
    } else {
        spdlog::debug("[Version] no existing versions candidate={}", candidate);
    }
    return resolution;
}

std::vector<std::string> VersionResolver::list_destination(const fs::path& destination_dir) const {
    std::vector<std::string> names;
    std::error_code ec;

    if (!fs::exists(destination_dir, ec)) {
        spdlog::warn("[Version] destination missing, assuming empty dir={}", destination_dir.string());
        return names;
    }

    fs::directory_iterator it(destination_dir, ec);
    if (ec) {
        spdlog::warn("[Version] destination unreadable, assuming empty dir={} error={}",
                     destination_dir.string(), ec.message());
        return names;
    }

    while (it != fs::directory_iterator()) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            names.push_back(it->path().filename().string());
        }
        it.increment(ec);
        if (ec) {
            spdlog::warn("[Version] listing interrupted dir={} error={}", destination_dir.string(), ec.message());
            break;
        }
    }
    return names;
}

} // namespace mip::ingest
