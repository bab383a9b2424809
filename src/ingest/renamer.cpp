#include "mip/ingest/renamer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <sstream>
#include <system_error>
#include <thread>

namespace mip::ingest {
namespace fs = std::filesystem;
namespace bp = boost::process;

namespace {

constexpr const char* kAsciiArrow = "->";
constexpr const char* kUnicodeArrow = "\xE2\x86\x92";  // U+2192
constexpr const char* kRenamedTo = "renamed to";

std::string trim_chars(const std::string& text, const std::string& chars) {
    const auto first = text.find_first_not_of(chars);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(chars);
    return text.substr(first, last - first + 1);
}

std::string clean_candidate(const std::string& raw) {
    std::string name = trim_chars(raw, " \t\r\n");
    name = trim_chars(name, "\"");
    name = trim_chars(name, "'");
    const auto slash = name.find_last_of('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    return name;
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string describe_command(const std::string& exe, const std::vector<std::string>& args) {
    std::string joined = exe;
    for (const auto& arg : args) {
        joined += ' ';
        joined += arg;
    }
    return joined;
}

} // namespace

std::optional<std::string> parse_renamer_output(const std::string& output) {
    const auto lines = split_lines(output);

    for (const auto& line : lines) {
        const char* arrow = nullptr;
        if (line.find(kAsciiArrow) != std::string::npos) {
            arrow = kAsciiArrow;
        } else if (line.find(kUnicodeArrow) != std::string::npos) {
            arrow = kUnicodeArrow;
        }
        if (arrow == nullptr) {
            continue;
        }
        const auto pos = line.rfind(arrow);
        const auto name = clean_candidate(line.substr(pos + std::char_traits<char>::length(arrow)));
        if (name.empty()) {
            return std::nullopt;
        }
        return name;
    }

    for (const auto& line : lines) {
        const auto pos = lower(line).rfind(kRenamedTo);
        if (pos == std::string::npos) {
            continue;
        }
        const auto name = clean_candidate(line.substr(pos + std::char_traits<char>::length(kRenamedTo)));
        if (name.empty()) {
            return std::nullopt;
        }
        return name;
    }

    return std::nullopt;
}

std::optional<std::string> sanitize_filename(const std::string& name) {
    std::string base = name;
    const auto separator = base.find_last_of("/\\");
    if (separator != std::string::npos) {
        base = base.substr(separator + 1);
    }

    static const std::string forbidden = "<>:\"/\\|?*";
    for (auto& c : base) {
        if (forbidden.find(c) != std::string::npos || static_cast<unsigned char>(c) < 0x20) {
            c = '_';
        }
    }

    base = trim_chars(base, " .");
    if (base.empty()) {
        return std::nullopt;
    }
    return base;
}

ExternalRenamer::ExternalRenamer(RenamerConfig config) : config_(std::move(config)) {}

std::vector<std::string> ExternalRenamer::build_arguments(const fs::path& path) const {
    std::vector<std::string> args;
    if (config_.batch_mode) {
        args.emplace_back("--batch");
    }
    args.emplace_back("--media");
    args.push_back(config_.media_type);
    if (!config_.movie_format.empty()) {
        args.emplace_back("--movie-format");
        args.push_back(config_.movie_format);
    }
    args.insert(args.end(), config_.extra_args.begin(), config_.extra_args.end());
    args.push_back(path.string());
    return args;
}

Outcome<RenameOutcome> ExternalRenamer::rename(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Fail<RenameOutcome>(ErrorCode::RenamerFailed, "File does not exist: " + path.string());
    }
    if (!fs::is_regular_file(path, ec)) {
        return Fail<RenameOutcome>(ErrorCode::RenamerFailed, "Path is not a file: " + path.string());
    }

    boost::filesystem::path exe(config_.executable_path);
    if (exe.filename() == exe) {
        exe = bp::search_path(config_.executable_path);
    }
    if (exe.empty() || !boost::filesystem::exists(exe)) {
        return Fail<RenameOutcome>(ErrorCode::RenamerFailed,
                                   "Renamer executable not found: " + config_.executable_path);
    }

    const auto args = build_arguments(path);
    spdlog::info("[Renamer] running {}", describe_command(exe.string(), args));

    boost::asio::io_context ioc;
    std::future<std::string> output_future;
    bp::child child(bp::exe = exe, bp::args = args,
                    (bp::std_out & bp::std_err) > output_future,
                    bp::std_in < bp::null,
                    ioc, ec);
    if (ec) {
        return Fail<RenameOutcome>(ErrorCode::RenamerFailed,
                                   "Failed to launch renamer " + exe.string() + ": " + ec.message());
    }

    // Pipe EOF normally arrives with process exit; poll the remainder so a
    // child that closed its output early still gets the full budget.
    const auto deadline = std::chrono::steady_clock::now() + config_.timeout;
    ioc.run_until(deadline);
    while (child.running(ec) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (child.running(ec)) {
        child.terminate(ec);
        child.wait(ec);
        spdlog::error("[Renamer] timed out after {} ms path={}", config_.timeout.count(), path.string());
        return Fail<RenameOutcome>(ErrorCode::RenamerFailed, "Renamer timed out for file: " + path.string());
    }
    child.wait(ec);

    if (output_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        // Child exited but a descendant still holds the pipe open
        return Fail<RenameOutcome>(ErrorCode::RenamerFailed, "Renamer output incomplete for file: " + path.string());
    }

    RenameOutcome outcome;
    try {
        outcome.raw_output = output_future.get();
    } catch (const std::exception& e) {
        return Fail<RenameOutcome>(ErrorCode::RenamerFailed, std::string("Failed to read renamer output: ") + e.what());
    }

    const int exit_code = child.exit_code();
    spdlog::debug("[Renamer] exit_code={} output={}", exit_code, outcome.raw_output);

    if (exit_code != 0) {
        return Fail<RenameOutcome>(ErrorCode::RenamerFailed,
                                   "Renamer exited with code " + std::to_string(exit_code) + ": " +
                                       trim_chars(outcome.raw_output, " \t\r\n"));
    }

    const auto parsed = parse_renamer_output(outcome.raw_output);
    const auto sanitized = parsed ? sanitize_filename(*parsed) : std::nullopt;
    if (!sanitized) {
        spdlog::warn("[Renamer] could not parse new filename path={}", path.string());
        return Fail<RenameOutcome>(ErrorCode::RenamerFailed, "Could not parse renamer output for a new filename");
    }

    outcome.new_filename = *sanitized;
    spdlog::info("[Renamer] proposed name {} for {}", outcome.new_filename, path.filename().string());
    return Ok<RenameOutcome, Error>(std::move(outcome));
}

} // namespace mip::ingest
