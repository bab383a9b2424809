#include "mip/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace mip {
namespace {

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("MIP_LOG_LEVEL")) {
        return level;
    }
    return config.level.empty() ? "info" : config.level;
}

} // namespace

Status init_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.file.empty()) {
        std::error_code ec;
        const auto parent = std::filesystem::path(config.file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_size_mb * 1024 * 1024, config.backup_count));
        } catch (const spdlog::spdlog_ex& e) {
            return Fail<void>(ErrorCode::Configuration,
                              "Cannot open log file " + config.file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("mip", sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);

    spdlog::debug("Logging initialized level={} file={}", resolve_level(config),
                  config.file.empty() ? "<none>" : config.file);
    return Done();
}

void shutdown_logging() {
    spdlog::shutdown();
}

std::string format_bytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return oss.str();
}

} // namespace mip
