#include "mip/core/logging.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

TEST(FormatBytesTest, PicksLargestUnit) {
    EXPECT_EQ(mip::format_bytes(0), "0.0 B");
    EXPECT_EQ(mip::format_bytes(1023), "1023.0 B");
    EXPECT_EQ(mip::format_bytes(1536), "1.5 KB");
    EXPECT_EQ(mip::format_bytes(700ull * 1024 * 1024), "700.0 MB");
    EXPECT_EQ(mip::format_bytes(3ull * 1024 * 1024 * 1024 * 1024 * 1024), "3072.0 TB");
}

TEST(InitLoggingTest, CreatesLogFileAndInstallsLogger) {
    const fs::path dir = fs::temp_directory_path() / "mip_logging_test";
    fs::remove_all(dir);

    mip::LoggingConfig config;
    config.level = "debug";
    config.file = (dir / "logs" / "mipd.log").string();

    auto status = mip::init_logging(config);
    ASSERT_TRUE(status.is_ok()) << status.error().message;
    EXPECT_EQ(spdlog::default_logger()->name(), "mip");

    spdlog::warn("written to file");
    spdlog::default_logger()->flush();
    EXPECT_TRUE(fs::exists(config.file));
    EXPECT_GT(fs::file_size(config.file), 0u);

    mip::shutdown_logging();
}
