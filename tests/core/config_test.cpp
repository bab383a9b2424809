#include "mip/core/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using mip::ConfigLoader;
using mip::ErrorCode;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("mip_config_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string minimal_yaml(const fs::path& downloads) {
    return "watcher:\n"
           "  download_folder: " + downloads.string() + "\n"
           "destination:\n"
           "  mount_path: /mnt/nas\n";
}

} // namespace

TEST(ConfigLoaderTest, MinimalDocumentGetsDefaults) {
    const auto downloads = create_temp_dir();

    auto loaded = ConfigLoader::load_string(minimal_yaml(downloads));
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;

    const auto& config = loaded.value();
    EXPECT_EQ(config.watcher.download_folder, downloads.string());
    EXPECT_EQ(config.watcher.min_file_size_mb, 500u);
    EXPECT_EQ(config.watcher.min_file_size_bytes(), 500ull * 1024 * 1024);
    EXPECT_EQ(config.watcher.stable_interval, std::chrono::seconds(30));
    EXPECT_EQ(config.destination.target_directory(), fs::path("/mnt/nas/Movies"));
    EXPECT_EQ(config.renamer.executable_path, "mnamer");
    EXPECT_EQ(config.versioning.format, ".v{number}");
    EXPECT_DOUBLE_EQ(config.versioning.similarity_threshold, 0.9);
    EXPECT_EQ(config.store.backend, mip::StoreBackend::Sqlite);
    EXPECT_EQ(config.api.port, 8080);
    EXPECT_EQ(config.api.approval_workers, 4u);
}

TEST(ConfigLoaderTest, ReadsEverySection) {
    const auto downloads = create_temp_dir();
    const std::string yaml = minimal_yaml(downloads) +
                             "  target_folder: Films\n"
                             "  chunk_size_kb: 64\n"
                             "  backoff_seconds: 0.25\n"
                             "renamer:\n"
                             "  executable_path: /opt/mnamer/bin/mnamer\n"
                             "  timeout_seconds: 5\n"
                             "  extra_args: []\n"
                             "versioning:\n"
                             "  format: \" (v{number})\"\n"
                             "  check_similar: false\n"
                             "store:\n"
                             "  backend: memory\n"
                             "api:\n"
                             "  port: 9090\n"
                             "  approval_workers: 2\n"
                             "logging:\n"
                             "  level: debug\n";

    auto loaded = ConfigLoader::load_string(yaml);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;

    const auto& config = loaded.value();
    EXPECT_EQ(config.destination.target_folder, "Films");
    EXPECT_EQ(config.destination.chunk_size, 64u * 1024);
    EXPECT_EQ(config.destination.backoff_base, std::chrono::milliseconds(250));
    EXPECT_EQ(config.renamer.executable_path, "/opt/mnamer/bin/mnamer");
    EXPECT_EQ(config.renamer.timeout, std::chrono::seconds(5));
    EXPECT_TRUE(config.renamer.extra_args.empty());
    EXPECT_EQ(config.versioning.format, " (v{number})");
    EXPECT_FALSE(config.versioning.check_similar);
    EXPECT_EQ(config.store.backend, mip::StoreBackend::Memory);
    EXPECT_EQ(config.api.port, 9090);
    EXPECT_EQ(config.api.approval_workers, 2u);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(ConfigLoaderTest, MissingDownloadFolderIsRejected) {
    auto loaded = ConfigLoader::load_string("watcher:\n  download_folder: /definitely/not/here\n"
                                            "destination:\n  mount_path: /mnt/nas\n");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::Configuration);
    EXPECT_NE(loaded.error().message.find("does not exist"), std::string::npos);
}

TEST(ConfigLoaderTest, MountPathIsRequired) {
    const auto downloads = create_temp_dir();
    auto loaded = ConfigLoader::load_string("watcher:\n  download_folder: " + downloads.string() + "\n");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::Configuration);
}

TEST(ConfigLoaderTest, VersionFormatNeedsPlaceholder) {
    const auto downloads = create_temp_dir();
    auto loaded = ConfigLoader::load_string(minimal_yaml(downloads) + "versioning:\n  format: \"_v\"\n");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_NE(loaded.error().message.find("{number}"), std::string::npos);
}

TEST(ConfigLoaderTest, WrongValueTypeIsConfigurationError) {
    const auto downloads = create_temp_dir();
    auto loaded = ConfigLoader::load_string(minimal_yaml(downloads) + "api:\n  port: not-a-number\n");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::Configuration);
}

TEST(ConfigLoaderTest, UnknownBackendIsRejected) {
    const auto downloads = create_temp_dir();
    auto loaded = ConfigLoader::load_string(minimal_yaml(downloads) + "store:\n  backend: postgres\n");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_NE(loaded.error().message.find("postgres"), std::string::npos);
}

TEST(ConfigLoaderTest, MalformedYamlIsRejected) {
    auto loaded = ConfigLoader::load_string("watcher: [unclosed\n");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::Configuration);
}

TEST(ConfigLoaderTest, LoadFileReadsFromDisk) {
    const auto dir = create_temp_dir();
    const auto downloads = dir / "downloads";
    fs::create_directories(downloads);
    const auto path = dir / "config.yaml";
    {
        std::ofstream out(path);
        out << minimal_yaml(downloads);
    }

    auto loaded = ConfigLoader::load_file(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;
    EXPECT_EQ(loaded.value().watcher.download_folder, downloads.string());

    auto missing = ConfigLoader::load_file(dir / "absent.yaml");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::Configuration);
}
