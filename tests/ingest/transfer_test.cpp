#include "mip/ingest/transfer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using mip::ErrorCode;
using mip::Status;
using mip::ingest::TransferEngine;
using mip::ingest::TransferOptions;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("mip_transfer_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

fs::path write_source(const fs::path& dir, const std::string& name, const std::string& content) {
    const fs::path path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

// Verification fails for the first `failures` calls
class FlakyVerifyEngine : public TransferEngine {
public:
    FlakyVerifyEngine(TransferOptions options, int failures)
        : TransferEngine(std::move(options)), failures_(failures) {}

    int verify_calls() const { return calls_; }

protected:
    Status verify_copy(const fs::path& source, const fs::path& temp) const override {
        ++calls_;
        if (calls_ <= failures_) {
            return mip::Fail<void>(ErrorCode::VerificationFailed, "simulated mismatch");
        }
        return TransferEngine::verify_copy(source, temp);
    }

private:
    int failures_;
    mutable int calls_ = 0;
};

// Inspects the destination while the temp file is complete but unpublished
class ObservingEngine : public TransferEngine {
public:
    using TransferEngine::TransferEngine;

    std::function<void(const fs::path& temp)> on_verify;

protected:
    Status verify_copy(const fs::path& source, const fs::path& temp) const override {
        if (on_verify) {
            on_verify(temp);
        }
        return TransferEngine::verify_copy(source, temp);
    }
};

// Close reports a deferred write error for the first `failures` calls
class FailingCloseEngine : public TransferEngine {
public:
    FailingCloseEngine(TransferOptions options, int failures)
        : TransferEngine(std::move(options)), failures_(failures) {}

    int close_calls() const { return calls_; }

protected:
    Status close_temp(std::ofstream& output, const fs::path& temp) const override {
        auto closed = TransferEngine::close_temp(output, temp);
        if (++calls_ <= failures_) {
            return mip::Fail<void>(ErrorCode::Io, "Close failed on " + temp.string() + ": Input/output error");
        }
        return closed;
    }

private:
    int failures_;
    mutable int calls_ = 0;
};

std::vector<std::string> entries(const fs::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

TransferOptions small_chunks() {
    TransferOptions options;
    options.chunk_size = 7;
    return options;
}

} // namespace

TEST(TransferEngineTest, CopiesIntoDestinationAndLeavesNoTemp) {
    const auto source_dir = create_temp_dir();
    const auto share = create_temp_dir();
    const auto destination = share / "Movies" / "nested";
    const std::string content = "Lorem ipsum dolor sit amet, consectetur adipiscing elit.";
    const auto source = write_source(source_dir, "raw.mkv", content);

    auto options = small_chunks();
    options.share_root = share;
    TransferEngine engine(options);

    auto copied = engine.copy(source, destination, "Final (2020).mkv");
    ASSERT_TRUE(copied.is_ok()) << copied.error().message;
    EXPECT_EQ(copied.value(), (destination / "Final (2020).mkv").string());
    EXPECT_EQ(read_file(destination / "Final (2020).mkv"), content);
    EXPECT_EQ(entries(destination), std::vector<std::string>{"Final (2020).mkv"});
    EXPECT_TRUE(fs::exists(source));  // copy never removes the source
}

TEST(TransferEngineTest, EmptySourceCopies) {
    const auto source_dir = create_temp_dir();
    const auto destination = create_temp_dir();
    const auto source = write_source(source_dir, "empty.mkv", "");

    TransferEngine engine;
    auto copied = engine.copy(source, destination, "empty.mkv");
    ASSERT_TRUE(copied.is_ok());
    EXPECT_EQ(fs::file_size(destination / "empty.mkv"), 0u);
}

TEST(TransferEngineTest, MissingShareIsNotRetried) {
    const auto source_dir = create_temp_dir();
    const auto source = write_source(source_dir, "raw.mkv", "data");
    const auto share = create_temp_dir() / "unmounted";

    auto options = small_chunks();
    options.share_root = share;
    FlakyVerifyEngine engine(options, 0);
    int sleeps = 0;
    engine.set_sleeper([&](std::chrono::milliseconds) { ++sleeps; });

    auto copied = engine.copy(source, share / "Movies", "x.mkv");
    ASSERT_TRUE(copied.is_error());
    EXPECT_EQ(copied.error().code, ErrorCode::ShareUnavailable);
    EXPECT_EQ(engine.verify_calls(), 0);
    EXPECT_EQ(sleeps, 0);
    EXPECT_FALSE(fs::exists(share / "Movies"));
}

TEST(TransferEngineTest, MissingSourceIsIoError) {
    const auto destination = create_temp_dir();
    TransferEngine engine;

    auto copied = engine.copy(destination / "nope.mkv", destination, "x.mkv");
    ASSERT_TRUE(copied.is_error());
    EXPECT_EQ(copied.error().code, ErrorCode::Io);
}

TEST(TransferEngineTest, RetriesWithExponentialBackoff) {
    const auto source_dir = create_temp_dir();
    const auto destination = create_temp_dir();
    const auto source = write_source(source_dir, "raw.mkv", "payload");

    FlakyVerifyEngine engine(small_chunks(), 2);
    std::vector<std::chrono::milliseconds> delays;
    engine.set_sleeper([&](std::chrono::milliseconds delay) { delays.push_back(delay); });

    auto copied = engine.copy(source, destination, "final.mkv");
    ASSERT_TRUE(copied.is_ok()) << copied.error().message;
    EXPECT_EQ(engine.verify_calls(), 3);
    ASSERT_EQ(delays.size(), 2u);
    EXPECT_EQ(delays[0], std::chrono::seconds(1));
    EXPECT_EQ(delays[1], std::chrono::seconds(2));
    EXPECT_EQ(read_file(destination / "final.mkv"), "payload");
}

TEST(TransferEngineTest, ExhaustedAttemptsLeaveNothingBehind) {
    const auto source_dir = create_temp_dir();
    const auto destination = create_temp_dir();
    const auto source = write_source(source_dir, "raw.mkv", "payload");

    FlakyVerifyEngine engine(small_chunks(), 100);
    engine.set_sleeper([](std::chrono::milliseconds) {});

    auto copied = engine.copy(source, destination, "final.mkv");
    ASSERT_TRUE(copied.is_error());
    EXPECT_EQ(copied.error().code, ErrorCode::TransferFailed);
    EXPECT_NE(copied.error().message.find("simulated mismatch"), std::string::npos);
    EXPECT_EQ(engine.verify_calls(), 3);
    EXPECT_TRUE(entries(destination).empty());
}

TEST(TransferEngineTest, ExistingFinalFileIsNeverReplaced) {
    const auto source_dir = create_temp_dir();
    const auto destination = create_temp_dir();
    const auto source = write_source(source_dir, "raw.mkv", "new content");
    write_source(destination, "final.mkv", "old");

    FlakyVerifyEngine engine(small_chunks(), 0);
    auto copied = engine.copy(source, destination, "final.mkv");
    ASSERT_TRUE(copied.is_error());
    EXPECT_EQ(copied.error().code, ErrorCode::DestinationExists);
    EXPECT_EQ(engine.verify_calls(), 0);
    EXPECT_EQ(read_file(destination / "final.mkv"), "old");
    EXPECT_EQ(entries(destination), std::vector<std::string>{"final.mkv"});
}

TEST(TransferEngineTest, NameTakenDuringCopyIsNotOverwritten) {
    const auto source_dir = create_temp_dir();
    const auto destination = create_temp_dir();
    const auto source = write_source(source_dir, "raw.mkv", "mine");

    ObservingEngine engine(small_chunks());
    int sleeps = 0;
    engine.set_sleeper([&](std::chrono::milliseconds) { ++sleeps; });
    engine.on_verify = [&](const fs::path&) { write_source(destination, "final.mkv", "theirs"); };

    auto copied = engine.copy(source, destination, "final.mkv");
    ASSERT_TRUE(copied.is_error());
    EXPECT_EQ(copied.error().code, ErrorCode::DestinationExists);
    EXPECT_EQ(sleeps, 0);
    EXPECT_EQ(read_file(destination / "final.mkv"), "theirs");
    EXPECT_EQ(entries(destination), std::vector<std::string>{"final.mkv"});
}

TEST(TransferEngineTest, FinalNameAbsentUntilVerified) {
    const auto source_dir = create_temp_dir();
    const auto destination = create_temp_dir();
    const auto source = write_source(source_dir, "raw.mkv", "payload");

    auto options = small_chunks();
    options.temp_suffix = ".partial";
    ObservingEngine engine(options);

    bool final_visible = true;
    std::string temp_name;
    std::uintmax_t temp_size = 0;
    engine.on_verify = [&](const fs::path& temp) {
        final_visible = fs::exists(destination / "final.mkv");
        temp_name = temp.filename().string();
        temp_size = fs::file_size(temp);
    };

    ASSERT_TRUE(engine.copy(source, destination, "final.mkv").is_ok());
    EXPECT_FALSE(final_visible);
    EXPECT_EQ(temp_size, 7u);
    EXPECT_EQ(temp_name.rfind("final.mkv.", 0), 0u);
    ASSERT_GT(temp_name.size(), std::string(".partial").size());
    EXPECT_EQ(temp_name.substr(temp_name.size() - 8), ".partial");
    EXPECT_EQ(entries(destination), std::vector<std::string>{"final.mkv"});
}

TEST(TransferEngineTest, EachCopyWritesItsOwnTempFile) {
    const auto source_dir = create_temp_dir();
    const auto destination = create_temp_dir();
    const auto source = write_source(source_dir, "raw.mkv", "payload");

    ObservingEngine engine(small_chunks());
    std::vector<std::string> temps;
    engine.on_verify = [&](const fs::path& temp) { temps.push_back(temp.filename().string()); };

    ASSERT_TRUE(engine.copy(source, destination, "a.mkv").is_ok());
    fs::remove(destination / "a.mkv");
    ASSERT_TRUE(engine.copy(source, destination, "a.mkv").is_ok());

    ASSERT_EQ(temps.size(), 2u);
    EXPECT_NE(temps[0], temps[1]);
}

TEST(TransferEngineTest, CloseFailureFailsTheAttempt) {
    const auto source_dir = create_temp_dir();
    const auto destination = create_temp_dir();
    const auto source = write_source(source_dir, "raw.mkv", "payload");

    FailingCloseEngine engine(small_chunks(), 1);
    int sleeps = 0;
    engine.set_sleeper([&](std::chrono::milliseconds) { ++sleeps; });

    auto copied = engine.copy(source, destination, "final.mkv");
    ASSERT_TRUE(copied.is_ok()) << copied.error().message;
    EXPECT_EQ(engine.close_calls(), 2);
    EXPECT_EQ(sleeps, 1);
    EXPECT_EQ(entries(destination), std::vector<std::string>{"final.mkv"});

    FailingCloseEngine broken(small_chunks(), 100);
    broken.set_sleeper([](std::chrono::milliseconds) {});
    auto failed = broken.copy(source, destination, "other.mkv");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::TransferFailed);
    EXPECT_NE(failed.error().message.find("Close failed"), std::string::npos);
    EXPECT_EQ(entries(destination), std::vector<std::string>{"final.mkv"});
}

TEST(TransferEngineTest, DeleteSource) {
    const auto dir = create_temp_dir();
    const auto source = write_source(dir, "raw.mkv", "x");
    TransferEngine engine;

    ASSERT_TRUE(engine.delete_source(source).is_ok());
    EXPECT_FALSE(fs::exists(source));

    auto again = engine.delete_source(source);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST(TransferOptionsTest, FromConfig) {
    mip::DestinationConfig config;
    config.mount_path = "/mnt/nas";
    config.chunk_size = 4096;
    config.max_attempts = 5;
    config.temp_suffix = ".partial";

    auto options = TransferOptions::from_config(config);
    EXPECT_EQ(options.chunk_size, 4096u);
    EXPECT_EQ(options.max_attempts, 5u);
    EXPECT_EQ(options.temp_suffix, ".partial");
    ASSERT_TRUE(options.share_root.has_value());
    EXPECT_EQ(*options.share_root, fs::path("/mnt/nas"));

    config.verify_mount = false;
    EXPECT_FALSE(TransferOptions::from_config(config).share_root.has_value());
}
