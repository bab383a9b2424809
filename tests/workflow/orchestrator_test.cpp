#include "mip/workflow/orchestrator.hpp"
#include "mip/store/memory_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using mip::ErrorCode;
using mip::Outcome;
using mip::Status;
using mip::ingest::RenameOutcome;
using mip::ingest::Renamer;
using mip::ingest::TransferEngine;
using mip::ingest::TransferOptions;
using mip::ingest::VersionResolver;
using mip::store::Disposition;
using mip::store::MemoryRecordStore;
using mip::store::PendingRecord;
using mip::store::RecordStatus;
using mip::workflow::ActionResult;
using mip::workflow::Orchestrator;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("mip_workflow_test_" + std::to_string(counter.fetch_add(1)));
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

class FakeRenamer : public Renamer {
public:
    Outcome<RenameOutcome> rename(const fs::path& path) override {
        ++calls;
        if (on_call) {
            on_call();
        }
        if (fail) {
            return mip::Fail<RenameOutcome>(ErrorCode::RenamerFailed, "No match found for " + path.filename().string());
        }
        return mip::Ok<RenameOutcome, mip::Error>(RenameOutcome{proposed, path.filename().string() + " -> " + proposed});
    }

    std::string proposed = "Inception (2010).mkv";
    bool fail = false;
    std::function<void()> on_call;
    std::atomic<int> calls{0};
};

class BrokenVerifyEngine : public TransferEngine {
public:
    using TransferEngine::TransferEngine;

protected:
    Status verify_copy(const fs::path&, const fs::path&) const override {
        return mip::Fail<void>(ErrorCode::VerificationFailed, "size mismatch");
    }
};

// Holds the first two verifications until both copies have written their bytes
class RendezvousEngine : public TransferEngine {
public:
    using TransferEngine::TransferEngine;

protected:
    Status verify_copy(const fs::path& source, const fs::path& temp) const override {
        {
            std::unique_lock lock(mutex_);
            ++arrivals_;
            cv_.notify_all();
            cv_.wait_for(lock, std::chrono::seconds(5), [this]() { return arrivals_ >= 2; });
        }
        return TransferEngine::verify_copy(source, temp);
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable int arrivals_ = 0;
};

ErrorCode code_of(const ActionResult& result) {
    EXPECT_TRUE(result.error_code.has_value());
    return result.error_code.value_or(ErrorCode::Store);
}

TransferOptions quick_options() {
    TransferOptions options;
    options.backoff_base = std::chrono::milliseconds(0);
    return options;
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        downloads = create_temp_dir();
        destination = create_temp_dir() / "Movies";
        orchestrator = std::make_unique<Orchestrator>(store, renamer, transfer, VersionResolver(mip::VersioningConfig{}),
                                                      destination);
    }

    std::int64_t add_download(const std::string& name, const std::string& content = "movie bytes") {
        const fs::path path = downloads / name;
        {
            std::ofstream out(path, std::ios::binary);
            out << content;
        }
        PendingRecord draft;
        draft.source_path = path.string();
        draft.filename = name;
        draft.size_bytes = content.size();
        draft.detected_at = mip::ingest::Clock::now();
        draft.side_metadata = "{}";
        auto inserted = store.insert_pending(draft);
        EXPECT_TRUE(inserted.is_ok());
        return inserted.value().id;
    }

    fs::path downloads;
    fs::path destination;
    MemoryRecordStore store;
    FakeRenamer renamer;
    TransferEngine transfer{quick_options()};
    std::unique_ptr<Orchestrator> orchestrator;
};

TEST_F(OrchestratorTest, ApproveCopiesAndRecordsHistory) {
    const auto id = add_download("inception.2010.1080p.mkv");

    auto result = orchestrator->approve(id);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.original_filename, "inception.2010.1080p.mkv");
    EXPECT_EQ(result.final_filename.value_or(""), "Inception (2010).mkv");
    EXPECT_EQ(result.final_path.value_or(""), (destination / "Inception (2010).mkv").string());
    EXPECT_EQ(result.version_number, 1u);

    EXPECT_EQ(read_file(destination / "Inception (2010).mkv"), "movie bytes");
    EXPECT_TRUE(fs::exists(downloads / "inception.2010.1080p.mkv"));
    EXPECT_EQ(store.get_pending(id).error().code, ErrorCode::NotFound);

    auto history = orchestrator->list_history();
    ASSERT_TRUE(history.is_ok());
    ASSERT_EQ(history.value().size(), 1u);
    EXPECT_EQ(history.value()[0].action, Disposition::Approved);
    EXPECT_EQ(history.value()[0].renamer_output, "inception.2010.1080p.mkv -> Inception (2010).mkv");
}

TEST_F(OrchestratorTest, ApproveWithDeleteSourceRemovesDownload) {
    const auto id = add_download("inception.mkv");

    auto result = orchestrator->approve(id, true);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_FALSE(fs::exists(downloads / "inception.mkv"));
}

TEST_F(OrchestratorTest, ExistingTitleGetsNextVersion) {
    fs::create_directories(destination);
    {
        std::ofstream out(destination / "Inception (2010).mkv");
        out << "first";
    }

    const auto id = add_download("inception.remux.mkv", "second");
    auto result = orchestrator->approve(id);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.final_filename.value_or(""), "Inception (2010).v2.mkv");
    EXPECT_EQ(result.version_number, 2u);
    EXPECT_EQ(read_file(destination / "Inception (2010).mkv"), "first");
    EXPECT_EQ(read_file(destination / "Inception (2010).v2.mkv"), "second");
}

TEST_F(OrchestratorTest, RenamerFailureMarksRecordFailed) {
    const auto id = add_download("mystery.mkv");
    renamer.fail = true;

    auto result = orchestrator->approve(id);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(code_of(result), ErrorCode::RenamerFailed);
    EXPECT_NE(result.error.find("No match found"), std::string::npos);

    auto record = store.get_pending(id);
    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().status, RecordStatus::Failed);
    EXPECT_EQ(record.value().error_message.value_or(""), result.error);
    EXPECT_FALSE(fs::exists(destination));

    auto failed = orchestrator->list_failed();
    ASSERT_TRUE(failed.is_ok());
    ASSERT_EQ(failed.value().size(), 1u);

    // A failed record needs a resubmit before it can be approved again
    auto blocked = orchestrator->approve(id);
    EXPECT_FALSE(blocked.success);
    EXPECT_EQ(code_of(blocked), ErrorCode::InvalidState);
    EXPECT_NE(blocked.error.find("not pending"), std::string::npos);

    auto resubmitted = orchestrator->resubmit(id);
    ASSERT_TRUE(resubmitted.success) << resubmitted.error;
    renamer.fail = false;

    auto retried = orchestrator->approve(id);
    EXPECT_TRUE(retried.success) << retried.error;
}

TEST_F(OrchestratorTest, TransferFailureMarksRecordFailed) {
    BrokenVerifyEngine broken(quick_options());
    Orchestrator failing(store, renamer, broken, VersionResolver(mip::VersioningConfig{}), destination);
    const auto id = add_download("inception.mkv");

    auto result = failing.approve(id);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(code_of(result), ErrorCode::TransferFailed);

    auto record = store.get_pending(id);
    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().status, RecordStatus::Failed);
    EXPECT_TRUE(fs::is_empty(destination));
    EXPECT_TRUE(fs::exists(downloads / "inception.mkv"));
}

TEST_F(OrchestratorTest, UnknownIdIsNotFound) {
    auto approve = orchestrator->approve(999);
    EXPECT_FALSE(approve.success);
    EXPECT_EQ(code_of(approve), ErrorCode::NotFound);

    auto reject = orchestrator->reject(999);
    EXPECT_EQ(code_of(reject), ErrorCode::NotFound);

    auto resubmit = orchestrator->resubmit(999);
    EXPECT_EQ(code_of(resubmit), ErrorCode::NotFound);
    EXPECT_EQ(renamer.calls.load(), 0);
}

TEST_F(OrchestratorTest, RejectDeletesSourceByDefault) {
    const auto id = add_download("junk.mkv");

    auto result = orchestrator->reject(id);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_FALSE(fs::exists(downloads / "junk.mkv"));
    EXPECT_EQ(renamer.calls.load(), 0);

    auto history = orchestrator->list_history();
    ASSERT_TRUE(history.is_ok());
    ASSERT_EQ(history.value().size(), 1u);
    EXPECT_EQ(history.value()[0].action, Disposition::Rejected);
    EXPECT_EQ(history.value()[0].notes, "Rejected by user");
    EXPECT_FALSE(history.value()[0].final_path.has_value());
}

TEST_F(OrchestratorTest, RejectCanKeepSource) {
    const auto id = add_download("keep.mkv");

    auto result = orchestrator->reject(id, false);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(fs::exists(downloads / "keep.mkv"));
}

TEST_F(OrchestratorTest, RejectSucceedsWhenSourceAlreadyGone) {
    const auto id = add_download("gone.mkv");
    fs::remove(downloads / "gone.mkv");

    auto result = orchestrator->reject(id, true);
    EXPECT_TRUE(result.success) << result.error;
}

TEST_F(OrchestratorTest, RejectFailedRecord) {
    const auto id = add_download("bad.mkv");
    renamer.fail = true;
    ASSERT_FALSE(orchestrator->approve(id).success);

    auto result = orchestrator->reject(id, false);
    EXPECT_TRUE(result.success) << result.error;

    auto stats = orchestrator->stats();
    ASSERT_TRUE(stats.is_ok());
    EXPECT_EQ(stats.value().failed, 0u);
    EXPECT_EQ(stats.value().rejected, 1u);
}

TEST_F(OrchestratorTest, ResubmitRequiresFailedStatus) {
    const auto id = add_download("fresh.mkv");
    auto result = orchestrator->resubmit(id);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(code_of(result), ErrorCode::InvalidState);
}

TEST_F(OrchestratorTest, ConcurrentApproveHasOneWinner) {
    const auto id = add_download("race.mkv");

    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    renamer.on_call = [&]() {
        entered.set_value();
        release_future.wait();
    };

    auto first = std::async(std::launch::async, [&]() { return orchestrator->approve(id); });
    entered.get_future().wait();

    auto second = orchestrator->approve(id);
    EXPECT_FALSE(second.success);
    EXPECT_EQ(code_of(second), ErrorCode::InvalidState);

    release.set_value();
    auto winner = first.get();
    EXPECT_TRUE(winner.success) << winner.error;
    EXPECT_EQ(renamer.calls.load(), 1);
}

TEST_F(OrchestratorTest, RejectDuringApprovalWins) {
    const auto id = add_download("race.mkv");

    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    renamer.on_call = [&]() {
        entered.set_value();
        release_future.wait();
    };

    auto approval = std::async(std::launch::async, [&]() { return orchestrator->approve(id); });
    entered.get_future().wait();

    auto rejected = orchestrator->reject(id, false);
    EXPECT_TRUE(rejected.success) << rejected.error;

    release.set_value();
    auto late = approval.get();
    EXPECT_FALSE(late.success);
    EXPECT_EQ(code_of(late), ErrorCode::NotFound);

    auto history = orchestrator->list_history();
    ASSERT_TRUE(history.is_ok());
    ASSERT_EQ(history.value().size(), 1u);
    EXPECT_EQ(history.value()[0].action, Disposition::Rejected);

    auto stats = orchestrator->stats();
    ASSERT_TRUE(stats.is_ok());
    EXPECT_EQ(stats.value().failed, 0u);
    EXPECT_EQ(stats.value().pending, 0u);
}

TEST_F(OrchestratorTest, RecordLeftProcessingCanBeRejected) {
    const auto id = add_download("stuck.mkv");
    ASSERT_TRUE(store.begin_processing(id).is_ok());

    EXPECT_EQ(code_of(orchestrator->approve(id)), ErrorCode::InvalidState);
    EXPECT_EQ(code_of(orchestrator->resubmit(id)), ErrorCode::InvalidState);

    auto rejected = orchestrator->reject(id, false);
    EXPECT_TRUE(rejected.success) << rejected.error;
    EXPECT_EQ(store.get_pending(id).error().code, ErrorCode::NotFound);
}

TEST_F(OrchestratorTest, ConcurrentApprovalsOfSameTitleKeepBothFiles) {
    RendezvousEngine engine(quick_options());
    Orchestrator racing(store, renamer, engine, VersionResolver(mip::VersioningConfig{}), destination);
    renamer.proposed = "Movie (2020).mkv";
    const auto a = add_download("a.mkv", "AAAAAAAA");
    const auto b = add_download("b.mkv", "BBBBBBBB");

    auto first = std::async(std::launch::async, [&]() { return racing.approve(a); });
    auto second = std::async(std::launch::async, [&]() { return racing.approve(b); });
    const auto result_a = first.get();
    const auto result_b = second.get();

    ASSERT_TRUE(result_a.success) << result_a.error;
    ASSERT_TRUE(result_b.success) << result_b.error;
    EXPECT_NE(result_a.final_path.value_or(""), result_b.final_path.value_or(""));
    EXPECT_EQ((std::set<std::string>{result_a.final_filename.value_or(""), result_b.final_filename.value_or("")}),
              (std::set<std::string>{"Movie (2020).mkv", "Movie (2020).v2.mkv"}));

    EXPECT_EQ(read_file(result_a.final_path.value_or("")), "AAAAAAAA");
    EXPECT_EQ(read_file(result_b.final_path.value_or("")), "BBBBBBBB");

    std::size_t files = 0;
    for (const auto& entry : fs::directory_iterator(destination)) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 2u);

    auto history = racing.list_history();
    ASSERT_TRUE(history.is_ok());
    ASSERT_EQ(history.value().size(), 2u);
    EXPECT_NE(history.value()[0].final_path, history.value()[1].final_path);
}
