#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "core/executor/executor.hpp"
#include "test_helpers.hpp"

using namespace reflux;
using core::TransferOutcome;
using core::TransferStatus;

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto store = storage::DurableStore::open(dir_.path() / "executor.db");
        ASSERT_TRUE(store.has_value()) << store.error().message;
        store_ = std::move(*store);
        ASSERT_TRUE(store_->ensure_namespaces({storage::ns::files}).has_value());
        files_ = std::make_unique<core::TransferRegistry>(*store_);
    }

    test::TempDir dir_;
    std::unique_ptr<storage::DurableStore> store_;
    std::unique_ptr<core::TransferRegistry> files_;
};

TEST_F(ExecutorTest, SingleRecordCompletes)
{
    ASSERT_TRUE(files_->add("/a/f.txt", "/b/f.txt").has_value());

    auto result = core::operate(*files_, [](const std::string&, const std::string&) {
        return TransferOutcome{100, std::nullopt};
    });

    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result->size(), 1u);
    const auto& r = result->front();
    EXPECT_EQ(r.source_path, "/a/f.txt");
    EXPECT_EQ(r.status, TransferStatus::Completed);
    EXPECT_EQ(r.bytes_transferred, 100u);
    EXPECT_TRUE(r.time_start.has_value());
    EXPECT_TRUE(r.time_end.has_value());
}

TEST_F(ExecutorTest, FailedTransferDoesNotStopIteration)
{
    ASSERT_TRUE(files_->add("/a/1", "/b/1").has_value());
    ASSERT_TRUE(files_->add("/a/bad", "/b/bad").has_value());
    ASSERT_TRUE(files_->add("/a/3", "/b/3").has_value());

    std::set<std::string> seen;
    auto result = core::operate(*files_, [&](const std::string& src, const std::string& dst) {
        seen.insert(src);
        EXPECT_EQ(dst, "/b" + src.substr(2));
        if (src == "/a/bad") {
            return TransferOutcome{5, infra::make_error(infra::ErrorCode::IoFailure, "permission denied")};
        }
        return TransferOutcome{10, std::nullopt};
    });

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(seen, (std::set<std::string>{"/a/1", "/a/bad", "/a/3"}));
    ASSERT_EQ(result->size(), 3u);

    for (const auto& r : *result) {
        if (r.source_path == "/a/bad") {
            EXPECT_EQ(r.status, TransferStatus::Failed);
            EXPECT_EQ(r.bytes_transferred, 5u);
            EXPECT_EQ(r.error_msg, "permission denied");
        } else {
            EXPECT_EQ(r.status, TransferStatus::Completed);
            EXPECT_EQ(r.bytes_transferred, 10u);
            EXPECT_FALSE(r.error_msg.has_value());
        }
    }
}

TEST_F(ExecutorTest, RerunClearsPreviousFailure)
{
    ASSERT_TRUE(files_->add("/a/f", "/b/f").has_value());
    ASSERT_TRUE(files_->set_error("/a/f", "timeout").has_value());

    auto result = core::operate(*files_, [](const std::string&, const std::string&) {
        return TransferOutcome{1, std::nullopt};
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->front().status, TransferStatus::Completed);
    EXPECT_FALSE(result->front().error_msg.has_value());
}

TEST_F(ExecutorTest, RecordRemovedDuringIterationIsSkipped)
{
    ASSERT_TRUE(files_->add("/a/1", "/b/1").has_value());
    ASSERT_TRUE(files_->add("/a/2", "/b/2").has_value());

    // Первая обработанная запись удаляет другую: та пропускается без ошибки
    std::string removed;
    int calls = 0;
    auto result = core::operate(*files_, [&](const std::string& src, const std::string&) {
        ++calls;
        if (removed.empty()) {
            removed = src == "/a/1" ? "/a/2" : "/a/1";
            EXPECT_TRUE(files_->remove(removed).has_value());
        }
        return TransferOutcome{1, std::nullopt};
    });

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(calls, 1);
    ASSERT_EQ(result->size(), 1u);
    EXPECT_NE(result->front().source_path, removed);
    EXPECT_EQ(result->front().status, TransferStatus::Completed);
}

TEST_F(ExecutorTest, EmptyRegistryReportsNotFound)
{
    bool called = false;
    auto result = core::operate(*files_, [&](const std::string&, const std::string&) {
        called = true;
        return TransferOutcome{};
    });

    EXPECT_FALSE(called);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, infra::ErrorCode::NotFound);
}

TEST_F(ExecutorTest, PersistenceFailureAbortsTraversal)
{
    ASSERT_TRUE(files_->add("/a/1", "/b/1").has_value());
    ASSERT_TRUE(files_->add("/a/2", "/b/2").has_value());

    int calls = 0;
    auto result = core::operate(*files_, [&](const std::string&, const std::string&) {
        ++calls;
        EXPECT_TRUE(store_->close().has_value());
        return TransferOutcome{1, std::nullopt};
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, infra::ErrorCode::Persistence);
    EXPECT_EQ(calls, 1);
}
