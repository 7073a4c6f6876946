#include <gtest/gtest.h>

#include <map>
#include <string>

#include "storage/durable_store.hpp"
#include "test_helpers.hpp"

using namespace reflux;

namespace {

auto open_store(const std::filesystem::path& path, storage::StoreOptions options = {})
    -> std::unique_ptr<storage::DurableStore>
{
    auto store = storage::DurableStore::open(path, options);
    EXPECT_TRUE(store.has_value()) << store.error().message;
    return store ? std::move(*store) : nullptr;
}

auto read_all(const storage::DurableStore& store, std::string_view ns) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> out;
    auto res = store.view([&](const storage::ReadTxn& tx) {
        return tx.for_each(ns, [&](std::string_view key, std::string_view value) -> infra::VoidResult {
            out.emplace(key, value);
            return {};
        });
    });
    EXPECT_TRUE(res.has_value()) << res.error().message;
    return out;
}

} // namespace

TEST(DurableStoreTest, PutAndGetWithinNamespace)
{
    test::TempDir dir;
    auto store = open_store(dir.path() / "store.db");
    ASSERT_TRUE(store);
    ASSERT_TRUE(store->ensure_namespaces({storage::ns::files}).has_value());

    auto put = store->update(storage::ns::files, [](storage::WriteTxn& tx) {
        return tx.put("/a/f.txt", std::string("payload\0with nul", 16));
    });
    ASSERT_TRUE(put.has_value()) << put.error().message;

    std::optional<std::string> value;
    auto res = store->view([&](const storage::ReadTxn& tx) -> infra::VoidResult {
        auto got = tx.get(storage::ns::files, "/a/f.txt");
        if (!got) return std::unexpected(std::move(got.error()));
        value = std::move(*got);
        return {};
    });
    ASSERT_TRUE(res.has_value());
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, std::string("payload\0with nul", 16));
}

TEST(DurableStoreTest, PutIntoMissingNamespaceFails)
{
    test::TempDir dir;
    auto store = open_store(dir.path() / "store.db");
    ASSERT_TRUE(store);

    auto res = store->update("Missing", [](storage::WriteTxn& tx) { return tx.put("k", "v"); });
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, infra::ErrorCode::NamespaceMissing);

    auto iter = store->view([](const storage::ReadTxn& tx) {
        return tx.for_each("Missing", [](std::string_view, std::string_view) -> infra::VoidResult { return {}; });
    });
    ASSERT_FALSE(iter.has_value());
    EXPECT_EQ(iter.error().code, infra::ErrorCode::NamespaceMissing);
}

TEST(DurableStoreTest, RemoveFromMissingNamespaceIsNoOp)
{
    test::TempDir dir;
    auto store = open_store(dir.path() / "store.db");
    ASSERT_TRUE(store);

    auto res = store->update("Missing", [](storage::WriteTxn& tx) { return tx.remove("k"); });
    EXPECT_TRUE(res.has_value());

    auto exists = store->has_namespace("Missing");
    ASSERT_TRUE(exists.has_value());
    EXPECT_FALSE(*exists);
}

TEST(DurableStoreTest, FailedUpdateRollsBackEveryChange)
{
    test::TempDir dir;
    auto store = open_store(dir.path() / "store.db");
    ASSERT_TRUE(store);
    ASSERT_TRUE(store->ensure_namespaces({storage::ns::additional_data}).has_value());
    ASSERT_TRUE(store->update(storage::ns::additional_data, [](storage::WriteTxn& tx) {
        return tx.put("kept", "1");
    }).has_value());

    auto res = store->update(storage::ns::additional_data, [](storage::WriteTxn& tx) -> infra::VoidResult {
        if (auto r = tx.put("new", "2"); !r) return r;
        if (auto r = tx.remove("kept"); !r) return r;
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown, "abort"));
    });
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().message, "abort");

    auto data = read_all(*store, storage::ns::additional_data);
    EXPECT_EQ(data, (std::map<std::string, std::string>{{"kept", "1"}}));
}

TEST(DurableStoreTest, DataSurvivesReopen)
{
    test::TempDir dir;
    const auto path = dir.path() / "store.db";
    {
        auto store = open_store(path);
        ASSERT_TRUE(store);
        ASSERT_TRUE(store->ensure_namespaces({storage::ns::server}).has_value());
        ASSERT_TRUE(store->update(storage::ns::server, [](storage::WriteTxn& tx) {
            return tx.put("Info", "address: localhost");
        }).has_value());
        ASSERT_TRUE(store->flush().has_value());
        ASSERT_TRUE(store->close().has_value());
    }

    auto store = open_store(path);
    ASSERT_TRUE(store);
    auto data = read_all(*store, storage::ns::server);
    EXPECT_EQ(data.at("Info"), "address: localhost");
}

TEST(DurableStoreTest, OperationsAfterCloseFailFast)
{
    test::TempDir dir;
    auto store = open_store(dir.path() / "store.db");
    ASSERT_TRUE(store);
    ASSERT_TRUE(store->ensure_namespaces({storage::ns::files}).has_value());
    ASSERT_TRUE(store->close().has_value());
    EXPECT_FALSE(store->is_open());

    auto put = store->update(storage::ns::files, [](storage::WriteTxn& tx) { return tx.put("k", "v"); });
    ASSERT_FALSE(put.has_value());
    EXPECT_EQ(put.error().code, infra::ErrorCode::Persistence);

    EXPECT_FALSE(store->flush().has_value());
    EXPECT_FALSE(store->close().has_value());
}

TEST(DurableStoreTest, ExclusiveStoreRejectsSecondWriter)
{
    test::TempDir dir;
    const auto path = dir.path() / "store.db";

    auto first = open_store(path);
    ASSERT_TRUE(first);
    ASSERT_TRUE(first->ensure_namespaces({storage::ns::files}).has_value());

    storage::StoreOptions options;
    options.busy_timeout_ms = 50;
    auto second = storage::DurableStore::open(path, options);
    if (!second) {
        EXPECT_EQ(second.error().code, infra::ErrorCode::Persistence);
        return;
    }
    auto res = (*second)->ensure_namespaces({storage::ns::files});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, infra::ErrorCode::Persistence);
}

TEST(DurableStoreTest, WalModeFlushCheckpoints)
{
    test::TempDir dir;
    storage::StoreOptions options;
    options.journal_mode = infra::JournalMode::Wal;
    options.synchronous = infra::SyncLevel::Normal;
    options.exclusive = false;

    auto store = open_store(dir.path() / "store.db", options);
    ASSERT_TRUE(store);
    ASSERT_TRUE(store->ensure_namespaces({storage::ns::files}).has_value());
    ASSERT_TRUE(store->update(storage::ns::files, [](storage::WriteTxn& tx) { return tx.put("k", "v"); }).has_value());
    EXPECT_TRUE(store->flush().has_value());
    EXPECT_EQ(read_all(*store, storage::ns::files).size(), 1u);
}
