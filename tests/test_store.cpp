#include <gtest/gtest.h>

#include <fstream>

#include "aegis/infra/Errors.hpp"
#include "aegis/store/JsonFileStateStore.hpp"
#include "aegis/store/MemoryStateStore.hpp"
#include "TestSupport.hpp"

using namespace aegis;
using json = nlohmann::json;

// --- MemoryStateStore ---

TEST(MemoryStateStore, CommitPutsAndErases) {
    MemoryStateStore store;
    WriteBatch b;
    b.put("pool.a", json{{"total", 1}});
    b.put("pool.b", json{{"total", 2}});
    store.commit(b);

    WriteBatch b2;
    b2.erase("pool.a");
    b2.put("alloc.x", json{{"amount", 5}});
    store.commit(b2);

    EXPECT_FALSE(store.get("pool.a").has_value());
    ASSERT_TRUE(store.get("pool.b").has_value());
    EXPECT_EQ((*store.get("pool.b"))["total"], 2);

    auto pools = store.scan("pool.");
    ASSERT_EQ(pools.size(), 1u);
    EXPECT_EQ(pools[0].first, "pool.b");
    EXPECT_EQ(store.commit_count(), 2u);
}

TEST(MemoryStateStore, EmptyBatchIsNotACommit) {
    MemoryStateStore store;
    store.commit(WriteBatch{});
    EXPECT_EQ(store.commit_count(), 0u);
}

TEST(MemoryStateStore, LogsKeepAppendOrder) {
    MemoryStateStore store;
    store.append("t", json{{"n", 1}});
    store.append("t", json{{"n", 2}});
    auto log = store.read_log("t");
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0]["n"], 1);
    EXPECT_EQ(log[1]["n"], 2);
    EXPECT_TRUE(store.read_log("other").empty());
}

// --- JsonFileStateStore ---

TEST(JsonFileStateStore, DocumentsSurviveReopen) {
    test::TempDir dir;
    {
        JsonFileStateStore store(dir.str());
        WriteBatch b;
        b.put("pipeline.conservative", json{{"active", true}});
        b.put("pool.research_pool", json{{"totalCapital", 10000}});
        store.commit(b);
    }
    JsonFileStateStore store(dir.str());
    auto doc = store.get("pipeline.conservative");
    ASSERT_TRUE(doc.has_value());
    EXPECT_TRUE((*doc)["active"].get<bool>());
    EXPECT_EQ(store.scan("pool.").size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "batch.redo"));
}

TEST(JsonFileStateStore, KeysWithUnsafeCharactersRoundTrip) {
    test::TempDir dir;
    JsonFileStateStore store(dir.str());
    WriteBatch b;
    b.put("strategy.strat_c1@pipe/x", json{{"ok", 1}});
    store.commit(b);

    auto all = store.scan("strategy.");
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].first, "strategy.strat_c1@pipe/x");
}

TEST(JsonFileStateStore, ReplaysPendingRedoBatchOnOpen) {
    test::TempDir dir;
    { JsonFileStateStore store(dir.str()); }

    // A crash after the redo file was written but before it was applied.
    json redo;
    redo["puts"] = json::array({ json::array({"pool.a", json{{"v", 1}}}),
                                 json::array({"pool.b", json{{"v", 2}}}) });
    redo["erases"] = json::array();
    {
        std::ofstream out(dir.path() / "batch.redo");
        out << redo.dump();
    }

    JsonFileStateStore store(dir.str());
    EXPECT_EQ(store.scan("pool.").size(), 2u);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "batch.redo"));
}

TEST(JsonFileStateStore, TornTrailingLogLineIsSkipped) {
    test::TempDir dir;
    {
        JsonFileStateStore store(dir.str());
        store.append("capital.transactions", json{{"id", "t1"}});
        store.append("capital.transactions", json{{"id", "t2"}});
    }
    {
        std::ofstream out(dir.path() / "logs" / "capital.transactions.jsonl", std::ios::app);
        out << "{\"id\": \"t3\", \"amou";
    }

    JsonFileStateStore store(dir.str());
    auto log = store.read_log("capital.transactions");
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[1]["id"], "t2");
}

TEST(JsonFileStateStore, CorruptDocumentIsAStoreFailure) {
    test::TempDir dir;
    JsonFileStateStore store(dir.str());
    {
        std::ofstream out(dir.path() / "docs" / "safety.status.json");
        out << "{not json";
    }
    EXPECT_THROW(store.get("safety.status"), StoreFailure);
}
