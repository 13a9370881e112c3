/*
 * taintguard C++17 - Durable audit store tests
 */
#include <gtest/gtest.h>
#include <taintguard/leakage/audit_store.hpp>

#include <cstdio>
#include <sqlite3.h>

using namespace taintguard;

class AuditStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "taintguard_store_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".db";
        remove_files();
        config_.db_path = path_;
        config_.retry_initial_ms = 5;
        config_.retry_max_ms = 20;
    }

    void TearDown() override {
        remove_files();
    }

    void remove_files() {
        std::remove(path_.c_str());
        std::remove((path_ + "-wal").c_str());
        std::remove((path_ + "-shm").c_str());
    }

    static AuditEvent event(uint64_t id, const std::string& session = "s1") {
        AuditEvent e;
        e.id = id;
        e.session_id = session;
        e.timestamp_ms = 1000 + static_cast<int64_t>(id);
        e.severity = AuditSeverity::Warning;
        e.vector = LeakageVector::DirectOutput;
        e.decision = AuditDecision::Redact;
        e.entry_ids.push_back("entry-" + std::to_string(id));
        e.taint_types.push_back("pii");
        e.description = "event " + std::to_string(id);
        return e;
    }

    // Run a statement on a separate raw connection; returns the SQLite code
    int raw_exec(const std::string& sql) {
        sqlite3* db = nullptr;
        int rc = sqlite3_open(path_.c_str(), &db);
        if (rc == SQLITE_OK) {
            rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
        }
        sqlite3_close(db);
        return rc;
    }

    std::string path_;
    AuditStoreConfig config_;
};

// ============================================================================
// Synchronous appends and reads
// ============================================================================

TEST_F(AuditStoreTest, Open_InMemoryDatabase) {
    AuditStoreConfig cfg;
    cfg.db_path = ":memory:";
    AuditStore store(cfg);
    ASSERT_TRUE(store.open());
    EXPECT_TRUE(store.is_open());
    EXPECT_EQ(0u, store.row_count());
    EXPECT_EQ(0u, store.max_event_id());
    EXPECT_TRUE(store.verify_chain());
}

TEST_F(AuditStoreTest, Open_RejectsEmptyPath) {
    AuditStoreConfig empty;
    AuditStore store(empty);
    EXPECT_FALSE(store.open());
    EXPECT_FALSE(store.is_open());
}

TEST_F(AuditStoreTest, Append_LoadRecentOldestFirst) {
    AuditStore store(config_);
    ASSERT_TRUE(store.open());
    for (uint64_t id = 1; id <= 5; ++id) {
        ASSERT_TRUE(store.append(event(id)));
    }
    EXPECT_EQ(5u, store.row_count());
    EXPECT_EQ(5u, store.max_event_id());
    EXPECT_EQ(5u, store.written());

    std::vector<AuditEvent> recent = store.load_recent(3);
    ASSERT_EQ(3u, recent.size());
    EXPECT_EQ(3u, recent[0].id);
    EXPECT_EQ(5u, recent[2].id);
    EXPECT_EQ("event 5", recent[2].description);
    ASSERT_EQ(1u, recent[2].entry_ids.size());
    EXPECT_EQ("entry-5", recent[2].entry_ids[0]);

    EXPECT_TRUE(store.load_recent(0).empty());
}

TEST_F(AuditStoreTest, Append_SurvivesReopen) {
    {
        AuditStore store(config_);
        ASSERT_TRUE(store.open());
        ASSERT_TRUE(store.append(event(1)));
        ASSERT_TRUE(store.append(event(2)));
    }
    AuditStore reopened(config_);
    ASSERT_TRUE(reopened.open());
    ASSERT_TRUE(reopened.append(event(3)));
    EXPECT_EQ(3u, reopened.row_count());
    EXPECT_TRUE(reopened.verify_chain());
}

TEST_F(AuditStoreTest, Append_FailsWhenClosed) {
    AuditStore store(config_);
    EXPECT_FALSE(store.append(event(1)));
}

// ============================================================================
// Append-only and hash chain
// ============================================================================

TEST_F(AuditStoreTest, Trigger_RejectsUpdates) {
    {
        AuditStore store(config_);
        ASSERT_TRUE(store.open());
        ASSERT_TRUE(store.append(event(1)));
    }
    EXPECT_NE(SQLITE_OK, raw_exec("UPDATE audit_events SET severity = 'info' WHERE seq = 1"));
    EXPECT_NE(SQLITE_OK, raw_exec("UPDATE audit_events SET record = 'x' WHERE seq = 1"));

    AuditStore store(config_);
    ASSERT_TRUE(store.open());
    EXPECT_TRUE(store.verify_chain());
}

TEST_F(AuditStoreTest, VerifyChain_DetectsRewrittenRecord) {
    {
        AuditStore store(config_);
        ASSERT_TRUE(store.open());
        for (uint64_t id = 1; id <= 3; ++id) {
            ASSERT_TRUE(store.append(event(id)));
        }
    }
    ASSERT_EQ(SQLITE_OK, raw_exec(
        "DROP TRIGGER audit_events_no_update;"
        "UPDATE audit_events SET record = '{\"tampered\":true}' WHERE seq = 2;"));

    AuditStore store(config_);
    ASSERT_TRUE(store.open());
    std::string error;
    EXPECT_FALSE(store.verify_chain(&error));
    EXPECT_EQ("row 2: record_hash mismatch", error);
}

TEST_F(AuditStoreTest, VerifyChain_DetectsBrokenLink) {
    {
        AuditStore store(config_);
        ASSERT_TRUE(store.open());
        for (uint64_t id = 1; id <= 3; ++id) {
            ASSERT_TRUE(store.append(event(id)));
        }
    }
    ASSERT_EQ(SQLITE_OK, raw_exec(
        "DROP TRIGGER audit_events_no_update;"
        "UPDATE audit_events SET prev_hash = 'ff' WHERE seq = 3;"));

    AuditStore store(config_);
    ASSERT_TRUE(store.open());
    std::string error;
    EXPECT_FALSE(store.verify_chain(&error));
    EXPECT_EQ("row 3: prev_hash does not link", error);
}

TEST_F(AuditStoreTest, VerifyChain_SurvivesRetentionDeletes) {
    {
        AuditStore store(config_);
        ASSERT_TRUE(store.open());
        for (uint64_t id = 1; id <= 4; ++id) {
            ASSERT_TRUE(store.append(event(id)));
        }
    }
    ASSERT_EQ(SQLITE_OK, raw_exec("DELETE FROM audit_events WHERE seq <= 2"));

    AuditStore store(config_);
    ASSERT_TRUE(store.open());
    EXPECT_TRUE(store.verify_chain());
    EXPECT_EQ(2u, store.row_count());
}

// ============================================================================
// Background writer
// ============================================================================

TEST_F(AuditStoreTest, Worker_PersistsQueuedEventsInOrder) {
    AuditStore store(config_);
    ASSERT_TRUE(store.open());
    ASSERT_TRUE(store.start());
    EXPECT_TRUE(store.running());

    for (uint64_t id = 1; id <= 50; ++id) {
        store.enqueue(event(id, id % 2 ? "odd" : "even"));
    }
    ASSERT_TRUE(store.flush(5000));
    EXPECT_EQ(0u, store.pending());

    std::vector<AuditEvent> all = store.load_recent(100);
    ASSERT_EQ(50u, all.size());
    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(i + 1, all[i].id);
    }
    EXPECT_TRUE(store.verify_chain());

    store.stop();
    EXPECT_FALSE(store.running());
}

TEST_F(AuditStoreTest, Queue_DropsOldestWhenFull) {
    config_.queue_capacity = 3;
    AuditStore store(config_);
    ASSERT_TRUE(store.open());

    for (uint64_t id = 1; id <= 5; ++id) {
        store.enqueue(event(id));
    }
    EXPECT_EQ(3u, store.pending());
    EXPECT_EQ(2u, store.dropped());

    ASSERT_TRUE(store.start());
    ASSERT_TRUE(store.flush(5000));

    std::vector<AuditEvent> all = store.load_recent(10);
    ASSERT_EQ(3u, all.size());
    EXPECT_EQ(3u, all[0].id);
    EXPECT_EQ(5u, all[2].id);
}

TEST_F(AuditStoreTest, Worker_RetriesUntilDatabaseReturns) {
    AuditStore store(config_);
    ASSERT_TRUE(store.open());
    ASSERT_TRUE(store.start());
    store.close();

    store.enqueue(event(1));
    store.enqueue(event(2));
    EXPECT_FALSE(store.flush(100));
    EXPECT_GT(store.failures(), 0u);
    EXPECT_EQ(2u, store.pending());

    ASSERT_TRUE(store.open());
    ASSERT_TRUE(store.flush(5000));
    EXPECT_EQ(2u, store.row_count());

    std::vector<AuditEvent> all = store.load_recent(10);
    ASSERT_EQ(2u, all.size());
    EXPECT_EQ(1u, all[0].id);
    EXPECT_EQ(2u, all[1].id);
}

TEST_F(AuditStoreTest, Stop_DrainsPendingEvents) {
    AuditStore store(config_);
    ASSERT_TRUE(store.open());
    ASSERT_TRUE(store.start());
    for (uint64_t id = 1; id <= 20; ++id) {
        store.enqueue(event(id));
    }
    store.stop();
    EXPECT_EQ(20u, store.row_count());
    EXPECT_EQ(0u, store.pending());
}

TEST_F(AuditStoreTest, Worker_InvalidUtf8FieldsStored) {
    AuditStore store(config_);
    ASSERT_TRUE(store.open());

    AuditEvent bad = event(1, "s\xff");
    bad.description = "bad \xfe bytes";
    EXPECT_TRUE(store.append(bad));

    ASSERT_TRUE(store.start());
    store.enqueue(event(2));
    AuditEvent worse = event(3);
    worse.pattern_name = "\xc3";
    store.enqueue(worse);
    ASSERT_TRUE(store.flush(5000));
    EXPECT_TRUE(store.running());
    store.stop();

    std::vector<AuditEvent> all = store.load_recent(10);
    ASSERT_EQ(3u, all.size());
    EXPECT_EQ("s\xEF\xBF\xBD", all[0].session_id);
    EXPECT_EQ("bad \xEF\xBF\xBD bytes", all[0].description);
    EXPECT_EQ(2u, all[1].id);
    EXPECT_EQ("\xEF\xBF\xBD", all[2].pattern_name);
    EXPECT_TRUE(store.verify_chain());
}
