/*
 * taintguard C++17 - Durable Audit Store
 *
 * SQLite persistence for audit events:
 *   - one INSERT per event into `audit_events` (WAL journal, synchronous=FULL)
 *   - an UPDATE trigger makes rows immutable
 *   - every row holds the full JSON record plus a SHA-256 hash chain
 *     (record_hash = sha256(prev_hash || record)), checked by verify_chain()
 *
 * Writes happen on a background worker fed by a bounded queue. When the queue
 * is full the oldest pending event is dropped (it stays in the in-memory
 * log); drops are counted and logged. Failed inserts are retried with
 * exponential backoff.
 */
#ifndef taintguard_LEAKAGE_AUDIT_STORE_HPP
#define taintguard_LEAKAGE_AUDIT_STORE_HPP

#include "audit.hpp"

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <sqlite3.h>

namespace taintguard {

struct AuditStoreConfig {
    std::string db_path;
    size_t queue_capacity;
    int retry_initial_ms;
    int retry_max_ms;

    AuditStoreConfig()
        : queue_capacity(4096)
        , retry_initial_ms(100)
        , retry_max_ms(5000) {}
};

class AuditStore : public AuditSink {
public:
    static const char* GENESIS_HASH;

    explicit AuditStore(const AuditStoreConfig& config);
    ~AuditStore();

    // Open (creating parent directory, schema and trigger as needed)
    bool open();
    void close();
    bool is_open() const;

    // Background writer
    bool start();
    // Drain what is queued (one last attempt per event), then join
    void stop();
    bool running() const { return running_.load(); }

    // AuditSink: never blocks on I/O
    void enqueue(const AuditEvent& event) override;

    // Wait until the queue is empty and no insert is in flight
    bool flush(int timeout_ms);

    // Synchronous insert; extends the hash chain
    bool append(const AuditEvent& event);

    // Newest `limit` events, returned oldest-first
    std::vector<AuditEvent> load_recent(size_t limit);
    uint64_t max_event_id();
    size_t row_count();

    // Recompute the hash chain over all rows. On failure `error` names the
    // first broken row.
    bool verify_chain(std::string* error = nullptr);

    size_t pending() const;
    uint64_t dropped() const { return dropped_.load(); }
    uint64_t written() const { return written_.load(); }
    uint64_t failures() const { return failures_.load(); }

    const AuditStoreConfig& config() const { return config_; }

private:
    AuditStoreConfig config_;

    sqlite3* db_;
    mutable std::mutex db_mutex_;
    std::string last_hash_;             // guarded by db_mutex_

    std::deque<AuditEvent> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;  // work available / stopping
    std::condition_variable idle_cv_;   // queue drained
    bool in_flight_;                    // guarded by queue_mutex_
    bool stopping_;                     // guarded by queue_mutex_

    std::thread worker_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> dropped_;
    std::atomic<uint64_t> written_;
    std::atomic<uint64_t> failures_;

    void worker_loop();

    bool init_schema();
    bool exec_sql(const std::string& sql);
    bool load_last_hash();
    bool insert_locked(const AuditEvent& event);
};

} // namespace taintguard

#endif // taintguard_LEAKAGE_AUDIT_STORE_HPP
