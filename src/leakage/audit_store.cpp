/*
 * taintguard C++17 - Durable Audit Store Implementation
 */
#include <taintguard/leakage/audit_store.hpp>
#include <taintguard/core/logger.hpp>
#include <taintguard/core/utils.hpp>

#include <algorithm>
#include <chrono>

namespace taintguard {

const char* AuditStore::GENESIS_HASH =
    "0000000000000000000000000000000000000000000000000000000000000000";

AuditStore::AuditStore(const AuditStoreConfig& config)
    : config_(config)
    , db_(nullptr)
    , last_hash_(GENESIS_HASH)
    , in_flight_(false)
    , stopping_(false)
    , running_(false)
    , dropped_(0)
    , written_(0)
    , failures_(0) {
    if (config_.queue_capacity == 0) config_.queue_capacity = 1;
    if (config_.retry_initial_ms <= 0) config_.retry_initial_ms = 1;
    if (config_.retry_max_ms < config_.retry_initial_ms) config_.retry_max_ms = config_.retry_initial_ms;
}

AuditStore::~AuditStore() {
    stop();
    close();
}

// ============================================================================
// Database
// ============================================================================

bool AuditStore::open() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        return true;
    }
    if (config_.db_path.empty()) {
        LOG_ERROR("[AuditStore] No database path configured");
        return false;
    }

    if (config_.db_path != ":memory:" && !create_parent_directory(config_.db_path)) {
        LOG_ERROR("[AuditStore] Failed to create parent directory for '%s'", config_.db_path.c_str());
        return false;
    }

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[AuditStore] Failed to open database '%s': %s",
                  config_.db_path.c_str(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Crash-safe incremental appends
    exec_sql("PRAGMA journal_mode=WAL");
    exec_sql("PRAGMA synchronous=FULL");
    exec_sql("PRAGMA busy_timeout=5000");

    if (!init_schema() || !load_last_hash()) {
        LOG_ERROR("[AuditStore] Failed to initialize schema");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("[AuditStore] Database opened: %s", config_.db_path.c_str());
    return true;
}

void AuditStore::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool AuditStore::is_open() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return db_ != nullptr;
}

bool AuditStore::exec_sql(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[AuditStore] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool AuditStore::init_schema() {
    const char* schema =
        "CREATE TABLE IF NOT EXISTS audit_events ("
        "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  event_id INTEGER NOT NULL,"
        "  session_id TEXT NOT NULL,"
        "  timestamp_ms INTEGER NOT NULL,"
        "  severity TEXT NOT NULL,"
        "  vector TEXT NOT NULL,"
        "  decision TEXT NOT NULL,"
        "  record TEXT NOT NULL,"
        "  prev_hash TEXT NOT NULL,"
        "  record_hash TEXT NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_audit_events_session ON audit_events(session_id, seq);"
        "CREATE INDEX IF NOT EXISTS idx_audit_events_time ON audit_events(timestamp_ms);"
        "CREATE TRIGGER IF NOT EXISTS audit_events_no_update "
        "BEFORE UPDATE ON audit_events "
        "BEGIN SELECT RAISE(ABORT, 'audit_events is append-only'); END;";
    return exec_sql(schema);
}

bool AuditStore::load_last_hash() {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_,
        "SELECT record_hash FROM audit_events ORDER BY seq DESC LIMIT 1", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[AuditStore] load_last_hash prepare failed: %s", sqlite3_errmsg(db_));
        return false;
    }

    last_hash_ = GENESIS_HASH;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (text) last_hash_ = text;
    }
    sqlite3_finalize(stmt);
    return rc == SQLITE_ROW || rc == SQLITE_DONE;
}

bool AuditStore::insert_locked(const AuditEvent& event) {
    if (!db_) return false;

    // Invalid UTF-8 in caller-supplied fields becomes U+FFFD instead of throwing
    const std::string record = event.to_json().dump(-1, ' ', false, Json::error_handler_t::replace);
    const std::string record_hash = sha256_hex(last_hash_ + record);

    const char* sql =
        "INSERT INTO audit_events "
        "(event_id, session_id, timestamp_ms, severity, vector, decision, record, prev_hash, record_hash) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[AuditStore] append prepare failed: %s", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(event.id));
    sqlite3_bind_text(stmt, 2, event.session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, event.timestamp_ms);
    sqlite3_bind_text(stmt, 4, to_string(event.severity), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 5, to_string(event.vector), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 6, to_string(event.decision), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 7, record.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, last_hash_.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 9, record_hash.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("[AuditStore] append step failed: %s", sqlite3_errmsg(db_));
        return false;
    }

    last_hash_ = record_hash;
    return true;
}

bool AuditStore::append(const AuditEvent& event) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!insert_locked(event)) {
        return false;
    }
    written_.fetch_add(1);
    return true;
}

std::vector<AuditEvent> AuditStore::load_recent(size_t limit) {
    std::vector<AuditEvent> out;
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_ || limit == 0) return out;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_,
        "SELECT record FROM audit_events ORDER BY seq DESC LIMIT ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[AuditStore] load_recent prepare failed: %s", sqlite3_errmsg(db_));
        return out;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

    size_t skipped = 0;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (!text) {
            ++skipped;
            continue;
        }
        Json j = Json::parse(text, nullptr, false);
        AuditEvent e;
        if (j.is_discarded() || !AuditEvent::from_json(j, e)) {
            ++skipped;
            continue;
        }
        out.push_back(e);
    }
    sqlite3_finalize(stmt);

    if (skipped > 0) {
        LOG_WARN("[AuditStore] Skipped %zu unreadable audit records", skipped);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

uint64_t AuditStore::max_event_id() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT MAX(event_id) FROM audit_events", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("[AuditStore] max_event_id prepare failed: %s", sqlite3_errmsg(db_));
        return 0;
    }
    uint64_t result = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        result = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return result;
}

size_t AuditStore::row_count() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM audit_events", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("[AuditStore] row_count prepare failed: %s", sqlite3_errmsg(db_));
        return 0;
    }
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

bool AuditStore::verify_chain(std::string* error) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        if (error) *error = "database not open";
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_,
        "SELECT seq, record, prev_hash, record_hash FROM audit_events ORDER BY seq ASC",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (error) *error = sqlite3_errmsg(db_);
        return false;
    }

    // Rows removed by external retention leave the first surviving row's
    // prev_hash as the anchor
    bool first = true;
    std::string expected_prev;
    bool ok = true;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        int64_t seq = sqlite3_column_int64(stmt, 0);
        const char* record = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const char* prev = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        const char* hash = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
        if (!record || !prev || !hash) {
            if (error) *error = "row " + std::to_string(seq) + ": missing column";
            ok = false;
            break;
        }
        if (!first && expected_prev != prev) {
            if (error) *error = "row " + std::to_string(seq) + ": prev_hash does not link";
            ok = false;
            break;
        }
        if (sha256_hex(std::string(prev) + record) != hash) {
            if (error) *error = "row " + std::to_string(seq) + ": record_hash mismatch";
            ok = false;
            break;
        }
        expected_prev = hash;
        first = false;
    }
    sqlite3_finalize(stmt);

    if (ok && rc != SQLITE_DONE) {
        if (error) *error = sqlite3_errmsg(db_);
        ok = false;
    }
    if (!ok) {
        LOG_ERROR("[AuditStore] Hash chain verification failed");
    }
    return ok;
}

// ============================================================================
// Queue and worker
// ============================================================================

void AuditStore::enqueue(const AuditEvent& event) {
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.size() >= config_.queue_capacity) {
            queue_.pop_front();
            dropped = true;
        }
        queue_.push_back(event);
    }
    queue_cv_.notify_one();

    if (dropped) {
        uint64_t total = dropped_.fetch_add(1) + 1;
        LOG_WARN("[AuditStore] Queue full (%zu), dropped oldest pending event (%llu dropped so far)",
                 config_.queue_capacity, static_cast<unsigned long long>(total));
    }
}

size_t AuditStore::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size() + (in_flight_ ? 1 : 0);
}

bool AuditStore::start() {
    if (running_.load()) {
        return true;
    }
    if (!is_open() && !open()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = false;
    }
    running_.store(true);
    worker_ = std::thread(&AuditStore::worker_loop, this);
    LOG_INFO("[AuditStore] Persistence worker started (capacity %zu)", config_.queue_capacity);
    return true;
}

void AuditStore::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load() && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false);
    LOG_INFO("[AuditStore] Persistence worker stopped (%llu written, %llu dropped)",
             static_cast<unsigned long long>(written_.load()),
             static_cast<unsigned long long>(dropped_.load()));
}

bool AuditStore::flush(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
        return queue_.empty() && !in_flight_;
    });
}

void AuditStore::worker_loop() {
    int backoff_ms = config_.retry_initial_ms;

    for (;;) {
        AuditEvent event;
        bool draining = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;  // stopping with nothing left
            }
            event = queue_.front();
            queue_.pop_front();
            in_flight_ = true;
            draining = stopping_;
        }

        bool ok = append(event);

        if (!ok) {
            failures_.fetch_add(1);
            if (draining) {
                LOG_ERROR("[AuditStore] Event #%llu not persisted during shutdown",
                          static_cast<unsigned long long>(event.id));
            } else {
                LOG_WARN("[AuditStore] Persisting event #%llu failed, retrying in %d ms",
                         static_cast<unsigned long long>(event.id), backoff_ms);
                std::unique_lock<std::mutex> lock(queue_mutex_);
                // Put it back at the head so per-session order survives the retry
                queue_.push_front(event);
                in_flight_ = false;
                queue_cv_.wait_for(lock, std::chrono::milliseconds(backoff_ms),
                                   [this] { return stopping_; });
                backoff_ms = std::min(backoff_ms * 2, config_.retry_max_ms);
                continue;
            }
        } else {
            backoff_ms = config_.retry_initial_ms;
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            in_flight_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        in_flight_ = false;
    }
    idle_cv_.notify_all();
}

} // namespace taintguard
