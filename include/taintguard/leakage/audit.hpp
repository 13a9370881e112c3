/*
 * taintguard C++17 - Audit Log
 *
 * Append-only, per-session ordered record of every sanitizer, interceptor,
 * canary and injection decision. Events carry entry ids and taint types,
 * never matched values.
 *
 * record() appends to the in-memory log and hands the event to an AuditSink
 * (the SQLite store) while still holding the session's partition lock, so the
 * durable order of one session equals its decision order. The sink only
 * queues; nothing on the decision path waits for storage.
 */
#ifndef taintguard_LEAKAGE_AUDIT_HPP
#define taintguard_LEAKAGE_AUDIT_HPP

#include "types.hpp"
#include <taintguard/core/json.hpp>

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <cstdint>

namespace taintguard {

// ============================================================================
// Event
// ============================================================================

struct AuditEvent {
    uint64_t id;                        // assigned by AuditLog::record
    std::string session_id;
    int64_t timestamp_ms;               // assigned by record() when 0
    AuditSeverity severity;
    LeakageVector vector;
    AuditDecision decision;
    std::vector<std::string> entry_ids; // matched taint entries, no values
    std::vector<std::string> taint_types;
    std::string description;
    std::string tool_name;
    std::string pattern_name;

    AuditEvent()
        : id(0), timestamp_ms(0)
        , severity(AuditSeverity::Info)
        , vector(LeakageVector::DirectOutput)
        , decision(AuditDecision::Allow) {}

    // Self-describing record, one per append
    Json to_json() const;
    static bool from_json(const Json& j, AuditEvent& out);
};

// Filter for AuditLog::query. Unset predicates match everything.
struct AuditQuery {
    bool has_session;
    std::string session_id;
    int64_t since_ms;                   // events with timestamp >= since_ms; 0 = no bound
    bool has_min_severity;
    AuditSeverity min_severity;
    size_t limit;                       // 0 = unlimited

    AuditQuery()
        : has_session(false), since_ms(0)
        , has_min_severity(false), min_severity(AuditSeverity::Info)
        , limit(0) {}

    AuditQuery& session(const std::string& id) { has_session = true; session_id = id; return *this; }
    AuditQuery& since(int64_t ms) { since_ms = ms; return *this; }
    AuditQuery& severity_at_least(AuditSeverity s) { has_min_severity = true; min_severity = s; return *this; }
    AuditQuery& max_results(size_t n) { limit = n; return *this; }

    // Build from {"session_id": .., "since_ms": .., "min_severity": .., "limit": ..}
    static AuditQuery from_json(const Json& j);
};

struct AuditStats {
    uint64_t total;
    size_t sessions;
    std::map<std::string, uint64_t> by_severity;
    std::map<std::string, uint64_t> by_vector;
    std::map<std::string, uint64_t> by_decision;

    AuditStats() : total(0), sessions(0) {}
    Json to_json() const;
};

// ============================================================================
// Sink
// ============================================================================

// Receives every recorded event. enqueue() is called under the session's
// partition lock and must not block on I/O.
class AuditSink {
public:
    virtual ~AuditSink() {}
    virtual void enqueue(const AuditEvent& event) = 0;
};

// ============================================================================
// AuditLog
// ============================================================================

class AuditLog {
public:
    AuditLog();
    ~AuditLog();

    // Not owned; may be null. On return no record() call can still reach
    // the previous sink, so it may be destroyed.
    void set_sink(AuditSink* sink);

    // Assign id (and timestamp when unset), append, forward to the sink.
    // Returns the event id.
    uint64_t record(AuditEvent event);

    // Most-recent-first
    std::vector<AuditEvent> query(const AuditQuery& filter) const;

    bool get(uint64_t event_id, AuditEvent& out) const;
    AuditStats stats() const;
    size_t size() const;

    // Seed history loaded from durable storage. Ids continue after the
    // highest of `last_id` and the restored ids. Not forwarded to the sink.
    void restore(const std::vector<AuditEvent>& events, uint64_t last_id = 0);

private:
    struct Partition {
        mutable std::mutex mutex;
        std::vector<AuditEvent> events;     // ascending id
    };

    std::map<std::string, std::shared_ptr<Partition> > partitions_;
    mutable std::shared_mutex partitions_mutex_;
    std::atomic<uint64_t> next_id_;
    std::atomic<AuditSink*> sink_;

    std::shared_ptr<Partition> partition_for(const std::string& session_id);
    std::vector<std::shared_ptr<Partition> > all_partitions() const;
};

} // namespace taintguard

#endif // taintguard_LEAKAGE_AUDIT_HPP
