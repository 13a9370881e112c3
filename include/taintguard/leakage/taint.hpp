/*
 * taintguard C++17 - Taint Registry
 *
 * Session-scoped store of sensitive-value fingerprints. Short values are kept
 * literally and compiled into an Aho-Corasick automaton; long values (and
 * credentials) are kept as SHA-256 plus length and found with a rolling-hash
 * window scan confirmed by SHA-256.
 *
 * Concurrency: each session owns an immutable snapshot (entries + scan index)
 * published through an atomic shared_ptr. scan() loads the snapshot once and
 * works on it to completion, so it sees either the whole entry set or, after
 * revoke_session(), no session at all. mark() rebuilds the snapshot
 * copy-on-write under the session's writer mutex. Distinct sessions share
 * only the session map, held briefly for lookup.
 */
#ifndef taintguard_LEAKAGE_TAINT_HPP
#define taintguard_LEAKAGE_TAINT_HPP

#include "types.hpp"
#include "canary.hpp"
#include "encoding.hpp"
#include "pattern_matcher.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <cstdint>

namespace taintguard {

// ============================================================================
// Entry
// ============================================================================

struct TaintEntry {
    std::string id;
    std::string session_id;
    TaintType type;
    std::string label;              // human-readable, never the raw value
    int64_t created_at_ms;

    bool hashed;                    // true: only hashes are kept
    std::string literal;            // raw value when !hashed
    size_t length;
    std::string value_hash;         // sha256 hex of the raw value
    std::string normalized_hash;    // sha256 hex of the case/whitespace-normalized value
    size_t normalized_length;

    // Rolling-hash prefilters for hashed entries (in memory only)
    uint64_t rolling_hash;
    uint64_t normalized_rolling_hash;

    TaintEntry()
        : created_at_ms(0), hashed(false), length(0), normalized_length(0)
        , rolling_hash(0), normalized_rolling_hash(0) {}
};

// Metadata view returned by list_entries(): no value, no hashes
struct TaintEntryInfo {
    std::string id;
    TaintType type;
    std::string label;
    int64_t created_at_ms;
    bool hashed;
    size_t length;

    TaintEntryInfo() : created_at_ms(0), hashed(false), length(0) {}
};

// ============================================================================
// Results
// ============================================================================

struct MarkResult {
    bool success;
    std::string entry_id;
    LeakageError error;
    std::string message;

    MarkResult() : success(false), error(LeakageError::None) {}

    static MarkResult ok(const std::string& id) {
        MarkResult r;
        r.success = true;
        r.entry_id = id;
        return r;
    }

    static MarkResult fail(LeakageError err, const std::string& msg) {
        MarkResult r;
        r.success = false;
        r.error = err;
        r.message = msg;
        return r;
    }
};

struct SessionResult {
    bool success;
    CanaryToken canary;
    bool created;                   // false when the session already existed
    LeakageError error;
    std::string message;

    SessionResult() : success(false), created(false), error(LeakageError::None) {}

    static SessionResult ok(const CanaryToken& token, bool created) {
        SessionResult r;
        r.success = true;
        r.canary = token;
        r.created = created;
        return r;
    }

    static SessionResult fail(LeakageError err, const std::string& msg) {
        SessionResult r;
        r.error = err;
        r.message = msg;
        return r;
    }
};

struct ScanResult {
    bool success;
    std::vector<TaintMatch> matches;
    bool decode_truncated;          // some encoded spans were never decoded
    LeakageError error;

    ScanResult() : success(false), decode_truncated(false), error(LeakageError::None) {}

    static ScanResult ok(const std::vector<TaintMatch>& matches) {
        ScanResult r;
        r.success = true;
        r.matches = matches;
        return r;
    }

    static ScanResult fail(LeakageError err) {
        ScanResult r;
        r.error = err;
        return r;
    }
};

struct RevokeResult {
    bool success;
    bool existed;
    size_t entries_wiped;
    size_t canary_wiped;

    RevokeResult() : success(true), existed(false), entries_wiped(0), canary_wiped(0) {}
};

// ============================================================================
// Configuration
// ============================================================================

struct RegistryConfig {
    size_t max_entries_per_session;
    size_t literal_max_length;      // longer values are stored hash-only
    size_t min_value_length;
    bool hash_credentials;          // credentials are hash-only regardless of length
    int max_decode_depth;
    size_t min_encoded_length;

    RegistryConfig()
        : max_entries_per_session(1024)
        , literal_max_length(256)
        , min_value_length(3)
        , hash_credentials(true)
        , max_decode_depth(2)
        , min_encoded_length(8) {}
};

// ============================================================================
// TaintRegistry
// ============================================================================

class TaintRegistry {
public:
    static const char* CANARY_ENTRY_ID;

    explicit TaintRegistry(const RegistryConfig& config = RegistryConfig());
    ~TaintRegistry();

    // Create the session and its canary. Idempotent: a live session returns
    // its existing token with created=false.
    SessionResult begin_session(const std::string& session_id);

    bool has_session(const std::string& session_id) const;

    MarkResult mark(const std::string& session_id, const std::string& value,
                    const TaintType& type, const std::string& label = "");

    // Only metadata may change after creation
    MarkResult amend_label(const std::string& session_id, const std::string& entry_id,
                           const std::string& label);

    // Exact, normalized, decoded and hashed-window matches of every entry of
    // the session plus its canary, sorted by offset. Never mutates `text`
    // and never fails on malformed encodings.
    ScanResult scan(const std::string& session_id, const std::string& text) const;

    // Purge entries and canary. Safe to call repeatedly; later calls report
    // nothing wiped.
    RevokeResult revoke_session(const std::string& session_id);

    std::vector<TaintEntryInfo> list_entries(const std::string& session_id) const;
    bool canary_for(const std::string& session_id, CanaryToken& out) const;

    size_t entry_count(const std::string& session_id) const;
    size_t session_count() const;

    const RegistryConfig& config() const { return config_; }

private:
    struct ScanIndex;
    struct Snapshot;
    struct SessionSlot;
    struct RawHit;

    RegistryConfig config_;
    EncodingScanner decoder_;
    uint64_t rolling_base_;

    std::map<std::string, std::shared_ptr<SessionSlot> > sessions_;
    mutable std::shared_mutex sessions_mutex_;

    std::shared_ptr<SessionSlot> find_slot(const std::string& session_id) const;
    std::shared_ptr<const ScanIndex> build_index(const std::vector<TaintEntry>& entries,
                                                 const CanaryToken& canary) const;

    void collect(const Snapshot& snap, const std::string& text, std::vector<RawHit>& out) const;
    void collect_hashed(const ScanIndex& index, const std::string& text,
                        const std::vector<size_t>* offsets, bool normalized,
                        std::vector<RawHit>& out) const;
};

// Lowercase ASCII and collapse whitespace runs to one space. `offsets[k]` is
// the byte offset in `text` of output byte k.
std::string normalize_for_match(const std::string& text, std::vector<size_t>* offsets);

} // namespace taintguard

#endif // taintguard_LEAKAGE_TAINT_HPP
