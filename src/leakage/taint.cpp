/*
 * taintguard C++17 - Taint Registry Implementation
 */
#include <taintguard/leakage/taint.hpp>
#include <taintguard/core/logger.hpp>
#include <taintguard/core/utils.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <set>
#include <tuple>

namespace taintguard {

const char* TaintRegistry::CANARY_ENTRY_ID = "canary";

namespace {

const size_t CANARY_OWNER = SIZE_MAX;

bool overlaps(size_t a_start, size_t a_end, size_t b_start, size_t b_end) {
    return a_start < b_end && b_start < a_end;
}

} // anonymous namespace

// ============================================================================
// Internal structures
// ============================================================================

struct TaintRegistry::ScanIndex {
    struct HashedTarget {
        std::string digest;
        size_t owner;
    };

    struct HashedWindow {
        size_t length;
        std::multimap<uint64_t, HashedTarget> targets;
    };

    PatternMatcher literal;
    std::vector<size_t> literal_owner;
    PatternMatcher normalized;
    std::vector<size_t> normalized_owner;

    std::vector<HashedWindow> raw_windows;
    std::vector<HashedWindow> normalized_windows;

    static HashedWindow& window_for(std::vector<HashedWindow>& windows, size_t length) {
        for (size_t i = 0; i < windows.size(); ++i) {
            if (windows[i].length == length) return windows[i];
        }
        HashedWindow w;
        w.length = length;
        windows.push_back(w);
        return windows.back();
    }
};

struct TaintRegistry::Snapshot {
    CanaryToken canary;
    std::vector<TaintEntry> entries;
    std::map<std::string, size_t> by_id;
    std::shared_ptr<const ScanIndex> index;
};

struct TaintRegistry::SessionSlot {
    std::mutex write_mutex;
    bool revoked;                               // guarded by write_mutex
    std::shared_ptr<const Snapshot> snapshot;   // atomic_load / atomic_store only

    SessionSlot() : revoked(false) {}
};

struct TaintRegistry::RawHit {
    size_t owner;
    size_t start;
    size_t end;
    MatchConfidence confidence;
};

// ============================================================================
// Normalization
// ============================================================================

std::string normalize_for_match(const std::string& text, std::vector<size_t>* offsets) {
    std::string out;
    out.reserve(text.size());
    if (offsets) {
        offsets->clear();
        offsets->reserve(text.size());
    }

    bool in_space = false;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isspace(c)) {
            if (in_space) continue;
            in_space = true;
            out += ' ';
        } else {
            in_space = false;
            out += static_cast<char>(std::tolower(c));
        }
        if (offsets) offsets->push_back(i);
    }
    return out;
}

// ============================================================================
// TaintRegistry
// ============================================================================

TaintRegistry::TaintRegistry(const RegistryConfig& config)
    : config_(config)
    , decoder_(config.max_decode_depth, config.min_encoded_length)
    , rolling_base_(0) {
    unsigned char bytes[8];
    if (random_bytes(bytes, sizeof(bytes))) {
        for (size_t i = 0; i < sizeof(bytes); ++i) {
            rolling_base_ = (rolling_base_ << 8) | bytes[i];
        }
    } else {
        LOG_WARN("[TaintRegistry] Random generator unavailable, using time-seeded rolling base");
        rolling_base_ = static_cast<uint64_t>(current_timestamp_ms()) * 0x9E3779B97F4A7C15ULL;
    }
    rolling_base_ = (rolling_base_ % RollingHash::MODULUS) | 1;
    if (rolling_base_ < 257) rolling_base_ += 257;
}

TaintRegistry::~TaintRegistry() {}

std::shared_ptr<TaintRegistry::SessionSlot> TaintRegistry::find_slot(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    std::map<std::string, std::shared_ptr<SessionSlot> >::const_iterator it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::shared_ptr<SessionSlot>();
    }
    return it->second;
}

SessionResult TaintRegistry::begin_session(const std::string& session_id) {
    if (session_id.empty()) {
        return SessionResult::fail(LeakageError::InvalidSession, "Session id must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    std::map<std::string, std::shared_ptr<SessionSlot> >::iterator it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        std::shared_ptr<const Snapshot> snap = std::atomic_load(&it->second->snapshot);
        if (snap) {
            return SessionResult::ok(snap->canary, false);
        }
    }

    CanaryToken token = Canary::generate(session_id);
    if (!token.valid()) {
        return SessionResult::fail(LeakageError::InvalidSession, "Canary generation failed");
    }

    std::shared_ptr<Snapshot> snap = std::make_shared<Snapshot>();
    snap->canary = token;
    snap->index = build_index(snap->entries, snap->canary);

    std::shared_ptr<SessionSlot> slot = std::make_shared<SessionSlot>();
    std::atomic_store(&slot->snapshot, std::shared_ptr<const Snapshot>(snap));
    sessions_[session_id] = slot;

    LOG_INFO("[TaintRegistry] Session '%s' started", session_id.c_str());
    return SessionResult::ok(token, true);
}

bool TaintRegistry::has_session(const std::string& session_id) const {
    return static_cast<bool>(find_slot(session_id));
}

std::shared_ptr<const TaintRegistry::ScanIndex> TaintRegistry::build_index(
        const std::vector<TaintEntry>& entries, const CanaryToken& canary) const {
    std::shared_ptr<ScanIndex> index = std::make_shared<ScanIndex>();

    for (size_t i = 0; i < entries.size(); ++i) {
        const TaintEntry& e = entries[i];
        if (!e.hashed) {
            if (index->literal.add(e.literal) != SIZE_MAX) {
                index->literal_owner.push_back(i);
            }
            if (index->normalized.add(trim(normalize_for_match(e.literal, nullptr))) != SIZE_MAX) {
                index->normalized_owner.push_back(i);
            }
            continue;
        }

        ScanIndex::HashedTarget raw;
        raw.digest = e.value_hash;
        raw.owner = i;
        ScanIndex::window_for(index->raw_windows, e.length).targets.insert(
            std::make_pair(e.rolling_hash, raw));

        ScanIndex::HashedTarget norm;
        norm.digest = e.normalized_hash;
        norm.owner = i;
        ScanIndex::window_for(index->normalized_windows, e.normalized_length).targets.insert(
            std::make_pair(e.normalized_rolling_hash, norm));
    }

    if (canary.valid()) {
        if (index->literal.add(canary.token) != SIZE_MAX) {
            index->literal_owner.push_back(CANARY_OWNER);
        }
        if (index->normalized.add(normalize_for_match(canary.token, nullptr)) != SIZE_MAX) {
            index->normalized_owner.push_back(CANARY_OWNER);
        }
    }

    index->literal.build();
    index->normalized.build();
    return index;
}

MarkResult TaintRegistry::mark(const std::string& session_id, const std::string& value,
                               const TaintType& type, const std::string& label) {
    std::shared_ptr<SessionSlot> slot = find_slot(session_id);
    if (!slot) {
        LOG_WARN("[TaintRegistry] mark on unknown session '%s'", session_id.c_str());
        return MarkResult::fail(LeakageError::InvalidSession, "Unknown or ended session: " + session_id);
    }

    if (value.empty() || value.size() < config_.min_value_length) {
        return MarkResult::fail(LeakageError::InvalidValue,
            "Value shorter than " + std::to_string(config_.min_value_length) + " bytes");
    }
    std::string normalized = trim(normalize_for_match(value, nullptr));
    if (normalized.empty()) {
        return MarkResult::fail(LeakageError::InvalidValue, "Value is whitespace only");
    }
    if (type.kind == TaintKind::Custom && type.custom_name.empty()) {
        return MarkResult::fail(LeakageError::InvalidValue, "Custom taint type needs a name");
    }

    std::lock_guard<std::mutex> lock(slot->write_mutex);
    if (slot->revoked) {
        return MarkResult::fail(LeakageError::InvalidSession, "Session ended: " + session_id);
    }

    std::shared_ptr<const Snapshot> current = std::atomic_load(&slot->snapshot);
    if (!current) {
        return MarkResult::fail(LeakageError::InvalidSession, "Session ended: " + session_id);
    }
    if (current->entries.size() >= config_.max_entries_per_session) {
        LOG_WARN("[TaintRegistry] Session '%s' is full (%zu entries)",
                 session_id.c_str(), current->entries.size());
        return MarkResult::fail(LeakageError::RegistryFull,
            "Registry full: " + std::to_string(config_.max_entries_per_session) + " entries");
    }

    TaintEntry entry;
    entry.id = generate_uuid();
    if (entry.id.empty()) {
        return MarkResult::fail(LeakageError::InvalidValue, "Random generator failed");
    }
    entry.session_id = session_id;
    entry.type = type;
    entry.label = label;
    entry.created_at_ms = current_timestamp_ms();
    entry.length = value.size();
    entry.value_hash = sha256_hex(value);
    entry.normalized_hash = sha256_hex(normalized);
    entry.normalized_length = normalized.size();
    entry.hashed = value.size() > config_.literal_max_length ||
                   (type.kind == TaintKind::Credential && config_.hash_credentials);
    if (entry.hashed) {
        entry.rolling_hash = RollingHash(rolling_base_, entry.length).hash(value);
        entry.normalized_rolling_hash = RollingHash(rolling_base_, entry.normalized_length).hash(normalized);
    } else {
        entry.literal = value;
    }

    std::shared_ptr<Snapshot> next = std::make_shared<Snapshot>();
    next->canary = current->canary;
    next->entries = current->entries;
    next->by_id = current->by_id;
    next->entries.push_back(entry);
    next->by_id[entry.id] = next->entries.size() - 1;
    next->index = build_index(next->entries, next->canary);

    std::atomic_store(&slot->snapshot, std::shared_ptr<const Snapshot>(next));

    LOG_DEBUG("[TaintRegistry] Marked %s entry %s in session '%s' (len=%zu, %s)",
              type.to_string().c_str(), entry.id.c_str(), session_id.c_str(),
              entry.length, entry.hashed ? "hashed" : "literal");
    return MarkResult::ok(entry.id);
}

MarkResult TaintRegistry::amend_label(const std::string& session_id, const std::string& entry_id,
                                      const std::string& label) {
    std::shared_ptr<SessionSlot> slot = find_slot(session_id);
    if (!slot) {
        return MarkResult::fail(LeakageError::InvalidSession, "Unknown or ended session: " + session_id);
    }

    std::lock_guard<std::mutex> lock(slot->write_mutex);
    std::shared_ptr<const Snapshot> current = std::atomic_load(&slot->snapshot);
    if (slot->revoked || !current) {
        return MarkResult::fail(LeakageError::InvalidSession, "Session ended: " + session_id);
    }

    std::map<std::string, size_t>::const_iterator it = current->by_id.find(entry_id);
    if (it == current->by_id.end()) {
        return MarkResult::fail(LeakageError::UnknownEntry, "No entry " + entry_id);
    }

    // Fingerprints are untouched, so the scan index is shared
    std::shared_ptr<Snapshot> next = std::make_shared<Snapshot>(*current);
    next->entries[it->second].label = label;
    std::atomic_store(&slot->snapshot, std::shared_ptr<const Snapshot>(next));
    return MarkResult::ok(entry_id);
}

void TaintRegistry::collect_hashed(const ScanIndex& index, const std::string& text,
                                   const std::vector<size_t>* offsets, bool normalized,
                                   std::vector<RawHit>& out) const {
    const std::vector<ScanIndex::HashedWindow>& windows =
        normalized ? index.normalized_windows : index.raw_windows;

    for (size_t w = 0; w < windows.size(); ++w) {
        const size_t len = windows[w].length;
        if (len == 0 || len > text.size()) continue;

        RollingHash rolling(rolling_base_, len);
        uint64_t h = rolling.reset(text.data());
        for (size_t i = 0; ; ++i) {
            if (i > 0) {
                h = rolling.roll(static_cast<unsigned char>(text[i - 1]),
                                 static_cast<unsigned char>(text[i + len - 1]));
            }

            typedef std::multimap<uint64_t, ScanIndex::HashedTarget>::const_iterator Iter;
            std::pair<Iter, Iter> range = windows[w].targets.equal_range(h);
            if (range.first != range.second) {
                const std::string digest = sha256_hex(text.substr(i, len));
                for (Iter it = range.first; it != range.second; ++it) {
                    if (it->second.digest != digest) continue;
                    RawHit hit;
                    hit.owner = it->second.owner;
                    hit.start = offsets ? (*offsets)[i] : i;
                    hit.end = offsets ? (*offsets)[i + len - 1] + 1 : i + len;
                    hit.confidence = normalized ? MatchConfidence::FuzzyNormalized : MatchConfidence::Exact;
                    out.push_back(hit);
                }
            }

            if (i + len >= text.size()) break;
        }
    }
}

void TaintRegistry::collect(const Snapshot& snap, const std::string& text, std::vector<RawHit>& out) const {
    const ScanIndex& index = *snap.index;

    // 1. Literal substrings
    std::vector<PatternMatcher::Hit> hits = index.literal.find_all(text);
    for (size_t i = 0; i < hits.size(); ++i) {
        RawHit hit;
        hit.owner = index.literal_owner[hits[i].pattern];
        hit.start = hits[i].start;
        hit.end = hits[i].end;
        hit.confidence = MatchConfidence::Exact;
        out.push_back(hit);
    }

    // 2. Case-folded, whitespace-collapsed substrings
    std::vector<size_t> offsets;
    const std::string norm = normalize_for_match(text, &offsets);
    hits = index.normalized.find_all(norm);
    for (size_t i = 0; i < hits.size(); ++i) {
        RawHit hit;
        hit.owner = index.normalized_owner[hits[i].pattern];
        hit.start = offsets[hits[i].start];
        hit.end = offsets[hits[i].end - 1] + 1;
        hit.confidence = MatchConfidence::FuzzyNormalized;
        out.push_back(hit);
    }

    // 3. Hashed entries: sliding windows at the stored lengths
    collect_hashed(index, text, nullptr, false, out);
    collect_hashed(index, norm, &offsets, true, out);
}

ScanResult TaintRegistry::scan(const std::string& session_id, const std::string& text) const {
    std::shared_ptr<SessionSlot> slot = find_slot(session_id);
    if (!slot) {
        return ScanResult::fail(LeakageError::InvalidSession);
    }
    // One load: the whole scan runs against this entry set
    std::shared_ptr<const Snapshot> snap = std::atomic_load(&slot->snapshot);
    if (!snap) {
        return ScanResult::fail(LeakageError::InvalidSession);
    }

    std::vector<RawHit> direct;
    collect(*snap, text, direct);

    // Exact beats a normalized hit of the same entry on the same bytes
    std::vector<RawHit> kept;
    std::set<std::tuple<size_t, size_t, size_t> > seen;
    for (size_t i = 0; i < direct.size(); ++i) {
        const RawHit& h = direct[i];
        if (h.confidence != MatchConfidence::Exact) {
            bool shadowed = false;
            for (size_t k = 0; k < direct.size(); ++k) {
                if (direct[k].confidence == MatchConfidence::Exact && direct[k].owner == h.owner &&
                    overlaps(direct[k].start, direct[k].end, h.start, h.end)) {
                    shadowed = true;
                    break;
                }
            }
            if (shadowed) continue;
        }
        if (seen.insert(std::make_tuple(h.owner, h.start, h.end)).second) {
            kept.push_back(h);
        }
    }

    std::vector<TaintMatch> matches;
    std::vector<std::string> encodings(kept.size());

    // Decoded variants map back to the whole encoded span
    bool truncated = false;
    std::vector<DecodedCandidate> candidates = decoder_.extract(text, &truncated);
    size_t direct_count = kept.size();
    for (size_t c = 0; c < candidates.size(); ++c) {
        std::vector<RawHit> inner;
        collect(*snap, candidates[c].decoded, inner);
        for (size_t i = 0; i < inner.size(); ++i) {
            RawHit h = inner[i];
            h.start = candidates[c].start;
            h.end = candidates[c].end;
            h.confidence = MatchConfidence::DecodedVariant;

            bool shadowed = false;
            for (size_t k = 0; k < direct_count; ++k) {
                if (kept[k].owner == h.owner && overlaps(kept[k].start, kept[k].end, h.start, h.end)) {
                    shadowed = true;
                    break;
                }
            }
            if (shadowed) continue;
            if (seen.insert(std::make_tuple(h.owner, h.start, h.end)).second) {
                kept.push_back(h);
                encodings.push_back(candidates[c].encoding);
            }
        }
    }

    matches.reserve(kept.size());
    for (size_t i = 0; i < kept.size(); ++i) {
        TaintMatch m;
        if (kept[i].owner == CANARY_OWNER) {
            m.entry_id = CANARY_ENTRY_ID;
            m.type = TaintType::system_prompt_canary();
        } else {
            m.entry_id = snap->entries[kept[i].owner].id;
            m.type = snap->entries[kept[i].owner].type;
        }
        m.start = kept[i].start;
        m.end = kept[i].end;
        m.confidence = kept[i].confidence;
        m.encoding = encodings[i];
        matches.push_back(m);
    }

    std::sort(matches.begin(), matches.end(), [](const TaintMatch& a, const TaintMatch& b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.end != b.end) return a.end < b.end;
        return a.entry_id < b.entry_id;
    });

    if (!matches.empty()) {
        LOG_DEBUG("[TaintRegistry] Session '%s': %zu matches (%zu decoded candidates)",
                  session_id.c_str(), matches.size(), candidates.size());
    }
    ScanResult result = ScanResult::ok(matches);
    result.decode_truncated = truncated;
    return result;
}

RevokeResult TaintRegistry::revoke_session(const std::string& session_id) {
    RevokeResult result;

    std::shared_ptr<SessionSlot> slot;
    {
        std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
        std::map<std::string, std::shared_ptr<SessionSlot> >::iterator it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            LOG_DEBUG("[TaintRegistry] revoke of unknown session '%s' is a no-op", session_id.c_str());
            return result;
        }
        slot = it->second;
        sessions_.erase(it);
    }

    std::lock_guard<std::mutex> lock(slot->write_mutex);
    std::shared_ptr<const Snapshot> snap = std::atomic_load(&slot->snapshot);
    slot->revoked = true;
    std::atomic_store(&slot->snapshot, std::shared_ptr<const Snapshot>());

    result.existed = true;
    if (snap) {
        result.entries_wiped = snap->entries.size();
        result.canary_wiped = snap->canary.valid() ? 1 : 0;
    }

    LOG_INFO("[TaintRegistry] Session '%s' revoked (%zu entries, %zu canary)",
             session_id.c_str(), result.entries_wiped, result.canary_wiped);
    return result;
}

std::vector<TaintEntryInfo> TaintRegistry::list_entries(const std::string& session_id) const {
    std::vector<TaintEntryInfo> out;
    std::shared_ptr<SessionSlot> slot = find_slot(session_id);
    if (!slot) return out;
    std::shared_ptr<const Snapshot> snap = std::atomic_load(&slot->snapshot);
    if (!snap) return out;

    out.reserve(snap->entries.size());
    for (size_t i = 0; i < snap->entries.size(); ++i) {
        const TaintEntry& e = snap->entries[i];
        TaintEntryInfo info;
        info.id = e.id;
        info.type = e.type;
        info.label = e.label;
        info.created_at_ms = e.created_at_ms;
        info.hashed = e.hashed;
        info.length = e.length;
        out.push_back(info);
    }
    return out;
}

bool TaintRegistry::canary_for(const std::string& session_id, CanaryToken& out) const {
    std::shared_ptr<SessionSlot> slot = find_slot(session_id);
    if (!slot) return false;
    std::shared_ptr<const Snapshot> snap = std::atomic_load(&slot->snapshot);
    if (!snap || !snap->canary.valid()) return false;
    out = snap->canary;
    return true;
}

size_t TaintRegistry::entry_count(const std::string& session_id) const {
    std::shared_ptr<SessionSlot> slot = find_slot(session_id);
    if (!slot) return 0;
    std::shared_ptr<const Snapshot> snap = std::atomic_load(&slot->snapshot);
    return snap ? snap->entries.size() : 0;
}

size_t TaintRegistry::session_count() const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    return sessions_.size();
}

} // namespace taintguard
