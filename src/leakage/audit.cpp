/*
 * taintguard C++17 - Audit Log Implementation
 */
#include <taintguard/leakage/audit.hpp>
#include <taintguard/core/logger.hpp>
#include <taintguard/core/utils.hpp>

#include <algorithm>

namespace taintguard {

// ============================================================================
// AuditEvent
// ============================================================================

Json AuditEvent::to_json() const {
    Json j;
    j["id"] = id;
    j["session_id"] = session_id;
    j["timestamp_ms"] = timestamp_ms;
    j["timestamp"] = format_timestamp_ms(timestamp_ms);
    j["severity"] = to_string(severity);
    j["vector"] = to_string(vector);
    j["decision"] = to_string(decision);
    j["entry_ids"] = entry_ids;
    j["taint_types"] = taint_types;
    j["description"] = description;
    if (!tool_name.empty()) j["tool_name"] = tool_name;
    if (!pattern_name.empty()) j["pattern_name"] = pattern_name;
    return j;
}

bool AuditEvent::from_json(const Json& j, AuditEvent& out) {
    if (!j.is_object()) return false;
    if (!j.contains("id") || !j["id"].is_number_integer() || j["id"].get<int64_t>() <= 0 ||
        !j.contains("session_id") || !j["session_id"].is_string() ||
        !j.contains("timestamp_ms") || !j["timestamp_ms"].is_number_integer()) {
        return false;
    }

    AuditEvent e;
    e.id = j["id"].get<uint64_t>();
    e.session_id = j["session_id"].get<std::string>();
    e.timestamp_ms = j["timestamp_ms"].get<int64_t>();
    if (!parse_severity(j.value("severity", ""), e.severity) ||
        !parse_vector(j.value("vector", ""), e.vector) ||
        !parse_audit_decision(j.value("decision", ""), e.decision)) {
        return false;
    }

    if (j.contains("entry_ids") && j["entry_ids"].is_array()) {
        for (const auto& id : j["entry_ids"]) {
            if (id.is_string()) e.entry_ids.push_back(id.get<std::string>());
        }
    }
    if (j.contains("taint_types") && j["taint_types"].is_array()) {
        for (const auto& t : j["taint_types"]) {
            if (t.is_string()) e.taint_types.push_back(t.get<std::string>());
        }
    }
    e.description = j.value("description", "");
    e.tool_name = j.value("tool_name", "");
    e.pattern_name = j.value("pattern_name", "");

    out = e;
    return true;
}

// ============================================================================
// AuditQuery / AuditStats
// ============================================================================

AuditQuery AuditQuery::from_json(const Json& j) {
    AuditQuery q;
    if (!j.is_object()) return q;

    if (j.contains("session_id") && j["session_id"].is_string()) {
        q.session(j["session_id"].get<std::string>());
    }
    if (j.contains("since_ms") && j["since_ms"].is_number_integer()) {
        q.since(j["since_ms"].get<int64_t>());
    }
    if (j.contains("min_severity") && j["min_severity"].is_string()) {
        AuditSeverity s;
        if (parse_severity(j["min_severity"].get<std::string>(), s)) {
            q.severity_at_least(s);
        } else {
            LOG_WARN("[AuditLog] Ignoring unknown severity filter '%s'",
                     j["min_severity"].get<std::string>().c_str());
        }
    }
    if (j.contains("limit") && j["limit"].is_number_integer() && j["limit"].get<int64_t>() > 0) {
        q.max_results(static_cast<size_t>(j["limit"].get<int64_t>()));
    }
    return q;
}

Json AuditStats::to_json() const {
    Json j;
    j["total"] = total;
    j["sessions"] = sessions;
    j["by_severity"] = by_severity;
    j["by_vector"] = by_vector;
    j["by_decision"] = by_decision;
    return j;
}

// ============================================================================
// AuditLog
// ============================================================================

AuditLog::AuditLog()
    : next_id_(1)
    , sink_(nullptr) {}

AuditLog::~AuditLog() {}

void AuditLog::set_sink(AuditSink* sink) {
    sink_.store(sink);

    // record() loads and uses the sink under its partition lock; passing
    // through every lock drains callers still holding the previous sink
    std::vector<std::shared_ptr<Partition> > parts = all_partitions();
    for (size_t p = 0; p < parts.size(); ++p) {
        std::lock_guard<std::mutex> lock(parts[p]->mutex);
    }
}

std::shared_ptr<AuditLog::Partition> AuditLog::partition_for(const std::string& session_id) {
    {
        std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
        std::map<std::string, std::shared_ptr<Partition> >::const_iterator it = partitions_.find(session_id);
        if (it != partitions_.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(partitions_mutex_);
    std::shared_ptr<Partition>& slot = partitions_[session_id];
    if (!slot) {
        slot = std::make_shared<Partition>();
    }
    return slot;
}

std::vector<std::shared_ptr<AuditLog::Partition> > AuditLog::all_partitions() const {
    std::vector<std::shared_ptr<Partition> > out;
    std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
    out.reserve(partitions_.size());
    for (std::map<std::string, std::shared_ptr<Partition> >::const_iterator it = partitions_.begin();
         it != partitions_.end(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

uint64_t AuditLog::record(AuditEvent event) {
    std::shared_ptr<Partition> part = partition_for(event.session_id);

    std::lock_guard<std::mutex> lock(part->mutex);
    event.id = next_id_.fetch_add(1);
    if (event.timestamp_ms == 0) {
        event.timestamp_ms = current_timestamp_ms();
    }
    part->events.push_back(event);

    AuditSink* sink = sink_.load();
    if (sink) {
        sink->enqueue(event);
    }

    if (event.severity == AuditSeverity::Critical) {
        LOG_WARN("[AuditLog] #%llu session '%s': %s/%s - %s",
                 static_cast<unsigned long long>(event.id), event.session_id.c_str(),
                 to_string(event.vector), to_string(event.decision), event.description.c_str());
    } else {
        LOG_DEBUG("[AuditLog] #%llu session '%s': %s/%s",
                  static_cast<unsigned long long>(event.id), event.session_id.c_str(),
                  to_string(event.vector), to_string(event.decision));
    }
    return event.id;
}

std::vector<AuditEvent> AuditLog::query(const AuditQuery& filter) const {
    std::vector<std::shared_ptr<Partition> > parts;
    if (filter.has_session) {
        std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
        std::map<std::string, std::shared_ptr<Partition> >::const_iterator it =
            partitions_.find(filter.session_id);
        if (it != partitions_.end()) {
            parts.push_back(it->second);
        }
    } else {
        parts = all_partitions();
    }

    std::vector<AuditEvent> out;
    for (size_t p = 0; p < parts.size(); ++p) {
        std::lock_guard<std::mutex> lock(parts[p]->mutex);
        const std::vector<AuditEvent>& events = parts[p]->events;
        for (size_t i = 0; i < events.size(); ++i) {
            const AuditEvent& e = events[i];
            if (filter.since_ms > 0 && e.timestamp_ms < filter.since_ms) continue;
            if (filter.has_min_severity && !at_least(e.severity, filter.min_severity)) continue;
            out.push_back(e);
        }
    }

    std::sort(out.begin(), out.end(), [](const AuditEvent& a, const AuditEvent& b) {
        return a.id > b.id;
    });
    if (filter.limit > 0 && out.size() > filter.limit) {
        out.resize(filter.limit);
    }
    return out;
}

bool AuditLog::get(uint64_t event_id, AuditEvent& out) const {
    std::vector<std::shared_ptr<Partition> > parts = all_partitions();
    for (size_t p = 0; p < parts.size(); ++p) {
        std::lock_guard<std::mutex> lock(parts[p]->mutex);
        const std::vector<AuditEvent>& events = parts[p]->events;
        std::vector<AuditEvent>::const_iterator it = std::lower_bound(
            events.begin(), events.end(), event_id,
            [](const AuditEvent& e, uint64_t id) { return e.id < id; });
        if (it != events.end() && it->id == event_id) {
            out = *it;
            return true;
        }
    }
    return false;
}

AuditStats AuditLog::stats() const {
    AuditStats s;
    std::vector<std::shared_ptr<Partition> > parts = all_partitions();
    for (size_t p = 0; p < parts.size(); ++p) {
        std::lock_guard<std::mutex> lock(parts[p]->mutex);
        const std::vector<AuditEvent>& events = parts[p]->events;
        if (!events.empty()) ++s.sessions;
        for (size_t i = 0; i < events.size(); ++i) {
            ++s.total;
            ++s.by_severity[to_string(events[i].severity)];
            ++s.by_vector[to_string(events[i].vector)];
            ++s.by_decision[to_string(events[i].decision)];
        }
    }
    return s;
}

size_t AuditLog::size() const {
    size_t total = 0;
    std::vector<std::shared_ptr<Partition> > parts = all_partitions();
    for (size_t p = 0; p < parts.size(); ++p) {
        std::lock_guard<std::mutex> lock(parts[p]->mutex);
        total += parts[p]->events.size();
    }
    return total;
}

void AuditLog::restore(const std::vector<AuditEvent>& events, uint64_t last_id) {
    uint64_t highest = last_id;
    for (size_t i = 0; i < events.size(); ++i) {
        std::shared_ptr<Partition> part = partition_for(events[i].session_id);
        std::lock_guard<std::mutex> lock(part->mutex);
        std::vector<AuditEvent>::iterator pos = std::lower_bound(
            part->events.begin(), part->events.end(), events[i].id,
            [](const AuditEvent& e, uint64_t id) { return e.id < id; });
        if (pos != part->events.end() && pos->id == events[i].id) {
            continue;
        }
        part->events.insert(pos, events[i]);
        if (events[i].id > highest) highest = events[i].id;
    }

    uint64_t next = next_id_.load();
    while (next <= highest && !next_id_.compare_exchange_weak(next, highest + 1)) {
    }
    LOG_INFO("[AuditLog] Restored %zu events, next id %llu",
             events.size(), static_cast<unsigned long long>(next_id_.load()));
}

} // namespace taintguard
