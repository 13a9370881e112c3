/*
 * taintguard C++17 - Output Sanitizer Implementation
 */
#include <taintguard/leakage/sanitizer.hpp>
#include <taintguard/leakage/canary.hpp>
#include <taintguard/core/logger.hpp>

#include <algorithm>
#include <map>
#include <sstream>

namespace taintguard {

// ============================================================================
// Helpers
// ============================================================================

std::vector<std::string> taint_type_names(const std::vector<TaintMatch>& matches) {
    std::vector<std::string> names;
    for (size_t i = 0; i < matches.size(); ++i) {
        std::string name = matches[i].type.to_string();
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

std::string describe_matches(const std::vector<TaintMatch>& matches) {
    std::map<std::string, size_t> counts;
    size_t decoded = 0;
    for (size_t i = 0; i < matches.size(); ++i) {
        ++counts[matches[i].type.to_string()];
        if (matches[i].confidence == MatchConfidence::DecodedVariant) ++decoded;
    }

    std::ostringstream oss;
    oss << matches.size() << " match" << (matches.size() == 1 ? "" : "es");
    if (!counts.empty()) {
        oss << " (";
        bool first = true;
        for (std::map<std::string, size_t>::const_iterator it = counts.begin(); it != counts.end(); ++it) {
            if (!first) oss << ", ";
            oss << it->first << " x" << it->second;
            first = false;
        }
        oss << ")";
    }
    if (decoded > 0) {
        oss << ", " << decoded << " decoded";
    }
    return oss.str();
}

// ============================================================================
// OutputSanitizer
// ============================================================================

OutputSanitizer::OutputSanitizer(TaintRegistry& registry, AuditLog& audit)
    : registry_(registry)
    , audit_(audit)
    , audit_allow_(false) {}

bool OutputSanitizer::forces_block(const TaintMatch& match) {
    switch (match.type.kind) {
        case TaintKind::Credential:
        case TaintKind::SystemPromptCanary:
            return true;
        case TaintKind::ProprietarySource:
            return match.confidence == MatchConfidence::Exact;
        case TaintKind::Pii:
        case TaintKind::Custom:
            return false;
    }
    return true;
}

std::vector<TaintMatch> OutputSanitizer::canary_matches(const CanaryToken& token, const std::string& text) {
    std::vector<TaintMatch> out;

    if (token.valid()) {
        size_t pos = text.find(token.token);
        while (pos != std::string::npos) {
            TaintMatch m;
            m.entry_id = TaintRegistry::CANARY_ENTRY_ID;
            m.type = TaintType::system_prompt_canary();
            m.start = pos;
            m.end = pos + token.token.size();
            m.confidence = MatchConfidence::Exact;
            out.push_back(m);
            pos = text.find(token.token, m.end);
        }
    }

    // Any other prefix-led marker: a token of some other (or unknown) session
    size_t pos = Canary::find_pattern(text);
    while (pos != std::string::npos) {
        size_t len = Canary::pattern_length(text, pos);
        bool covered = false;
        for (size_t i = 0; i < out.size(); ++i) {
            if (out[i].start == pos) {
                covered = true;
                break;
            }
        }
        if (!covered) {
            TaintMatch m;
            m.entry_id = "canary-pattern";
            m.type = TaintType::system_prompt_canary();
            m.start = pos;
            m.end = pos + len;
            m.confidence = MatchConfidence::Exact;
            out.push_back(m);
        }
        pos = text.find(Canary::PREFIX, pos + 1);
    }

    std::sort(out.begin(), out.end(), [](const TaintMatch& a, const TaintMatch& b) {
        return a.start < b.start;
    });
    return out;
}

std::string OutputSanitizer::redact(const std::string& text, const std::vector<TaintMatch>& matches,
                                    size_t* replaced) {
    std::vector<TaintMatch> sorted(matches);
    std::stable_sort(sorted.begin(), sorted.end(), [](const TaintMatch& a, const TaintMatch& b) {
        return a.start < b.start;
    });

    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    size_t count = 0;
    size_t i = 0;
    while (i < sorted.size()) {
        size_t start = std::min(sorted[i].start, text.size());
        size_t end = std::min(sorted[i].end, text.size());
        const std::string placeholder = sorted[i].type.placeholder();
        ++i;
        while (i < sorted.size() && sorted[i].start < end) {
            end = std::max(end, std::min(sorted[i].end, text.size()));
            ++i;
        }
        if (start < cursor) start = cursor;
        if (end <= start) continue;

        out.append(text, cursor, start - cursor);
        out += placeholder;
        cursor = end;
        ++count;
    }
    out.append(text, cursor, std::string::npos);

    if (replaced) *replaced = count;
    return out;
}

uint64_t OutputSanitizer::audit_decision(const std::string& session_id, Decision decision,
                                         AuditSeverity severity, LeakageVector vector,
                                         const std::vector<TaintMatch>& matches,
                                         const std::string& description) {
    AuditEvent event;
    event.session_id = session_id;
    event.severity = severity;
    event.vector = vector;
    switch (decision) {
        case Decision::Allow: event.decision = AuditDecision::Allow; break;
        case Decision::Redact: event.decision = AuditDecision::Redact; break;
        case Decision::Block: event.decision = AuditDecision::Block; break;
    }
    event.entry_ids = unique_entry_ids(matches);
    event.taint_types = taint_type_names(matches);
    event.description = description;
    return audit_.record(event);
}

SanitizeResult OutputSanitizer::sanitize(const std::string& session_id, const std::string& text) {
    SanitizeResult result;

    CanaryToken token;
    if (!registry_.canary_for(session_id, token)) {
        LOG_WARN("[Sanitizer] Output for unknown session '%s' withheld", session_id.c_str());
        result.decision = Decision::Block;
        result.error = LeakageError::InvalidSession;
        result.audit_event_id = audit_decision(session_id, Decision::Block, AuditSeverity::Warning,
            LeakageVector::DirectOutput, result.matches, "Output withheld: unknown or ended session");
        return result;
    }

    // 1. Canary dominates every other outcome
    std::vector<TaintMatch> canary = canary_matches(token, text);
    if (!canary.empty()) {
        LOG_WARN("[Sanitizer] Canary leak in session '%s' (%zu occurrences)",
                 session_id.c_str(), canary.size());
        result.decision = Decision::Block;
        result.matches = canary;
        result.audit_event_id = audit_decision(session_id, Decision::Block, AuditSeverity::Critical,
            LeakageVector::CanaryLeak, canary, "System prompt canary in output: " + describe_matches(canary));
        return result;
    }

    // 2. Registry scan
    ScanResult scan = registry_.scan(session_id, text);
    if (!scan.success) {
        // Session ended between the canary lookup and the scan
        result.decision = Decision::Block;
        result.error = scan.error;
        result.audit_event_id = audit_decision(session_id, Decision::Block, AuditSeverity::Warning,
            LeakageVector::DirectOutput, result.matches, "Output withheld: unknown or ended session");
        return result;
    }

    result.matches = scan.matches;
    bool any_blocker = false;
    for (size_t i = 0; i < scan.matches.size() && !any_blocker; ++i) {
        any_blocker = forces_block(scan.matches[i]);
    }
    if (scan.decode_truncated && !any_blocker) {
        // Undecoded spans may hide a tainted value
        result.decision = Decision::Block;
        result.audit_event_id = audit_decision(session_id, Decision::Block, AuditSeverity::Warning,
            LeakageVector::EncodedOutput, scan.matches, "Output withheld: decode limit reached");
        LOG_WARN("[Sanitizer] Withheld output in session '%s': too many encoded spans",
                 session_id.c_str());
        return result;
    }

    if (scan.matches.empty()) {
        result.decision = Decision::Allow;
        result.text = text;
        if (audit_allow_) {
            result.audit_event_id = audit_decision(session_id, Decision::Allow, AuditSeverity::Info,
                LeakageVector::DirectOutput, result.matches, "Output allowed");
        }
        return result;
    }

    // 3. Block or redact
    bool block = false;
    bool canary_type = false;
    bool all_blockers_decoded = true;
    for (size_t i = 0; i < scan.matches.size(); ++i) {
        const TaintMatch& m = scan.matches[i];
        if (!forces_block(m)) continue;
        block = true;
        if (m.type.kind == TaintKind::SystemPromptCanary) canary_type = true;
        if (m.confidence != MatchConfidence::DecodedVariant) all_blockers_decoded = false;
    }

    if (block) {
        LeakageVector vector = canary_type ? LeakageVector::CanaryLeak
                             : all_blockers_decoded ? LeakageVector::EncodedOutput
                             : LeakageVector::DirectOutput;
        result.decision = Decision::Block;
        result.audit_event_id = audit_decision(session_id, Decision::Block, AuditSeverity::Critical,
            vector, scan.matches, "Output blocked: " + describe_matches(scan.matches));
        LOG_WARN("[Sanitizer] Blocked output in session '%s' (%s)",
                 session_id.c_str(), to_string(vector));
        return result;
    }

    bool all_decoded = true;
    for (size_t i = 0; i < scan.matches.size(); ++i) {
        if (scan.matches[i].confidence != MatchConfidence::DecodedVariant) {
            all_decoded = false;
            break;
        }
    }

    result.decision = Decision::Redact;
    result.text = redact(text, scan.matches, &result.redaction_count);
    result.was_redacted = result.redaction_count > 0;
    result.audit_event_id = audit_decision(session_id, Decision::Redact, AuditSeverity::Warning,
        all_decoded ? LeakageVector::EncodedOutput : LeakageVector::DirectOutput,
        scan.matches, "Output redacted: " + describe_matches(scan.matches));
    LOG_INFO("[Sanitizer] Redacted %zu spans in session '%s'",
             result.redaction_count, session_id.c_str());
    return result;
}

} // namespace taintguard
