#include <taintguard/leakage/types.hpp>
#include <taintguard/core/utils.hpp>

#include <set>

namespace taintguard {

std::string TaintType::to_string() const {
    if (kind == TaintKind::Custom) {
        return std::string("custom:") + custom_name;
    }
    return taintguard::to_string(kind);
}

std::string TaintType::placeholder() const {
    switch (kind) {
        case TaintKind::Pii: return "[REDACTED:PII]";
        case TaintKind::Credential: return "[REDACTED:CREDENTIAL]";
        case TaintKind::ProprietarySource: return "[REDACTED:PROPRIETARY]";
        case TaintKind::SystemPromptCanary: return "[REDACTED:CANARY]";
        case TaintKind::Custom:
            return "[REDACTED:" + (custom_name.empty() ? std::string("CUSTOM") : to_upper(custom_name)) + "]";
    }
    return "[REDACTED]";
}

bool TaintType::parse(const std::string& text, TaintType& out) {
    std::string lower = to_lower(trim(text));
    if (lower == "pii") { out = pii(); return true; }
    if (lower == "credential") { out = credential(); return true; }
    if (lower == "proprietary_source" || lower == "proprietary") { out = proprietary_source(); return true; }
    if (lower == "system_prompt_canary" || lower == "canary") { out = system_prompt_canary(); return true; }
    if (starts_with(lower, "custom:")) {
        // keep the caller's casing for the name
        std::string name = trim(text).substr(7);
        if (name.empty()) return false;
        out = custom(name);
        return true;
    }
    return false;
}

const char* to_string(TaintKind kind) {
    switch (kind) {
        case TaintKind::Pii: return "pii";
        case TaintKind::Credential: return "credential";
        case TaintKind::ProprietarySource: return "proprietary_source";
        case TaintKind::SystemPromptCanary: return "system_prompt_canary";
        case TaintKind::Custom: return "custom";
    }
    return "unknown";
}

const char* to_string(MatchConfidence confidence) {
    switch (confidence) {
        case MatchConfidence::Exact: return "exact";
        case MatchConfidence::DecodedVariant: return "decoded_variant";
        case MatchConfidence::FuzzyNormalized: return "fuzzy_normalized";
    }
    return "unknown";
}

const char* to_string(Decision decision) {
    switch (decision) {
        case Decision::Allow: return "allow";
        case Decision::Redact: return "redact";
        case Decision::Block: return "block";
    }
    return "unknown";
}

const char* to_string(InterceptDecision decision) {
    switch (decision) {
        case InterceptDecision::Allow: return "allow";
        case InterceptDecision::Block: return "block";
        case InterceptDecision::Modify: return "modify";
    }
    return "unknown";
}

const char* to_string(AuditSeverity severity) {
    switch (severity) {
        case AuditSeverity::Info: return "info";
        case AuditSeverity::Warning: return "warning";
        case AuditSeverity::Critical: return "critical";
    }
    return "unknown";
}

const char* to_string(LeakageVector vector) {
    switch (vector) {
        case LeakageVector::DirectOutput: return "direct_output";
        case LeakageVector::EncodedOutput: return "encoded_output";
        case LeakageVector::ToolArgument: return "tool_argument";
        case LeakageVector::CanaryLeak: return "canary_leak";
        case LeakageVector::PromptInjection: return "prompt_injection";
    }
    return "unknown";
}

const char* to_string(AuditDecision decision) {
    switch (decision) {
        case AuditDecision::Allow: return "allow";
        case AuditDecision::Redact: return "redact";
        case AuditDecision::Block: return "block";
        case AuditDecision::Modify: return "modify";
        case AuditDecision::Flag: return "flag";
    }
    return "unknown";
}

const char* to_string(LeakageError error) {
    switch (error) {
        case LeakageError::None: return "none";
        case LeakageError::InvalidSession: return "invalid_session";
        case LeakageError::RegistryFull: return "registry_full";
        case LeakageError::InvalidValue: return "invalid_value";
        case LeakageError::UnknownEntry: return "unknown_entry";
        case LeakageError::PersistenceError: return "persistence_error";
    }
    return "unknown";
}

bool parse_severity(const std::string& text, AuditSeverity& out) {
    std::string lower = to_lower(trim(text));
    if (lower == "info") { out = AuditSeverity::Info; return true; }
    if (lower == "warning" || lower == "warn") { out = AuditSeverity::Warning; return true; }
    if (lower == "critical") { out = AuditSeverity::Critical; return true; }
    return false;
}

bool parse_vector(const std::string& text, LeakageVector& out) {
    std::string lower = to_lower(trim(text));
    if (lower == "direct_output") { out = LeakageVector::DirectOutput; return true; }
    if (lower == "encoded_output") { out = LeakageVector::EncodedOutput; return true; }
    if (lower == "tool_argument") { out = LeakageVector::ToolArgument; return true; }
    if (lower == "canary_leak") { out = LeakageVector::CanaryLeak; return true; }
    if (lower == "prompt_injection") { out = LeakageVector::PromptInjection; return true; }
    return false;
}

bool parse_audit_decision(const std::string& text, AuditDecision& out) {
    std::string lower = to_lower(trim(text));
    if (lower == "allow") { out = AuditDecision::Allow; return true; }
    if (lower == "redact") { out = AuditDecision::Redact; return true; }
    if (lower == "block") { out = AuditDecision::Block; return true; }
    if (lower == "modify") { out = AuditDecision::Modify; return true; }
    if (lower == "flag") { out = AuditDecision::Flag; return true; }
    return false;
}

std::vector<std::string> unique_entry_ids(const std::vector<TaintMatch>& matches) {
    std::vector<std::string> ids;
    std::set<std::string> seen;
    for (size_t i = 0; i < matches.size(); ++i) {
        if (seen.insert(matches[i].entry_id).second) {
            ids.push_back(matches[i].entry_id);
        }
    }
    return ids;
}

} // namespace taintguard
