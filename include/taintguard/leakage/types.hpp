/*
 * taintguard C++17 - Leakage Prevention Types
 *
 * Closed vocabularies shared by the registry, sanitizer, interceptor and
 * audit log. Every decision function switches over these enums without a
 * default branch so that adding a value is a compile-time visible change.
 */
#ifndef taintguard_LEAKAGE_TYPES_HPP
#define taintguard_LEAKAGE_TYPES_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace taintguard {

// ============================================================================
// Taint classification
// ============================================================================

enum class TaintKind {
    Pii,
    Credential,
    ProprietarySource,
    SystemPromptCanary,
    Custom
};

// Tagged value: `custom_name` is only meaningful for TaintKind::Custom.
struct TaintType {
    TaintKind kind;
    std::string custom_name;

    TaintType() : kind(TaintKind::Pii) {}
    explicit TaintType(TaintKind k, const std::string& name = "")
        : kind(k), custom_name(k == TaintKind::Custom ? name : "") {}

    static TaintType pii() { return TaintType(TaintKind::Pii); }
    static TaintType credential() { return TaintType(TaintKind::Credential); }
    static TaintType proprietary_source() { return TaintType(TaintKind::ProprietarySource); }
    static TaintType system_prompt_canary() { return TaintType(TaintKind::SystemPromptCanary); }
    static TaintType custom(const std::string& name) { return TaintType(TaintKind::Custom, name); }

    // "pii", "credential", "proprietary_source", "system_prompt_canary",
    // "custom:<name>"
    std::string to_string() const;

    // Redaction marker: "[REDACTED:PII]", "[REDACTED:CREDENTIAL]",
    // "[REDACTED:PROPRIETARY]", "[REDACTED:CANARY]", "[REDACTED:<NAME>]"
    std::string placeholder() const;

    // Inverse of to_string(); also accepts "custom" + name via "custom:x"
    static bool parse(const std::string& text, TaintType& out);

    bool operator==(const TaintType& other) const {
        return kind == other.kind && custom_name == other.custom_name;
    }
    bool operator!=(const TaintType& other) const { return !(*this == other); }
};

// Which matching strategy produced a hit
enum class MatchConfidence {
    Exact,
    DecodedVariant,
    FuzzyNormalized
};

// ============================================================================
// Decisions
// ============================================================================

enum class Decision {
    Allow,
    Redact,
    Block
};

enum class InterceptDecision {
    Allow,
    Block,
    Modify
};

// ============================================================================
// Audit vocabulary
// ============================================================================

enum class AuditSeverity {
    Info = 0,
    Warning = 1,
    Critical = 2
};

enum class LeakageVector {
    DirectOutput,
    EncodedOutput,
    ToolArgument,
    CanaryLeak,
    PromptInjection
};

// Decision recorded in an audit event (union of the sanitizer and
// interceptor outcomes plus Flag for warn-only detections)
enum class AuditDecision {
    Allow,
    Redact,
    Block,
    Modify,
    Flag
};

enum class LeakageError {
    None,
    InvalidSession,     // session never started or already ended
    RegistryFull,       // per-session entry cap reached
    InvalidValue,       // empty or below the minimum fingerprint length
    UnknownEntry,       // entry id not found in the session
    PersistenceError    // audit store failure (never surfaced to decision callers)
};

// ============================================================================
// Scan result
// ============================================================================

struct TaintMatch {
    std::string entry_id;
    TaintType type;
    size_t start;               // byte offset in the scanned text (inclusive)
    size_t end;                 // byte offset in the scanned text (exclusive)
    MatchConfidence confidence;
    std::string encoding;       // decoder chain for DecodedVariant, e.g. "base64" or "hex>base64"
    std::string location;       // JSON pointer of the tool argument (interceptor only)

    TaintMatch() : start(0), end(0), confidence(MatchConfidence::Exact) {}
};

// ============================================================================
// String conversions
// ============================================================================

const char* to_string(TaintKind kind);
const char* to_string(MatchConfidence confidence);
const char* to_string(Decision decision);
const char* to_string(InterceptDecision decision);
const char* to_string(AuditSeverity severity);
const char* to_string(LeakageVector vector);
const char* to_string(AuditDecision decision);
const char* to_string(LeakageError error);

bool parse_severity(const std::string& text, AuditSeverity& out);
bool parse_vector(const std::string& text, LeakageVector& out);
bool parse_audit_decision(const std::string& text, AuditDecision& out);

// Severity ordering used by "most severe wins" policies
inline bool at_least(AuditSeverity severity, AuditSeverity floor) {
    return static_cast<int>(severity) >= static_cast<int>(floor);
}

// Entry ids of a match list, in order, without duplicates
std::vector<std::string> unique_entry_ids(const std::vector<TaintMatch>& matches);

} // namespace taintguard

#endif // taintguard_LEAKAGE_TYPES_HPP
