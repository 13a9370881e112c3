/*
 * taintguard C++17 - Output Sanitizer
 *
 * Runs on every chunk of model output before it reaches a user-facing
 * surface. Canary hits block outright; credentials, canaries and exact
 * proprietary-source hits block the whole response; everything else is
 * redacted span by span. Every non-Allow decision is in the audit log before
 * sanitize() returns.
 */
#ifndef taintguard_LEAKAGE_SANITIZER_HPP
#define taintguard_LEAKAGE_SANITIZER_HPP

#include "types.hpp"
#include "taint.hpp"
#include "audit.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace taintguard {

struct SanitizeResult {
    std::string text;                   // empty for Block
    std::vector<TaintMatch> matches;
    Decision decision;
    bool was_redacted;
    size_t redaction_count;             // merged spans replaced
    uint64_t audit_event_id;            // 0 when nothing was recorded
    LeakageError error;

    SanitizeResult()
        : decision(Decision::Allow)
        , was_redacted(false)
        , redaction_count(0)
        , audit_event_id(0)
        , error(LeakageError::None) {}
};

class OutputSanitizer {
public:
    OutputSanitizer(TaintRegistry& registry, AuditLog& audit);

    // Also record Allow decisions at Info severity
    void set_audit_allow(bool enabled) { audit_allow_ = enabled; }
    bool audit_allow() const { return audit_allow_; }

    SanitizeResult sanitize(const std::string& session_id, const std::string& text);

    // Replace the byte ranges of `matches` with their type placeholders.
    // Overlapping ranges are merged and the earliest match names the
    // placeholder. Bytes outside every range are copied unchanged.
    static std::string redact(const std::string& text, const std::vector<TaintMatch>& matches,
                              size_t* replaced = nullptr);

    // Canary occurrences (exact token and bare prefix) as matches
    static std::vector<TaintMatch> canary_matches(const CanaryToken& token, const std::string& text);

    // True when this match alone forces Block
    static bool forces_block(const TaintMatch& match);

private:
    TaintRegistry& registry_;
    AuditLog& audit_;
    bool audit_allow_;

    uint64_t audit_decision(const std::string& session_id, Decision decision,
                            AuditSeverity severity, LeakageVector vector,
                            const std::vector<TaintMatch>& matches,
                            const std::string& description);
};

// Shared by the sanitizer and interceptor audit paths
std::vector<std::string> taint_type_names(const std::vector<TaintMatch>& matches);
std::string describe_matches(const std::vector<TaintMatch>& matches);

} // namespace taintguard

#endif // taintguard_LEAKAGE_SANITIZER_HPP
