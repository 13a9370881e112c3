/*
 * taintguard C++17 - Leakage Guard
 *
 * Facade used by the agent runtime. Owns the taint registry, the audit log
 * and its durable store, the output sanitizer, the tool interceptor and the
 * prompt-injection detector.
 *
 * Typical turn:
 *   guard.begin_session(id)          -> splice canary instruction into prompt
 *   guard.mark_sensitive(id, ...)    -> for every sensitive value injected
 *   guard.scan_input(id, user_text)  -> before the model sees user input
 *   guard.sanitize_output(id, text)  -> before output reaches the user
 *   guard.intercept_tool_call(...)   -> before a tool runs
 *   guard.end_session(id)
 */
#ifndef taintguard_LEAKAGE_GUARD_HPP
#define taintguard_LEAKAGE_GUARD_HPP

#include "types.hpp"
#include "taint.hpp"
#include "audit.hpp"
#include "audit_store.hpp"
#include "sanitizer.hpp"
#include "interceptor.hpp"
#include "injection.hpp"
#include <taintguard/core/config.hpp>

#include <string>
#include <vector>
#include <memory>

namespace taintguard {

// ============================================================================
// Configuration
// ============================================================================

struct GuardConfig {
    RegistryConfig registry;
    bool sanitizer_audit_allow;
    InterceptorConfig interceptor;

    bool persistence_enabled;
    AuditStoreConfig store;
    size_t restore_limit;

    bool injection_enabled;
    bool injection_detect_encoded;

    GuardConfig()
        : sanitizer_audit_allow(false)
        , persistence_enabled(false)
        , restore_limit(10000)
        , injection_enabled(true)
        , injection_detect_encoded(true) {}

    // Read the guard keys from `cfg`. Anything missing keeps the value found
    // in `defaults`, which is where the caller puts computed paths
    // (workspace root, audit database).
    static GuardConfig from_config(const Config& cfg, const GuardConfig& defaults = GuardConfig());
};

struct InputScanResult {
    InjectionResult injection;
    uint64_t audit_event_id;

    InputScanResult() : audit_event_id(0) {}

    bool blocked() const { return injection.verdict == InjectionVerdict::Blocked; }
};

// ============================================================================
// LeakageGuard
// ============================================================================

class LeakageGuard {
public:
    explicit LeakageGuard(const GuardConfig& config = GuardConfig());
    ~LeakageGuard();

    // Open the audit store (when enabled), restore recent history into the
    // in-memory log and start the writer. Returns false if the store cannot
    // be opened; the guard keeps working in memory in that case.
    bool start();
    // Drain the persistence queue and stop the writer
    void stop();

    SessionResult begin_session(const std::string& session_id);
    MarkResult mark_sensitive(const std::string& session_id, const std::string& value,
                              const TaintType& type, const std::string& label = "");
    RevokeResult end_session(const std::string& session_id);

    SanitizeResult sanitize_output(const std::string& session_id, const std::string& text);
    InterceptResult intercept_tool_call(const std::string& session_id, const std::string& tool_name,
                                        const Json& args);
    InputScanResult scan_input(const std::string& session_id, const std::string& text);

    std::vector<AuditEvent> list_audit_events(const AuditQuery& filter) const;
    AuditStats audit_stats() const;

    TaintRegistry& registry() { return registry_; }
    AuditLog& audit() { return audit_; }
    AuditStore* store() { return store_.get(); }
    ToolInterceptor& interceptor() { return interceptor_; }
    InjectionDetector& detector() { return detector_; }
    const GuardConfig& config() const { return config_; }

private:
    GuardConfig config_;
    TaintRegistry registry_;
    AuditLog audit_;
    std::unique_ptr<AuditStore> store_;
    OutputSanitizer sanitizer_;
    ToolInterceptor interceptor_;
    InjectionDetector detector_;
    bool started_;

    LeakageGuard(const LeakageGuard&);
    LeakageGuard& operator=(const LeakageGuard&);
};

} // namespace taintguard

#endif // taintguard_LEAKAGE_GUARD_HPP
