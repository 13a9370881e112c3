/*
 * taintguard C++17 - Leakage Guard Implementation
 */
#include <taintguard/leakage/guard.hpp>
#include <taintguard/core/logger.hpp>

namespace taintguard {

namespace {

size_t size_setting(const Config& cfg, const std::string& key, size_t fallback) {
    int64_t value = cfg.get_int(key, static_cast<int64_t>(fallback));
    if (value < 0) {
        LOG_WARN("[Guard] Ignoring negative value for %s", key.c_str());
        return fallback;
    }
    return static_cast<size_t>(value);
}

int int_setting(const Config& cfg, const std::string& key, int fallback) {
    int64_t value = cfg.get_int(key, fallback);
    if (value < 0 || value > 0x7fffffff) {
        LOG_WARN("[Guard] Ignoring out-of-range value for %s", key.c_str());
        return fallback;
    }
    return static_cast<int>(value);
}

void read_extra_patterns(const Json& node, std::vector<PatternSpec>& out) {
    if (node.is_null()) return;
    if (!node.is_array()) {
        LOG_WARN("[Guard] interceptor.extra_patterns must be an array");
        return;
    }
    for (size_t i = 0; i < node.size(); ++i) {
        const Json& item = node[i];
        if (!item.is_object() || !item.contains("name") || !item.contains("pattern") ||
            !item["name"].is_string() || !item["pattern"].is_string()) {
            LOG_WARN("[Guard] Skipping malformed extra pattern #%zu", i);
            continue;
        }
        PatternSpec spec;
        spec.name = item["name"].get<std::string>();
        spec.pattern = item["pattern"].get<std::string>();
        if (item.contains("target") && item["target"].is_string()) {
            if (!parse_pattern_target(item["target"].get<std::string>(), spec.target)) {
                LOG_WARN("[Guard] Extra pattern '%s' has unknown target, using arguments",
                         spec.name.c_str());
                spec.target = PatternTarget::Arguments;
            }
        }
        out.push_back(spec);
    }
}

} // anonymous namespace

// ============================================================================
// GuardConfig
// ============================================================================

GuardConfig GuardConfig::from_config(const Config& cfg, const GuardConfig& defaults) {
    GuardConfig out = defaults;

    // Registry and scan
    out.registry.max_entries_per_session = size_setting(cfg, "registry.max_entries_per_session",
                                                        defaults.registry.max_entries_per_session);
    out.registry.literal_max_length = size_setting(cfg, "registry.literal_max_length",
                                                   defaults.registry.literal_max_length);
    out.registry.min_value_length = size_setting(cfg, "registry.min_value_length",
                                                 defaults.registry.min_value_length);
    out.registry.hash_credentials = cfg.get_bool("registry.hash_credentials",
                                                 defaults.registry.hash_credentials);
    out.registry.max_decode_depth = int_setting(cfg, "scan.max_decode_depth",
                                                defaults.registry.max_decode_depth);
    out.registry.min_encoded_length = size_setting(cfg, "scan.min_encoded_length",
                                                   defaults.registry.min_encoded_length);

    out.sanitizer_audit_allow = cfg.get_bool("sanitizer.audit_allow", defaults.sanitizer_audit_allow);

    // Interceptor
    out.interceptor.workspace_root = cfg.get_string("interceptor.workspace_root",
                                                    defaults.interceptor.workspace_root);
    out.interceptor.allowed_paths = cfg.get_string_list("interceptor.allowed_paths",
                                                        defaults.interceptor.allowed_paths);
    out.interceptor.network_tools = cfg.get_string_list("interceptor.network_tools",
                                                        defaults.interceptor.network_tools);
    out.interceptor.command_tools = cfg.get_string_list("interceptor.command_tools",
                                                        defaults.interceptor.command_tools);
    out.interceptor.workspace_tools = cfg.get_string_list("interceptor.workspace_tools",
                                                          defaults.interceptor.workspace_tools);
    out.interceptor.write_tools = cfg.get_string_list("interceptor.write_tools",
                                                      defaults.interceptor.write_tools);
    out.interceptor.path_keys = cfg.get_string_list("interceptor.path_keys",
                                                    defaults.interceptor.path_keys);
    read_extra_patterns(cfg.get_json("interceptor.extra_patterns"), out.interceptor.extra_patterns);
    out.interceptor.audit_allow = out.sanitizer_audit_allow;

    // Audit persistence
    out.persistence_enabled = cfg.get_bool("audit.persistence.enabled", defaults.persistence_enabled);
    out.store.db_path = cfg.get_string("audit.persistence.db_path", defaults.store.db_path);
    out.store.queue_capacity = size_setting(cfg, "audit.queue_capacity", defaults.store.queue_capacity);
    out.store.retry_initial_ms = int_setting(cfg, "audit.retry_initial_ms", defaults.store.retry_initial_ms);
    out.store.retry_max_ms = int_setting(cfg, "audit.retry_max_ms", defaults.store.retry_max_ms);
    out.restore_limit = size_setting(cfg, "audit.restore_limit", defaults.restore_limit);

    // Injection
    out.injection_enabled = cfg.get_bool("injection.enabled", defaults.injection_enabled);
    out.injection_detect_encoded = cfg.get_bool("injection.detect_encoded",
                                                defaults.injection_detect_encoded);

    if (out.registry.min_value_length == 0) {
        out.registry.min_value_length = 1;
    }
    if (out.store.retry_max_ms < out.store.retry_initial_ms) {
        out.store.retry_max_ms = out.store.retry_initial_ms;
    }
    return out;
}

// ============================================================================
// LeakageGuard
// ============================================================================

LeakageGuard::LeakageGuard(const GuardConfig& config)
    : config_(config)
    , registry_(config.registry)
    , sanitizer_(registry_, audit_)
    , interceptor_(registry_, audit_, config.interceptor)
    , started_(false)
{
    sanitizer_.set_audit_allow(config_.sanitizer_audit_allow);
    detector_.set_detect_encoded(config_.injection_detect_encoded);
}

LeakageGuard::~LeakageGuard() {
    stop();
}

bool LeakageGuard::start() {
    if (started_) return true;
    started_ = true;

    if (!config_.persistence_enabled) {
        LOG_INFO("[Guard] Audit persistence disabled, events kept in memory only");
        return true;
    }
    if (config_.store.db_path.empty()) {
        LOG_ERROR("[Guard] Audit persistence enabled but no database path configured");
        return false;
    }

    std::unique_ptr<AuditStore> store(new AuditStore(config_.store));
    if (!store->open()) {
        LOG_ERROR("[Guard] Cannot open audit store at %s; continuing in memory",
                  config_.store.db_path.c_str());
        return false;
    }

    std::vector<AuditEvent> history = store->load_recent(config_.restore_limit);
    uint64_t last_id = store->max_event_id();
    audit_.restore(history, last_id);

    std::string chain_error;
    if (!store->verify_chain(&chain_error)) {
        LOG_WARN("[Guard] Audit hash chain check failed: %s", chain_error.c_str());
    }

    if (!store->start()) {
        LOG_ERROR("[Guard] Audit writer did not start; continuing in memory");
        return false;
    }

    store_ = std::move(store);
    audit_.set_sink(store_.get());
    LOG_INFO("[Guard] Audit persistence -> %s", config_.store.db_path.c_str());
    return true;
}

void LeakageGuard::stop() {
    if (!started_) return;
    started_ = false;

    audit_.set_sink(nullptr);
    if (store_) {
        store_->stop();
        store_->close();
        store_.reset();
    }
}

SessionResult LeakageGuard::begin_session(const std::string& session_id) {
    SessionResult result = registry_.begin_session(session_id);
    if (result.success && result.created) {
        LOG_INFO("[Guard] Session '%s' started", session_id.c_str());
    }
    return result;
}

MarkResult LeakageGuard::mark_sensitive(const std::string& session_id, const std::string& value,
                                        const TaintType& type, const std::string& label) {
    MarkResult result = registry_.mark(session_id, value, type, label);
    if (!result.success) {
        LOG_WARN("[Guard] mark_sensitive failed for session '%s': %s (%s)",
                 session_id.c_str(), to_string(result.error), result.message.c_str());
    }
    return result;
}

RevokeResult LeakageGuard::end_session(const std::string& session_id) {
    RevokeResult result = registry_.revoke_session(session_id);
    if (result.existed) {
        LOG_INFO("[Guard] Session '%s' ended (%zu entries, %zu canary wiped)",
                 session_id.c_str(), result.entries_wiped, result.canary_wiped);
    }
    return result;
}

SanitizeResult LeakageGuard::sanitize_output(const std::string& session_id, const std::string& text) {
    return sanitizer_.sanitize(session_id, text);
}

InterceptResult LeakageGuard::intercept_tool_call(const std::string& session_id,
                                                  const std::string& tool_name, const Json& args) {
    return interceptor_.intercept(session_id, tool_name, args);
}

InputScanResult LeakageGuard::scan_input(const std::string& session_id, const std::string& text) {
    InputScanResult result;
    if (!config_.injection_enabled) {
        return result;
    }

    result.injection = detector_.scan(text);
    if (result.injection.verdict == InjectionVerdict::Clean) {
        return result;
    }

    AuditEvent event;
    event.session_id = session_id;
    event.vector = LeakageVector::PromptInjection;
    if (result.injection.verdict == InjectionVerdict::Blocked) {
        event.severity = AuditSeverity::Critical;
        event.decision = AuditDecision::Block;
        event.description = "Prompt injection blocked: " + result.injection.categories();
    } else {
        event.severity = AuditSeverity::Warning;
        event.decision = AuditDecision::Flag;
        event.description = "Suspicious input: " + result.injection.categories();
    }
    if (!result.injection.matches.empty()) {
        event.pattern_name = result.injection.matches.front().pattern;
    }
    result.audit_event_id = audit_.record(event);

    LOG_WARN("[Guard] Input for session '%s' %s (%zu pattern hits)",
             session_id.c_str(), to_string(result.injection.verdict),
             result.injection.matches.size());
    return result;
}

std::vector<AuditEvent> LeakageGuard::list_audit_events(const AuditQuery& filter) const {
    return audit_.query(filter);
}

AuditStats LeakageGuard::audit_stats() const {
    return audit_.stats();
}

} // namespace taintguard
