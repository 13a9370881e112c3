/*
 * taintguard C++17 - Tool Interceptor Implementation
 */
#include <taintguard/leakage/interceptor.hpp>
#include <taintguard/leakage/sanitizer.hpp>
#include <taintguard/core/logger.hpp>
#include <taintguard/core/utils.hpp>

#include <map>

namespace taintguard {

const char* ToolInterceptor::WRITE_OUTSIDE_WORKSPACE = "write_outside_workspace";

// ============================================================================
// Enum conversions
// ============================================================================

const char* to_string(ToolClass tool_class) {
    switch (tool_class) {
        case ToolClass::Network: return "network";
        case ToolClass::Command: return "command";
        case ToolClass::Workspace: return "workspace";
        case ToolClass::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(PatternTarget target) {
    switch (target) {
        case PatternTarget::ToolName: return "tool_name";
        case PatternTarget::Arguments: return "arguments";
    }
    return "arguments";
}

bool parse_pattern_target(const std::string& text, PatternTarget& out) {
    std::string lower = to_lower(trim(text));
    if (lower == "tool_name" || lower == "tool" || lower == "name") {
        out = PatternTarget::ToolName;
        return true;
    }
    if (lower == "arguments" || lower == "args" || lower.empty()) {
        out = PatternTarget::Arguments;
        return true;
    }
    return false;
}

// ============================================================================
// InterceptorConfig
// ============================================================================

InterceptorConfig::InterceptorConfig()
    : network_tools(default_network_tools())
    , command_tools(default_command_tools())
    , workspace_tools(default_workspace_tools())
    , write_tools(default_write_tools())
    , path_keys(default_path_keys())
    , audit_allow(false) {}

std::vector<std::string> InterceptorConfig::default_network_tools() {
    return {"http_get", "http_post", "http_request", "fetch", "web_fetch", "web_search",
            "browser", "browse", "send_email", "send_message", "webhook", "upload", "download"};
}

std::vector<std::string> InterceptorConfig::default_command_tools() {
    return {"bash", "shell", "exec", "run_command", "execute", "terminal", "system"};
}

std::vector<std::string> InterceptorConfig::default_workspace_tools() {
    return {"read_file", "write_file", "edit_file", "append_file", "create_file", "delete_file",
            "move_file", "copy_file", "list_dir", "list_files", "search_files", "grep", "glob"};
}

std::vector<std::string> InterceptorConfig::default_write_tools() {
    return {"write_file", "edit_file", "append_file", "create_file", "delete_file",
            "move_file", "copy_file"};
}

std::vector<std::string> InterceptorConfig::default_path_keys() {
    return {"path", "file", "file_path", "filename", "target", "destination", "dest",
            "output", "output_path"};
}

// ============================================================================
// ToolInterceptor
// ============================================================================

ToolInterceptor::ToolInterceptor(TaintRegistry& registry, AuditLog& audit,
                                 const InterceptorConfig& config)
    : registry_(registry)
    , audit_(audit)
    , config_(config)
    , workspace_(config.workspace_root) {
    for (size_t i = 0; i < config_.allowed_paths.size(); ++i) {
        workspace_.allow_path(config_.allowed_paths[i]);
    }

    add_builtin_patterns();
    for (size_t i = 0; i < config_.extra_patterns.size(); ++i) {
        const PatternSpec& spec = config_.extra_patterns[i];
        std::string error;
        if (!add_pattern(spec.name, spec.pattern, spec.target, &error)) {
            LOG_WARN("[Interceptor] Skipping pattern '%s': %s", spec.name.c_str(), error.c_str());
        }
    }
    LOG_DEBUG("[Interceptor] %zu denylist patterns, workspace root '%s'",
              patterns_.size(), workspace_.root().c_str());
}

void ToolInterceptor::add_builtin_patterns() {
    static const struct {
        const char* name;
        const char* pattern;
        PatternTarget target;
    } BUILTIN[] = {
        {"network_utility_tool", "^(curl|wget|nc|ncat|netcat|socat|telnet|scp|sftp|ftp|rsync)$",
         PatternTarget::ToolName},
        {"curl_wget", "\\b(curl|wget)\\b", PatternTarget::Arguments},
        {"netcat", "\\b(nc|ncat|netcat|socat|telnet)\\b", PatternTarget::Arguments},
        {"remote_copy", "\\b(scp|sftp|rsync|ssh)\\b", PatternTarget::Arguments},
        {"dev_tcp_redirect", "/dev/(tcp|udp)/", PatternTarget::Arguments},
        {"dns_lookup", "\\b(nslookup|dig)\\b", PatternTarget::Arguments},
        {"remote_url", "\\b(https?|ftp)://", PatternTarget::Arguments},
        {nullptr, nullptr, PatternTarget::Arguments}
    };

    for (size_t i = 0; BUILTIN[i].name; ++i) {
        std::string error;
        if (!add_pattern(BUILTIN[i].name, BUILTIN[i].pattern, BUILTIN[i].target, &error)) {
            LOG_ERROR("[Interceptor] Built-in pattern '%s' rejected: %s", BUILTIN[i].name, error.c_str());
        }
    }
}

bool ToolInterceptor::add_pattern(const std::string& name, const std::string& pattern,
                                  PatternTarget target, std::string* error) {
    if (name.empty() || pattern.empty()) {
        if (error) *error = "pattern name and expression are required";
        return false;
    }

    DangerousPattern dp;
    dp.name = name;
    dp.source = pattern;
    dp.target = target;
    try {
        dp.regex = std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        if (error) *error = e.what();
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(patterns_mutex_);
    patterns_.push_back(dp);
    return true;
}

std::vector<std::string> ToolInterceptor::pattern_names() const {
    std::shared_lock<std::shared_mutex> lock(patterns_mutex_);
    std::vector<std::string> names;
    names.reserve(patterns_.size());
    for (size_t i = 0; i < patterns_.size(); ++i) {
        names.push_back(patterns_[i].name);
    }
    return names;
}

bool ToolInterceptor::list_contains(const std::vector<std::string>& list, const std::string& name) {
    for (size_t i = 0; i < list.size(); ++i) {
        if (to_lower(list[i]) == name) return true;
    }
    return false;
}

ToolClass ToolInterceptor::classify(const std::string& tool_name) const {
    const std::string name = to_lower(trim(tool_name));
    if (list_contains(config_.network_tools, name)) return ToolClass::Network;
    if (list_contains(config_.command_tools, name)) return ToolClass::Command;
    if (list_contains(config_.workspace_tools, name)) return ToolClass::Workspace;
    return ToolClass::Unknown;
}

bool ToolInterceptor::is_write_tool(const std::string& tool_name) const {
    return list_contains(config_.write_tools, to_lower(trim(tool_name)));
}

std::string ToolInterceptor::escape_pointer_token(const std::string& token) {
    std::string out;
    out.reserve(token.size());
    for (size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '~') out += "~0";
        else if (token[i] == '/') out += "~1";
        else out += token[i];
    }
    return out;
}

void ToolInterceptor::collect_leaves(const Json& node, const std::string& pointer,
                                     std::vector<ArgLeaf>& out) {
    if (node.is_object()) {
        for (Json::const_iterator it = node.begin(); it != node.end(); ++it) {
            collect_leaves(it.value(), pointer + "/" + escape_pointer_token(it.key()), out);
        }
    } else if (node.is_array()) {
        for (size_t i = 0; i < node.size(); ++i) {
            collect_leaves(node[i], pointer + "/" + std::to_string(i), out);
        }
    } else if (node.is_string()) {
        ArgLeaf leaf;
        leaf.pointer = pointer;
        leaf.text = node.get<std::string>();
        out.push_back(leaf);
    } else if (node.is_number()) {
        ArgLeaf leaf;
        leaf.pointer = pointer;
        leaf.text = node.dump();
        out.push_back(leaf);
    }
}

std::vector<std::string> ToolInterceptor::match_patterns(const std::string& tool_name, ToolClass tool_class,
                                                         const Json& args) const {
    std::vector<std::string> hits;
    std::vector<ArgLeaf> leaves;
    collect_leaves(args, "", leaves);

    const bool scan_arguments = tool_class == ToolClass::Command || tool_class == ToolClass::Unknown;
    {
        std::shared_lock<std::shared_mutex> lock(patterns_mutex_);
        for (size_t p = 0; p < patterns_.size(); ++p) {
            const DangerousPattern& dp = patterns_[p];
            bool hit = false;
            if (dp.target == PatternTarget::ToolName) {
                hit = std::regex_search(tool_name, dp.regex);
            } else if (scan_arguments) {
                for (size_t i = 0; i < leaves.size() && !hit; ++i) {
                    hit = std::regex_search(leaves[i].text, dp.regex);
                }
            }
            if (hit) hits.push_back(dp.name);
        }
    }

    if (is_write_tool(tool_name) && args.is_object()) {
        for (size_t k = 0; k < config_.path_keys.size(); ++k) {
            Json::const_iterator it = args.find(config_.path_keys[k]);
            if (it == args.end() || !it->is_string()) continue;
            if (!workspace_.contains(it->get<std::string>())) {
                hits.push_back(WRITE_OUTSIDE_WORKSPACE);
                break;
            }
        }
    }
    return hits;
}

uint64_t ToolInterceptor::audit_decision(const std::string& session_id, const std::string& tool_name,
                                         InterceptDecision decision, AuditSeverity severity,
                                         LeakageVector vector, const std::vector<TaintMatch>& matches,
                                         const std::string& pattern_name, const std::string& description) {
    AuditEvent event;
    event.session_id = session_id;
    event.severity = severity;
    event.vector = vector;
    switch (decision) {
        case InterceptDecision::Allow: event.decision = AuditDecision::Allow; break;
        case InterceptDecision::Block: event.decision = AuditDecision::Block; break;
        case InterceptDecision::Modify: event.decision = AuditDecision::Modify; break;
    }
    event.entry_ids = unique_entry_ids(matches);
    event.taint_types = taint_type_names(matches);
    event.tool_name = tool_name;
    event.pattern_name = pattern_name;
    event.description = description;
    return audit_.record(event);
}

InterceptResult ToolInterceptor::intercept(const std::string& session_id, const std::string& tool_name,
                                           const Json& args) {
    InterceptResult result;
    result.tool_class = classify(tool_name);

    CanaryToken token;
    if (!registry_.canary_for(session_id, token)) {
        LOG_WARN("[Interceptor] Tool '%s' for unknown session '%s' refused",
                 tool_name.c_str(), session_id.c_str());
        result.decision = InterceptDecision::Block;
        result.error = LeakageError::InvalidSession;
        result.reason = "unknown or ended session";
        result.audit_event_id = audit_decision(session_id, tool_name, InterceptDecision::Block,
            AuditSeverity::Warning, LeakageVector::ToolArgument, result.matches, "",
            "Tool '" + tool_name + "' refused: unknown or ended session");
        return result;
    }

    std::vector<ArgLeaf> leaves;
    collect_leaves(args, "", leaves);

    // Per-leaf matches, kept for building the display copy
    std::map<std::string, std::vector<TaintMatch> > by_leaf;
    std::string whole_doc_text;
    bool whole_doc = false;

    // 1. Canary
    std::vector<TaintMatch> canary;
    for (size_t i = 0; i < leaves.size(); ++i) {
        std::vector<TaintMatch> hits = OutputSanitizer::canary_matches(token, leaves[i].text);
        for (size_t k = 0; k < hits.size(); ++k) {
            hits[k].location = leaves[i].pointer;
            canary.push_back(hits[k]);
            by_leaf[leaves[i].pointer].push_back(hits[k]);
        }
    }
    if (canary.empty()) {
        // Object keys are not leaves; check the serialized form
        whole_doc_text = args.dump(-1, ' ', false, Json::error_handler_t::replace);
        canary = OutputSanitizer::canary_matches(token, whole_doc_text);
        whole_doc = !canary.empty();
    }

    // 2. Registry scan per leaf
    std::vector<TaintMatch> matches = canary;
    bool decode_truncated = false;
    if (canary.empty()) {
        for (size_t i = 0; i < leaves.size(); ++i) {
            ScanResult scan = registry_.scan(session_id, leaves[i].text);
            decode_truncated = decode_truncated || scan.decode_truncated;
            if (!scan.success) {
                result.decision = InterceptDecision::Block;
                result.error = scan.error;
                result.reason = "session ended during interception";
                result.audit_event_id = audit_decision(session_id, tool_name, InterceptDecision::Block,
                    AuditSeverity::Warning, LeakageVector::ToolArgument, result.matches, "",
                    "Tool '" + tool_name + "' refused: session ended");
                return result;
            }
            for (size_t k = 0; k < scan.matches.size(); ++k) {
                scan.matches[k].location = leaves[i].pointer;
                matches.push_back(scan.matches[k]);
                by_leaf[leaves[i].pointer].push_back(scan.matches[k]);
            }
        }
        if (matches.empty()) {
            ScanResult scan = registry_.scan(session_id, whole_doc_text);
            decode_truncated = decode_truncated || scan.decode_truncated;
            if (scan.success && !scan.matches.empty()) {
                matches = scan.matches;
                whole_doc = true;
            }
        }
    }
    result.matches = matches;

    // 3. Denylist
    result.pattern_names = match_patterns(tool_name, result.tool_class, args);
    if (!result.pattern_names.empty()) {
        result.pattern_name = result.pattern_names.front();
    }
    result.exfil_capable = result.tool_class == ToolClass::Network ||
                           result.tool_class == ToolClass::Unknown ||
                           !result.pattern_names.empty();

    // Display copy: matched spans of each leaf replaced with placeholders
    if (whole_doc) {
        result.display_args = Json(OutputSanitizer::redact(whole_doc_text, matches));
    } else {
        result.display_args = args;
        for (std::map<std::string, std::vector<TaintMatch> >::const_iterator it = by_leaf.begin();
             it != by_leaf.end(); ++it) {
            const Json& original = args.at(Json::json_pointer(it->first));
            const std::string text = original.is_string() ? original.get<std::string>() : original.dump();
            result.display_args[Json::json_pointer(it->first)] = OutputSanitizer::redact(text, it->second);
        }
    }

    // 4. Decide
    bool canary_type = false;
    bool hard = false;
    for (size_t i = 0; i < matches.size(); ++i) {
        switch (matches[i].type.kind) {
            case TaintKind::SystemPromptCanary:
                canary_type = true;
                hard = true;
                break;
            case TaintKind::Credential:
                hard = true;
                break;
            case TaintKind::Pii:
            case TaintKind::ProprietarySource:
            case TaintKind::Custom:
                break;
        }
    }

    const std::string summary = describe_matches(matches);
    if (canary_type) {
        result.decision = InterceptDecision::Block;
        result.reason = "system prompt canary in arguments";
        result.audit_event_id = audit_decision(session_id, tool_name, result.decision,
            AuditSeverity::Critical, LeakageVector::CanaryLeak, matches, result.pattern_name,
            "Tool '" + tool_name + "' blocked: canary in arguments, " + summary);
    } else if (!matches.empty() && result.exfil_capable) {
        result.decision = InterceptDecision::Block;
        result.reason = "tainted arguments on exfiltration-capable tool";
        result.audit_event_id = audit_decision(session_id, tool_name, result.decision,
            hard ? AuditSeverity::Critical : AuditSeverity::Warning, LeakageVector::ToolArgument,
            matches, result.pattern_name,
            "Tool '" + tool_name + "' (" + to_string(result.tool_class) + ") blocked: " + summary);
    } else if (!result.pattern_names.empty()) {
        result.decision = InterceptDecision::Block;
        result.reason = "denylisted pattern: " + join(result.pattern_names, ", ");
        result.audit_event_id = audit_decision(session_id, tool_name, result.decision,
            AuditSeverity::Warning, LeakageVector::ToolArgument, matches, result.pattern_name,
            "Tool '" + tool_name + "' blocked by pattern " + result.pattern_name);
    } else if (decode_truncated) {
        result.decision = InterceptDecision::Block;
        result.reason = "decode limit reached";
        result.audit_event_id = audit_decision(session_id, tool_name, result.decision,
            AuditSeverity::Warning, LeakageVector::ToolArgument, matches, "",
            "Tool '" + tool_name + "' refused: too many encoded spans to inspect");
    } else if (!matches.empty()) {
        result.decision = InterceptDecision::Modify;
        result.reason = "tainted arguments on workspace-local tool";
        result.audit_event_id = audit_decision(session_id, tool_name, result.decision,
            AuditSeverity::Warning, LeakageVector::ToolArgument, matches, "",
            "Tool '" + tool_name + "' arguments redacted for display: " + summary);
    } else {
        result.decision = InterceptDecision::Allow;
        if (config_.audit_allow) {
            result.audit_event_id = audit_decision(session_id, tool_name, result.decision,
                AuditSeverity::Info, LeakageVector::ToolArgument, matches, "",
                "Tool '" + tool_name + "' allowed");
        }
    }

    if (result.decision != InterceptDecision::Allow) {
        LOG_INFO("[Interceptor] %s tool '%s' in session '%s' (%s)",
                 to_string(result.decision), tool_name.c_str(), session_id.c_str(),
                 result.reason.c_str());
    }
    return result;
}

} // namespace taintguard
