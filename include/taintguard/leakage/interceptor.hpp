/*
 * taintguard C++17 - Tool Interceptor
 *
 * Checks every tool call the model requests before it runs. Each argument
 * leaf is scanned for canaries and tainted values; the tool name and argument
 * text are matched against a denylist of exfiltration patterns; write tools
 * are checked against the workspace root.
 *
 * Policy, most severe wins:
 *   canary anywhere                         -> Block (Critical, CanaryLeak)
 *   taint on an exfiltration-capable tool   -> Block (Critical for credentials)
 *   denylist hit                            -> Block (Warning)
 *   taint on a workspace-local tool         -> Modify (display copy redacted,
 *                                              tool runs with the original)
 *   otherwise                               -> Allow
 */
#ifndef taintguard_LEAKAGE_INTERCEPTOR_HPP
#define taintguard_LEAKAGE_INTERCEPTOR_HPP

#include "types.hpp"
#include "taint.hpp"
#include "audit.hpp"
#include <taintguard/core/json.hpp>
#include <taintguard/core/workspace.hpp>

#include <string>
#include <vector>
#include <regex>
#include <shared_mutex>
#include <cstdint>

namespace taintguard {

enum class ToolClass {
    Network,        // moves data off the host
    Command,        // shell execution; exfiltration-capable on a denylist hit
    Workspace,      // confined to the session workspace
    Unknown         // treated as exfiltration-capable
};

enum class PatternTarget {
    ToolName,
    Arguments
};

const char* to_string(ToolClass tool_class);
const char* to_string(PatternTarget target);
bool parse_pattern_target(const std::string& text, PatternTarget& out);

struct DangerousPattern {
    std::string name;
    std::string source;
    std::regex regex;
    PatternTarget target;
};

struct PatternSpec {
    std::string name;
    std::string pattern;
    PatternTarget target;

    PatternSpec() : target(PatternTarget::Arguments) {}
    PatternSpec(const std::string& n, const std::string& p, PatternTarget t)
        : name(n), pattern(p), target(t) {}
};

struct InterceptorConfig {
    std::string workspace_root;
    std::vector<std::string> allowed_paths;
    std::vector<std::string> network_tools;
    std::vector<std::string> command_tools;
    std::vector<std::string> workspace_tools;
    std::vector<std::string> write_tools;
    std::vector<std::string> path_keys;     // argument keys holding a target path
    std::vector<PatternSpec> extra_patterns;
    bool audit_allow;

    InterceptorConfig();

    static std::vector<std::string> default_network_tools();
    static std::vector<std::string> default_command_tools();
    static std::vector<std::string> default_workspace_tools();
    static std::vector<std::string> default_write_tools();
    static std::vector<std::string> default_path_keys();
};

struct InterceptResult {
    InterceptDecision decision;
    Json display_args;                      // redacted copy for logs and previews
    std::vector<TaintMatch> matches;        // location = JSON pointer of the leaf
    std::string pattern_name;               // first denylist hit
    std::vector<std::string> pattern_names;
    ToolClass tool_class;
    bool exfil_capable;
    uint64_t audit_event_id;
    LeakageError error;
    std::string reason;

    InterceptResult()
        : decision(InterceptDecision::Allow)
        , tool_class(ToolClass::Unknown)
        , exfil_capable(true)
        , audit_event_id(0)
        , error(LeakageError::None) {}
};

class ToolInterceptor {
public:
    static const char* WRITE_OUTSIDE_WORKSPACE;

    ToolInterceptor(TaintRegistry& registry, AuditLog& audit,
                    const InterceptorConfig& config = InterceptorConfig());

    InterceptResult intercept(const std::string& session_id, const std::string& tool_name,
                              const Json& args);

    // Add a denylist regex (ECMAScript, case-insensitive). Returns false and
    // fills `error` when the expression does not compile.
    bool add_pattern(const std::string& name, const std::string& pattern,
                     PatternTarget target, std::string* error = nullptr);
    std::vector<std::string> pattern_names() const;

    ToolClass classify(const std::string& tool_name) const;
    bool is_write_tool(const std::string& tool_name) const;

    // Denylist hits for this call (tool-name patterns, argument patterns,
    // and the workspace check for write tools)
    std::vector<std::string> match_patterns(const std::string& tool_name, ToolClass tool_class,
                                            const Json& args) const;

    const Workspace& workspace() const { return workspace_; }
    const InterceptorConfig& config() const { return config_; }

private:
    struct ArgLeaf {
        std::string pointer;
        std::string text;
    };

    TaintRegistry& registry_;
    AuditLog& audit_;
    InterceptorConfig config_;
    Workspace workspace_;

    std::vector<DangerousPattern> patterns_;
    mutable std::shared_mutex patterns_mutex_;

    void add_builtin_patterns();
    static void collect_leaves(const Json& node, const std::string& pointer, std::vector<ArgLeaf>& out);
    static std::string escape_pointer_token(const std::string& token);
    static bool list_contains(const std::vector<std::string>& list, const std::string& name);

    uint64_t audit_decision(const std::string& session_id, const std::string& tool_name,
                            InterceptDecision decision, AuditSeverity severity,
                            LeakageVector vector, const std::vector<TaintMatch>& matches,
                            const std::string& pattern_name, const std::string& description);
};

} // namespace taintguard

#endif // taintguard_LEAKAGE_INTERCEPTOR_HPP
