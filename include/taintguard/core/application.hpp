/*
 * taintguard C++17 - Application
 *
 * Host process for the leakage guard. Reads one JSON request per line on
 * stdin and writes one JSON response per line on stdout:
 *
 *   {"id": 1, "op": "begin_session", "session_id": "s1"}
 *   {"id": 2, "op": "mark", "session_id": "s1", "value": "...", "type": "pii"}
 *   {"id": 3, "op": "sanitize", "session_id": "s1", "text": "..."}
 *   {"id": 4, "op": "intercept", "session_id": "s1", "tool": "http_post", "args": {...}}
 *   {"id": 5, "op": "scan_input", "session_id": "s1", "text": "..."}
 *   {"id": 6, "op": "audit", "filter": {"session_id": "s1", "min_severity": "warning"}}
 *   {"id": 7, "op": "stats"}
 *   {"id": 8, "op": "end_session", "session_id": "s1"}
 *
 * Logs go to stderr.
 */
#ifndef taintguard_CORE_APPLICATION_HPP
#define taintguard_CORE_APPLICATION_HPP

#include "config.hpp"
#include "json.hpp"
#include <taintguard/leakage/guard.hpp>

#include <string>
#include <memory>
#include <atomic>

namespace taintguard {

struct AppInfo {
    static constexpr const char* NAME = "taintguard";
    static constexpr const char* VERSION = "0.3.0";
};

class Application {
public:
    static Application& instance();

    // Returns false for --help/--version (is_running() == false) or on
    // fatal setup errors (is_running() == true)
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_.store(false); }
    bool is_running() const { return running_.load(); }

    // One request document in, one response document out
    Json handle_request(const Json& request);
    // Raw line variant: parse errors become an error response
    std::string handle_line(const std::string& line);

    LeakageGuard* guard() { return guard_.get(); }
    const Config& config() const { return config_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    std::atomic<bool> running_;
    Config config_;
    std::string config_file_;
    std::unique_ptr<LeakageGuard> guard_;

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    void setup_signals();
    GuardConfig default_guard_config() const;

    Json op_begin_session(const Json& req);
    Json op_mark(const Json& req);
    Json op_end_session(const Json& req);
    Json op_sanitize(const Json& req);
    Json op_intercept(const Json& req);
    Json op_scan_input(const Json& req);
    Json op_audit(const Json& req);
    Json op_stats(const Json& req);
};

} // namespace taintguard

#endif // taintguard_CORE_APPLICATION_HPP
