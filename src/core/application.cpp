/*
 * taintguard C++17 - Application Implementation
 *
 * Central application singleton: configuration, logging, guard lifecycle and
 * the stdio request loop.
 */
#include <taintguard/core/application.hpp>
#include <taintguard/core/logger.hpp>
#include <taintguard/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <climits>
#include <cerrno>
#include <unistd.h>
#include <poll.h>

namespace taintguard {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - leakage guard for AI agent sessions\n\n"
              << "Usage: " << prog << " [options] [config.json]\n\n"
              << "Options:\n"
              << "  --config FILE  Load configuration from FILE\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Requests are read from stdin, one JSON object per line.\n"
              << "Example:\n"
              << "  echo '{\"op\":\"begin_session\",\"session_id\":\"s1\"}' | " << prog << "\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
}

Json error_response(const std::string& code, const std::string& message) {
    Json resp;
    resp["ok"] = false;
    resp["error"] = code;
    resp["message"] = message;
    return resp;
}

bool require_string(const Json& req, const char* key, std::string& out) {
    if (!req.contains(key) || !req[key].is_string()) return false;
    out = req[key].get<std::string>();
    return true;
}

Json match_to_json(const TaintMatch& m) {
    Json j;
    j["entry_id"] = m.entry_id;
    j["type"] = m.type.to_string();
    j["start"] = m.start;
    j["end"] = m.end;
    j["confidence"] = to_string(m.confidence);
    if (!m.encoding.empty()) j["encoding"] = m.encoding;
    if (!m.location.empty()) j["location"] = m.location;
    return j;
}

Json matches_to_json(const std::vector<TaintMatch>& matches) {
    Json arr = Json::array();
    for (size_t i = 0; i < matches.size(); ++i) {
        arr.push_back(match_to_json(matches[i]));
    }
    return arr;
}

} // anonymous namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_.store(false);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_.store(false);
            return false;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file argument\n";
                return false;
            }
            config_file_ = std::string(argv[++i]);
            continue;
        }
        if (argv[i][0] != '-') {
            config_file_ = std::string(argv[i]);
            continue;
        }
        std::cerr << "Unknown option: " << argv[i] << "\n";
        print_usage(argv[0]);
        return false;
    }
    return true;
}

void Application::setup_logging() {
    Logger& logger = Logger::instance();
    logger.set_level(parse_log_level(config_.get_string("log_level", "info"), LogLevel::INFO));
    if (config_.has("log_color")) {
        logger.set_color(config_.get_bool("log_color", true));
    }
}

void Application::setup_signals() {
    // No SA_RESTART: a blocked poll() returns EINTR and the loop sees running_
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

GuardConfig Application::default_guard_config() const {
    GuardConfig defaults;
    defaults.persistence_enabled = true;

    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        defaults.store.db_path = std::string(home) + "/.taintguard/audit.db";
    } else {
        defaults.store.db_path = ".taintguard/audit.db";
    }

    char cwd[PATH_MAX];
    if (getcwd(cwd, sizeof(cwd)) != nullptr) {
        defaults.interceptor.workspace_root = cwd;
    } else {
        LOG_WARN("[App] getcwd failed (%s); no default workspace root", strerror(errno));
    }
    return defaults;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    setup_signals();

    if (!config_file_.empty()) {
        if (!config_.load_file(config_file_)) {
            LOG_ERROR("Failed to load config from %s, aborting!", config_file_.c_str());
            return false;
        }
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    } else {
        LOG_INFO("No config file given, using built-in defaults");
    }

    setup_logging();
    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    GuardConfig guard_config = GuardConfig::from_config(config_, default_guard_config());
    LOG_INFO("[App] Registry: max_entries=%zu literal_max=%zu decode_depth=%d",
             guard_config.registry.max_entries_per_session,
             guard_config.registry.literal_max_length,
             guard_config.registry.max_decode_depth);
    LOG_INFO("[App] Workspace root: %s", guard_config.interceptor.workspace_root.c_str());

    guard_.reset(new LeakageGuard(guard_config));
    if (!guard_->start()) {
        LOG_WARN("[App] Guard started without durable audit persistence");
    }
    return true;
}

int Application::run() {
    LOG_INFO("Serving requests on stdin (poll interval: 100ms)");

    std::string pending;
    char buf[4096];

    while (running_.load()) {
        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, 100);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[App] poll failed: %s", strerror(errno));
            return 1;
        }
        if (rc == 0) continue;

        ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            LOG_ERROR("[App] read failed: %s", strerror(errno));
            return 1;
        }
        if (n == 0) {
            LOG_INFO("[App] stdin closed");
            break;
        }
        pending.append(buf, static_cast<size_t>(n));

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (trim(line).empty()) continue;
            std::cout << handle_line(line) << "\n";
            std::cout.flush();
        }
    }

    // Last request without a trailing newline
    if (!trim(pending).empty()) {
        std::cout << handle_line(pending) << "\n";
        std::cout.flush();
    }
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");
    if (guard_) {
        guard_->stop();
        guard_.reset();
    }
    LOG_INFO("Goodbye!");
}

// ============================================================================
// Request dispatch
// ============================================================================

std::string Application::handle_line(const std::string& line) {
    Json response;
    try {
        Json request = Json::parse(line);
        response = handle_request(request);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN("[App] Rejecting malformed request: %s", e.what());
        response = error_response("invalid_json", e.what());
    }
    return response.dump(-1, ' ', false, Json::error_handler_t::replace);
}

Json Application::handle_request(const Json& request) {
    if (!request.is_object()) {
        return error_response("invalid_request", "request must be a JSON object");
    }
    if (!guard_) {
        return error_response("not_ready", "guard not initialized");
    }

    std::string op;
    if (!require_string(request, "op", op)) {
        return error_response("invalid_request", "missing 'op'");
    }

    Json response;
    if (op == "begin_session") {
        response = op_begin_session(request);
    } else if (op == "mark") {
        response = op_mark(request);
    } else if (op == "end_session") {
        response = op_end_session(request);
    } else if (op == "sanitize") {
        response = op_sanitize(request);
    } else if (op == "intercept") {
        response = op_intercept(request);
    } else if (op == "scan_input") {
        response = op_scan_input(request);
    } else if (op == "audit") {
        response = op_audit(request);
    } else if (op == "stats") {
        response = op_stats(request);
    } else {
        response = error_response("unknown_op", "unknown op '" + op + "'");
    }

    if (request.contains("id")) {
        response["id"] = request["id"];
    }
    return response;
}

Json Application::op_begin_session(const Json& req) {
    std::string session_id;
    if (!require_string(req, "session_id", session_id) || session_id.empty()) {
        return error_response("invalid_request", "missing 'session_id'");
    }

    SessionResult result = guard_->begin_session(session_id);
    if (!result.success) {
        return error_response(to_string(result.error), result.message);
    }

    Json resp;
    resp["ok"] = true;
    resp["created"] = result.created;
    resp["canary"] = result.canary.token;
    resp["instruction"] = Canary::system_instruction(result.canary);
    return resp;
}

Json Application::op_mark(const Json& req) {
    std::string session_id;
    std::string value;
    std::string type_name;
    if (!require_string(req, "session_id", session_id) ||
        !require_string(req, "value", value) ||
        !require_string(req, "type", type_name)) {
        return error_response("invalid_request", "'session_id', 'value' and 'type' are required");
    }

    TaintType type;
    if (!TaintType::parse(type_name, type)) {
        return error_response("invalid_request", "unknown taint type '" + type_name + "'");
    }
    std::string label;
    if (req.contains("label") && req["label"].is_string()) {
        label = req["label"].get<std::string>();
    }

    MarkResult result = guard_->mark_sensitive(session_id, value, type, label);
    if (!result.success) {
        return error_response(to_string(result.error), result.message);
    }

    Json resp;
    resp["ok"] = true;
    resp["entry_id"] = result.entry_id;
    return resp;
}

Json Application::op_end_session(const Json& req) {
    std::string session_id;
    if (!require_string(req, "session_id", session_id)) {
        return error_response("invalid_request", "missing 'session_id'");
    }

    RevokeResult result = guard_->end_session(session_id);
    Json resp;
    resp["ok"] = true;
    resp["existed"] = result.existed;
    resp["entries_wiped"] = result.entries_wiped;
    resp["canary_wiped"] = result.canary_wiped;
    return resp;
}

Json Application::op_sanitize(const Json& req) {
    std::string session_id;
    std::string text;
    if (!require_string(req, "session_id", session_id) || !require_string(req, "text", text)) {
        return error_response("invalid_request", "'session_id' and 'text' are required");
    }

    SanitizeResult result = guard_->sanitize_output(session_id, text);
    Json resp;
    resp["ok"] = true;
    resp["decision"] = to_string(result.decision);
    resp["text"] = result.text;
    resp["redaction_count"] = result.redaction_count;
    resp["matches"] = matches_to_json(result.matches);
    resp["audit_event_id"] = result.audit_event_id;
    if (result.error != LeakageError::None) {
        resp["error"] = to_string(result.error);
    }
    return resp;
}

Json Application::op_intercept(const Json& req) {
    std::string session_id;
    std::string tool;
    if (!require_string(req, "session_id", session_id) || !require_string(req, "tool", tool)) {
        return error_response("invalid_request", "'session_id' and 'tool' are required");
    }
    Json args = req.contains("args") ? req["args"] : Json::object();

    InterceptResult result = guard_->intercept_tool_call(session_id, tool, args);
    Json resp;
    resp["ok"] = true;
    resp["decision"] = to_string(result.decision);
    resp["display_args"] = result.display_args;
    resp["tool_class"] = to_string(result.tool_class);
    resp["exfil_capable"] = result.exfil_capable;
    resp["patterns"] = result.pattern_names;
    resp["matches"] = matches_to_json(result.matches);
    resp["audit_event_id"] = result.audit_event_id;
    if (!result.reason.empty()) {
        resp["reason"] = result.reason;
    }
    if (result.error != LeakageError::None) {
        resp["error"] = to_string(result.error);
    }
    return resp;
}

Json Application::op_scan_input(const Json& req) {
    std::string session_id;
    std::string text;
    if (!require_string(req, "session_id", session_id) || !require_string(req, "text", text)) {
        return error_response("invalid_request", "'session_id' and 'text' are required");
    }

    InputScanResult result = guard_->scan_input(session_id, text);
    Json matches = Json::array();
    for (size_t i = 0; i < result.injection.matches.size(); ++i) {
        const InjectionMatch& m = result.injection.matches[i];
        Json j;
        j["category"] = to_string(m.category);
        j["pattern"] = m.pattern;
        j["blocking"] = m.is_blocking;
        j["position"] = m.position;
        matches.push_back(j);
    }

    Json resp;
    resp["ok"] = true;
    resp["verdict"] = to_string(result.injection.verdict);
    resp["matches"] = matches;
    resp["audit_event_id"] = result.audit_event_id;
    return resp;
}

Json Application::op_audit(const Json& req) {
    AuditQuery filter;
    if (req.contains("filter")) {
        if (!req["filter"].is_object()) {
            return error_response("invalid_request", "'filter' must be an object");
        }
        filter = AuditQuery::from_json(req["filter"]);
    }

    std::vector<AuditEvent> events = guard_->list_audit_events(filter);
    Json arr = Json::array();
    for (size_t i = 0; i < events.size(); ++i) {
        arr.push_back(events[i].to_json());
    }

    Json resp;
    resp["ok"] = true;
    resp["events"] = arr;
    return resp;
}

Json Application::op_stats(const Json& req) {
    (void)req;
    Json resp;
    resp["ok"] = true;
    resp["audit"] = guard_->audit_stats().to_json();
    resp["sessions"] = guard_->registry().session_count();

    AuditStore* store = guard_->store();
    if (store) {
        Json persistence;
        persistence["db_path"] = store->config().db_path;
        persistence["pending"] = store->pending();
        persistence["written"] = store->written();
        persistence["dropped"] = store->dropped();
        persistence["failures"] = store->failures();
        resp["persistence"] = persistence;
    }
    return resp;
}

} // namespace taintguard
