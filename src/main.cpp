/*
 * taintguard C++17 - Leakage guard for AI agent sessions
 *
 * Usage:
 *   ./taintguard [--config config.json]
 *
 * Requests are read from stdin as JSON lines; see application.hpp.
 */
#include <taintguard/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = taintguard::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.is_running() ? 1 : 0;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
