/*
 * gatedrepl C++ - Gated code execution REPL
 *
 * Usage:
 *   ./gatedrepl [options] [config.json]
 *
 * Reads code and slash commands from stdin; see /help.
 */
#include <gatedrepl/app/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = gatedrepl::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.info_only() ? 0 : 1;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
