/*
 * Primus C++ - Policy and Isolation Core
 *
 * Usage:
 *   ./primus [--config config.json]
 */
#include <primus/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = primus::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.is_running() ? 1 : 0;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
