/*
 * sqlgate - sandboxed SQL query validator
 *
 * Usage:
 *   ./sqlgate [--config config.json]
 */
#include <sqlgate/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = sqlgate::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.is_running() ? 1 : 0;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
