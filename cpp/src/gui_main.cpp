/**
 * Kibitz desktop front-end - Main Entry Point
 *
 * Usage:
 *   kibitz_gui [--engine PATH] [--pieces DIR] [--font FILE] [--server ADDR] ...
 */

#include <exception>
#include <memory>
#include <print>

#include "config.hpp"
#include "engine/uci_engine.hpp"
#include "gui/gui_app.hpp"

int main(int argc, char* argv[]) {
    try {
        kibitz::FrontendConfig config = kibitz::parse_args(argc, argv);
        if (config.show_help) {
            std::print("Usage: {} [options]\n{}", argv[0], kibitz::USAGE);
            return 0;
        }

        kibitz::GuiApp app(config, [&config]() -> std::unique_ptr<kibitz::Engine> {
            return kibitz::UciEngine::popen(config.engine_path);
        });
        app.run();
    } catch (const std::exception& e) {
        std::println(stderr, "Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
