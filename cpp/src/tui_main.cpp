/**
 * Kibitz terminal front-end - Main Entry Point
 *
 * Plays White against a UCI engine in a curses screen, with a short
 * multi-PV analysis refreshed between keystrokes and an optional Syzygy
 * lookup after every move.
 *
 * Usage:
 *   kibitz_tui [--engine PATH] [--syzygy DIR] [--log FILE] ...
 */

#include <clocale>
#include <cstdio>
#include <exception>
#include <format>
#include <memory>
#include <print>
#include <string>

#include "config.hpp"
#include "engine/uci_engine.hpp"
#include "errors.hpp"
#include "tablebase/syzygy.hpp"
#include "tui/terminal_app.hpp"

int main(int argc, char* argv[]) {
    try {
        kibitz::FrontendConfig config = kibitz::parse_args(argc, argv);
        if (config.show_help) {
            std::print("Usage: {} [options]\n{}", argv[0], kibitz::USAGE);
            return 0;
        }

        // curses owns the terminal from here on; diagnostics go to the log
        if (std::freopen(config.log_path.c_str(), "a", stderr) == nullptr) {
            std::println(stderr, "Cannot open log file {}", config.log_path);
            return 1;
        }

        // Wide-character curses needs the user's UTF-8 locale for the board glyphs
        std::setlocale(LC_ALL, "");

        std::unique_ptr<kibitz::SyzygyTablebase> tablebase;
        std::string tablebase_error;
        try {
            tablebase = std::make_unique<kibitz::SyzygyTablebase>(config.syzygy_path);
        } catch (const kibitz::TablebaseError& e) {
            tablebase_error = std::format("Syzygy error: {}", e.what());
            std::println(stderr, "{}", tablebase_error);
        }

        kibitz::TerminalApp app(config, tablebase.get());
        if (!tablebase_error.empty()) {
            app.session().set_status(tablebase_error);
        }

        app.run([&config]() -> std::unique_ptr<kibitz::Engine> {
            return kibitz::UciEngine::popen(config.engine_path);
        });
    } catch (const std::exception& e) {
        std::println(stderr, "Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
