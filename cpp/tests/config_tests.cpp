/**
 * Command-line configuration.
 */

#include <doctest/doctest.h>

#include <stdexcept>
#include <vector>

#include "../src/config.hpp"

using namespace kibitz;

namespace {

FrontendConfig parse(std::vector<const char*> args) {
    args.insert(args.begin(), "kibitz");
    return parse_args(static_cast<int>(args.size()), args.data());
}

}  // namespace

TEST_SUITE("Configuration") {

    TEST_CASE("Defaults") {
        FrontendConfig config = parse({});
        CHECK(config.engine_path == "./stockfish-ubuntu-x86-64-avx2");
        CHECK(config.syzygy_path.empty());
        CHECK(config.multipv == 3);
        CHECK(config.refresh_interval == doctest::Approx(0.5));
        CHECK(config.analysis_time == doctest::Approx(0.3));
        CHECK(config.use_syzygy_after_move);
        CHECK(config.engine_depth == 10);
        CHECK(config.gui_engine_depth == 15);
        CHECK(config.server_address == "13.38.13.177");
        CHECK(config.server_port == 5555);
        CHECK(config.username == "Buldozer");
        CHECK(config.password == "123");
        CHECK(config.puzzle_url == "https://lichess.org/api/puzzle/next");
        CHECK_FALSE(config.show_help);
    }

    TEST_CASE("Every option can be overridden") {
        FrontendConfig config = parse({
            "--engine", "/opt/sf", "--syzygy", "/tb", "--multipv", "5",
            "--analysis-time", "1.5", "--refresh", "0.25", "--depth", "12",
            "--gui-depth", "20", "--no-syzygy", "--log", "x.log",
            "--server", "127.0.0.1", "--port", "7000", "--user", "alice",
            "--password", "pw", "--puzzle-url", "http://localhost/p",
            "--pieces", "img", "--font", "f.ttf",
        });
        CHECK(config.engine_path == "/opt/sf");
        CHECK(config.syzygy_path == "/tb");
        CHECK(config.multipv == 5);
        CHECK(config.analysis_time == doctest::Approx(1.5));
        CHECK(config.refresh_interval == doctest::Approx(0.25));
        CHECK(config.engine_depth == 12);
        CHECK(config.gui_engine_depth == 20);
        CHECK_FALSE(config.use_syzygy_after_move);
        CHECK(config.log_path == "x.log");
        CHECK(config.server_address == "127.0.0.1");
        CHECK(config.server_port == 7000);
        CHECK(config.username == "alice");
        CHECK(config.password == "pw");
        CHECK(config.puzzle_url == "http://localhost/p");
        CHECK(config.pieces_dir == "img");
        CHECK(config.font_path == "f.ttf");
    }

    TEST_CASE("Help flag") {
        CHECK(parse({"--help"}).show_help);
        CHECK(parse({"-h"}).show_help);
    }

    TEST_CASE("Bad input is rejected") {
        CHECK_THROWS_AS(parse({"--bogus"}), std::invalid_argument);
        CHECK_THROWS_AS(parse({"--engine"}), std::invalid_argument);
        CHECK_THROWS_AS(parse({"--multipv", "0"}), std::invalid_argument);
        CHECK_THROWS_AS(parse({"--multipv", "11"}), std::invalid_argument);
        CHECK_THROWS_AS(parse({"--multipv", "3x"}), std::invalid_argument);
        CHECK_THROWS_AS(parse({"--port", "70000"}), std::invalid_argument);
        CHECK_THROWS_AS(parse({"--analysis-time", "-1"}), std::invalid_argument);
    }
}
