/**
 * UciEngine and EngineProcess against scripted engines.
 *
 * The engines are small POSIX shell scripts written to a temporary
 * directory; they answer the handful of commands the client sends with
 * canned output, which is enough to drive handshake, play and analysis.
 */

#include <doctest/doctest.h>
#include <chess.hpp>

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "../src/engine/engine_process.hpp"
#include "../src/engine/uci_engine.hpp"
#include "../src/errors.hpp"
#include "../src/game.hpp"

using namespace kibitz;

namespace {

namespace fs = std::filesystem;

constexpr std::string_view HANDSHAKE =
    "    uci)\n"
    "      echo 'id name FakeFish 1.0'\n"
    "      echo 'id author Kibitz Tests'\n"
    "      echo 'option name MultiPV type spin default 1 min 1 max 500'\n"
    "      echo 'option name Syzygy Path type string default <empty>'\n"
    "      echo 'uciok' ;;\n"
    "    isready) echo 'readyok' ;;\n"
    "    quit) exit 0 ;;\n";

fs::path script_dir() {
    fs::path dir = fs::temp_directory_path() / ("kibitz_tests_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    return dir;
}

/**
 * Write an engine script answering "go" with go_reply (shell commands).
 * With a log path, every command received is appended to that file.
 */
fs::path write_engine(const std::string& name, const std::string& go_reply,
                      bool answer_uci = true, const fs::path& log = {}) {
    fs::path path = script_dir() / name;

    {
        std::ofstream out(path);
        out << "#!/bin/sh\n"
            << "while IFS= read -r line; do\n";
        if (!log.empty()) {
            out << "  echo \"$line\" >> '" << log.string() << "'\n";
        }
        out << "  case \"$line\" in\n";
        if (answer_uci) {
            out << HANDSHAKE;
        }
        out << "    go*)\n" << go_reply << " ;;\n"
            << "  esac\n"
            << "done\n";
    }
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return path;
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

const std::string CANNED_SEARCH =
    "      echo 'info depth 1 multipv 1 score cp 10 pv e2e4'\n"
    "      echo 'info string thinking'\n"
    "      echo 'info depth 2 currmove e2e4 currmovenumber 1'\n"
    "      echo 'info depth 2 multipv 1 score cp 30 pv e2e4 e7e5'\n"
    "      echo 'info depth 2 multipv 2 score cp -15 pv d2d4 d7d5'\n"
    "      echo 'info depth 3 multipv 1 score cp 99'\n"
    "      echo 'bestmove e2e4 ponder e7e5'";

UciEngineOptions fast_options() {
    UciEngineOptions options;
    options.handshake_timeout = std::chrono::milliseconds(2000);
    options.search_grace = std::chrono::milliseconds(300);
    options.quit_grace = std::chrono::milliseconds(500);
    return options;
}

}  // namespace

// ============================================================================
// EngineProcess
// ============================================================================

TEST_SUITE("EngineProcess") {

    TEST_CASE("Lines written come back from an echoing child") {
        EngineProcess process;
        process.start("/bin/cat");
        REQUIRE(process.running());

        REQUIRE(process.write("hello engine\nsecond\n"));
        CHECK(process.read_line() == "hello engine");
        CHECK(process.read_line() == "second");

        process.close_stdin();
        CHECK_FALSE(process.read_line().has_value());
        process.reap(500);
        CHECK_FALSE(process.running());
    }
}

// ============================================================================
// Handshake
// ============================================================================

TEST_SUITE("UciEngine handshake") {

    TEST_CASE("Identification and options are collected") {
        auto path = write_engine("fake_ok.sh", CANNED_SEARCH);
        auto engine = UciEngine::popen(path.string(), fast_options());

        CHECK(engine->name() == "FakeFish 1.0");
        CHECK(engine->id().author == "Kibitz Tests");
        const auto& options = engine->option_names();
        CHECK(std::find(options.begin(), options.end(), "MultiPV") != options.end());
        CHECK(std::find(options.begin(), options.end(), "Syzygy Path") != options.end());

        engine->quit();
        engine->quit();  // second quit is a no-op
    }

    TEST_CASE("Missing executable is an engine error") {
        CHECK_THROWS_AS(UciEngine::popen("/nonexistent/kibitz-engine", fast_options()),
                        EngineError);
    }

    TEST_CASE("Engine that never says uciok times out") {
        auto path = write_engine("fake_mute.sh", "      :", false);
        UciEngineOptions options = fast_options();
        options.handshake_timeout = std::chrono::milliseconds(200);
        CHECK_THROWS_AS(UciEngine::popen(path.string(), options), EngineError);
    }
}

// ============================================================================
// Searching
// ============================================================================

TEST_SUITE("UciEngine search") {

    TEST_CASE("play returns the legal best move and ponder move") {
        auto path = write_engine("fake_play.sh", CANNED_SEARCH);
        auto engine = UciEngine::popen(path.string(), fast_options());

        Game game;
        PlayResult result = engine->play(game, SearchLimits::make_depth(10));
        REQUIRE(result.has_move());
        CHECK(chess::uci::moveToUci(result.best_move) == "e2e4");
        REQUIRE(result.ponder.has_value());
        CHECK(chess::uci::moveToUci(*result.ponder) == "e7e5");
    }

    TEST_CASE("analyse keeps the latest scored line with a PV per multipv index") {
        auto path = write_engine("fake_analyse.sh", CANNED_SEARCH);
        auto engine = UciEngine::popen(path.string(), fast_options());

        Game game;
        auto lines = engine->analyse(game, SearchLimits::make_seconds(0.1), 2);
        REQUIRE(lines.size() == 2);
        CHECK(lines[0].multipv == 1);
        CHECK(lines[0].score == Score::cp(30));
        CHECK(lines[0].pv.size() == 2);
        CHECK(lines[1].multipv == 2);
        CHECK(lines[1].score == Score::cp(-15));
    }

    TEST_CASE("analyse drops lines beyond the requested count") {
        auto path = write_engine("fake_single.sh", CANNED_SEARCH);
        auto engine = UciEngine::popen(path.string(), fast_options());

        Game game;
        auto lines = engine->analyse(game, SearchLimits::make_seconds(0.1), 1);
        REQUIRE(lines.size() == 1);
        CHECK(lines[0].score == Score::cp(30));
    }

    TEST_CASE("Illegal best move is an engine error") {
        auto path = write_engine("fake_illegal.sh", "      echo 'bestmove e2e5'");
        auto engine = UciEngine::popen(path.string(), fast_options());

        Game game;
        CHECK_THROWS_AS(engine->play(game, SearchLimits::make_depth(1)), EngineError);
    }

    TEST_CASE("No move is an engine error") {
        auto path = write_engine("fake_none.sh", "      echo 'bestmove (none)'");
        auto engine = UciEngine::popen(path.string(), fast_options());

        Game game;
        CHECK_THROWS_AS(engine->play(game, SearchLimits::make_depth(1)), EngineError);
    }

    TEST_CASE("Engine ignoring stop is an engine error") {
        auto path = write_engine("fake_stuck.sh", "      :");
        auto engine = UciEngine::popen(path.string(), fast_options());

        Game game;
        CHECK_THROWS_AS(engine->play(game, SearchLimits::make_seconds(0.05)), EngineError);
    }

    TEST_CASE("Late answer to a stopped search does not leak into the next one") {
        fs::path marker = script_dir() / "late_done";
        fs::remove(marker);
        auto path = write_engine(
            "fake_late.sh",
            "      if [ -f '" + marker.string() + "' ]; then\n"
            "        echo 'bestmove e2e4'\n"
            "      else\n"
            "        touch '" + marker.string() + "'; sleep 1; echo 'bestmove a2a3'\n"
            "      fi");
        auto engine = UciEngine::popen(path.string(), fast_options());

        Game game;
        CHECK_THROWS_AS(engine->play(game, SearchLimits::make_seconds(0.05)), EngineError);

        PlayResult result = engine->play(game, SearchLimits::make_depth(1));
        CHECK(chess::uci::moveToUci(result.best_move) == "e2e4");
    }

    TEST_CASE("Searching after quit is an engine error") {
        auto path = write_engine("fake_quit.sh", CANNED_SEARCH);
        auto engine = UciEngine::popen(path.string(), fast_options());
        engine->quit();

        Game game;
        CHECK_THROWS_AS(engine->play(game, SearchLimits::make_depth(1)), EngineError);
    }
}

// ============================================================================
// Commands sent to the engine
// ============================================================================

TEST_SUITE("UciEngine commands") {

    TEST_CASE("Position is sent as start FEN plus move history") {
        fs::path log = script_dir() / "commands_position.log";
        fs::remove(log);
        auto path = write_engine("fake_log_position.sh", CANNED_SEARCH, true, log);
        auto engine = UciEngine::popen(path.string(), fast_options());

        Game game;
        (void)engine->play(game, SearchLimits::make_depth(3));
        game.push_uci("e2e4");
        game.push_uci("e7e5");
        (void)engine->analyse(game, SearchLimits::make_seconds(0.1), 1);
        engine->quit();

        auto lines = read_lines(log);
        std::string start = "position fen " + std::string(STARTPOS_FEN);
        std::vector<std::string> expected = {
            "uci", "isready",
            start, "go depth 3",
            start + " moves e2e4 e7e5", "go movetime 100",
            "quit",
        };
        CHECK(lines == expected);
    }

    TEST_CASE("MultiPV is set only when it changes") {
        fs::path log = script_dir() / "commands_multipv.log";
        fs::remove(log);
        auto path = write_engine("fake_log_multipv.sh", CANNED_SEARCH, true, log);
        auto engine = UciEngine::popen(path.string(), fast_options());

        Game game;
        (void)engine->analyse(game, SearchLimits::make_seconds(0.1), 2);
        (void)engine->analyse(game, SearchLimits::make_seconds(0.1), 2);
        (void)engine->analyse(game, SearchLimits::make_seconds(0.1), 3);
        engine->quit();

        auto lines = read_lines(log);
        CHECK(std::count(lines.begin(), lines.end(), "setoption name MultiPV value 2") == 1);
        CHECK(std::count(lines.begin(), lines.end(), "setoption name MultiPV value 3") == 1);
        CHECK(std::count(lines.begin(), lines.end(), "go movetime 100") == 3);

        // Each setoption is confirmed with isready before the next search
        auto it = std::find(lines.begin(), lines.end(), "setoption name MultiPV value 2");
        REQUIRE(it != lines.end());
        REQUIRE(std::next(it) != lines.end());
        CHECK(*std::next(it) == "isready");
    }
}
