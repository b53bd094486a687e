#include "terminal_app.hpp"

#include <ncurses.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <string>
#include <thread>

#include "../notation.hpp"

namespace kibitz {

namespace {

/**
 * Byte length of the first max_cols code points of a UTF-8 string.
 * Every code point we draw occupies a single column.
 */
std::size_t utf8_prefix_bytes(std::string_view text, int max_cols) {
    std::size_t i = 0;
    int cols = 0;
    while (i < text.size() && cols < max_cols) {
        auto lead = static_cast<unsigned char>(text[i]);
        std::size_t len = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : 4;
        i = std::min(text.size(), i + len);
        ++cols;
    }
    return i;
}

}  // namespace

CursesScreen::CursesScreen() {
    initscr();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
}

CursesScreen::~CursesScreen() {
    endwin();
}

void CursesScreen::put(int row, int col, std::string_view text) {
    int rows = 0;
    int cols = 0;
    getmaxyx(stdscr, rows, cols);
    if (row < 0 || row >= rows || col < 0 || col >= cols) {
        return;
    }
    // Leave the last cell free; writing it on the bottom row scrolls
    int room = cols - col - (row == rows - 1 ? 1 : 0);
    if (room <= 0) {
        return;
    }
    std::string clipped(text.substr(0, utf8_prefix_bytes(text, room)));
    mvaddstr(row, col, clipped.c_str());
}

TerminalApp::TerminalApp(const FrontendConfig& config, SyzygyTablebase* tablebase)
    : config_(config)
    , session_(config, tablebase)
{}

void TerminalApp::run(const EngineFactory& factory) {
    session_.init_engine(factory);
    draw();
    main_loop();
    session_.shutdown_engine();

    clear();
    screen_.put(0, 0, std::format("Game over. Result: {}", session_.result()));
    screen_.put(1, 0, "Press any key to exit.");
    refresh();
    nodelay(stdscr, FALSE);
    getch();
}

void TerminalApp::main_loop() {
    using Clock = std::chrono::steady_clock;
    auto interval = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(config_.refresh_interval));

    draw();
    while (!session_.is_over()) {
        if (session_.is_engine_turn()) {
            session_.handle_engine_move();
            draw();
        }

        auto start = Clock::now();
        while (Clock::now() - start < interval) {
            nodelay(stdscr, TRUE);
            int ch = getch();
            nodelay(stdscr, FALSE);

            if (ch == ERR) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }
            if (!handle_key(ch)) {
                return;
            }
            draw();
        }

        if (!session_.is_over()) {
            session_.run_analysis();
            draw();
        }
    }

    draw();
    std::this_thread::sleep_for(std::chrono::seconds(1));
}

bool TerminalApp::handle_key(int ch) {
    std::string& input = session_.input_line;

    if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) {
        if (!input.empty()) {
            input.pop_back();
        }
    } else if (ch == KEY_ENTER || ch == 10 || ch == 13) {
        std::string cmd = detail::trim(input);
        std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (cmd == "exit") {
            return false;
        }
        session_.handle_player_move(input);
        input.clear();
    } else if (ch >= 32 && ch < 127) {
        input += static_cast<char>(ch);
    }
    return true;
}

void TerminalApp::draw() {
    clear();

    screen_.put(0, 0, std::format("[Move: {}]  White: {} | Black: {}",
                                  session_.move_count(),
                                  session_.last_move_white(),
                                  session_.last_move_black()));

    auto lines = board_to_unicode(session_.game().board());
    for (std::size_t i = 0; i < lines.size(); ++i) {
        screen_.put(2 + static_cast<int>(i), 0, lines[i]);
    }

    screen_.put(2, 25, std::format("Eval: {}", session_.best_eval()));
    int row = 3;
    const auto& variants = session_.variants();
    // The first variation is already in the Eval line
    for (std::size_t i = 1; i < variants.size(); ++i) {
        screen_.put(row++, 25, std::format("{}  {}", variants[i].score_text, variants[i].line_text));
    }

    screen_.put(12, 0, std::format("{:<80}", session_.status()));

    screen_.put(14, 0, "Your move ('exit' to quit): ");
    screen_.put(15, 0, "> " + session_.input_line.substr(0, 50));

    refresh();
}

}  // namespace kibitz
