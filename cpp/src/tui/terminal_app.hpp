/**
 * TerminalApp - curses front-end: play White against the engine while a
 * short multi-PV analysis refreshes between keystrokes.
 *
 * Screen layout (row, col):
 *   0,0    [Move: N]  White: <san> | Black: <san>
 *   2..9   the board, rank 8 first
 *   2,25   Eval: <score> <thermometer>
 *   3+,25  further variations
 *   12,0   status line
 *   14,0   prompt, 15,0 the input buffer
 */

#ifndef KIBITZ_TUI_TERMINAL_APP_HPP
#define KIBITZ_TUI_TERMINAL_APP_HPP

#include <string_view>

#include "../config.hpp"
#include "../engine/engine.hpp"
#include "../tablebase/syzygy.hpp"
#include "game_session.hpp"

namespace kibitz {

/**
 * Owns curses for its lifetime: initscr() in the constructor, endwin() in
 * the destructor, so the terminal is restored even when run() throws.
 */
class CursesScreen {
public:
    CursesScreen();
    ~CursesScreen();

    CursesScreen(const CursesScreen&) = delete;
    CursesScreen& operator=(const CursesScreen&) = delete;

    /**
     * Write text at (row, col), cut to the window. Rows and columns outside
     * the window are ignored.
     */
    void put(int row, int col, std::string_view text);
};

class TerminalApp {
public:
    TerminalApp(const FrontendConfig& config, SyzygyTablebase* tablebase);

    /**
     * Launch the engine, run the game loop until the game ends or the user
     * types "exit", then show the result screen.
     */
    void run(const EngineFactory& factory);

    [[nodiscard]] GameSession& session() noexcept { return session_; }

private:
    /**
     * Alternate engine moves, keyboard input and analysis until the game
     * is over or the user quits.
     */
    void main_loop();

    /**
     * Handle one key code. Returns false when the user typed "exit".
     */
    bool handle_key(int ch);

    void draw();

    const FrontendConfig& config_;
    GameSession session_;
    CursesScreen screen_;
};

}  // namespace kibitz

#endif  // KIBITZ_TUI_TERMINAL_APP_HPP
