/**
 * GameSession - Play and analysis state behind the terminal front-end.
 *
 * Holds everything the curses screen shows (move counter, last moves, the
 * current evaluation and variations, a status line) and the operations that
 * change it. No drawing happens here, so the whole flow can be driven from
 * tests with a scripted Engine.
 *
 * Every failure is caught and turned into the status line; the session
 * keeps going with whatever state it had.
 */

#ifndef KIBITZ_TUI_GAME_SESSION_HPP
#define KIBITZ_TUI_GAME_SESSION_HPP

#include <chess.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../config.hpp"
#include "../engine/engine.hpp"
#include "../game.hpp"
#include "../tablebase/syzygy.hpp"

namespace kibitz {

/**
 * One analysed line as displayed: White-POV centipawns for the thermometer
 * (0 for mate scores), the formatted score, and the SAN continuation.
 */
struct Variant {
    int cp = 0;
    std::string score_text;
    std::string line_text;
};

class GameSession {
public:
    explicit GameSession(const FrontendConfig& config, SyzygyTablebase* tablebase = nullptr);
    ~GameSession();

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /**
     * Launch the engine. On failure the status reports it and the session
     * continues without one.
     */
    void init_engine(const EngineFactory& factory);

    /**
     * Quit and release the engine, logging any shutdown failure.
     */
    void shutdown_engine();

    /**
     * Play a legal move and update the move counter and last-move texts.
     */
    void do_move(const chess::Move& move);

    /**
     * Put the tablebase WDL of the current position in the status line.
     * Does nothing when the position is not covered.
     */
    void tablebase_check();

    /**
     * Parse and play typed input (UCI or SAN).
     */
    void handle_player_move(std::string_view text);

    /**
     * Let the engine choose and play a move. Does nothing without an engine.
     */
    void handle_engine_move();

    /**
     * Short timed multi-PV analysis of the current position.
     */
    void run_analysis();

    [[nodiscard]] bool is_engine_turn() const {
        return game_.board().sideToMove() != human_color_;
    }

    [[nodiscard]] bool is_over() const { return game_.is_over(); }
    [[nodiscard]] std::string result() const { return game_.result(); }
    [[nodiscard]] bool has_engine() const noexcept { return engine_ != nullptr; }

    [[nodiscard]] const Game& game() const noexcept { return game_; }
    [[nodiscard]] int move_count() const noexcept { return move_count_; }
    [[nodiscard]] const std::string& last_move_white() const noexcept { return last_move_white_; }
    [[nodiscard]] const std::string& last_move_black() const noexcept { return last_move_black_; }
    [[nodiscard]] const std::string& best_eval() const noexcept { return best_eval_; }
    [[nodiscard]] const std::vector<Variant>& variants() const noexcept { return variants_; }
    [[nodiscard]] const std::string& status() const noexcept { return status_; }
    void set_status(std::string status) { status_ = std::move(status); }

    // Line editor state for the prompt
    std::string input_line;

private:
    const FrontendConfig& config_;
    SyzygyTablebase* tablebase_;
    std::unique_ptr<Engine> engine_;

    Game game_;
    chess::Color human_color_ = chess::Color::WHITE;
    int move_count_ = 1;
    std::string last_move_white_ = "-";
    std::string last_move_black_ = "-";

    std::string best_eval_ = "---";
    std::vector<Variant> variants_;
    std::string status_;
};

}  // namespace kibitz

#endif  // KIBITZ_TUI_GAME_SESSION_HPP
