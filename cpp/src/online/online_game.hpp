/**
 * OnlineGame - A game against a remote player.
 *
 * Keeps the board and turns local moves into MOVE messages and incoming
 * OPPONENT_MOVE text into board moves. Owned and driven by the UI thread;
 * the network layer only delivers messages.
 */

#ifndef KIBITZ_ONLINE_ONLINE_GAME_HPP
#define KIBITZ_ONLINE_ONLINE_GAME_HPP

#include <chess.hpp>

#include <cctype>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <utility>

#include "../game.hpp"
#include "protocol.hpp"

namespace kibitz {

class OnlineGame {
public:
    /**
     * @param color "white" or "black" (any case), as the pairing reports it.
     */
    OnlineGame(std::string_view color, std::string opponent, std::string username)
        : color_(is_white_text(color) ? chess::Color::WHITE : chess::Color::BLACK)
        , opponent_(std::move(opponent))
        , username_(std::move(username))
    {}

    [[nodiscard]] bool my_turn() const {
        return !game_.is_over() && game_.board().sideToMove() == color_;
    }

    /**
     * Play our move and return the message that announces it.
     *
     * @throws MoveParseError if it is not our turn or the move is illegal.
     */
    [[nodiscard]] Message play_local(const chess::Move& move) {
        if (!my_turn()) {
            throw MoveParseError("not your turn");
        }
        game_.push(move);
        return Message::move(opponent_, chess::uci::moveToUci(move));
    }

    /**
     * Apply the opponent's move. Returns false (and leaves the board as is)
     * when it is not the opponent's turn or the move is not legal.
     */
    bool apply_remote(std::string_view uci) {
        if (game_.is_over() || game_.board().sideToMove() == color_) {
            std::println(stderr, "Ignoring opponent move {} out of turn", uci);
            return false;
        }
        try {
            game_.push_uci(uci);
        } catch (const MoveParseError& e) {
            std::println(stderr, "Ignoring opponent move: {}", e.what());
            return false;
        }
        return true;
    }

    /**
     * The GAME_OVER report, once, after the game has ended.
     */
    [[nodiscard]] std::optional<Message> game_over_message() {
        if (!game_.is_over() || reported_) {
            return std::nullopt;
        }
        reported_ = true;
        return Message::game_over(username_, opponent_, game_.result());
    }

    [[nodiscard]] const Game& game() const noexcept { return game_; }
    [[nodiscard]] chess::Color color() const noexcept { return color_; }
    [[nodiscard]] const std::string& opponent() const noexcept { return opponent_; }

private:
    static bool is_white_text(std::string_view color) {
        std::string lower;
        for (char c : color) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return lower == "white";
    }

    Game game_;
    chess::Color color_;
    std::string opponent_;
    std::string username_;
    bool reported_ = false;
};

}  // namespace kibitz

#endif  // KIBITZ_ONLINE_ONLINE_GAME_HPP
