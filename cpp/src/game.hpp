/**
 * Game - the single position a front-end works on, plus how it got there.
 *
 * Owns the starting FEN, the current chess::Board and the move history.
 * All rule decisions are made by chess-library; this class only refuses
 * to push moves that library does not list as legal.
 */

#ifndef KIBITZ_GAME_HPP
#define KIBITZ_GAME_HPP

#include <chess.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"

namespace kibitz {

// Standard starting position FEN
inline constexpr std::string_view STARTPOS_FEN =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

/**
 * Check whether a move is legal on the given board.
 */
[[nodiscard]] inline bool is_legal(const chess::Board& board, const chess::Move& move) {
    if (move == chess::Move::NO_MOVE) {
        return false;
    }
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    return std::find(moves.begin(), moves.end(), move) != moves.end();
}

/**
 * Shape check for coordinate notation: e2e4, e7e8q. Says nothing about legality.
 */
[[nodiscard]] inline bool is_uci_syntax(std::string_view s) noexcept {
    if (s.size() != 4 && s.size() != 5) {
        return false;
    }
    auto file_ok = [](char c) { return c >= 'a' && c <= 'h'; };
    auto rank_ok = [](char c) { return c >= '1' && c <= '8'; };
    if (!file_ok(s[0]) || !rank_ok(s[1]) || !file_ok(s[2]) || !rank_ok(s[3])) {
        return false;
    }
    return s.size() == 4 || std::string_view("qrbn").find(s[4]) != std::string_view::npos;
}

/**
 * Result in PGN notation: "1-0", "0-1", "1/2-1/2", or "*" while ongoing.
 */
[[nodiscard]] inline std::string result_string(const chess::Board& board) {
    auto [reason, result] = board.isGameOver();
    if (result == chess::GameResult::NONE) {
        return "*";
    }
    if (result == chess::GameResult::DRAW) {
        return "1/2-1/2";
    }
    // WIN/LOSE are from the side to move's perspective
    bool white_to_move = board.sideToMove() == chess::Color::WHITE;
    bool white_won = (result == chess::GameResult::WIN) == white_to_move;
    return white_won ? "1-0" : "0-1";
}

class Game {
public:
    explicit Game(std::string_view fen = STARTPOS_FEN)
        : start_fen_(fen)
        , board_(fen)
    {}

    /**
     * Play a legal move.
     *
     * @throws MoveParseError if the move is not legal in the current position.
     */
    void push(const chess::Move& move) {
        if (!is_legal(board_, move)) {
            throw MoveParseError("illegal move " + chess::uci::moveToUci(move));
        }
        board_.makeMove<true>(move);
        moves_.push_back(move);
    }

    /**
     * Play a move given in UCI notation.
     */
    void push_uci(std::string_view uci) {
        if (!is_uci_syntax(uci)) {
            throw MoveParseError("malformed UCI move '" + std::string(uci) + "'");
        }
        push(chess::uci::uciToMove(board_, std::string(uci)));
    }

    [[nodiscard]] const chess::Board& board() const noexcept { return board_; }
    [[nodiscard]] const std::vector<chess::Move>& moves() const noexcept { return moves_; }
    [[nodiscard]] const std::string& start_fen() const noexcept { return start_fen_; }

    [[nodiscard]] std::vector<std::string> uci_moves() const {
        std::vector<std::string> out;
        out.reserve(moves_.size());
        for (const auto& move : moves_) {
            out.push_back(chess::uci::moveToUci(move));
        }
        return out;
    }

    [[nodiscard]] bool is_over() const {
        return board_.isGameOver().second != chess::GameResult::NONE;
    }

    [[nodiscard]] std::string result() const { return result_string(board_); }

    [[nodiscard]] chess::Movelist legal_moves() const {
        chess::Movelist moves;
        chess::movegen::legalmoves(moves, board_);
        return moves;
    }

private:
    std::string start_fen_;
    chess::Board board_;
    std::vector<chess::Move> moves_;
};

}  // namespace kibitz

#endif  // KIBITZ_GAME_HPP
