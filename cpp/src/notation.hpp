/**
 * Text helpers shared by the front-ends.
 *
 * Rendering of boards, scores and principal variations as plain text, and
 * the lenient move parser used for typed input. Nothing here knows the
 * rules of chess; every legality question goes to chess-library.
 */

#ifndef KIBITZ_NOTATION_HPP
#define KIBITZ_NOTATION_HPP

#include <chess.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/search_result.hpp"
#include "errors.hpp"
#include "game.hpp"

namespace kibitz {

/**
 * Unicode glyphs indexed by chess::Piece::internal():
 * white pawn..king, then black pawn..king.
 */
inline constexpr std::array<std::string_view, 12> UNICODE_PIECES = {
    "♙", "♘", "♗", "♖", "♕", "♔",
    "♟", "♞", "♝", "♜", "♛", "♚",
};

[[nodiscard]] inline std::string_view piece_to_unicode(chess::Piece piece) {
    int idx = static_cast<int>(piece.internal());
    if (idx < 0 || idx >= static_cast<int>(UNICODE_PIECES.size())) {
        return "?";
    }
    return UNICODE_PIECES[idx];
}

/**
 * Eight lines, rank 8 first. Pieces as unicode glyphs, empty squares as '.',
 * squares separated by one space.
 */
[[nodiscard]] inline std::vector<std::string> board_to_unicode(const chess::Board& board) {
    std::vector<std::string> lines;
    lines.reserve(8);
    for (int rank = 7; rank >= 0; --rank) {
        std::string row;
        for (int file = 0; file < 8; ++file) {
            if (file > 0) {
                row += ' ';
            }
            auto piece = board.at(chess::Square(rank * 8 + file));
            if (piece != chess::Piece::NONE) {
                row += piece_to_unicode(piece);
            } else {
                row += '.';
            }
        }
        lines.push_back(std::move(row));
    }
    return lines;
}

/**
 * ASCII "thermometer" for a centipawn evaluation.
 *
 * The marker sits in the middle for 0 and moves towards either end as the
 * score approaches +/- cp_range. Rounding is half-to-even.
 */
[[nodiscard]] inline std::string thermometer(int cp, int cp_range = 300, int length = 15) {
    cp = std::clamp(cp, -cp_range, cp_range);
    int center = length / 2;
    double scaled = static_cast<double>(cp) / cp_range * center;
    int marker = center + static_cast<int>(std::nearbyint(scaled));

    std::string bar = "[";
    for (int i = 0; i < length; ++i) {
        bar += (i == marker) ? "█" : "-";
    }
    bar += "]";
    return bar;
}

namespace detail {

inline std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

inline std::vector<std::string> split_ws(std::string_view s) {
    std::vector<std::string> tokens;
    std::istringstream iss{std::string(s)};
    std::string token;
    while (iss >> token) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

}  // namespace detail

/**
 * Parse a typed move. Tries UCI first, then SAN.
 *
 * Move numbers are tolerated: "1. e4" and "12... Nf6" parse as the last token.
 *
 * @throws MoveParseError if neither notation yields a move.
 */
[[nodiscard]] inline chess::Move parse_move(std::string_view input, const chess::Board& board) {
    std::string s = detail::trim(input);
    if (s.find('.') != std::string::npos) {
        auto tokens = detail::split_ws(s);
        if (!tokens.empty()) {
            s = tokens.back();
        }
    }
    if (s.empty()) {
        throw MoveParseError("empty move");
    }

    if (is_uci_syntax(s)) {
        auto move = chess::uci::uciToMove(board, s);
        if (is_legal(board, move)) {
            return move;
        }
    }

    chess::Move move = chess::Move::NO_MOVE;
    try {
        move = chess::uci::parseSan(board, s);
    } catch (const std::exception& e) {
        throw MoveParseError(std::format("invalid move '{}': {}", s, e.what()));
    }
    if (move == chess::Move::NO_MOVE) {
        throw MoveParseError(std::format("invalid move '{}'", s));
    }
    return move;
}

/**
 * "Mate in N" or "+0.35" / "-1.20" (pawns). Expects a White-POV score.
 */
[[nodiscard]] inline std::string format_score_white(const Score& score) {
    if (score.is_mate()) {
        return std::format("Mate in {}", score.value);
    }
    const char* sign = score.value >= 0 ? "+" : "";
    return std::format("{}{:.2f}", sign, score.value / 100.0);
}

/**
 * "cp N" or "Mate in N", as the desktop front-end shows a side-to-move score.
 */
[[nodiscard]] inline std::string format_score_relative(const Score& score) {
    if (score.is_mate()) {
        return std::format("Mate in {}", score.value);
    }
    return std::format("cp {}", score.value);
}

/**
 * SAN rendering of a principal variation, cut to max_chars.
 *
 * A move that cannot be played from the position reached so far is shown
 * as "???" and ends the line.
 */
[[nodiscard]] inline std::string san_line(const chess::Board& board,
                                          const std::vector<chess::Move>& pv,
                                          std::size_t max_chars = 60) {
    chess::Board scratch = board;
    std::string line;
    for (const auto& move : pv) {
        if (!line.empty()) {
            line += ' ';
        }
        if (!is_legal(scratch, move)) {
            line += "???";
            break;
        }
        line += chess::uci::moveToSan(scratch, move);
        scratch.makeMove<true>(move);
    }
    if (line.size() > max_chars) {
        line.resize(max_chars);
    }
    return line;
}

}  // namespace kibitz

#endif  // KIBITZ_NOTATION_HPP
