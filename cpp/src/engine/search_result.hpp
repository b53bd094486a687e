/**
 * Results reported by a UCI engine.
 *
 * PlayResult is the answer to a "go" that only needs a move; AnalysisInfo
 * is one principal variation out of a multi-PV analysis.
 */

#ifndef KIBITZ_ENGINE_SEARCH_RESULT_HPP
#define KIBITZ_ENGINE_SEARCH_RESULT_HPP

#include <chess.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace kibitz {

/**
 * Score type: either centipawns or mate distance.
 *
 * As on the wire, the score is relative to the side to move.
 */
struct Score {
    enum class Type { CENTIPAWNS, MATE };

    Type type = Type::CENTIPAWNS;
    int value = 0;  // Centipawns, or moves to mate (positive = side to move mates)

    [[nodiscard]] static constexpr Score cp(int centipawns) noexcept {
        return Score{Type::CENTIPAWNS, centipawns};
    }

    [[nodiscard]] static constexpr Score mate(int moves) noexcept {
        return Score{Type::MATE, moves};
    }

    [[nodiscard]] constexpr bool is_mate() const noexcept {
        return type == Type::MATE;
    }

    /**
     * The same score seen from White's side.
     *
     * @param side_to_move Side to move in the analysed position.
     */
    [[nodiscard]] constexpr Score white_pov(chess::Color side_to_move) const noexcept {
        if (side_to_move == chess::Color::WHITE) {
            return *this;
        }
        return Score{type, -value};
    }

    constexpr bool operator==(const Score&) const = default;
};

/**
 * One line of a (multi-PV) analysis.
 */
struct AnalysisInfo {
    int multipv = 1;
    Score score;
    std::optional<int> depth;
    std::optional<int> seldepth;
    std::optional<std::int64_t> nodes;
    std::optional<std::int64_t> time_ms;

    // Principal variation, legal from the analysed position onward
    std::vector<chess::Move> pv;
};

struct PlayResult {
    chess::Move best_move = chess::Move::NO_MOVE;
    std::optional<chess::Move> ponder;

    /**
     * Check if a valid move was found.
     */
    [[nodiscard]] bool has_move() const noexcept {
        return best_move != chess::Move::NO_MOVE;
    }
};

}  // namespace kibitz

#endif  // KIBITZ_ENGINE_SEARCH_RESULT_HPP
