/**
 * Desktop front-end logic that does not depend on the window system:
 * click-to-move selection, evaluation text, the engine's reply with its
 * random fallback, and per-position analysis caching.
 */

#ifndef KIBITZ_GUI_PLAY_LOGIC_HPP
#define KIBITZ_GUI_PLAY_LOGIC_HPP

#include <chess.hpp>

#include <algorithm>
#include <format>
#include <optional>
#include <print>
#include <random>
#include <string>
#include <vector>

#include "../engine/engine.hpp"
#include "../game.hpp"
#include "../notation.hpp"

namespace kibitz {

// Evaluation bar geometry, in pixels
inline constexpr int THERMOMETER_HEIGHT = 300;
inline constexpr int THERMOMETER_WIDTH = 20;

/**
 * Height of the filled part of the evaluation bar for a centipawn score.
 * +/-100 cp and beyond fill the bar completely / leave it empty.
 */
[[nodiscard]] constexpr int thermometer_fill(int cp) noexcept {
    double score = std::clamp(cp / 100.0, -1.0, 1.0);
    return static_cast<int>((score + 1.0) * (THERMOMETER_HEIGHT / 2));
}

/**
 * What the evaluation line shows: "cp N", "Mate in N", "No engine", or
 * "Analysis error: ...". cp is set only for centipawn scores.
 */
struct Evaluation {
    std::string text;
    std::optional<int> cp;
};

/**
 * Single-line analysis of the position, score from the side to move's view.
 */
[[nodiscard]] inline Evaluation evaluate(Engine* engine, const Game& game, double seconds) {
    if (engine == nullptr) {
        return {"No engine", std::nullopt};
    }
    try {
        auto infos = engine->analyse(game, SearchLimits::make_seconds(seconds), 1);
        if (infos.empty()) {
            return {"Analysis error: no score", std::nullopt};
        }
        const Score& score = infos.front().score;
        std::optional<int> cp;
        if (!score.is_mate()) {
            cp = score.value;
        }
        return {format_score_relative(score), cp};
    } catch (const std::exception& e) {
        return {std::format("Analysis error: {}", e.what()), std::nullopt};
    }
}

/**
 * The engine's move at the given depth, or a random legal move when there
 * is no engine or it fails to produce a legal one. The game must not be over.
 */
template <typename Rng>
[[nodiscard]] chess::Move choose_reply(Engine* engine, const Game& game, int depth, Rng& rng) {
    if (engine != nullptr) {
        try {
            PlayResult result = engine->play(game, SearchLimits::make_depth(depth));
            if (result.has_move() && is_legal(game.board(), result.best_move)) {
                return result.best_move;
            }
        } catch (const std::exception& e) {
            std::println(stderr, "Engine error: {}", e.what());
        }
    }

    chess::Movelist moves = game.legal_moves();
    if (moves.empty()) {
        return chess::Move::NO_MOVE;
    }
    std::uniform_int_distribution<int> pick(0, moves.size() - 1);
    return moves[pick(rng)];
}

/**
 * Two-click move entry: first click picks up a piece of the side allowed
 * to move, second click names the target. Pawns reaching the last rank
 * promote to a queen.
 */
class MoveSelector {
public:
    enum class Click {
        Ignored,   // Not a square we can use
        Selected,  // Piece picked up
        Moved,     // Legal move completed; see move()
        Illegal,   // Target rejected; selection cleared
    };

    /**
     * @param mover Side whose pieces may be picked up.
     */
    Click click(const chess::Board& board, chess::Square square, chess::Color mover) {
        if (!selected_.has_value()) {
            auto piece = board.at(square);
            if (piece == chess::Piece::NONE || piece.color() != mover) {
                return Click::Ignored;
            }
            selected_ = square;
            return Click::Selected;
        }

        chess::Square from = *selected_;
        selected_.reset();
        auto candidate = find_move(board, from, square);
        if (!candidate.has_value()) {
            return Click::Illegal;
        }
        move_ = *candidate;
        return Click::Moved;
    }

    void reset() noexcept { selected_.reset(); }

    [[nodiscard]] std::optional<chess::Square> selected() const noexcept { return selected_; }

    /**
     * The move completed by the last Click::Moved.
     */
    [[nodiscard]] chess::Move move() const noexcept { return move_; }

private:
    static std::optional<chess::Move> find_move(const chess::Board& board,
                                                chess::Square from,
                                                chess::Square to) {
        // Compare by text so castling is matched by the king's destination
        std::string uci = std::format("{}{}", static_cast<std::string>(from),
                                      static_cast<std::string>(to));
        auto piece = board.at(from);
        bool last_rank = to.rank() == chess::Rank::RANK_8 || to.rank() == chess::Rank::RANK_1;
        if (piece.type() == chess::PieceType::PAWN && last_rank) {
            uci += 'q';
        }

        chess::Movelist moves;
        chess::movegen::legalmoves(moves, board);
        for (const auto& move : moves) {
            if (chess::uci::moveToUci(move) == uci) {
                return move;
            }
        }
        return std::nullopt;
    }

    std::optional<chess::Square> selected_;
    chess::Move move_ = chess::Move::NO_MOVE;
};

/**
 * Multi-PV analysis that is recomputed only when the position changes.
 */
class AnalysisCache {
public:
    /**
     * Lines for the game's current position, best first. Failures are
     * reported through error() and give an empty list.
     */
    const std::vector<AnalysisInfo>& lines(Engine& engine, const Game& game,
                                           double seconds, int multipv) {
        std::string fen = game.board().getFen();
        if (fen == fen_) {
            return lines_;
        }
        fen_ = fen;
        error_.clear();
        try {
            lines_ = engine.analyse(game, SearchLimits::make_seconds(seconds), multipv);
        } catch (const std::exception& e) {
            lines_.clear();
            error_ = std::format("Analysis error: {}", e.what());
            std::println(stderr, "{}", error_);
        }
        return lines_;
    }

    void invalidate() { fen_.clear(); }

    [[nodiscard]] const std::string& error() const noexcept { return error_; }

private:
    std::string fen_;
    std::vector<AnalysisInfo> lines_;
    std::string error_;
};

}  // namespace kibitz

#endif  // KIBITZ_GUI_PLAY_LOGIC_HPP
