/**
 * Puzzle - A tactics exercise: a game's movetext plus the moves that solve
 * the position reached at its end.
 *
 * parse_puzzle() reads the JSON served by the puzzle API, replay_movetext()
 * turns the PGN into a position, and PuzzleSession checks attempts against
 * the solution, auto-playing the scripted replies.
 */

#ifndef KIBITZ_PUZZLE_PUZZLE_HPP
#define KIBITZ_PUZZLE_PUZZLE_HPP

#include <chess.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kibitz {

struct Puzzle {
    std::string id;
    int rating = 0;
    std::string pgn;                    // Movetext of the source game up to the puzzle
    std::vector<std::string> solution;  // UCI moves, player and opponent alternating
};

/**
 * Extract game.pgn, puzzle.solution, puzzle.id and puzzle.rating.
 *
 * @throws PuzzleError on malformed JSON or missing fields.
 */
[[nodiscard]] Puzzle parse_puzzle(std::string_view json);

/**
 * Play SAN movetext from the standard starting position.
 *
 * Move numbers ("12.", "12..."), results, {comments} and $NAGs are skipped.
 *
 * @throws PuzzleError if a move cannot be played.
 */
[[nodiscard]] chess::Board replay_movetext(std::string_view pgn);

enum class PuzzleOutcome {
    Correct,          // Move matched; the scripted reply (if any) was played
    Wrong,            // Move did not match; board unchanged
    Solved,           // Last solution move played
    AlreadyFinished,  // Nothing left to solve
    BadSolution,      // Scripted reply is illegal; session ended
};

[[nodiscard]] constexpr std::string_view to_string(PuzzleOutcome outcome) noexcept {
    switch (outcome) {
        case PuzzleOutcome::Correct: return "Correct";
        case PuzzleOutcome::Wrong: return "Wrong";
        case PuzzleOutcome::Solved: return "Solved";
        case PuzzleOutcome::AlreadyFinished: return "AlreadyFinished";
        case PuzzleOutcome::BadSolution: return "BadSolution";
    }
    return "?";
}

class PuzzleSession {
public:
    /**
     * @throws PuzzleError if the puzzle's movetext cannot be replayed.
     */
    explicit PuzzleSession(Puzzle puzzle);

    /**
     * Check a (legal) move against the next solution entry.
     */
    PuzzleOutcome try_move(const chess::Move& move);

    [[nodiscard]] const chess::Board& board() const noexcept { return board_; }
    [[nodiscard]] const Puzzle& puzzle() const noexcept { return puzzle_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }

    /**
     * UCI text of the move the solution expects next, empty when finished.
     */
    [[nodiscard]] std::string expected() const;

    /**
     * Side the solver plays: the side to move at the puzzle start.
     */
    [[nodiscard]] chess::Color solver() const noexcept { return solver_; }

private:
    Puzzle puzzle_;
    chess::Board board_;
    chess::Color solver_;
    std::size_t index_ = 0;
    bool finished_ = false;
};

}  // namespace kibitz

#endif  // KIBITZ_PUZZLE_PUZZLE_HPP
