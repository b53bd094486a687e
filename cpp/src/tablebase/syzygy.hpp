/**
 * SyzygyTablebase - Win/draw/loss lookups in Syzygy endgame tables.
 *
 * A thin owner of Fathom's global tablebase state. Fathom keeps a single
 * process-wide table set, so at most one SyzygyTablebase should be alive
 * at a time; constructing a new one replaces the previous tables.
 */

#ifndef KIBITZ_TABLEBASE_SYZYGY_HPP
#define KIBITZ_TABLEBASE_SYZYGY_HPP

#include <chess.hpp>

#include <string>

namespace kibitz {

// Largest table size this front-end consults, whatever is installed
inline constexpr int MAX_TB_PIECES = 7;

/**
 * WDL values in the side to move's view, as Syzygy defines them.
 */
enum class Wdl : int {
    LOSS = -2,
    BLESSED_LOSS = -1,  // loss, but drawn under the 50-move rule
    DRAW = 0,
    CURSED_WIN = 1,     // win, but drawn under the 50-move rule
    WIN = 2,
};

class SyzygyTablebase {
public:
    /**
     * Open the tables in a directory (or several, separated by ':').
     *
     * @param path Directory with .rtbw/.rtbz files; empty disables probing.
     * @throws TablebaseError if path is non-empty but no table is found.
     */
    explicit SyzygyTablebase(const std::string& path);
    ~SyzygyTablebase();

    SyzygyTablebase(const SyzygyTablebase&) = delete;
    SyzygyTablebase& operator=(const SyzygyTablebase&) = delete;
    SyzygyTablebase(SyzygyTablebase&&) = delete;
    SyzygyTablebase& operator=(SyzygyTablebase&&) = delete;

    [[nodiscard]] bool enabled() const noexcept { return max_pieces_ > 0; }

    /**
     * Largest piece count (kings included) covered by the loaded tables.
     */
    [[nodiscard]] int max_pieces() const noexcept { return max_pieces_; }

    /**
     * Whether the position is small enough to be looked up.
     */
    [[nodiscard]] bool covers(const chess::Board& board) const;

    /**
     * Probe the WDL table.
     *
     * @throws TablebaseError if the position is not covered, has castling
     *         rights, or the probe fails.
     */
    [[nodiscard]] Wdl probe_wdl(const chess::Board& board) const;

private:
    int max_pieces_ = 0;
};

/**
 * The integer form shown to users: -2..2.
 */
[[nodiscard]] constexpr int to_int(Wdl wdl) noexcept {
    return static_cast<int>(wdl);
}

}  // namespace kibitz

#endif  // KIBITZ_TABLEBASE_SYZYGY_HPP
