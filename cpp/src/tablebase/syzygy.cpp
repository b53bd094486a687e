#include "syzygy.hpp"

#include <tbprobe.h>

#include <algorithm>
#include <cstdint>
#include <format>
#include <print>

#include "../errors.hpp"

namespace kibitz {

SyzygyTablebase::SyzygyTablebase(const std::string& path) {
    if (path.empty()) {
        return;
    }
    if (!tb_init(path.c_str()) || TB_LARGEST == 0) {
        tb_free();
        throw TablebaseError(std::format("no Syzygy tables found in '{}'", path));
    }
    max_pieces_ = static_cast<int>(TB_LARGEST);
    std::println(stderr, "Syzygy tables loaded from {} (up to {} pieces)", path, max_pieces_);
}

SyzygyTablebase::~SyzygyTablebase() {
    if (max_pieces_ > 0) {
        tb_free();
    }
}

bool SyzygyTablebase::covers(const chess::Board& board) const {
    if (!enabled()) {
        return false;
    }
    int limit = std::min(MAX_TB_PIECES, max_pieces_);
    return board.occ().count() <= limit;
}

Wdl SyzygyTablebase::probe_wdl(const chess::Board& board) const {
    if (!covers(board)) {
        throw TablebaseError("position is not covered by the loaded tables");
    }
    if (board.castlingRights().has(chess::Color::WHITE) ||
        board.castlingRights().has(chess::Color::BLACK)) {
        throw TablebaseError("positions with castling rights are not in the tables");
    }

    std::uint64_t white = board.us(chess::Color::WHITE).getBits();
    std::uint64_t black = board.us(chess::Color::BLACK).getBits();
    std::uint64_t kings = board.pieces(chess::PieceType::KING).getBits();
    std::uint64_t queens = board.pieces(chess::PieceType::QUEEN).getBits();
    std::uint64_t rooks = board.pieces(chess::PieceType::ROOK).getBits();
    std::uint64_t bishops = board.pieces(chess::PieceType::BISHOP).getBits();
    std::uint64_t knights = board.pieces(chess::PieceType::KNIGHT).getBits();
    std::uint64_t pawns = board.pieces(chess::PieceType::PAWN).getBits();

    // Fathom takes the en passant square index, 0 for none
    unsigned ep = board.enpassantSq() != chess::Square::NO_SQ
                      ? static_cast<unsigned>(board.enpassantSq().index())
                      : 0u;
    bool turn = board.sideToMove() == chess::Color::WHITE;

    // WDL tables ignore the 50-move counter; Fathom requires it to be 0 here
    unsigned result = tb_probe_wdl(white, black, kings, queens, rooks, bishops, knights, pawns,
                                   0, 0, ep, turn);
    if (result == TB_RESULT_FAILED) {
        throw TablebaseError("tablebase probe failed (missing table?)");
    }

    switch (result) {
        case TB_LOSS: return Wdl::LOSS;
        case TB_BLESSED_LOSS: return Wdl::BLESSED_LOSS;
        case TB_DRAW: return Wdl::DRAW;
        case TB_CURSED_WIN: return Wdl::CURSED_WIN;
        case TB_WIN: return Wdl::WIN;
        default:
            throw TablebaseError(std::format("unexpected tablebase result {}", result));
    }
}

}  // namespace kibitz
