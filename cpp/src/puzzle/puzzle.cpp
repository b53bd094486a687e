#include "puzzle.hpp"

#include <json/json.h>

#include <format>
#include <memory>
#include <print>
#include <utility>

#include "../errors.hpp"
#include "../game.hpp"
#include "../notation.hpp"

namespace kibitz {

namespace {

bool is_result_token(std::string_view token) {
    return token == "1-0" || token == "0-1" || token == "1/2-1/2" || token == "*";
}

/**
 * "12." / "12..." on their own, or glued to the move as in "12.e4".
 * Returns the move part, empty if the token is only a number.
 */
std::string_view strip_move_number(std::string_view token) {
    std::size_t digits = 0;
    while (digits < token.size() && token[digits] >= '0' && token[digits] <= '9') {
        ++digits;
    }
    if (digits == 0 || digits == token.size() || token[digits] != '.') {
        return token;
    }
    auto rest = token.substr(digits);
    auto move_start = rest.find_first_not_of('.');
    return move_start == std::string_view::npos ? std::string_view{} : rest.substr(move_start);
}

const Json::Value& require(const Json::Value& parent, const char* key, std::string_view path) {
    if (!parent.isObject() || !parent.isMember(key)) {
        throw PuzzleError(std::format("puzzle JSON has no '{}'", path));
    }
    return parent[key];
}

}  // namespace

Puzzle parse_puzzle(std::string_view json) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw PuzzleError(std::format("invalid puzzle JSON: {}", errors));
    }

    const Json::Value& game = require(root, "game", "game");
    const Json::Value& puzzle = require(root, "puzzle", "puzzle");
    const Json::Value& pgn = require(game, "pgn", "game.pgn");
    const Json::Value& solution = require(puzzle, "solution", "puzzle.solution");

    if (!pgn.isString()) {
        throw PuzzleError("game.pgn is not a string");
    }
    if (!solution.isArray() || solution.empty()) {
        throw PuzzleError("puzzle.solution is not a non-empty list");
    }

    Puzzle result;
    result.pgn = pgn.asString();
    for (const auto& move : solution) {
        if (!move.isString() || !is_uci_syntax(move.asString())) {
            throw PuzzleError("puzzle.solution holds a malformed move");
        }
        result.solution.push_back(move.asString());
    }

    const Json::Value& id = require(puzzle, "id", "puzzle.id");
    result.id = id.isString() ? id.asString() : id.toStyledString();
    const Json::Value& rating = require(puzzle, "rating", "puzzle.rating");
    if (!rating.isNumeric()) {
        throw PuzzleError("puzzle.rating is not a number");
    }
    result.rating = rating.asInt();
    return result;
}

chess::Board replay_movetext(std::string_view pgn) {
    chess::Board board{STARTPOS_FEN};
    auto tokens = detail::split_ws(pgn);

    int comment_depth = 0;
    for (const auto& raw : tokens) {
        std::string_view token = raw;

        // Comments may span several tokens
        if (comment_depth > 0 || token.starts_with('{')) {
            for (char c : token) {
                if (c == '{') ++comment_depth;
                if (c == '}') --comment_depth;
            }
            continue;
        }
        if (token.starts_with('$') || is_result_token(token)) {
            continue;
        }
        token = strip_move_number(token);
        if (token.empty()) {
            continue;
        }

        chess::Move move = chess::Move::NO_MOVE;
        try {
            move = chess::uci::parseSan(board, token);
        } catch (const std::exception& e) {
            throw PuzzleError(std::format("cannot replay '{}': {}", token, e.what()));
        }
        if (!is_legal(board, move)) {
            throw PuzzleError(std::format("cannot replay '{}': illegal move", token));
        }
        board.makeMove<true>(move);
    }
    return board;
}

PuzzleSession::PuzzleSession(Puzzle puzzle)
    : puzzle_(std::move(puzzle))
    , board_(replay_movetext(puzzle_.pgn))
    , solver_(board_.sideToMove())
{
    std::println(stderr, "Puzzle {} (rating {}), {} to move, {} solution moves",
                 puzzle_.id, puzzle_.rating,
                 solver_ == chess::Color::WHITE ? "White" : "Black",
                 puzzle_.solution.size());
}

std::string PuzzleSession::expected() const {
    if (finished_ || index_ >= puzzle_.solution.size()) {
        return {};
    }
    return puzzle_.solution[index_];
}

PuzzleOutcome PuzzleSession::try_move(const chess::Move& move) {
    if (finished_ || index_ >= puzzle_.solution.size()) {
        finished_ = true;
        return PuzzleOutcome::AlreadyFinished;
    }

    if (!is_legal(board_, move) || chess::uci::moveToUci(move) != puzzle_.solution[index_]) {
        return PuzzleOutcome::Wrong;
    }

    board_.makeMove<true>(move);
    ++index_;
    if (index_ >= puzzle_.solution.size()) {
        finished_ = true;
        return PuzzleOutcome::Solved;
    }

    const std::string& reply_uci = puzzle_.solution[index_];
    chess::Move reply = chess::uci::uciToMove(board_, reply_uci);
    if (!is_legal(board_, reply)) {
        std::println(stderr, "Puzzle {}: scripted reply {} is illegal", puzzle_.id, reply_uci);
        finished_ = true;
        return PuzzleOutcome::BadSolution;
    }
    board_.makeMove<true>(reply);
    ++index_;
    if (index_ >= puzzle_.solution.size()) {
        finished_ = true;
        return PuzzleOutcome::Solved;
    }
    return PuzzleOutcome::Correct;
}

}  // namespace kibitz
