#include "game_session.hpp"

#include <format>
#include <print>

#include "../errors.hpp"
#include "../notation.hpp"

namespace kibitz {

GameSession::GameSession(const FrontendConfig& config, SyzygyTablebase* tablebase)
    : config_(config)
    , tablebase_(tablebase)
{}

GameSession::~GameSession() {
    shutdown_engine();
}

void GameSession::init_engine(const EngineFactory& factory) {
    try {
        engine_ = factory();
    } catch (const std::exception& e) {
        std::string message = std::format("Engine launch error: {}", e.what());
        std::println(stderr, "{}", message);
        // Keep an earlier startup error (tablebase) visible
        status_ = status_.empty() ? message : std::format("{} | {}", status_, message);
        engine_.reset();
    }
}

void GameSession::shutdown_engine() {
    if (!engine_) {
        return;
    }
    try {
        engine_->quit();
    } catch (const std::exception& e) {
        std::println(stderr, "Engine shutdown failed: {}", e.what());
    }
    engine_.reset();
}

void GameSession::do_move(const chess::Move& move) {
    // SAN depends on the position before the move
    std::string san = chess::uci::moveToSan(game_.board(), move);
    game_.push(move);

    if (game_.board().sideToMove() == chess::Color::WHITE) {
        last_move_black_ = san;
        ++move_count_;
    } else {
        last_move_white_ = san;
    }

    if (config_.use_syzygy_after_move) {
        tablebase_check();
    }
}

void GameSession::tablebase_check() {
    if (tablebase_ == nullptr || !tablebase_->covers(game_.board())) {
        return;
    }
    try {
        Wdl wdl = tablebase_->probe_wdl(game_.board());
        status_ = std::format("(Syzygy) WDL = {}", to_int(wdl));
    } catch (const std::exception& e) {
        status_ = std::format("Syzygy error: {}", e.what());
    }
}

void GameSession::handle_player_move(std::string_view text) {
    try {
        chess::Move move = parse_move(text, game_.board());
        if (!is_legal(game_.board(), move)) {
            status_ = "Illegal move.";
            return;
        }
        do_move(move);
        status_.clear();
    } catch (const std::exception& e) {
        status_ = std::format("Move error: {}", e.what());
    }
}

void GameSession::handle_engine_move() {
    if (!engine_) {
        return;
    }
    try {
        PlayResult result = engine_->play(game_, SearchLimits::make_depth(config_.engine_depth));
        std::string san = chess::uci::moveToSan(game_.board(), result.best_move);
        do_move(result.best_move);
        status_ = std::format("Engine move: {}", san);
    } catch (const std::exception& e) {
        status_ = std::format("Engine error: {}", e.what());
    }
}

void GameSession::run_analysis() {
    if (!engine_) {
        return;
    }
    try {
        auto infos = engine_->analyse(game_,
                                      SearchLimits::make_seconds(config_.analysis_time),
                                      config_.multipv);
        const chess::Board& board = game_.board();

        variants_.clear();
        for (const auto& info : infos) {
            Score white = info.score.white_pov(board.sideToMove());
            Variant variant;
            variant.cp = white.is_mate() ? 0 : white.value;
            variant.score_text = format_score_white(white);
            variant.line_text = san_line(board, info.pv);
            variants_.push_back(std::move(variant));
        }

        if (!variants_.empty()) {
            best_eval_ = std::format("{} {}", variants_.front().score_text,
                                     thermometer(variants_.front().cp));
        } else {
            best_eval_ = "---";
        }
    } catch (const std::exception& e) {
        status_ = std::format("Analysis error: {}", e.what());
    }
}

}  // namespace kibitz
