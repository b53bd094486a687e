#include "uci_engine.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <print>

#include "../errors.hpp"

namespace kibitz {

std::unique_ptr<UciEngine> UciEngine::popen(const std::string& exe_path, UciEngineOptions options) {
    auto engine = std::make_unique<UciEngine>(Passkey{}, options);
    engine->start(exe_path);
    engine->handshake();
    std::println(stderr, "Engine started: {} by {} ({})",
                 engine->id_.name, engine->id_.author, exe_path);
    return engine;
}

UciEngine::UciEngine(Passkey, UciEngineOptions options)
    : options_(options)
{}

UciEngine::~UciEngine() {
    quit();
}

void UciEngine::start(const std::string& exe_path) {
    exe_path_ = exe_path;
    process_.start(exe_path);
    running_ = true;
    reader_ = std::thread([this]() { reader_loop(); });
}

void UciEngine::reader_loop() {
    for (;;) {
        auto line = process_.read_line();
        std::lock_guard lock(mutex_);
        if (!line.has_value()) {
            eof_ = true;
            lines_cv_.notify_all();
            return;
        }
        lines_.push_back(std::move(*line));
        lines_cv_.notify_all();
    }
}

void UciEngine::quit() {
    if (!running_) {
        return;
    }
    running_ = false;

    // The engine may already be gone; a failed write is expected then
    if (!process_.write("quit\n")) {
        std::println(stderr, "Engine stdin already closed during quit");
    }
    process_.close_stdin();
    process_.reap(static_cast<int>(options_.quit_grace.count()));

    if (reader_.joinable()) {
        reader_.join();
    }
    process_.stop(0);

    std::lock_guard lock(mutex_);
    lines_.clear();
}

void UciEngine::send(const std::string& line) {
    if (!process_.write(line + "\n")) {
        throw EngineError(std::format("engine '{}' is not accepting input", exe_path_));
    }
}

std::optional<std::string> UciEngine::next_line(std::optional<Clock::time_point> deadline) {
    std::unique_lock lock(mutex_);
    auto ready = [this]() { return !lines_.empty() || eof_; };

    if (deadline.has_value()) {
        if (!lines_cv_.wait_until(lock, *deadline, ready)) {
            return std::nullopt;
        }
    } else {
        lines_cv_.wait(lock, ready);
    }

    if (lines_.empty()) {
        throw EngineError(std::format("engine process '{}' exited", exe_path_));
    }
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

void UciEngine::handshake() {
    send("uci");

    auto deadline = Clock::now() + options_.handshake_timeout;
    for (;;) {
        auto line = next_line(deadline);
        if (!line.has_value()) {
            throw EngineError(std::format("engine '{}' did not answer 'uci'", exe_path_));
        }
        if (*line == "uciok") {
            break;
        }
        if (parse_id_line(*line, id_)) {
            continue;
        }
        auto tokens = tokenize(*line);
        if (tokens.size() >= 3 && tokens[0] == "option" && tokens[1] == "name") {
            // Option names may contain spaces; they run up to " type "
            auto start = line->find("name ") + 5;
            auto end = line->find(" type ", start);
            option_names_.push_back(line->substr(start, end == std::string::npos
                                                            ? std::string::npos
                                                            : end - start));
        }
    }

    sync_ready();
}

void UciEngine::sync_ready() {
    send("isready");
    auto deadline = Clock::now() + options_.handshake_timeout;
    for (;;) {
        auto line = next_line(deadline);
        if (!line.has_value()) {
            throw EngineError(std::format("engine '{}' did not answer 'isready'", exe_path_));
        }
        if (*line == "readyok") {
            return;
        }
    }
}

void UciEngine::recover_after_stop() {
    // A late bestmove must not answer the next search. The engine handles
    // commands in order, so "readyok" comes after whatever it still owes us.
    try {
        sync_ready();
    } catch (const EngineError& e) {
        std::println(stderr, "Engine did not recover after stop ({}), shutting it down", e.what());
        quit();
        return;
    }
    std::lock_guard lock(mutex_);
    lines_.clear();
}

void UciEngine::set_option(std::string_view name, std::string_view value) {
    send(std::format("setoption name {} value {}", name, value));
    sync_ready();
}

void UciEngine::send_position(const Game& game) {
    std::string cmd = "position fen " + game.start_fen();
    auto moves = game.uci_moves();
    if (!moves.empty()) {
        cmd += " moves";
        for (const auto& m : moves) {
            cmd += ' ';
            cmd += m;
        }
    }
    send(cmd);
}

BestMoveLine UciEngine::run_search(const Game& game,
                                   const SearchLimits& limits,
                                   const std::function<void(const std::string&)>& on_line) {
    if (!running_) {
        throw EngineError("engine is not running");
    }

    // Anything still queued belongs to an earlier command
    {
        std::lock_guard lock(mutex_);
        lines_.clear();
    }

    send_position(game);
    send(limits.to_go_command());

    std::optional<Clock::time_point> deadline;
    if (limits.movetime.has_value()) {
        deadline = Clock::now() + std::chrono::milliseconds(*limits.movetime) + options_.search_grace;
    }

    bool stop_sent = false;
    for (;;) {
        auto line = next_line(deadline);
        if (!line.has_value()) {
            if (stop_sent) {
                recover_after_stop();
                throw EngineError(std::format("engine '{}' ignored 'stop'", exe_path_));
            }
            std::println(stderr, "Engine overran its time budget, sending stop");
            send("stop");
            stop_sent = true;
            deadline = Clock::now() + options_.search_grace;
            continue;
        }
        if (auto best = parse_bestmove_line(*line)) {
            return *best;
        }
        on_line(*line);
    }
}

PlayResult UciEngine::play(const Game& game, const SearchLimits& limits) {
    auto best = run_search(game, limits, [](const std::string&) {});

    if (best.best == "(none)" || best.best == "0000" || !is_uci_syntax(best.best)) {
        throw EngineError(std::format("engine returned no move ('{}')", best.best));
    }

    const chess::Board& board = game.board();
    PlayResult result;
    result.best_move = chess::uci::uciToMove(board, best.best);
    if (!is_legal(board, result.best_move)) {
        throw EngineError(std::format("engine played illegal move '{}'", best.best));
    }

    if (best.ponder.has_value() && is_uci_syntax(*best.ponder)) {
        chess::Board after = board;
        after.makeMove<true>(result.best_move);
        auto ponder = chess::uci::uciToMove(after, *best.ponder);
        if (is_legal(after, ponder)) {
            result.ponder = ponder;
        }
    }
    return result;
}

std::vector<AnalysisInfo> UciEngine::analyse(const Game& game,
                                             const SearchLimits& limits,
                                             int multipv) {
    multipv = std::max(multipv, 1);
    if (multipv != multipv_) {
        set_option("MultiPV", std::to_string(multipv));
        multipv_ = multipv;
    }

    // Keyed by multipv index, latest line with a PV wins
    std::map<int, AnalysisInfo> latest;
    const chess::Board& board = game.board();
    run_search(game, limits, [&](const std::string& line) {
        if (auto info = parse_info_line(line, board)) {
            if (info->multipv >= 1 && info->multipv <= multipv && !info->pv.empty()) {
                latest[info->multipv] = std::move(*info);
            }
        }
    });

    std::vector<AnalysisInfo> infos;
    infos.reserve(latest.size());
    for (auto& [idx, info] : latest) {
        infos.push_back(std::move(info));
    }
    return infos;
}

}  // namespace kibitz
