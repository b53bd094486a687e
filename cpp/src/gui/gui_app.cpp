#include "gui_app.hpp"

#include <format>
#include <print>
#include <string_view>

#include "../errors.hpp"
#include "../notation.hpp"
#include "../puzzle/puzzle.hpp"
#include "../puzzle/puzzle_client.hpp"
#include "play_logic.hpp"

namespace kibitz {

namespace {

constexpr std::chrono::milliseconds NOTICE_TIME{2000};
constexpr std::chrono::milliseconds ILLEGAL_MOVE_TIME{1000};
constexpr std::chrono::milliseconds GAME_OVER_TIME{3000};
constexpr std::chrono::milliseconds ENGINE_PAUSE{500};
constexpr std::chrono::milliseconds LOGIN_REPLY_TIMEOUT{2000};

// Pairing reported after START_MATCH
constexpr std::string_view MATCH_COLOR = "white";
constexpr std::string_view MATCH_OPPONENT = "Opponent1";

const Button* button_at(const std::vector<Button>& buttons, sf::Vector2i click) {
    for (const auto& button : buttons) {
        if (button.contains(click.x, click.y)) {
            return &button;
        }
    }
    return nullptr;
}

std::string uci_history(const Game& game) {
    std::string out;
    for (const auto& uci : game.uci_moves()) {
        if (!out.empty()) {
            out += ' ';
        }
        out += uci;
    }
    return out;
}

}  // namespace

GuiApp::GuiApp(const FrontendConfig& config, EngineFactory engine_factory)
    : config_(config)
    , engine_factory_(std::move(engine_factory))
    , window_(sf::VideoMode(WINDOW_WIDTH, WINDOW_HEIGHT), "Kibitz", sf::Style::Titlebar | sf::Style::Close)
    , view_(window_, config.pieces_dir, config.font_path)
    , rng_(std::random_device{}())
{
    window_.setFramerateLimit(FRAME_RATE);
}

GuiApp::Input GuiApp::poll_input() {
    Input input;
    sf::Event event;
    while (window_.pollEvent(event)) {
        if (event.type == sf::Event::Closed) {
            window_.close();
        } else if (event.type == sf::Event::MouseButtonPressed &&
                   event.mouseButton.button == sf::Mouse::Left) {
            input.clicks.push_back({event.mouseButton.x, event.mouseButton.y});
        } else if (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::Escape) {
            input.back = true;
        }
    }
    return input;
}

void GuiApp::hold(std::chrono::milliseconds duration) {
    sf::Clock clock;
    while (window_.isOpen() && clock.getElapsedTime() < sf::milliseconds(duration.count())) {
        sf::Event event;
        while (window_.pollEvent(event)) {
            if (event.type == sf::Event::Closed) {
                window_.close();
            }
        }
        sf::sleep(sf::milliseconds(10));
    }
}

void GuiApp::show_notice(const std::string& text, std::chrono::milliseconds duration) {
    window_.clear(MENU_BACKGROUND);
    view_.draw_centered(text, WINDOW_HEIGHT / 2.f);
    window_.display();
    hold(duration);
}

std::unique_ptr<Engine> GuiApp::launch_engine() {
    try {
        return engine_factory_();
    } catch (const std::exception& e) {
        std::println(stderr, "Engine launch error: {}", e.what());
        return nullptr;
    }
}

void GuiApp::run() {
    const std::vector<Button> buttons = {
        {{250, 100, 300, 40}, sf::Color(100, 100, 250), "Play vs engine"},
        {{250, 160, 300, 40}, sf::Color(100, 200, 100), "Game analysis"},
        {{250, 220, 300, 40}, sf::Color(200, 100, 100), "Lichess puzzles"},
        {{250, 280, 300, 40}, sf::Color(150, 150, 50), "Online play"},
        {{250, 340, 300, 40}, sf::Color(200, 80, 80), "Quit"},
    };

    while (window_.isOpen()) {
        Input input = poll_input();
        for (const auto& click : input.clicks) {
            const Button* button = button_at(buttons, click);
            if (button == nullptr) {
                continue;
            }
            if (button->label == "Play vs engine") {
                play_vs_engine();
            } else if (button->label == "Game analysis") {
                analysis_board();
            } else if (button->label == "Lichess puzzles") {
                puzzles();
            } else if (button->label == "Online play") {
                online_mode();
            } else if (button->label == "Quit") {
                window_.close();
            }
            break;
        }
        if (!window_.isOpen()) {
            break;
        }

        window_.clear(MENU_BACKGROUND);
        view_.draw_centered("Choose a mode:", 30.f);
        for (const auto& button : buttons) {
            view_.draw_button(button);
        }
        window_.display();
    }
}

void GuiApp::play_vs_engine() {
    auto engine = launch_engine();
    Game game;
    MoveSelector selector;
    Evaluation evaluation;
    std::string evaluated_fen;

    auto draw = [&]() {
        window_.clear(BACKGROUND);
        view_.draw_board(game.board(), selector.selected());
        view_.draw_text(std::format("Eval: {}", evaluation.text), 50.f, 8.f);
        if (evaluation.cp.has_value()) {
            view_.draw_thermometer(*evaluation.cp);
        }
        view_.draw_text(std::format("Moves: {}", uci_history(game)), 50.f, WINDOW_HEIGHT - 40.f,
                        TEXT_COLOR, 16);
    };

    while (window_.isOpen()) {
        std::string fen = game.board().getFen();
        if (fen != evaluated_fen) {
            evaluation = evaluate(engine.get(), game, config_.analysis_time);
            evaluated_fen = fen;
        }

        Input input = poll_input();
        if (input.back) {
            break;
        }

        draw();
        window_.display();

        if (game.is_over()) {
            std::println(stderr, "Game over: {}", game.result());
            hold(GAME_OVER_TIME);
            break;
        }

        if (game.board().sideToMove() == chess::Color::WHITE) {
            for (const auto& click : input.clicks) {
                auto square = BoardView::square_at(click.x, click.y);
                if (!square.has_value()) {
                    continue;
                }
                auto result = selector.click(game.board(), *square, chess::Color::WHITE);
                if (result == MoveSelector::Click::Moved) {
                    game.push(selector.move());
                    break;
                }
                if (result == MoveSelector::Click::Illegal) {
                    draw();
                    view_.draw_text("Invalid move! Try again.", WINDOW_WIDTH / 2.f - 100.f,
                                    WINDOW_HEIGHT - 70.f, ERROR_COLOR);
                    window_.display();
                    hold(ILLEGAL_MOVE_TIME);
                    break;
                }
            }
        } else {
            hold(ENGINE_PAUSE);
            chess::Move reply = choose_reply(engine.get(), game, config_.gui_engine_depth, rng_);
            if (reply != chess::Move::NO_MOVE) {
                game.push(reply);
            }
        }
    }
}

void GuiApp::analysis_board() {
    auto engine = launch_engine();
    Game game;
    MoveSelector selector;
    AnalysisCache cache;

    while (window_.isOpen()) {
        Input input = poll_input();
        if (input.back) {
            break;
        }

        for (const auto& click : input.clicks) {
            auto square = BoardView::square_at(click.x, click.y);
            if (!square.has_value() || game.is_over()) {
                continue;
            }
            if (selector.click(game.board(), *square, game.board().sideToMove()) ==
                MoveSelector::Click::Moved) {
                game.push(selector.move());
            }
        }

        window_.clear(BACKGROUND);
        view_.draw_board(game.board(), selector.selected());

        if (game.is_over()) {
            view_.draw_text(std::format("Game over: {}   (Esc: menu)", game.result()), 50.f, 8.f);
        } else if (!engine) {
            view_.draw_text("Eval: No engine   (Esc: menu)", 50.f, 8.f);
        } else {
            const auto& lines = cache.lines(*engine, game, config_.analysis_time, config_.multipv);
            const chess::Board& board = game.board();
            if (!cache.error().empty()) {
                view_.draw_text(cache.error(), 50.f, 8.f, ERROR_COLOR, 16);
            } else if (!lines.empty()) {
                Score best = lines.front().score.white_pov(board.sideToMove());
                view_.draw_text(std::format("Eval: {}   (Esc: menu)", format_score_white(best)), 50.f, 8.f);
                view_.draw_thermometer(best.is_mate() ? (best.value > 0 ? 100 : -100) : best.value);
            }
            float y = BOARD_OFFSET_Y + 8 * SQUARE_SIZE + 2.f;
            for (const auto& info : lines) {
                Score score = info.score.white_pov(board.sideToMove());
                view_.draw_text(std::format("{}  {}", format_score_white(score), san_line(board, info.pv)),
                                static_cast<float>(BOARD_OFFSET_X), y, TEXT_COLOR, 12);
                y += 14.f;
            }
        }
        window_.display();
    }
}

void GuiApp::puzzles() {
    std::unique_ptr<PuzzleSession> session;
    try {
        std::string json = fetch_puzzle_json(config_.puzzle_url);
        session = std::make_unique<PuzzleSession>(parse_puzzle(json));
    } catch (const std::exception& e) {
        std::println(stderr, "Puzzle fetch failed: {}", e.what());
        show_notice(std::format("Puzzle error: {}", e.what()), NOTICE_TIME);
        return;
    }

    MoveSelector selector;
    std::string feedback = "Find the best move";
    std::string title = std::format("Puzzle {} ({})  {} to move", session->puzzle().id,
                                    session->puzzle().rating,
                                    session->solver() == chess::Color::WHITE ? "White" : "Black");

    auto draw = [&]() {
        window_.clear(BACKGROUND);
        view_.draw_board(session->board(), selector.selected());
        view_.draw_text(title, 50.f, 8.f);
        view_.draw_text(feedback, 50.f, WINDOW_HEIGHT - 40.f);
        window_.display();
    };

    while (window_.isOpen()) {
        Input input = poll_input();
        if (input.back) {
            return;
        }

        for (const auto& click : input.clicks) {
            auto square = BoardView::square_at(click.x, click.y);
            if (!square.has_value()) {
                continue;
            }
            const chess::Board& board = session->board();
            if (selector.click(board, *square, board.sideToMove()) != MoveSelector::Click::Moved) {
                continue;
            }

            std::string expected = session->expected();
            PuzzleOutcome outcome = session->try_move(selector.move());
            std::println(stderr, "Puzzle {}: {} -> {}", session->puzzle().id,
                         chess::uci::moveToUci(selector.move()), to_string(outcome));

            switch (outcome) {
                case PuzzleOutcome::Correct:
                    feedback = "Correct";
                    break;
                case PuzzleOutcome::Wrong:
                    feedback = std::format("Wrong, expected {}", expected);
                    break;
                case PuzzleOutcome::Solved:
                    feedback = "Puzzle solved!";
                    draw();
                    hold(NOTICE_TIME);
                    return;
                case PuzzleOutcome::BadSolution:
                    feedback = "Puzzle data error: illegal reply";
                    draw();
                    hold(NOTICE_TIME);
                    return;
                case PuzzleOutcome::AlreadyFinished:
                    return;
            }
            break;
        }

        draw();
    }
}

void GuiApp::online_mode() {
    OnlineClient client(config_.server_address, config_.server_port);
    try {
        client.connect();
        client.send(Message::login(config_.username, config_.password));
    } catch (const NetworkError& e) {
        std::println(stderr, "Server connection error: {}", e.what());
        show_notice(std::format("Connection error: {}", e.what()), NOTICE_TIME);
        return;
    }

    auto reply = client.wait_for(LOGIN_REPLY_TIMEOUT);
    std::println(stderr, "Login reply: {}", reply.has_value() ? reply->raw : "(none)");

    lobby(client);
    client.close();
}

void GuiApp::lobby(OnlineClient& client) {
    const std::vector<Button> buttons = {
        {{50, 100, 200, 40}, sf::Color(80, 80, 200), "Quick match"},
        {{50, 160, 200, 40}, sf::Color(80, 200, 100), "Statistics"},
        {{50, 220, 200, 40}, sf::Color(200, 80, 80), "Log out"},
    };

    while (window_.isOpen()) {
        Input input = poll_input();
        for (const auto& click : input.clicks) {
            const Button* button = button_at(buttons, click);
            if (button == nullptr) {
                continue;
            }
            if (button->label == "Quick match") {
                choose_opponent(client);
            } else if (button->label == "Statistics") {
                show_notice("Statistics - not implemented", NOTICE_TIME);
            } else if (button->label == "Log out") {
                return;
            }
            break;
        }
        if (input.back) {
            return;
        }

        window_.clear(MENU_BACKGROUND);
        view_.draw_text(std::format("Welcome, {}!", config_.username), 50.f, 30.f);
        for (const auto& button : buttons) {
            view_.draw_button(button);
        }
        if (!client.connected()) {
            view_.draw_text("Connection to the server lost", 50.f, 300.f, ERROR_COLOR);
        }
        window_.display();
    }
}

void GuiApp::choose_opponent(OnlineClient& client) {
    const std::vector<Button> buttons = {
        {{250, 120, 300, 40}, sf::Color(100, 100, 250), "Random online player"},
        {{250, 180, 300, 40}, sf::Color(100, 200, 100), "Play the bot"},
        {{250, 240, 300, 40}, sf::Color(200, 100, 100), "Cancel"},
    };

    while (window_.isOpen()) {
        Input input = poll_input();
        for (const auto& click : input.clicks) {
            const Button* button = button_at(buttons, click);
            if (button == nullptr) {
                continue;
            }
            if (button->label == "Random online player") {
                try {
                    client.send(Message::start_match());
                } catch (const NetworkError& e) {
                    std::println(stderr, "START_MATCH failed: {}", e.what());
                    show_notice(std::format("Connection error: {}", e.what()), NOTICE_TIME);
                    return;
                }
                auto [color, opponent] = wait_for_match();
                OnlineGame game(color, opponent, config_.username);
                online_game(client, game);
                return;
            }
            if (button->label == "Play the bot") {
                play_vs_engine();
            }
            // Cancel, or back from a finished bot game
            return;
        }
        if (input.back) {
            return;
        }

        window_.clear(MENU_BACKGROUND);
        view_.draw_centered("Choose an opponent", 50.f);
        for (const auto& button : buttons) {
            view_.draw_button(button);
        }
        window_.display();
    }
}

std::pair<std::string, std::string> GuiApp::wait_for_match() {
    // The server does not announce pairings yet; assume one after a short wait
    std::println(stderr, "Waiting for an opponent...");
    show_notice("Waiting for an opponent...", NOTICE_TIME);
    return {std::string(MATCH_COLOR), std::string(MATCH_OPPONENT)};
}

void GuiApp::online_game(OnlineClient& client, OnlineGame& game) {
    MoveSelector selector;
    std::string error;
    std::string header = std::format("{} ({}) vs {}", config_.username,
                                     game.color() == chess::Color::WHITE ? "White" : "Black",
                                     game.opponent());

    auto send = [&](const Message& message) {
        try {
            client.send(message);
        } catch (const NetworkError& e) {
            std::println(stderr, "{}", e.what());
            error = std::format("Connection error: {}", e.what());
        }
    };

    while (window_.isOpen()) {
        for (const auto& message : client.poll()) {
            if (message.kind == Message::Kind::OpponentMove) {
                game.apply_remote(message.fields.front());
            }
        }
        if (!client.connected() && error.empty()) {
            error = "Connection to the server lost";
        }

        Input input = poll_input();
        if (input.back) {
            return;
        }

        window_.clear(BACKGROUND);
        view_.draw_board(game.game().board(), selector.selected());
        view_.draw_text(header, 50.f, 8.f);
        view_.draw_text(game.my_turn() ? "Your move" : "Opponent's move", 50.f, WINDOW_HEIGHT - 40.f);
        if (!error.empty()) {
            view_.draw_text(error, 300.f, WINDOW_HEIGHT - 40.f, ERROR_COLOR, 18);
        }
        window_.display();

        if (game.game().is_over()) {
            if (auto message = game.game_over_message()) {
                send(*message);
            }
            std::println(stderr, "Game over: {}", game.game().result());
            hold(GAME_OVER_TIME);
            return;
        }

        if (!game.my_turn()) {
            continue;
        }
        for (const auto& click : input.clicks) {
            auto square = BoardView::square_at(click.x, click.y);
            if (!square.has_value()) {
                continue;
            }
            if (selector.click(game.game().board(), *square, game.color()) ==
                MoveSelector::Click::Moved) {
                send(game.play_local(selector.move()));
                break;
            }
        }
    }
}

}  // namespace kibitz
