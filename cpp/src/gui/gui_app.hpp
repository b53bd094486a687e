/**
 * GuiApp - Desktop front-end: a main menu leading to play against the
 * engine, an analysis board, puzzles and online play.
 *
 * Every screen is a blocking loop on the UI thread that polls window
 * events, updates its state and redraws at FRAME_RATE. Closing the window
 * unwinds all screens back to run().
 */

#ifndef KIBITZ_GUI_GUI_APP_HPP
#define KIBITZ_GUI_GUI_APP_HPP

#include <SFML/Graphics.hpp>

#include <chrono>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "../config.hpp"
#include "../engine/engine.hpp"
#include "../online/online_client.hpp"
#include "../online/online_game.hpp"
#include "board_view.hpp"

namespace kibitz {

class GuiApp {
public:
    GuiApp(const FrontendConfig& config, EngineFactory engine_factory);

    /**
     * Show the main menu until the user quits or closes the window.
     */
    void run();

private:
    /**
     * Events gathered since the last frame.
     */
    struct Input {
        std::vector<sf::Vector2i> clicks;
        bool back = false;  // Escape pressed
    };

    Input poll_input();

    /**
     * Keep the window responsive for a while without redrawing.
     */
    void hold(std::chrono::milliseconds duration);

    void show_notice(const std::string& text, std::chrono::milliseconds duration);

    /**
     * Start an engine, or log why not and return null.
     */
    std::unique_ptr<Engine> launch_engine();

    void play_vs_engine();
    void analysis_board();
    void puzzles();

    void online_mode();
    void lobby(OnlineClient& client);
    void choose_opponent(OnlineClient& client);
    void online_game(OnlineClient& client, OnlineGame& game);

    /**
     * Pairing after START_MATCH: colour and opponent name.
     */
    std::pair<std::string, std::string> wait_for_match();

    const FrontendConfig& config_;
    EngineFactory engine_factory_;
    sf::RenderWindow window_;
    BoardView view_;
    std::mt19937 rng_;
};

}  // namespace kibitz

#endif  // KIBITZ_GUI_GUI_APP_HPP
