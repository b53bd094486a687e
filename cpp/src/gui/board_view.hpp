/**
 * BoardView - Draws boards, buttons, text and the evaluation bar into an
 * SFML window, and maps mouse positions back to squares.
 */

#ifndef KIBITZ_GUI_BOARD_VIEW_HPP
#define KIBITZ_GUI_BOARD_VIEW_HPP

#include <SFML/Graphics.hpp>
#include <chess.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace kibitz {

inline constexpr unsigned WINDOW_WIDTH = 800;
inline constexpr unsigned WINDOW_HEIGHT = 600;
inline constexpr unsigned FRAME_RATE = 30;

inline constexpr int SQUARE_SIZE = 64;
inline constexpr int BOARD_OFFSET_X = (WINDOW_WIDTH - 8 * SQUARE_SIZE) / 2;
inline constexpr int BOARD_OFFSET_Y = (WINDOW_HEIGHT - 8 * SQUARE_SIZE) / 2;

inline const sf::Color BACKGROUND{30, 30, 30};
inline const sf::Color MENU_BACKGROUND{20, 20, 20};
inline const sf::Color TEXT_COLOR{255, 255, 255};
inline const sf::Color ERROR_COLOR{255, 0, 0};

/**
 * A clickable rectangle with a label.
 */
struct Button {
    sf::IntRect rect;
    sf::Color color;
    std::string label;

    [[nodiscard]] bool contains(int x, int y) const { return rect.contains(x, y); }
};

class BoardView {
public:
    /**
     * Load piece images from pieces_dir/{w,b}{p,n,b,r,q,k}.png and the font.
     * Missing images are logged; those pieces are drawn as letters.
     *
     * @throws std::runtime_error if the font cannot be loaded.
     */
    BoardView(sf::RenderWindow& window, const std::string& pieces_dir, const std::string& font_path);

    /**
     * Draw the board, White at the bottom, with an optional highlighted square.
     */
    void draw_board(const chess::Board& board,
                    std::optional<chess::Square> selected = std::nullopt);

    /**
     * Red/green evaluation bar right of the board for a centipawn score.
     */
    void draw_thermometer(int cp);

    void draw_text(std::string_view text, float x, float y,
                   sf::Color color = TEXT_COLOR, unsigned size = 24);

    /**
     * Text horizontally centred in the window.
     */
    void draw_centered(std::string_view text, float y,
                       sf::Color color = TEXT_COLOR, unsigned size = 24);

    void draw_button(const Button& button);

    /**
     * Square under a window position, if any.
     */
    [[nodiscard]] static std::optional<chess::Square> square_at(int x, int y);

private:
    [[nodiscard]] sf::Text make_text(std::string_view text, unsigned size, sf::Color color) const;

    sf::RenderWindow& window_;
    sf::Font font_;

    // Indexed by chess::Piece::internal()
    std::array<std::optional<sf::Texture>, 12> textures_;
};

}  // namespace kibitz

#endif  // KIBITZ_GUI_BOARD_VIEW_HPP
