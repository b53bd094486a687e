#include "board_view.hpp"

#include <filesystem>
#include <format>
#include <print>
#include <stdexcept>
#include <utility>

#include "play_logic.hpp"

namespace kibitz {

namespace {

constexpr std::string_view PIECE_LETTERS = "pnbrqk";

const sf::Color LIGHT_SQUARE{240, 217, 181};
const sf::Color DARK_SQUARE{181, 136, 99};
const sf::Color SELECTED_SQUARE{246, 246, 105};

}  // namespace

BoardView::BoardView(sf::RenderWindow& window, const std::string& pieces_dir,
                     const std::string& font_path)
    : window_(window)
{
    if (!font_.loadFromFile(font_path)) {
        throw std::runtime_error(std::format("cannot load font '{}'", font_path));
    }

    for (int idx = 0; idx < 12; ++idx) {
        char color = idx < 6 ? 'w' : 'b';
        auto path = std::filesystem::path(pieces_dir) /
                    std::format("{}{}.png", color, PIECE_LETTERS[idx % 6]);
        sf::Texture texture;
        if (!texture.loadFromFile(path.string())) {
            std::println(stderr, "Cannot load piece image {}", path.string());
            continue;
        }
        texture.setSmooth(true);
        textures_[idx] = std::move(texture);
    }
}

sf::Text BoardView::make_text(std::string_view text, unsigned size, sf::Color color) const {
    sf::Text out(sf::String::fromUtf8(text.begin(), text.end()), font_, size);
    out.setFillColor(color);
    return out;
}

void BoardView::draw_board(const chess::Board& board, std::optional<chess::Square> selected) {
    for (int row = 0; row < 8; ++row) {
        for (int file = 0; file < 8; ++file) {
            // Row 0 is rank 8
            int rank = 7 - row;
            chess::Square square(rank * 8 + file);
            float x = static_cast<float>(BOARD_OFFSET_X + file * SQUARE_SIZE);
            float y = static_cast<float>(BOARD_OFFSET_Y + row * SQUARE_SIZE);

            sf::RectangleShape cell({static_cast<float>(SQUARE_SIZE), static_cast<float>(SQUARE_SIZE)});
            cell.setPosition(x, y);
            bool light = (row + file) % 2 == 0;
            cell.setFillColor(selected == square ? SELECTED_SQUARE : light ? LIGHT_SQUARE : DARK_SQUARE);
            window_.draw(cell);

            auto piece = board.at(square);
            if (piece == chess::Piece::NONE) {
                continue;
            }
            int idx = static_cast<int>(piece.internal());
            if (textures_[idx].has_value()) {
                sf::Sprite sprite(*textures_[idx]);
                auto size = textures_[idx]->getSize();
                sprite.setScale(static_cast<float>(SQUARE_SIZE) / size.x,
                                static_cast<float>(SQUARE_SIZE) / size.y);
                sprite.setPosition(x, y);
                window_.draw(sprite);
            } else {
                auto letter = static_cast<std::string>(piece);
                sf::Text text = make_text(letter, 40,
                                          piece.color() == chess::Color::WHITE ? sf::Color::White
                                                                               : sf::Color::Black);
                auto bounds = text.getLocalBounds();
                text.setPosition(x + (SQUARE_SIZE - bounds.width) / 2 - bounds.left,
                                 y + (SQUARE_SIZE - bounds.height) / 2 - bounds.top);
                window_.draw(text);
            }
        }
    }
}

void BoardView::draw_thermometer(int cp) {
    // Right of the board, top aligned with it
    float x = static_cast<float>(BOARD_OFFSET_X + 8 * SQUARE_SIZE + 20);
    float y = static_cast<float>(BOARD_OFFSET_Y);

    sf::RectangleShape bar({static_cast<float>(THERMOMETER_WIDTH), static_cast<float>(THERMOMETER_HEIGHT)});
    bar.setPosition(x, y);
    bar.setFillColor(sf::Color(255, 0, 0));
    window_.draw(bar);

    int fill = thermometer_fill(cp);
    sf::RectangleShape level({static_cast<float>(THERMOMETER_WIDTH), static_cast<float>(fill)});
    level.setPosition(x, y + static_cast<float>(THERMOMETER_HEIGHT - fill));
    level.setFillColor(sf::Color(0, 255, 0));
    window_.draw(level);
}

void BoardView::draw_text(std::string_view text, float x, float y, sf::Color color, unsigned size) {
    sf::Text out = make_text(text, size, color);
    out.setPosition(x, y);
    window_.draw(out);
}

void BoardView::draw_centered(std::string_view text, float y, sf::Color color, unsigned size) {
    sf::Text out = make_text(text, size, color);
    out.setPosition((WINDOW_WIDTH - out.getLocalBounds().width) / 2.f, y);
    window_.draw(out);
}

void BoardView::draw_button(const Button& button) {
    sf::RectangleShape shape({static_cast<float>(button.rect.width),
                              static_cast<float>(button.rect.height)});
    shape.setPosition(static_cast<float>(button.rect.left), static_cast<float>(button.rect.top));
    shape.setFillColor(button.color);
    window_.draw(shape);
    draw_text(button.label, static_cast<float>(button.rect.left + 10),
              static_cast<float>(button.rect.top + 5), sf::Color::Black);
}

std::optional<chess::Square> BoardView::square_at(int x, int y) {
    if (x < BOARD_OFFSET_X || y < BOARD_OFFSET_Y) {
        return std::nullopt;
    }
    int file = (x - BOARD_OFFSET_X) / SQUARE_SIZE;
    int rank = 7 - (y - BOARD_OFFSET_Y) / SQUARE_SIZE;
    if (file < 0 || file >= 8 || rank < 0 || rank >= 8) {
        return std::nullopt;
    }
    return chess::Square(rank * 8 + file);
}

}  // namespace kibitz
