/**
 * Front-end configuration.
 *
 * Defaults match a Stockfish binary next to the executable and no
 * tablebases. Every field can be overridden from the command line.
 */

#ifndef KIBITZ_CONFIG_HPP
#define KIBITZ_CONFIG_HPP

#include <charconv>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kibitz {

struct FrontendConfig {
    /**
     * UCI engine executable.
     */
    std::string engine_path = "./stockfish-ubuntu-x86-64-avx2";

    /**
     * Syzygy table directory. Empty disables tablebase lookups.
     */
    std::string syzygy_path;

    /**
     * Number of principal variations shown by the analysis.
     */
    int multipv = 3;

    /**
     * Seconds between analysis refreshes while waiting for keyboard input.
     */
    double refresh_interval = 0.5;

    /**
     * Wall-clock budget (seconds) for each background analysis.
     */
    double analysis_time = 0.3;

    /**
     * Probe the tablebase after every move.
     */
    bool use_syzygy_after_move = true;

    /**
     * Search depth for engine moves in the terminal front-end.
     */
    int engine_depth = 10;

    /**
     * Search depth for engine moves in the desktop front-end.
     */
    int gui_engine_depth = 15;

    /**
     * Where diagnostics go while curses owns the terminal.
     */
    std::string log_path = "kibitz.log";

    // Online play server (IPv4 literal) and credentials
    std::string server_address = "13.38.13.177";
    std::uint16_t server_port = 5555;
    std::string username = "Buldozer";
    std::string password = "123";

    std::string puzzle_url = "https://lichess.org/api/puzzle/next";

    // Desktop assets
    std::string pieces_dir = "pieces";
    std::string font_path = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";

    bool show_help = false;
};

inline constexpr std::string_view USAGE =
    "Options:\n"
    "  --engine PATH         UCI engine executable\n"
    "  --syzygy DIR          Syzygy tablebase directory\n"
    "  --multipv N           analysis lines (1-10)\n"
    "  --analysis-time SEC   time budget per analysis\n"
    "  --refresh SEC         analysis refresh interval\n"
    "  --depth N             engine search depth (terminal)\n"
    "  --gui-depth N         engine search depth (desktop)\n"
    "  --no-syzygy           do not probe tablebases after moves\n"
    "  --log FILE            diagnostics file (terminal)\n"
    "  --server ADDR         online server IPv4 address\n"
    "  --port N              online server port\n"
    "  --user NAME           online user name\n"
    "  --password PW         online password\n"
    "  --puzzle-url URL      puzzle API endpoint\n"
    "  --pieces DIR          piece image directory (desktop)\n"
    "  --font FILE           TrueType font (desktop)\n"
    "  --help                show this text\n";

namespace detail {

template <typename T>
T parse_config_number(std::string_view flag, std::string_view text, T min, T max) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < min || value > max) {
        throw std::invalid_argument(
            std::format("{} expects a number in [{}, {}], got '{}'", flag, min, max, text));
    }
    return value;
}

}  // namespace detail

/**
 * Build a configuration from command-line arguments.
 *
 * @throws std::invalid_argument on unknown flags, missing values, or
 *         out-of-range numbers.
 */
[[nodiscard]] inline FrontendConfig parse_args(int argc, const char* const argv[]) {
    FrontendConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string_view flag = argv[i];

        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::format("{} requires a value", flag));
            }
            return argv[++i];
        };

        if (flag == "--help" || flag == "-h") {
            config.show_help = true;
        } else if (flag == "--engine") {
            config.engine_path = value();
        } else if (flag == "--syzygy") {
            config.syzygy_path = value();
        } else if (flag == "--multipv") {
            config.multipv = detail::parse_config_number<int>(flag, value(), 1, 10);
        } else if (flag == "--analysis-time") {
            config.analysis_time = detail::parse_config_number<double>(flag, value(), 0.01, 60.0);
        } else if (flag == "--refresh") {
            config.refresh_interval = detail::parse_config_number<double>(flag, value(), 0.05, 60.0);
        } else if (flag == "--depth") {
            config.engine_depth = detail::parse_config_number<int>(flag, value(), 1, 100);
        } else if (flag == "--gui-depth") {
            config.gui_engine_depth = detail::parse_config_number<int>(flag, value(), 1, 100);
        } else if (flag == "--no-syzygy") {
            config.use_syzygy_after_move = false;
        } else if (flag == "--log") {
            config.log_path = value();
        } else if (flag == "--server") {
            config.server_address = value();
        } else if (flag == "--port") {
            config.server_port = detail::parse_config_number<std::uint16_t>(flag, value(), 1, 65535);
        } else if (flag == "--user") {
            config.username = value();
        } else if (flag == "--password") {
            config.password = value();
        } else if (flag == "--puzzle-url") {
            config.puzzle_url = value();
        } else if (flag == "--pieces") {
            config.pieces_dir = value();
        } else if (flag == "--font") {
            config.font_path = value();
        } else {
            throw std::invalid_argument(std::format("unknown option '{}'", flag));
        }
    }

    return config;
}

}  // namespace kibitz

#endif  // KIBITZ_CONFIG_HPP
