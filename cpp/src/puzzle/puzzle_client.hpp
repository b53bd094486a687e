/**
 * HTTP(S) fetch of puzzle JSON.
 */

#ifndef KIBITZ_PUZZLE_PUZZLE_CLIENT_HPP
#define KIBITZ_PUZZLE_PUZZLE_CLIENT_HPP

#include <chrono>
#include <string>
#include <string_view>

namespace kibitz {

struct Url {
    bool tls = true;
    std::string host;
    std::string port;
    std::string target = "/";
};

/**
 * Split "https://host[:port]/path?query" into its parts.
 *
 * @throws PuzzleError for schemes other than http and https, or no host.
 */
[[nodiscard]] Url parse_url(std::string_view url);

/**
 * GET the URL and return the response body. The whole exchange, name
 * lookup included, must finish within timeout.
 *
 * @throws PuzzleError on connection, TLS or HTTP failure, including any
 *         status other than 200.
 */
[[nodiscard]] std::string fetch_puzzle_json(const std::string& url,
                                            std::chrono::seconds timeout = std::chrono::seconds(10));

}  // namespace kibitz

#endif  // KIBITZ_PUZZLE_PUZZLE_CLIENT_HPP
