/**
 * Parsing of the engine side of the UCI protocol.
 *
 * Only the lines a GUI has to understand are handled: "id", "option",
 * "info" and "bestmove". Unknown tokens are skipped, as the protocol asks.
 */

#ifndef KIBITZ_ENGINE_UCI_PROTOCOL_HPP
#define KIBITZ_ENGINE_UCI_PROTOCOL_HPP

#include <chess.hpp>

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../game.hpp"
#include "search_result.hpp"

namespace kibitz {

/**
 * Split a line on spaces and tabs.
 */
[[nodiscard]] inline std::vector<std::string> tokenize(std::string_view line) {
    std::vector<std::string> tokens;
    std::string token;

    for (char c : line) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            if (!token.empty()) {
                tokens.push_back(std::move(token));
                token.clear();
            }
        } else {
            token += c;
        }
    }

    if (!token.empty()) {
        tokens.push_back(std::move(token));
    }

    return tokens;
}

namespace detail {

template <typename T>
std::optional<T> parse_number(std::string_view s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace detail

/**
 * Parse an "info" line.
 *
 * Returns nullopt for info lines without a score (currmove, string, ...)
 * and for lowerbound/upperbound scores, which are not final. PV moves are
 * converted against the given position and the PV is cut at the first
 * move that is not legal there.
 */
[[nodiscard]] inline std::optional<AnalysisInfo> parse_info_line(std::string_view line,
                                                                 const chess::Board& board) {
    auto tokens = tokenize(line);
    if (tokens.empty() || tokens[0] != "info") {
        return std::nullopt;
    }

    AnalysisInfo info;
    bool has_score = false;

    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto& token = tokens[i];

        if (token == "string") {
            return std::nullopt;  // free text until end of line
        } else if (token == "depth" && i + 1 < tokens.size()) {
            info.depth = detail::parse_number<int>(tokens[++i]);
        } else if (token == "seldepth" && i + 1 < tokens.size()) {
            info.seldepth = detail::parse_number<int>(tokens[++i]);
        } else if (token == "multipv" && i + 1 < tokens.size()) {
            info.multipv = detail::parse_number<int>(tokens[++i]).value_or(1);
        } else if (token == "nodes" && i + 1 < tokens.size()) {
            info.nodes = detail::parse_number<std::int64_t>(tokens[++i]);
        } else if (token == "time" && i + 1 < tokens.size()) {
            info.time_ms = detail::parse_number<std::int64_t>(tokens[++i]);
        } else if (token == "score" && i + 2 < tokens.size()) {
            auto value = detail::parse_number<int>(tokens[i + 2]);
            if (!value.has_value()) {
                return std::nullopt;
            }
            if (tokens[i + 1] == "cp") {
                info.score = Score::cp(*value);
            } else if (tokens[i + 1] == "mate") {
                info.score = Score::mate(*value);
            } else {
                return std::nullopt;
            }
            has_score = true;
            i += 2;
        } else if (token == "lowerbound" || token == "upperbound") {
            return std::nullopt;
        } else if (token == "pv") {
            chess::Board scratch = board;
            for (++i; i < tokens.size(); ++i) {
                if (!is_uci_syntax(tokens[i])) {
                    break;
                }
                auto move = chess::uci::uciToMove(scratch, tokens[i]);
                if (!is_legal(scratch, move)) {
                    break;
                }
                info.pv.push_back(move);
                scratch.makeMove<true>(move);
            }
            break;  // pv is always last
        }
    }

    if (!has_score) {
        return std::nullopt;
    }
    return info;
}

/**
 * The moves named by a "bestmove" line.
 */
struct BestMoveLine {
    std::string best;
    std::optional<std::string> ponder;
};

/**
 * Parse "bestmove e2e4 [ponder e7e5]". Returns nullopt for other lines.
 */
[[nodiscard]] inline std::optional<BestMoveLine> parse_bestmove_line(std::string_view line) {
    auto tokens = tokenize(line);
    if (tokens.size() < 2 || tokens[0] != "bestmove") {
        return std::nullopt;
    }
    BestMoveLine out;
    out.best = tokens[1];
    if (tokens.size() >= 4 && tokens[2] == "ponder") {
        out.ponder = tokens[3];
    }
    return out;
}

/**
 * Engine identification collected during the handshake.
 */
struct EngineId {
    std::string name;
    std::string author;
};

/**
 * Apply an "id name ..." / "id author ..." line. Returns false for other lines.
 */
inline bool parse_id_line(std::string_view line, EngineId& id) {
    constexpr std::string_view name_prefix = "id name ";
    constexpr std::string_view author_prefix = "id author ";
    if (line.starts_with(name_prefix)) {
        id.name = std::string(line.substr(name_prefix.size()));
        return true;
    }
    if (line.starts_with(author_prefix)) {
        id.author = std::string(line.substr(author_prefix.size()));
        return true;
    }
    return false;
}

}  // namespace kibitz

#endif  // KIBITZ_ENGINE_UCI_PROTOCOL_HPP
