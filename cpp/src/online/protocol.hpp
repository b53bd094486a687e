/**
 * Online play wire protocol.
 *
 * Messages are single lines of '|'-separated fields, the first field naming
 * the message:
 *
 *   LOGIN|<user>|<password>               client -> server
 *   START_MATCH                           client -> server
 *   MOVE|<opponent>|<uci>                 client -> server
 *   GAME_OVER|<user>|<opponent>|<result>  client -> server
 *   OPPONENT_MOVE|<uci>                   server -> client
 *
 * Anything else the server sends is kept verbatim as Kind::Other.
 */

#ifndef KIBITZ_ONLINE_PROTOCOL_HPP
#define KIBITZ_ONLINE_PROTOCOL_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kibitz {

struct Message {
    enum class Kind { Login, StartMatch, Move, GameOver, OpponentMove, Other };

    Kind kind = Kind::Other;
    std::vector<std::string> fields;  // Everything after the name
    std::string raw;                  // Received text, without line terminator

    [[nodiscard]] static Message login(std::string user, std::string password) {
        return Message{Kind::Login, {std::move(user), std::move(password)}, {}};
    }

    [[nodiscard]] static Message start_match() {
        return Message{Kind::StartMatch, {}, {}};
    }

    [[nodiscard]] static Message move(std::string opponent, std::string uci) {
        return Message{Kind::Move, {std::move(opponent), std::move(uci)}, {}};
    }

    [[nodiscard]] static Message game_over(std::string user, std::string opponent,
                                           std::string result) {
        return Message{Kind::GameOver, {std::move(user), std::move(opponent), std::move(result)}, {}};
    }

    [[nodiscard]] static Message opponent_move(std::string uci) {
        return Message{Kind::OpponentMove, {std::move(uci)}, {}};
    }
};

[[nodiscard]] constexpr std::string_view kind_name(Message::Kind kind) noexcept {
    switch (kind) {
        case Message::Kind::Login: return "LOGIN";
        case Message::Kind::StartMatch: return "START_MATCH";
        case Message::Kind::Move: return "MOVE";
        case Message::Kind::GameOver: return "GAME_OVER";
        case Message::Kind::OpponentMove: return "OPPONENT_MOVE";
        case Message::Kind::Other: return "";
    }
    return "";
}

/**
 * Wire form of a message, without the trailing newline.
 * Kind::Other messages are sent as their raw text.
 */
[[nodiscard]] inline std::string encode(const Message& message) {
    if (message.kind == Message::Kind::Other) {
        return message.raw;
    }
    std::string out(kind_name(message.kind));
    for (const auto& field : message.fields) {
        out += '|';
        out += field;
    }
    return out;
}

/**
 * Parse one received line. Never throws; unknown names and malformed
 * known messages come back as Kind::Other with the raw text.
 */
[[nodiscard]] inline Message decode(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }

    Message message;
    message.raw = std::string(line);

    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        auto bar = line.find('|', start);
        parts.emplace_back(line.substr(start, bar == std::string_view::npos ? bar : bar - start));
        if (bar == std::string_view::npos) {
            break;
        }
        start = bar + 1;
    }

    const std::string& name = parts.front();
    std::size_t arity = parts.size() - 1;
    using Kind = Message::Kind;

    Kind kind = Kind::Other;
    if (name == "LOGIN" && arity == 2) {
        kind = Kind::Login;
    } else if (name == "START_MATCH" && arity == 0) {
        kind = Kind::StartMatch;
    } else if (name == "MOVE" && arity == 2) {
        kind = Kind::Move;
    } else if (name == "GAME_OVER" && arity == 3) {
        kind = Kind::GameOver;
    } else if (name == "OPPONENT_MOVE" && arity == 1) {
        kind = Kind::OpponentMove;
    }

    if (kind != Kind::Other) {
        message.kind = kind;
        message.fields.assign(parts.begin() + 1, parts.end());
    }
    return message;
}

/**
 * Split a received chunk into message lines.
 *
 * The server writes one message per send and does not always terminate it,
 * so a trailing piece without '\n' is a message too. Empty lines are dropped.
 */
[[nodiscard]] inline std::vector<std::string> split_messages(std::string_view chunk) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < chunk.size()) {
        auto nl = chunk.find('\n', start);
        auto end = nl == std::string_view::npos ? chunk.size() : nl;
        auto line = chunk.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty()) {
            lines.emplace_back(line);
        }
        start = end + 1;
    }
    return lines;
}

}  // namespace kibitz

#endif  // KIBITZ_ONLINE_PROTOCOL_HPP
