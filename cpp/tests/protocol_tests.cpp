/**
 * Online play wire format: encoding, decoding and chunk splitting.
 */

#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "../src/online/protocol.hpp"

using namespace kibitz;

// ============================================================================
// Encoding
// ============================================================================

TEST_SUITE("Online protocol encoding") {

    TEST_CASE("Client messages") {
        CHECK(encode(Message::login("Buldozer", "123")) == "LOGIN|Buldozer|123");
        CHECK(encode(Message::start_match()) == "START_MATCH");
        CHECK(encode(Message::move("Opponent1", "e2e4")) == "MOVE|Opponent1|e2e4");
        CHECK(encode(Message::game_over("Buldozer", "Opponent1", "1-0")) ==
              "GAME_OVER|Buldozer|Opponent1|1-0");
    }

    TEST_CASE("Other messages go out as their raw text") {
        Message message;
        message.raw = "PING";
        CHECK(encode(message) == "PING");
    }
}

// ============================================================================
// Decoding
// ============================================================================

TEST_SUITE("Online protocol decoding") {

    TEST_CASE("Opponent move") {
        Message message = decode("OPPONENT_MOVE|e7e5");
        CHECK(message.kind == Message::Kind::OpponentMove);
        REQUIRE(message.fields.size() == 1);
        CHECK(message.fields[0] == "e7e5");
    }

    TEST_CASE("Line terminators are stripped") {
        Message message = decode("OPPONENT_MOVE|g8f6\r\n");
        CHECK(message.kind == Message::Kind::OpponentMove);
        CHECK(message.fields[0] == "g8f6");
        CHECK(message.raw == "OPPONENT_MOVE|g8f6");
    }

    TEST_CASE("Known client messages decode back") {
        CHECK(decode("LOGIN|a|b").kind == Message::Kind::Login);
        CHECK(decode("START_MATCH").kind == Message::Kind::StartMatch);
        CHECK(decode("MOVE|bob|e2e4").kind == Message::Kind::Move);
        CHECK(decode("GAME_OVER|a|b|1/2-1/2").fields[2] == "1/2-1/2");
    }

    TEST_CASE("Wrong arity is not a known message") {
        CHECK(decode("OPPONENT_MOVE").kind == Message::Kind::Other);
        CHECK(decode("OPPONENT_MOVE|e2e4|extra").kind == Message::Kind::Other);
        CHECK(decode("START_MATCH|now").kind == Message::Kind::Other);
    }

    TEST_CASE("Unknown text is kept raw") {
        Message message = decode("Login successful");
        CHECK(message.kind == Message::Kind::Other);
        CHECK(message.fields.empty());
        CHECK(message.raw == "Login successful");

        CHECK(decode("").kind == Message::Kind::Other);
    }

    TEST_CASE("Kind names") {
        CHECK(kind_name(Message::Kind::OpponentMove) == "OPPONENT_MOVE");
        CHECK(kind_name(Message::Kind::Other).empty());
    }
}

// ============================================================================
// Chunk splitting
// ============================================================================

TEST_SUITE("Online protocol framing") {

    TEST_CASE("One message per line") {
        auto lines = split_messages("OK\nOPPONENT_MOVE|e7e5\n");
        CHECK(lines == std::vector<std::string>{"OK", "OPPONENT_MOVE|e7e5"});
    }

    TEST_CASE("Unterminated message is delivered") {
        auto lines = split_messages("OPPONENT_MOVE|d7d5");
        CHECK(lines == std::vector<std::string>{"OPPONENT_MOVE|d7d5"});
    }

    TEST_CASE("CRLF and blank lines") {
        auto lines = split_messages("\r\nA\r\n\nB");
        CHECK(lines == std::vector<std::string>{"A", "B"});
    }

    TEST_CASE("Empty chunk") {
        CHECK(split_messages("").empty());
        CHECK(split_messages("\n\n").empty());
    }
}
