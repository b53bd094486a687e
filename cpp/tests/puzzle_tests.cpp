/**
 * Puzzle decoding, movetext replay, solution checking, URL splitting, and
 * fetching from local HTTP servers on the loopback interface.
 */

#include <doctest/doctest.h>
#include <chess.hpp>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../src/errors.hpp"
#include "../src/puzzle/puzzle.hpp"
#include "../src/puzzle/puzzle_client.hpp"

using namespace kibitz;

namespace {

// Scholar's mate: White to play Qxf7#
constexpr std::string_view MATE_IN_ONE_JSON = R"({
    "game": {"id": "g4m3", "pgn": "e4 e5 Bc4 Nc6 Qh5 Nf6", "clock": "3+0"},
    "puzzle": {"id": "K00xy", "rating": 1234, "plays": 10,
               "solution": ["h5f7"], "themes": ["mateIn1", "short"]}
})";

Puzzle make_puzzle(std::string pgn, std::vector<std::string> solution) {
    Puzzle puzzle;
    puzzle.id = "test";
    puzzle.rating = 1500;
    puzzle.pgn = std::move(pgn);
    puzzle.solution = std::move(solution);
    return puzzle;
}

chess::Move uci(const chess::Board& board, const std::string& text) {
    return chess::uci::uciToMove(board, text);
}

/**
 * Listening socket on 127.0.0.1 with a kernel-chosen port. Connections
 * complete in the backlog even when nobody calls accept().
 */
class LocalServer {
public:
    LocalServer() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd_ >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        REQUIRE(::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(fd_, 4) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port_ = ntohs(addr.sin_port);
    }

    ~LocalServer() { ::close(fd_); }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

    [[nodiscard]] std::string url(std::string_view target) const {
        return std::format("http://127.0.0.1:{}{}", port_, target);
    }

    /**
     * Accept one connection, read the request head, send response, close.
     * Returns the request line.
     */
    std::string answer_once(const std::string& response) const {
        int conn = ::accept(fd_, nullptr, nullptr);
        if (conn < 0) {
            return {};
        }
        std::string request;
        char c = 0;
        while (!request.ends_with("\r\n\r\n") && ::recv(conn, &c, 1, 0) == 1) {
            request += c;
        }
        std::size_t sent = 0;
        while (sent < response.size()) {
            ssize_t n = ::send(conn, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                break;
            }
            sent += static_cast<std::size_t>(n);
        }
        ::close(conn);
        return request.substr(0, request.find("\r\n"));
    }

private:
    int fd_ = -1;
    std::uint16_t port_ = 0;
};

}  // namespace

// ============================================================================
// JSON decoding
// ============================================================================

TEST_SUITE("Puzzle JSON") {

    TEST_CASE("Fields are extracted") {
        Puzzle puzzle = parse_puzzle(MATE_IN_ONE_JSON);
        CHECK(puzzle.id == "K00xy");
        CHECK(puzzle.rating == 1234);
        CHECK(puzzle.pgn == "e4 e5 Bc4 Nc6 Qh5 Nf6");
        CHECK(puzzle.solution == std::vector<std::string>{"h5f7"});
    }

    TEST_CASE("Invalid JSON") {
        CHECK_THROWS_AS((void)parse_puzzle("{not json"), PuzzleError);
        CHECK_THROWS_AS((void)parse_puzzle(""), PuzzleError);
    }

    TEST_CASE("Missing fields") {
        CHECK_THROWS_AS((void)parse_puzzle(R"({"puzzle": {"id": "a", "rating": 1, "solution": ["e2e4"]}})"),
                        PuzzleError);
        CHECK_THROWS_AS((void)parse_puzzle(R"({"game": {"pgn": "e4"}, "puzzle": {"id": "a", "rating": 1}})"),
                        PuzzleError);
        CHECK_THROWS_AS((void)parse_puzzle(R"({"game": {"pgn": "e4"}, "puzzle": {"id": "a", "solution": ["e7e5"]}})"),
                        PuzzleError);
        CHECK_THROWS_AS((void)parse_puzzle(R"([1, 2, 3])"), PuzzleError);
    }

    TEST_CASE("Bad solution lists") {
        CHECK_THROWS_AS((void)parse_puzzle(R"({"game": {"pgn": "e4"}, "puzzle": {"id": "a", "rating": 1, "solution": []}})"),
                        PuzzleError);
        CHECK_THROWS_AS((void)parse_puzzle(R"({"game": {"pgn": "e4"}, "puzzle": {"id": "a", "rating": 1, "solution": ["Nf3"]}})"),
                        PuzzleError);
        CHECK_THROWS_AS((void)parse_puzzle(R"({"game": {"pgn": "e4"}, "puzzle": {"id": "a", "rating": 1, "solution": "e7e5"}})"),
                        PuzzleError);
    }

    TEST_CASE("Wrong field types") {
        CHECK_THROWS_AS((void)parse_puzzle(R"({"game": {"pgn": 42}, "puzzle": {"id": "a", "rating": 1, "solution": ["e7e5"]}})"),
                        PuzzleError);
        CHECK_THROWS_AS((void)parse_puzzle(R"({"game": {"pgn": "e4"}, "puzzle": {"id": "a", "rating": "high", "solution": ["e7e5"]}})"),
                        PuzzleError);
    }
}

// ============================================================================
// Movetext replay
// ============================================================================

TEST_SUITE("Movetext replay") {

    TEST_CASE("Bare SAN") {
        chess::Board board = replay_movetext("e4 e5 Nf3");
        CHECK(board.getFen() == "rnbqkbnr/pppp1ppp/8/4p3/4P3/5N2/PPPP1PPP/RNBQKB1R b KQkq - 1 2");
    }

    TEST_CASE("Numbers, comments, NAGs and results are skipped") {
        chess::Board expected = replay_movetext("e4 e5 Nf3 Nc6 Bb5");
        chess::Board board = replay_movetext(
            "1. e4 e5 2.Nf3 {a quiet developing move} Nc6 $1 3. Bb5 *");
        CHECK(board.getFen() == expected.getFen());
    }

    TEST_CASE("Black move numbers") {
        chess::Board board = replay_movetext("1. e4 1... c5 2. Nf3");
        CHECK(board.sideToMove() == chess::Color::BLACK);
        CHECK(board.at(chess::Square::SQ_C5) == chess::Piece::BLACKPAWN);
    }

    TEST_CASE("Empty movetext is the starting position") {
        CHECK(replay_movetext("").getFen() == chess::Board().getFen());
    }

    TEST_CASE("Unplayable moves are puzzle errors") {
        CHECK_THROWS_AS((void)replay_movetext("e4 e4"), PuzzleError);
        CHECK_THROWS_AS((void)replay_movetext("Ke2"), PuzzleError);
    }
}

// ============================================================================
// Solving
// ============================================================================

TEST_SUITE("PuzzleSession") {

    TEST_CASE("Mate in one is solved by the single solution move") {
        PuzzleSession session(parse_puzzle(MATE_IN_ONE_JSON));
        CHECK(session.solver() == chess::Color::WHITE);
        CHECK(session.expected() == "h5f7");

        auto outcome = session.try_move(uci(session.board(), "h5f7"));
        CHECK(outcome == PuzzleOutcome::Solved);
        CHECK(session.finished());
        CHECK(session.expected().empty());
        CHECK(session.board().isGameOver().second != chess::GameResult::NONE);
    }

    TEST_CASE("Wrong move leaves the board as it was") {
        PuzzleSession session(parse_puzzle(MATE_IN_ONE_JSON));
        std::string before = session.board().getFen();

        auto outcome = session.try_move(uci(session.board(), "c4f7"));
        CHECK(outcome == PuzzleOutcome::Wrong);
        CHECK(session.board().getFen() == before);
        CHECK_FALSE(session.finished());
        CHECK(session.expected() == "h5f7");
    }

    TEST_CASE("Illegal move is wrong") {
        PuzzleSession session(parse_puzzle(MATE_IN_ONE_JSON));
        CHECK(session.try_move(chess::Move::NO_MOVE) == PuzzleOutcome::Wrong);
    }

    TEST_CASE("Correct move plays the scripted reply") {
        PuzzleSession session(make_puzzle("e4 e5", {"g1f3", "b8c6", "f1c4"}));

        auto outcome = session.try_move(uci(session.board(), "g1f3"));
        CHECK(outcome == PuzzleOutcome::Correct);
        CHECK(session.board().at(chess::Square::SQ_C6) == chess::Piece::BLACKKNIGHT);
        CHECK(session.board().sideToMove() == chess::Color::WHITE);
        CHECK(session.expected() == "f1c4");

        CHECK(session.try_move(uci(session.board(), "f1c4")) == PuzzleOutcome::Solved);
    }

    TEST_CASE("Solution ending on a scripted reply is solved after the reply") {
        PuzzleSession session(make_puzzle("e4", {"e7e5", "g1f3"}));
        CHECK(session.solver() == chess::Color::BLACK);

        CHECK(session.try_move(uci(session.board(), "e7e5")) == PuzzleOutcome::Solved);
        CHECK(session.board().at(chess::Square::SQ_F3) == chess::Piece::WHITEKNIGHT);
    }

    TEST_CASE("Moves after the end are reported as finished") {
        PuzzleSession session(parse_puzzle(MATE_IN_ONE_JSON));
        REQUIRE(session.try_move(uci(session.board(), "h5f7")) == PuzzleOutcome::Solved);
        CHECK(session.try_move(chess::Move::NO_MOVE) == PuzzleOutcome::AlreadyFinished);
    }

    TEST_CASE("Illegal scripted reply ends the session") {
        PuzzleSession session(make_puzzle("e4 e5", {"g1f3", "e2e4", "f1c4"}));
        CHECK(session.try_move(uci(session.board(), "g1f3")) == PuzzleOutcome::BadSolution);
        CHECK(session.finished());
    }

    TEST_CASE("Broken movetext is rejected up front") {
        CHECK_THROWS_AS(PuzzleSession(make_puzzle("e4 Qxf7", {"e7e5"})), PuzzleError);
    }

    TEST_CASE("Outcome names") {
        CHECK(to_string(PuzzleOutcome::Correct) == "Correct");
        CHECK(to_string(PuzzleOutcome::BadSolution) == "BadSolution");
    }
}

// ============================================================================
// URLs
// ============================================================================

TEST_SUITE("Puzzle URL") {

    TEST_CASE("HTTPS with default port") {
        Url url = parse_url("https://lichess.org/api/puzzle/next");
        CHECK(url.tls);
        CHECK(url.host == "lichess.org");
        CHECK(url.port == "443");
        CHECK(url.target == "/api/puzzle/next");
    }

    TEST_CASE("HTTP with explicit port and query") {
        Url url = parse_url("http://localhost:8080/puzzle?difficulty=hard");
        CHECK_FALSE(url.tls);
        CHECK(url.host == "localhost");
        CHECK(url.port == "8080");
        CHECK(url.target == "/puzzle?difficulty=hard");
    }

    TEST_CASE("Host only") {
        Url url = parse_url("http://example.com");
        CHECK(url.port == "80");
        CHECK(url.target == "/");
    }

    TEST_CASE("Unsupported or empty URLs") {
        CHECK_THROWS_AS((void)parse_url("ftp://example.com/x"), PuzzleError);
        CHECK_THROWS_AS((void)parse_url("lichess.org/api"), PuzzleError);
        CHECK_THROWS_AS((void)parse_url("https:///path"), PuzzleError);
        CHECK_THROWS_AS((void)parse_url("http://host:/x"), PuzzleError);
    }
}

// ============================================================================
// Fetching
// ============================================================================

TEST_SUITE("Puzzle fetch") {

    TEST_CASE("Body of a 200 response is returned") {
        LocalServer server;
        std::string request_line;
        std::thread thread([&]() {
            request_line = server.answer_once(
                "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
                "Content-Length: 14\r\nConnection: close\r\n\r\n{\"puzzle\": {}}");
        });

        std::string body = fetch_puzzle_json(server.url("/api/puzzle/next"), std::chrono::seconds(5));
        thread.join();

        CHECK(body == "{\"puzzle\": {}}");
        CHECK(request_line == "GET /api/puzzle/next HTTP/1.1");
    }

    TEST_CASE("Other statuses are puzzle errors") {
        LocalServer server;
        std::thread thread([&]() {
            (void)server.answer_once(
                "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
        });

        CHECK_THROWS_AS((void)fetch_puzzle_json(server.url("/missing"), std::chrono::seconds(5)),
                        PuzzleError);
        thread.join();
    }

    TEST_CASE("Server that never answers times out") {
        LocalServer server;

        auto started = std::chrono::steady_clock::now();
        CHECK_THROWS_AS((void)fetch_puzzle_json(server.url("/"), std::chrono::seconds(1)),
                        PuzzleError);
        auto elapsed = std::chrono::steady_clock::now() - started;
        CHECK(elapsed < std::chrono::seconds(4));
    }

    TEST_CASE("Refused connection is a puzzle error") {
        std::string url;
        {
            LocalServer server;
            url = server.url("/");
        }
        CHECK_THROWS_AS((void)fetch_puzzle_json(url, std::chrono::seconds(2)), PuzzleError);
    }
}
