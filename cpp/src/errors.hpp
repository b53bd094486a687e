/**
 * Exception types raised by the kibitz core.
 *
 * Library code throws; the front-end sessions catch and turn the message
 * into a status line for the user.
 */

#ifndef KIBITZ_ERRORS_HPP
#define KIBITZ_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace kibitz {

/** Text could not be read as a legal UCI or SAN move. */
class MoveParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** The UCI engine failed to start, misbehaved, or exited. */
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** A Syzygy probe could not be answered. */
class TablebaseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** Puzzle download, decoding, or replay failed. */
class PuzzleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** TCP connect, send, or receive failure in online mode. */
class NetworkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace kibitz

#endif  // KIBITZ_ERRORS_HPP
