/**
 * Engine - Abstract interface to a move-selecting, position-analysing engine.
 *
 * The front-ends own an Engine and delegate every "what should be played"
 * and "how good is this" question to it. UciEngine is the production
 * implementation; tests substitute scripted engines.
 *
 * Threading model:
 * - All calls are made from the UI thread and block until the engine answers
 * - Implementations may use helper threads internally
 */

#ifndef KIBITZ_ENGINE_ENGINE_HPP
#define KIBITZ_ENGINE_ENGINE_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../game.hpp"
#include "search_limits.hpp"
#include "search_result.hpp"

namespace kibitz {

/**
 * Abstract base class for engines.
 */
class Engine {
public:
    virtual ~Engine() = default;

    // Non-copyable, non-movable (engines own processes and threads)
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    /**
     * Choose a move for the side to move.
     *
     * @param game Position to search, with the history that led to it.
     * @param limits Depth, time, or node limit.
     * @return The engine's move, legal in game.board().
     * @throws EngineError on protocol failure or if no move is returned.
     */
    virtual PlayResult play(const Game& game, const SearchLimits& limits) = 0;

    /**
     * Analyse the position and return up to multipv principal variations,
     * best first. Scores are relative to the side to move.
     *
     * @throws EngineError on protocol failure.
     */
    virtual std::vector<AnalysisInfo> analyse(const Game& game,
                                              const SearchLimits& limits,
                                              int multipv) = 0;

    /**
     * Shut the engine down. Safe to call more than once.
     */
    virtual void quit() = 0;

    /**
     * Engine name as reported by the engine.
     */
    [[nodiscard]] virtual std::string name() const = 0;

protected:
    // Protected constructor - only derived classes can instantiate
    Engine() = default;
};

/**
 * Factory function type for launching engines. May throw EngineError.
 */
using EngineFactory = std::function<std::unique_ptr<Engine>()>;

}  // namespace kibitz

#endif  // KIBITZ_ENGINE_ENGINE_HPP
