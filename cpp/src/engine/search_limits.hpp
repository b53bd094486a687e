/**
 * SearchLimits - Limits attached to a UCI "go" command.
 *
 * The front-ends only ever bound a search by depth, by wall-clock time,
 * or by node count. An empty SearchLimits means "go infinite".
 */

#ifndef KIBITZ_ENGINE_SEARCH_LIMITS_HPP
#define KIBITZ_ENGINE_SEARCH_LIMITS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace kibitz {

struct SearchLimits {
    // Hard limits
    std::optional<int> depth;
    std::optional<std::int64_t> nodes;

    // Fixed time per search (milliseconds)
    std::optional<std::int64_t> movetime;

    /**
     * Check if any limit is set.
     */
    [[nodiscard]] constexpr bool is_bounded() const noexcept {
        return depth.has_value() || nodes.has_value() || movetime.has_value();
    }

    /**
     * Render the "go" command the engine should receive.
     */
    [[nodiscard]] std::string to_go_command() const {
        if (!is_bounded()) {
            return "go infinite";
        }
        std::string cmd = "go";
        if (depth.has_value()) {
            cmd += " depth " + std::to_string(*depth);
        }
        if (nodes.has_value()) {
            cmd += " nodes " + std::to_string(*nodes);
        }
        if (movetime.has_value()) {
            cmd += " movetime " + std::to_string(*movetime);
        }
        return cmd;
    }

    /**
     * Create limits for fixed depth search.
     */
    [[nodiscard]] static constexpr SearchLimits make_depth(int d) noexcept {
        SearchLimits limits;
        limits.depth = d;
        return limits;
    }

    /**
     * Create limits for fixed time search.
     */
    [[nodiscard]] static constexpr SearchLimits make_movetime(std::int64_t ms) noexcept {
        SearchLimits limits;
        limits.movetime = ms;
        return limits;
    }

    /**
     * Create limits from a time budget in seconds (e.g. 0.3 -> movetime 300).
     */
    [[nodiscard]] static SearchLimits make_seconds(double seconds) {
        auto ms = std::chrono::round<std::chrono::milliseconds>(
            std::chrono::duration<double>(seconds));
        return make_movetime(ms.count() > 0 ? ms.count() : 1);
    }
};

}  // namespace kibitz

#endif  // KIBITZ_ENGINE_SEARCH_LIMITS_HPP
