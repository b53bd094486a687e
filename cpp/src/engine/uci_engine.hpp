/**
 * UciEngine - Engine implementation talking UCI to a subprocess.
 *
 * Threading model:
 * - A reader thread pulls lines from the child's stdout into a queue
 * - The calling thread writes commands and waits on the queue with deadlines
 * - quit() sends "quit", reaps the child and joins the reader
 */

#ifndef KIBITZ_ENGINE_UCI_ENGINE_HPP
#define KIBITZ_ENGINE_UCI_ENGINE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "engine.hpp"
#include "engine_process.hpp"
#include "uci_protocol.hpp"

namespace kibitz {

struct UciEngineOptions {
    /**
     * Time allowed for "uciok" and "readyok" answers.
     */
    std::chrono::milliseconds handshake_timeout{10000};

    /**
     * Slack on top of "movetime" before the client sends "stop", and again
     * after "stop" before the engine is declared unresponsive.
     */
    std::chrono::milliseconds search_grace{5000};

    /**
     * Time the child gets to exit after "quit" before it is killed.
     */
    std::chrono::milliseconds quit_grace{1000};
};

class UciEngine : public Engine {
public:
    /**
     * Launch an engine and complete the UCI handshake.
     *
     * @param exe_path Path of the engine executable.
     * @throws EngineError if the process cannot be started or does not
     *         answer "uci"/"isready" in time.
     */
    static std::unique_ptr<UciEngine> popen(const std::string& exe_path,
                                            UciEngineOptions options = {});

private:
    // Restricts construction to popen() while still allowing make_unique
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    UciEngine(Passkey, UciEngineOptions options);
    ~UciEngine() override;

    PlayResult play(const Game& game, const SearchLimits& limits) override;

    std::vector<AnalysisInfo> analyse(const Game& game,
                                      const SearchLimits& limits,
                                      int multipv) override;

    void quit() override;

    [[nodiscard]] std::string name() const override { return id_.name; }

    [[nodiscard]] const EngineId& id() const noexcept { return id_; }

    /**
     * Names of the options the engine advertised during the handshake.
     */
    [[nodiscard]] const std::vector<std::string>& option_names() const noexcept {
        return option_names_;
    }

    /**
     * Send "setoption name <name> value <value>" and wait for "readyok".
     */
    void set_option(std::string_view name, std::string_view value);

private:
    using Clock = std::chrono::steady_clock;

    void start(const std::string& exe_path);
    void handshake();
    void sync_ready();

    /**
     * After an unanswered "stop": wait for "readyok" and drop the engine's
     * leftover output, or shut the engine down if it stays silent.
     */
    void recover_after_stop();

    void send(const std::string& line);
    void send_position(const Game& game);

    /**
     * Pop the next engine line, waiting until deadline (forever if none).
     *
     * @return nullopt on timeout.
     * @throws EngineError if the engine has exited.
     */
    std::optional<std::string> next_line(std::optional<Clock::time_point> deadline);

    /**
     * Issue "go", feed every line to on_line, and return the bestmove line.
     */
    BestMoveLine run_search(const Game& game,
                            const SearchLimits& limits,
                            const std::function<void(const std::string&)>& on_line);

    void reader_loop();

    UciEngineOptions options_;
    std::string exe_path_;
    EngineId id_;
    std::vector<std::string> option_names_;
    int multipv_ = 1;
    bool running_ = false;

    EngineProcess process_;

    std::mutex mutex_;
    std::condition_variable lines_cv_;
    std::deque<std::string> lines_;
    bool eof_ = false;

    std::thread reader_;
};

}  // namespace kibitz

#endif  // KIBITZ_ENGINE_UCI_ENGINE_HPP
