/**
 * EngineProcess - A child process with piped stdin and stdout.
 *
 * The child's stdout and stderr share one pipe. Lines are read with
 * read_line(); writes go straight to the child's stdin.
 */

#ifndef KIBITZ_ENGINE_ENGINE_PROCESS_HPP
#define KIBITZ_ENGINE_ENGINE_PROCESS_HPP

#include <sys/types.h>

#include <optional>
#include <string>

namespace kibitz {

class EngineProcess {
public:
    EngineProcess() = default;
    ~EngineProcess();

    EngineProcess(const EngineProcess&) = delete;
    EngineProcess& operator=(const EngineProcess&) = delete;
    EngineProcess(EngineProcess&&) = delete;
    EngineProcess& operator=(EngineProcess&&) = delete;

    /**
     * Spawn the executable.
     *
     * A path that cannot be executed is only detected once the child has
     * exited, i.e. as end-of-file on the first read.
     *
     * @throws EngineError if pipes or the fork cannot be created.
     */
    void start(const std::string& exe_path);

    /**
     * Write raw bytes to the child's stdin.
     *
     * @return false if the child has gone away.
     */
    bool write(const std::string& data);

    /**
     * Close the child's stdin so it sees end-of-file.
     */
    void close_stdin();

    /**
     * Block until a full line arrives. The trailing CR/LF is removed.
     *
     * @return nullopt on end-of-file or read error.
     */
    std::optional<std::string> read_line();

    /**
     * Wait for the child to exit, killing it after grace_ms.
     *
     * Once the child is gone a reader blocked in read_line() sees
     * end-of-file, so the pipes can then be closed safely.
     */
    void reap(int grace_ms = 500);

    /**
     * Close both pipes and reap the child.
     */
    void stop(int grace_ms = 500);

    [[nodiscard]] bool running() const noexcept { return pid_ > 0; }

private:
    pid_t pid_ = -1;
    int stdin_write_ = -1;   // parent -> child stdin
    int stdout_read_ = -1;   // child stdout/stderr -> parent
    std::string read_buf_;
};

}  // namespace kibitz

#endif  // KIBITZ_ENGINE_ENGINE_PROCESS_HPP
