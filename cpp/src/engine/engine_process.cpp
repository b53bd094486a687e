#include "engine_process.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include "../errors.hpp"

namespace kibitz {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

EngineProcess::~EngineProcess() {
    stop(0);
}

void EngineProcess::start(const std::string& exe_path) {
    stop(0);

    // A dead engine must surface as a failed write, not kill the front-end
    std::signal(SIGPIPE, SIG_IGN);

    int in_pipe[2] = {-1, -1};   // child reads [0], parent writes [1]
    int out_pipe[2] = {-1, -1};  // parent reads [0], child writes [1]

    if (::pipe(in_pipe) != 0) {
        throw EngineError(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (::pipe(out_pipe) != 0) {
        int err = errno;
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        throw EngineError(std::string("pipe failed: ") + std::strerror(err));
    }

    // Parent ends must not leak into later children
    ::fcntl(in_pipe[1], F_SETFD, FD_CLOEXEC);
    ::fcntl(out_pipe[0], F_SETFD, FD_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw EngineError(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);

        ::close(in_pipe[0]);
        ::close(out_pipe[1]);

        char* const argv[] = {const_cast<char*>(exe_path.c_str()), nullptr};
        ::execv(exe_path.c_str(), argv);
        _exit(127);
    }

    // Parent
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);

    pid_ = pid;
    stdin_write_ = in_pipe[1];
    stdout_read_ = out_pipe[0];
    read_buf_.clear();
}

bool EngineProcess::write(const std::string& data) {
    if (stdin_write_ < 0) {
        return false;
    }

    const char* p = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t n = ::write(stdin_write_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        p += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return true;
}

void EngineProcess::close_stdin() {
    close_fd(stdin_write_);
}

std::optional<std::string> EngineProcess::read_line() {
    if (stdout_read_ < 0) {
        return std::nullopt;
    }

    for (;;) {
        auto pos = read_buf_.find('\n');
        if (pos != std::string::npos) {
            std::string line = read_buf_.substr(0, pos);
            read_buf_.erase(0, pos + 1);
            while (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }

        char tmp[4096];
        ssize_t n = ::read(stdout_read_, tmp, sizeof(tmp));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::nullopt;
        }
        if (n == 0) {
            if (!read_buf_.empty()) {
                std::string line = std::move(read_buf_);
                read_buf_.clear();
                return line;
            }
            return std::nullopt;
        }

        read_buf_.append(tmp, tmp + n);
    }
}

void EngineProcess::reap(int grace_ms) {
    if (pid_ <= 0) {
        return;
    }

    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    for (;;) {
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_ || (r < 0 && errno != EINTR)) {
            pid_ = -1;
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ::kill(pid_, SIGKILL);
    ::waitpid(pid_, &status, 0);
    pid_ = -1;
}

void EngineProcess::stop(int grace_ms) {
    close_fd(stdin_write_);
    reap(grace_ms);
    close_fd(stdout_read_);
    read_buf_.clear();
}

}  // namespace kibitz
