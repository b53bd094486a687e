/**
 * OnlineClient - TCP link to the online play server.
 *
 * Threading model:
 * - A libcoro io_scheduler owns the socket and runs one receive coroutine
 * - The receive coroutine decodes incoming lines into a mutex-protected inbox
 * - The UI thread sends synchronously and drains the inbox with poll()
 * - Nothing here touches a board; applying moves is the caller's job
 */

#ifndef KIBITZ_ONLINE_ONLINE_CLIENT_HPP
#define KIBITZ_ONLINE_ONLINE_CLIENT_HPP

#include <coro/coro.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "protocol.hpp"

namespace kibitz {

class OnlineClient {
public:
    /**
     * @param address Server IPv4 address in dotted form.
     */
    OnlineClient(std::string address, std::uint16_t port);
    ~OnlineClient();

    OnlineClient(const OnlineClient&) = delete;
    OnlineClient& operator=(const OnlineClient&) = delete;

    /**
     * Open the connection and start the receive loop.
     *
     * @throws NetworkError if the address is invalid or the connect fails.
     */
    void connect(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    /**
     * Send one message followed by '\n'.
     *
     * @throws NetworkError if not connected or the socket fails.
     */
    void send(const Message& message);

    /**
     * All messages received so far, oldest first. Never blocks.
     */
    [[nodiscard]] std::vector<Message> poll();

    /**
     * Wait up to timeout for the next message.
     */
    [[nodiscard]] std::optional<Message> wait_for(std::chrono::milliseconds timeout);

    /**
     * Stop the receive loop and close the socket. Safe to call more than once.
     */
    void close();

    [[nodiscard]] bool connected() const noexcept { return connected_.load(); }

private:
    coro::task<coro::net::connect_status> connect_task(std::chrono::milliseconds timeout);
    coro::task<bool> send_task(std::string data);
    coro::task<void> receive_loop();

    void push(Message message);

    std::string address_;
    std::uint16_t port_;

    std::shared_ptr<coro::io_scheduler> scheduler_;
    std::unique_ptr<coro::net::tcp::client> client_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> stop_requested_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Message> inbox_;
    bool loop_running_ = false;
};

}  // namespace kibitz

#endif  // KIBITZ_ONLINE_ONLINE_CLIENT_HPP
