#include "online_client.hpp"

#include <array>
#include <format>
#include <iterator>
#include <print>
#include <span>
#include <string_view>
#include <utility>

#include "../errors.hpp"

namespace kibitz {

namespace {

// Receive poll timeout; bounds how long close() waits for the loop
constexpr std::chrono::milliseconds POLL_INTERVAL{250};
constexpr std::chrono::milliseconds SEND_RETRY_DELAY{5};
constexpr std::size_t RECV_BUFFER_SIZE = 2048;

}  // namespace

OnlineClient::OnlineClient(std::string address, std::uint16_t port)
    : address_(std::move(address))
    , port_(port)
{}

OnlineClient::~OnlineClient() {
    close();
}

void OnlineClient::connect(std::chrono::milliseconds timeout) {
    if (connected_) {
        return;
    }

    auto ip = [this]() {
        try {
            return coro::net::ip_address::from_string(address_);
        } catch (const std::exception& e) {
            throw NetworkError(std::format("invalid server address '{}': {}", address_, e.what()));
        }
    }();

    scheduler_ = coro::io_scheduler::make_shared();
    client_ = std::make_unique<coro::net::tcp::client>(
        scheduler_,
        coro::net::tcp::client::options{.address = ip, .port = port_});

    auto status = coro::sync_wait(connect_task(timeout));
    if (status != coro::net::connect_status::connected) {
        client_.reset();
        scheduler_->shutdown();
        scheduler_.reset();
        throw NetworkError(std::format("cannot connect to {}:{} (status {})",
                                       address_, port_, static_cast<int>(status)));
    }

    connected_ = true;
    stop_requested_ = false;
    {
        std::lock_guard lock(mutex_);
        loop_running_ = true;
    }
    if (!scheduler_->spawn(receive_loop())) {
        std::lock_guard lock(mutex_);
        loop_running_ = false;
        connected_ = false;
        throw NetworkError("cannot start the receive loop");
    }
    std::println(stderr, "Connected to {}:{}", address_, port_);
}

coro::task<coro::net::connect_status> OnlineClient::connect_task(std::chrono::milliseconds timeout) {
    co_await scheduler_->schedule();
    co_return co_await client_->connect(timeout);
}

void OnlineClient::send(const Message& message) {
    if (!connected_) {
        throw NetworkError("not connected to the server");
    }
    std::string data = encode(message) + "\n";
    if (!coro::sync_wait(send_task(std::move(data)))) {
        connected_ = false;
        throw NetworkError(std::format("sending {} failed", kind_name(message.kind)));
    }
}

coro::task<bool> OnlineClient::send_task(std::string data) {
    co_await scheduler_->schedule();

    std::span<const char> remaining(data.data(), data.size());
    while (!remaining.empty()) {
        auto [status, rest] = client_->send(remaining);
        if (status == coro::net::send_status::ok) {
            remaining = rest;
        } else if (status == coro::net::send_status::try_again ||
                   status == coro::net::send_status::would_block) {
            // The receive loop owns the socket's poll registration, so back off instead
            co_await scheduler_->yield_for(SEND_RETRY_DELAY);
        } else {
            std::println(stderr, "Send failed (status {})", static_cast<int>(status));
            co_return false;
        }
    }
    co_return true;
}

coro::task<void> OnlineClient::receive_loop() {
    std::array<char, RECV_BUFFER_SIZE> buffer{};

    while (!stop_requested_) {
        auto poll_status = co_await client_->poll(coro::poll_op::read, POLL_INTERVAL);
        if (poll_status == coro::poll_status::timeout) {
            continue;
        }
        if (poll_status != coro::poll_status::event) {
            std::println(stderr, "Connection lost (poll status {})", static_cast<int>(poll_status));
            break;
        }

        auto [status, data] = client_->recv(buffer);
        if (status == coro::net::recv_status::try_again ||
            status == coro::net::recv_status::would_block) {
            continue;
        }
        if (status != coro::net::recv_status::ok) {
            std::println(stderr, "Connection closed by server (recv status {})",
                         static_cast<int>(status));
            break;
        }

        for (const auto& line : split_messages(std::string_view(data.data(), data.size()))) {
            push(decode(line));
        }
    }

    connected_ = false;
    std::lock_guard lock(mutex_);
    loop_running_ = false;
    cv_.notify_all();
    co_return;
}

void OnlineClient::push(Message message) {
    if (message.kind == Message::Kind::Other) {
        std::println(stderr, "Server: {}", message.raw);
    }
    std::lock_guard lock(mutex_);
    inbox_.push_back(std::move(message));
    cv_.notify_all();
}

std::vector<Message> OnlineClient::poll() {
    std::lock_guard lock(mutex_);
    std::vector<Message> out(std::make_move_iterator(inbox_.begin()),
                             std::make_move_iterator(inbox_.end()));
    inbox_.clear();
    return out;
}

std::optional<Message> OnlineClient::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return !inbox_.empty() || !loop_running_; })) {
        return std::nullopt;
    }
    if (inbox_.empty()) {
        return std::nullopt;
    }
    Message message = std::move(inbox_.front());
    inbox_.pop_front();
    return message;
}

void OnlineClient::close() {
    if (!scheduler_) {
        return;
    }
    stop_requested_ = true;
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !loop_running_; });
    }
    connected_ = false;
    client_.reset();
    scheduler_->shutdown();
    scheduler_.reset();
    std::println(stderr, "Disconnected from {}:{}", address_, port_);
}

}  // namespace kibitz
