#include "puzzle_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <format>
#include <print>
#include <utility>

#include "../errors.hpp"

namespace kibitz {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr int HTTP_VERSION = 11;
constexpr const char* USER_AGENT = "kibitz/1.0 " BOOST_BEAST_VERSION_STRING;

http::request<http::empty_body> make_request(const Url& url) {
    http::request<http::empty_body> req{http::verb::get, url.target, HTTP_VERSION};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::accept, "application/json");
    return req;
}

std::string check_response(const http::response<http::string_body>& res, const Url& url) {
    if (res.result() != http::status::ok) {
        throw PuzzleError(std::format("GET {}{} returned HTTP {}",
                                      url.host, url.target, res.result_int()));
    }
    return res.body();
}

using Clock = std::chrono::steady_clock;

/**
 * Start one asynchronous operation and run the context until it finishes.
 *
 * Beast's stream expiry only bounds asynchronous operations, so every
 * step of a fetch goes through here. The handler receives the error code
 * first; any further completion arguments are ignored.
 *
 * @throws beast::system_error on failure or when the deadline passes.
 */
template <typename Initiate>
void complete(net::io_context& ioc, Clock::time_point deadline, Initiate&& initiate) {
    beast::error_code result;
    bool done = false;
    initiate([&result, &done](beast::error_code ec, auto&&...) {
        result = ec;
        done = true;
    });

    ioc.restart();
    ioc.run_until(deadline);
    if (!done) {
        throw beast::system_error{make_error_code(beast::error::timeout)};
    }
    if (result) {
        throw beast::system_error{result};
    }
}

tcp::resolver::results_type resolve(net::io_context& ioc, tcp::resolver& resolver,
                                    const Url& url, Clock::time_point deadline) {
    tcp::resolver::results_type endpoints;
    complete(ioc, deadline, [&](auto handler) {
        resolver.async_resolve(url.host, url.port,
                               [&endpoints, handler](beast::error_code ec,
                                                     tcp::resolver::results_type results) mutable {
                                   endpoints = std::move(results);
                                   handler(ec);
                               });
    });
    return endpoints;
}

std::string fetch_plain(const Url& url, std::chrono::seconds timeout) {
    auto deadline = Clock::now() + timeout;
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    auto endpoints = resolve(ioc, resolver, url, deadline);

    stream.expires_at(deadline);
    complete(ioc, deadline, [&](auto handler) { stream.async_connect(endpoints, handler); });

    auto req = make_request(url);
    complete(ioc, deadline, [&](auto handler) { http::async_write(stream, req, handler); });

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    complete(ioc, deadline, [&](auto handler) { http::async_read(stream, buffer, res, handler); });

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        std::println(stderr, "HTTP shutdown: {}", ec.message());
    }
    return check_response(res, url);
}

std::string fetch_tls(const Url& url, std::chrono::seconds timeout) {
    auto deadline = Clock::now() + timeout;
    net::io_context ioc;
    ssl::context ctx(ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI, required by most HTTPS hosts
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw beast::system_error{ec};
    }
    stream.set_verify_callback(ssl::host_name_verification(url.host));

    auto endpoints = resolve(ioc, resolver, url, deadline);

    beast::get_lowest_layer(stream).expires_at(deadline);
    complete(ioc, deadline, [&](auto handler) {
        beast::get_lowest_layer(stream).async_connect(endpoints, handler);
    });
    complete(ioc, deadline, [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, handler);
    });

    auto req = make_request(url);
    complete(ioc, deadline, [&](auto handler) { http::async_write(stream, req, handler); });

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    complete(ioc, deadline, [&](auto handler) { http::async_read(stream, buffer, res, handler); });

    // Servers commonly drop the connection without close_notify
    try {
        complete(ioc, deadline, [&](auto handler) { stream.async_shutdown(handler); });
    } catch (const beast::system_error& e) {
        if (e.code() != net::error::eof && e.code() != ssl::error::stream_truncated) {
            std::println(stderr, "TLS shutdown: {}", e.code().message());
        }
    }
    return check_response(res, url);
}

}  // namespace

Url parse_url(std::string_view url) {
    Url out;
    constexpr std::string_view HTTPS = "https://";
    constexpr std::string_view HTTP = "http://";

    if (url.starts_with(HTTPS)) {
        out.tls = true;
        url.remove_prefix(HTTPS.size());
    } else if (url.starts_with(HTTP)) {
        out.tls = false;
        url.remove_prefix(HTTP.size());
    } else {
        throw PuzzleError(std::format("unsupported URL '{}'", url));
    }

    auto slash = url.find('/');
    std::string_view authority = url.substr(0, slash);
    if (slash != std::string_view::npos) {
        out.target = std::string(url.substr(slash));
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        out.host = std::string(authority.substr(0, colon));
        out.port = std::string(authority.substr(colon + 1));
    } else {
        out.host = std::string(authority);
        out.port = out.tls ? "443" : "80";
    }

    if (out.host.empty() || out.port.empty()) {
        throw PuzzleError(std::format("URL has no host: '{}'", url));
    }
    return out;
}

std::string fetch_puzzle_json(const std::string& url, std::chrono::seconds timeout) {
    Url parsed = parse_url(url);
    try {
        return parsed.tls ? fetch_tls(parsed, timeout) : fetch_plain(parsed, timeout);
    } catch (const beast::system_error& e) {
        throw PuzzleError(std::format("fetching {} failed: {}", url, e.code().message()));
    }
}

}  // namespace kibitz
