// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Stellar a resilient client for the Stellar API.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "client/BeastTransport.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"

using stellar::BeastTransport;
using stellar::ErrorCode;
using stellar::HttpRequest;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using namespace std::chrono_literals;

namespace {

// Answers exactly one HTTP request on 127.0.0.1 from a background thread.
class LoopbackServer {
public:
    using Handler = std::function<void(const http::request<http::string_body>&, http::response<http::string_body>&)>;

    explicit LoopbackServer(Handler h)
        : acceptor {ioc, tcp::endpoint {net::ip::make_address("127.0.0.1"), 0}},
          handler {std::move(h)},
          worker {[this] { serveOne(); }} {}

    ~LoopbackServer() {
        join();
    }

    void join() {
        if (worker.joinable()) {
            worker.join();
        }
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) + target;
    }

    // Valid after join().
    http::request<http::string_body> received;
private:
    void serveOne() {
        beast::error_code ec;
        tcp::socket socket {ioc};
        acceptor.accept(socket, ec);
        if (ec) {
            return;
        }
        beast::flat_buffer buffer;
        http::read(socket, buffer, received, ec);
        if (ec) {
            return;
        }
        http::response<http::string_body> res {http::status::ok, received.version()};
        handler(received, res);
        res.prepare_payload();
        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
    }

    net::io_context ioc;
    tcp::acceptor acceptor;
    Handler handler;
    std::thread worker;
};

} // namespace

TEST(ParseUrlTest, DefaultsPortAndTarget) {
    auto u = stellar::parseUrl("http://example.com");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->scheme, "http");
    EXPECT_EQ(u->host, "example.com");
    EXPECT_EQ(u->port, "80");
    EXPECT_EQ(u->target, "/");
}

TEST(ParseUrlTest, HttpsWithPortQueryAndFragment) {
    auto u = stellar::parseUrl("https://Example.com:8443/a/b?x=1#frag");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->scheme, "https");
    EXPECT_EQ(u->host, "Example.com");
    EXPECT_EQ(u->port, "8443");
    EXPECT_EQ(u->target, "/a/b?x=1");
    EXPECT_EQ(stellar::parseUrl("https://example.com/")->port, "443");
}

TEST(ParseUrlTest, SchemeIsCaseInsensitiveAndUserinfoDropped) {
    auto u = stellar::parseUrl("HTTP://user:pw@host/x");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->scheme, "http");
    EXPECT_EQ(u->host, "host");
    EXPECT_EQ(u->target, "/x");
}

TEST(ParseUrlTest, QueryWithoutPath) {
    EXPECT_EQ(stellar::parseUrl("http://example.com?q=1")->target, "/?q=1");
}

TEST(ParseUrlTest, BracketedIpv6) {
    auto u = stellar::parseUrl("http://[::1]:8080/health");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->host, "::1");
    EXPECT_EQ(u->port, "8080");
    EXPECT_EQ(u->target, "/health");
}

TEST(ParseUrlTest, RejectsMalformed) {
    for (const char* bad : {"example.com", "ftp://example.com", "http://:80/", "http://host:0", "http://host:70000",
                            "http://host:abc", "http://[::1/", "http://[::1]x/"}) {
        auto u = stellar::parseUrl(bad);
        ASSERT_FALSE(u.has_value()) << bad;
        EXPECT_EQ(u.error().code, ErrorCode::InvalidArg) << bad;
    }
}

TEST(BeastTransportTest, RoundTrip) {
    LoopbackServer server {[](const auto& req, auto& res) {
        res.result(http::status::too_many_requests);
        res.set("Retry-After", "7");
        res.set(http::field::content_type, "application/json");
        res.body() = R"({"echo":")" + std::string(req.body()) + R"("})";
    }};
    BeastTransport transport {2s};
    HttpRequest request;
    request.method = "PUT";
    request.url = server.url("/api/v1/users/profile?verbose=1");
    request.headers = {{"Content-Type", "application/json"}, {"Authorization", "Bearer A1"}};
    request.body = "hi";

    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value()) << response.error().describe();
    EXPECT_EQ(response->status, 429);
    EXPECT_EQ(response->headers.at("retry-after"), "7");
    EXPECT_EQ(response->body, R"({"echo":"hi"})");
}

TEST(BeastTransportTest, SendsMethodTargetAndHeaders) {
    LoopbackServer server {[](const auto&, auto& res) {
        res.body() = "{}";
    }};
    BeastTransport transport {2s};
    HttpRequest request;
    request.method = "POST";
    request.url = server.url("/api/v1/auth/login?x=a%20b");
    request.headers = {{"Content-Type", "application/json"}, {"Accept", "application/json"}};
    request.body = R"({"identifier":"jane"})";
    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value()) << response.error().describe();
    EXPECT_EQ(response->status, 200);

    server.join();
    const auto& received = server.received;
    EXPECT_EQ(received.method(), http::verb::post);
    EXPECT_EQ(received.target(), "/api/v1/auth/login?x=a%20b");
    EXPECT_EQ(received[http::field::content_type], "application/json");
    EXPECT_EQ(received[http::field::accept], "application/json");
    EXPECT_EQ(received[http::field::host], server.url("").substr(std::string {"http://"}.size()));
    EXPECT_EQ(received.body(), R"({"identifier":"jane"})");
    EXPECT_EQ(received[http::field::content_length], std::to_string(request.body.size()));
}

TEST(BeastTransportTest, ConnectionRefusedIsTransportError) {
    std::string url;
    {
        net::io_context ioc;
        tcp::acceptor reserved {ioc, tcp::endpoint {net::ip::make_address("127.0.0.1"), 0}};
        url = "http://127.0.0.1:" + std::to_string(reserved.local_endpoint().port()) + "/health";
    }
    BeastTransport transport {1s};
    HttpRequest request;
    request.method = "GET";
    request.url = url;
    auto response = transport.send(request);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, ErrorCode::Transport);
    EXPECT_EQ(response.error().what.rfind("connect", 0), 0U) << response.error().what;
}

TEST(BeastTransportTest, SlowServerTimesOut) {
    LoopbackServer server {[](const auto&, auto& res) {
        std::this_thread::sleep_for(500ms);
        res.body() = "{}";
    }};
    BeastTransport transport {100ms};
    HttpRequest request;
    request.method = "GET";
    request.url = server.url("/health");
    auto response = transport.send(request);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, ErrorCode::Transport);
    EXPECT_EQ(response.error().what.rfind("read", 0), 0U) << response.error().what;
}

TEST(BeastTransportTest, InvalidUrlIsRejectedBeforeConnecting) {
    BeastTransport transport {1s};
    HttpRequest request;
    request.method = "GET";
    request.url = "not a url";
    auto response = transport.send(request);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, ErrorCode::InvalidArg);
}
