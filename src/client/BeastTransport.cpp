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
#include "client/BeastTransport.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace stellar {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

Error transportError(const std::string& stage, const beast::error_code& ec) {
    return Error {ErrorCode::Transport, stage + ": " + ec.message()};
}

void runPending(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string defaultPort(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

template <typename Stream>
std::expected<HttpResponse, Error> exchange(net::io_context& ioc,
                                            Stream& stream,
                                            http::request<http::string_body>& req,
                                            std::chrono::milliseconds timeout) {
    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    runPending(ioc);
    if (ec) {
        return std::unexpected {transportError("write", ec)};
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_read(stream, buffer, res, [&ec](beast::error_code e, std::size_t) { ec = e; });
    runPending(ioc);
    if (ec) {
        return std::unexpected {transportError("read", ec)};
    }

    HttpResponse out;
    out.status = static_cast<long>(res.result_int());
    for (const auto& field : res) {
        auto name = field.name_string();
        auto value = field.value();
        out.headers.insert_or_assign(std::string(name.data(), name.size()), std::string(value.data(), value.size()));
    }
    out.body = std::move(res.body());
    return out;
}

} // namespace

std::expected<Url, Error> parseUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "URL has no scheme: " + url}};
    }
    Url u;
    u.scheme = toLower(url.substr(0, schemeEnd));
    if (u.scheme != "http" && u.scheme != "https") {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Unsupported URL scheme: " + u.scheme}};
    }
    auto rest = url.substr(schemeEnd + 3);
    auto pathStart = rest.find_first_of("/?#");
    auto authority = rest.substr(0, pathStart);
    u.target = pathStart == std::string::npos ? "/" : rest.substr(pathStart);
    if (auto hash = u.target.find('#'); hash != std::string::npos) {
        u.target.erase(hash);
    }
    if (u.target.empty() || u.target.front() != '/') {
        u.target.insert(0, "/");
    }
    if (auto at = authority.rfind('@'); at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    std::string portPart;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::unexpected {Error {ErrorCode::InvalidArg, "Unterminated IPv6 address in URL: " + url}};
        }
        u.host = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::unexpected {Error {ErrorCode::InvalidArg, "Malformed authority in URL: " + url}};
            }
            portPart = after.substr(1);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string::npos) {
        u.host = authority.substr(0, colon);
        portPart = authority.substr(colon + 1);
    } else {
        u.host = authority;
    }
    if (u.host.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "URL has no host: " + url}};
    }

    if (portPart.empty()) {
        u.port = defaultPort(u.scheme);
    } else {
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(portPart.data(), portPart.data() + portPart.size(), port);
        if (ec != std::errc{} || ptr != portPart.data() + portPart.size() || port == 0 || port > 65535) {
            return std::unexpected {Error {ErrorCode::InvalidArg, "Invalid port in URL: " + url}};
        }
        u.port = portPart;
    }
    return u;
}

BeastTransport::BeastTransport(std::chrono::milliseconds t)
    : timeout {t},
      sslContext {boost::asio::ssl::context::tls_client} {
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
}

std::expected<HttpResponse, Error> BeastTransport::send(const HttpRequest& request) {
    auto parsed = parseUrl(request.url);
    if (!parsed.has_value()) {
        return std::unexpected {parsed.error()};
    }
    const auto& u = parsed.value();

    http::request<http::string_body> req;
    auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        req.method_string(request.method);
    } else {
        req.method(verb);
    }
    req.target(u.target);
    req.version(11);
    auto hostHeader = u.host.find(':') != std::string::npos ? "[" + u.host + "]" : u.host;
    if (u.port != defaultPort(u.scheme)) {
        hostHeader += ":" + u.port;
    }
    req.set(http::field::host, hostHeader);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    net::io_context ioc;
    beast::error_code ec;

    tcp::resolver resolver {ioc};
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(u.host, u.port, [&ec, &endpoints](beast::error_code e, tcp::resolver::results_type r) {
        ec = e;
        endpoints = std::move(r);
    });
    ioc.restart();
    ioc.run_for(timeout);
    if (!ioc.stopped()) {
        resolver.cancel();
        ioc.run();
        ec = net::error::timed_out;
    }
    if (ec) {
        return std::unexpected {transportError("resolve " + u.host, ec)};
    }

    spdlog::debug("BeastTransport: {} {}", request.method, request.url);

    if (u.scheme == "https") {
        beast::ssl_stream<beast::tcp_stream> stream {ioc, sslContext};
        if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
            ec.assign(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            return std::unexpected {transportError("tls server name", ec)};
        }
        stream.set_verify_callback(ssl::rfc2818_verification(u.host));

        beast::get_lowest_layer(stream).expires_after(timeout);
        beast::get_lowest_layer(stream).async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        runPending(ioc);
        if (ec) {
            return std::unexpected {transportError("connect", ec)};
        }

        beast::get_lowest_layer(stream).expires_after(timeout);
        stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
        runPending(ioc);
        if (ec) {
            return std::unexpected {transportError("tls handshake", ec)};
        }

        auto result = exchange(ioc, stream, req, timeout);

        beast::get_lowest_layer(stream).expires_after(timeout);
        stream.async_shutdown([&ec](beast::error_code e) { ec = e; });
        runPending(ioc);
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            spdlog::debug("BeastTransport: TLS shutdown of {} failed: {}", u.host, ec.message());
        }
        return result;
    }

    beast::tcp_stream stream {ioc};
    stream.expires_after(timeout);
    stream.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    runPending(ioc);
    if (ec) {
        return std::unexpected {transportError("connect", ec)};
    }

    auto result = exchange(ioc, stream, req, timeout);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("BeastTransport: socket shutdown of {} failed: {}", u.host, ec.message());
    }
    return result;
}

} // namespace stellar
