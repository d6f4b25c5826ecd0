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
#ifndef STELLAR_BEAST_TRANSPORT_H
#define STELLAR_BEAST_TRANSPORT_H

#include <chrono>
#include <expected>
#include <string>
#include <boost/asio/ssl/context.hpp>
#include "client/Transport.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace stellar {

struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

std::expected<Url, Error> parseUrl(const std::string& url);

class BeastTransport : public Transport {
public:
    explicit BeastTransport(std::chrono::milliseconds timeout = std::chrono::seconds {10});
    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;
    std::expected<HttpResponse, Error> send(const HttpRequest& request) override;
private:
    std::chrono::milliseconds timeout;
    boost::asio::ssl::context sslContext;
};

} // namespace stellar

#endif // STELLAR_BEAST_TRANSPORT_H
