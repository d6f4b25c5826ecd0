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
#ifndef STELLAR_TEST_DOUBLES_H
#define STELLAR_TEST_DOUBLES_H

#include <gmock/gmock.h>
#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "client/Transport.hpp"
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace stellar::test {

using SendResult = std::expected<HttpResponse, Error>;

class MockTransport : public Transport {
public:
    MOCK_METHOD(SendResult, send, (const HttpRequest& request), (override));
};

// Manual time. sleep() records the delay and advances now() by it.
class FakeClock {
public:
    Clock clock() {
        Clock c;
        c.now = [this] {
            std::lock_guard lock {m};
            return current;
        };
        c.sleep = [this](std::chrono::milliseconds d) {
            std::lock_guard lock {m};
            slept.push_back(d);
            current += d;
        };
        return c;
    }

    void advance(std::chrono::milliseconds d) {
        std::lock_guard lock {m};
        current += d;
    }

    TimePoint now() {
        std::lock_guard lock {m};
        return current;
    }

    std::vector<std::chrono::milliseconds> sleeps() {
        std::lock_guard lock {m};
        return slept;
    }
private:
    std::mutex m;
    TimePoint current {std::chrono::hours {1}};
    std::vector<std::chrono::milliseconds> slept;
};

inline SendResult reply(long status, std::string body = "{}", Headers headers = {}) {
    return HttpResponse {status, std::move(headers), std::move(body)};
}

inline SendResult unreachable(std::string what = "connect: Connection refused") {
    return std::unexpected {Error {ErrorCode::Transport, std::move(what)}};
}

inline std::string tokensBody(const std::string& access,
                              const std::optional<std::string>& refresh = std::nullopt,
                              std::optional<long> expiresIn = std::nullopt) {
    Json tokens {{"accessToken", access}};
    if (refresh.has_value()) {
        tokens["refreshToken"] = refresh.value();
    }
    if (expiresIn.has_value()) {
        tokens["expiresIn"] = expiresIn.value();
    }
    return Json {{"success", true}, {"tokens", tokens}}.dump();
}

MATCHER_P2(IsRequest, method, url, "") {
    return arg.method == method && arg.url == url;
}

MATCHER_P(HasBearer, token, "") {
    auto it = arg.headers.find("Authorization");
    return it != arg.headers.end() && it->second == std::string {"Bearer "} + token;
}

MATCHER(HasNoAuthorization, "") {
    return arg.headers.find("Authorization") == arg.headers.end();
}

} // namespace stellar::test

#endif // STELLAR_TEST_DOUBLES_H
