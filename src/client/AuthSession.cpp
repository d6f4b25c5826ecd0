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
#include "client/AuthSession.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <string>
#include <utility>
#include "common/Error.hpp"

namespace stellar {

namespace {

// Clears the session tokens on scope exit, also when the remote call throws.
class ClearOnExit {
public:
    explicit ClearOnExit(TokenState& t) : tokens {t} {}
    ~ClearOnExit() {
        tokens.clear();
    }
    ClearOnExit(const ClearOnExit&) = delete;
    ClearOnExit& operator=(const ClearOnExit&) = delete;
private:
    TokenState& tokens;
};

} // namespace

AuthSession::AuthSession(const Config& c, Transport& t, Clock clock)
    : tokenState {},
      circuitBreaker {c.policy},
      exec {c, t, tokenState, circuitBreaker, std::move(clock)} {}

Result AuthSession::login(const std::string& identifier, const std::string& password, bool rememberMe) {
    Request request {"POST", "/auth/login", Json {
        {"identifier", identifier},
        {"password", password},
        {"rememberMe", rememberMe}
    }};
    // A 401 here means bad credentials, not a stale token.
    request.allowRefresh = false;
    auto response = exec.execute(request);
    if (!response.has_value()) {
        return response;
    }
    auto stored = exec.storeTokens(response.value());
    if (!stored.has_value()) {
        return std::unexpected {stored.error()};
    }
    spdlog::info("Logged in as {}", identifier);
    return response;
}

Result AuthSession::refresh() {
    return exec.refresh();
}

Result AuthSession::logout() {
    const ClearOnExit guard {tokenState};
    auto refreshToken = tokenState.refreshToken();
    Json payload {{"refreshToken", nullptr}};
    if (refreshToken.has_value()) {
        payload["refreshToken"] = refreshToken.value();
    }
    auto response = exec.execute(Request {"POST", "/auth/logout", std::move(payload)});
    if (!response.has_value()) {
        spdlog::warn("Remote logout failed, local tokens cleared anyway: {}", response.error().describe());
    }
    return response;
}

Result AuthSession::deleteAccount(const std::string& password) {
    const ClearOnExit guard {tokenState};
    auto response = exec.execute(Request {"DELETE", "/users/delete", Json {{"password", password}}});
    if (!response.has_value()) {
        spdlog::warn("Account deletion failed, local tokens cleared anyway: {}", response.error().describe());
    }
    return response;
}

void AuthSession::clear() {
    tokenState.clear();
}

bool AuthSession::isAuthenticated() const {
    return tokenState.isAuthenticated();
}

Tokens AuthSession::tokens() const {
    return tokenState.snapshot();
}

CircuitBreaker::State AuthSession::breakerState() const {
    return circuitBreaker.state();
}

RequestExecutor& AuthSession::executor() {
    return exec;
}

ScopedSession::ScopedSession(AuthSession& s, const std::string& identifier, const std::string& password)
    : session {s} {
    auto r = session.login(identifier, password);
    if (!r.has_value()) {
        throw ApiException {r.error()};
    }
    response = std::move(r.value());
}

ScopedSession::~ScopedSession() {
    try {
        auto r = session.logout();
        if (!r.has_value()) {
            spdlog::warn("Logout on session scope exit failed: {}", r.error().describe());
        }
    } catch (const std::exception& e) {
        session.clear();
        spdlog::error("Logout on session scope exit threw: {}", e.what());
    }
}

const Json& ScopedSession::loginResponse() const {
    return response;
}

} // namespace stellar
