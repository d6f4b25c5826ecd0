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
#ifndef STELLAR_AUTH_SESSION_H
#define STELLAR_AUTH_SESSION_H

#include <string>
#include "client/Config.hpp"
#include "client/RequestExecutor.hpp"
#include "client/Transport.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Clock.hpp"
#include "common/TokenState.hpp"
#include "common/Types.hpp"

namespace stellar {

// Owns the session-wide token state and circuit breaker. Logout and account
// deletion always drop the local tokens, whatever the server answered.
class AuthSession {
public:
    AuthSession(const Config& c, Transport& t, Clock clock = Clock {});
    AuthSession(const AuthSession&) = delete;
    AuthSession& operator=(const AuthSession&) = delete;

    [[nodiscard]] Result login(const std::string& identifier, const std::string& password, bool rememberMe = false);
    [[nodiscard]] Result refresh();
    [[nodiscard]] Result logout();
    [[nodiscard]] Result deleteAccount(const std::string& password);
    void clear();

    [[nodiscard]] bool isAuthenticated() const;
    [[nodiscard]] Tokens tokens() const;
    [[nodiscard]] CircuitBreaker::State breakerState() const;
    [[nodiscard]] RequestExecutor& executor();
private:
    TokenState tokenState;
    CircuitBreaker circuitBreaker;
    RequestExecutor exec;
};

// Logs in for the lifetime of the object and logs out on destruction.
class ScopedSession {
public:
    ScopedSession(AuthSession& s, const std::string& identifier, const std::string& password);
    ~ScopedSession();
    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;
    [[nodiscard]] const Json& loginResponse() const;
private:
    AuthSession& session;
    Json response;
};

} // namespace stellar

#endif // STELLAR_AUTH_SESSION_H
