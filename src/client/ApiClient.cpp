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
#include "client/ApiClient.hpp"
#include <optional>
#include <string>
#include "common/Util.hpp"

namespace stellar {

ApiClient::ApiClient(AuthSession& s) : session {s} {}

Result ApiClient::registerUser(const std::string& username,
                               const std::string& email,
                               const std::string& password,
                               const std::optional<Json>& profile) {
    Json payload {
        {"username", username},
        {"email", email},
        {"password", password}
    };
    if (profile.has_value()) {
        payload["profile"] = profile.value();
    }
    return session.executor().execute(Request {"POST", "/auth/register", payload});
}

Result ApiClient::verifyEmail(const std::string& token) {
    return session.executor().execute(Request {"GET", "/auth/verify-email" + buildQuery({{"token", token}})});
}

Result ApiClient::forgotPassword(const std::string& email) {
    return session.executor().execute(Request {"POST", "/auth/forgot-password", Json {{"email", email}}});
}

Result ApiClient::resetPassword(const std::string& token, const std::string& newPassword) {
    return session.executor().execute(Request {"POST", "/auth/reset-password", Json {
        {"token", token},
        {"newPassword", newPassword}
    }});
}

Result ApiClient::getProfile() {
    return session.executor().execute(Request {"GET", "/users/profile"});
}

Result ApiClient::updateProfile(const Json& updates) {
    return session.executor().execute(Request {"PUT", "/users/profile", updates});
}

Result ApiClient::changePassword(const std::string& currentPassword, const std::string& newPassword) {
    return session.executor().execute(Request {"POST", "/users/change-password", Json {
        {"currentPassword", currentPassword},
        {"newPassword", newPassword}
    }});
}

Result ApiClient::getUser(const std::string& userId) {
    return session.executor().execute(Request {"GET", "/users/" + percentEncode(userId)});
}

Result ApiClient::listUsers(const ListUsersQuery& query) {
    QueryParams params {
        {"page", std::to_string(query.page)},
        {"limit", std::to_string(query.limit)},
        {"sort", query.sort}
    };
    if (query.status.has_value()) {
        params.emplace_back("status", query.status.value());
    }
    if (query.role.has_value()) {
        params.emplace_back("role", query.role.value());
    }
    if (query.search.has_value()) {
        params.emplace_back("search", query.search.value());
    }
    return session.executor().execute(Request {"GET", "/users" + buildQuery(params)});
}

Result ApiClient::checkHealth() {
    return session.executor().execute(Request {"GET", "/health"});
}

AuthSession& ApiClient::auth() {
    return session;
}

} // namespace stellar
