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
#ifndef STELLAR_API_CLIENT_H
#define STELLAR_API_CLIENT_H

#include <optional>
#include <string>
#include "client/AuthSession.hpp"
#include "client/RequestExecutor.hpp"
#include "common/Types.hpp"

namespace stellar {

struct ListUsersQuery {
    int page = 1;
    int limit = 20;
    std::string sort = "-createdAt";
    std::optional<std::string> status;
    std::optional<std::string> role;
    std::optional<std::string> search;
};

class ApiClient {
public:
    explicit ApiClient(AuthSession& s);
    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    [[nodiscard]] Result registerUser(const std::string& username,
                                      const std::string& email,
                                      const std::string& password,
                                      const std::optional<Json>& profile = std::nullopt);
    [[nodiscard]] Result verifyEmail(const std::string& token);
    [[nodiscard]] Result forgotPassword(const std::string& email);
    [[nodiscard]] Result resetPassword(const std::string& token, const std::string& newPassword);

    [[nodiscard]] Result getProfile();
    [[nodiscard]] Result updateProfile(const Json& updates);
    [[nodiscard]] Result changePassword(const std::string& currentPassword, const std::string& newPassword);

    [[nodiscard]] Result getUser(const std::string& userId);
    [[nodiscard]] Result listUsers(const ListUsersQuery& query = ListUsersQuery {});

    [[nodiscard]] Result checkHealth();

    [[nodiscard]] AuthSession& auth();
private:
    AuthSession& session;
};

} // namespace stellar

#endif // STELLAR_API_CLIENT_H
