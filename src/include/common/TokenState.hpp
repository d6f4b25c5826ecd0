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
#ifndef STELLAR_TOKEN_STATE_HPP
#define STELLAR_TOKEN_STATE_HPP

#include "common/Clock.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace stellar {

struct Tokens {
    std::optional<std::string> accessToken;
    std::optional<std::string> refreshToken;
    std::optional<TimePoint> expiry;
};

class TokenState {
public:
    static constexpr std::chrono::seconds defaultExpiresIn {3600};
    static constexpr std::chrono::seconds defaultLeadTime {300};
    // Ten years. Longer lifetimes are clamped so now + expiresIn stays representable.
    static constexpr std::chrono::seconds maxExpiresIn {315360000};

    TokenState() = default;
    TokenState(const TokenState&) = delete;
    TokenState& operator=(const TokenState&) = delete;

    // An absent refresh token keeps the one already stored. expiresIn is clamped to [0, maxExpiresIn].
    void setTokens(const std::string& accessToken,
                   const std::optional<std::string>& refreshToken,
                   std::optional<std::chrono::seconds> expiresIn,
                   TimePoint now);
    void clear();
    [[nodiscard]] bool needsProactiveRefresh(TimePoint now, std::chrono::seconds leadTime = defaultLeadTime) const;
    [[nodiscard]] bool isAuthenticated() const;
    // "Bearer <token>", empty when unauthenticated.
    [[nodiscard]] std::string authorizationHeader() const;
    [[nodiscard]] std::optional<std::string> refreshToken() const;
    [[nodiscard]] std::optional<TimePoint> expiry() const;
    [[nodiscard]] Tokens snapshot() const;
private:
    mutable std::mutex m;
    Tokens tokens;
};

} // namespace stellar

#endif // STELLAR_TOKEN_STATE_HPP
