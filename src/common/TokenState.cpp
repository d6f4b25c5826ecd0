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
#include "common/TokenState.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace stellar {

void TokenState::setTokens(const std::string& accessToken,
                           const std::optional<std::string>& refreshToken,
                           std::optional<std::chrono::seconds> expiresIn,
                           TimePoint now) {
    std::lock_guard lock {m};
    tokens.accessToken = accessToken;
    if (refreshToken.has_value()) {
        tokens.refreshToken = refreshToken;
    }
    auto lifetime = std::clamp(expiresIn.value_or(defaultExpiresIn), std::chrono::seconds::zero(), maxExpiresIn);
    tokens.expiry = now + lifetime;
    spdlog::debug("TokenState: stored access token, expires in {}s", lifetime.count());
}

void TokenState::clear() {
    std::lock_guard lock {m};
    tokens = Tokens {};
}

bool TokenState::needsProactiveRefresh(TimePoint now, std::chrono::seconds leadTime) const {
    std::lock_guard lock {m};
    return tokens.expiry.has_value() && now >= tokens.expiry.value() - leadTime;
}

bool TokenState::isAuthenticated() const {
    std::lock_guard lock {m};
    return tokens.accessToken.has_value();
}

std::string TokenState::authorizationHeader() const {
    std::lock_guard lock {m};
    if (!tokens.accessToken.has_value()) {
        return {};
    }
    return "Bearer " + tokens.accessToken.value();
}

std::optional<std::string> TokenState::refreshToken() const {
    std::lock_guard lock {m};
    return tokens.refreshToken;
}

std::optional<TimePoint> TokenState::expiry() const {
    std::lock_guard lock {m};
    return tokens.expiry;
}

Tokens TokenState::snapshot() const {
    std::lock_guard lock {m};
    return tokens;
}

} // namespace stellar
