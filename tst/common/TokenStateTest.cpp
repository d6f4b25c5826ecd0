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
#include <optional>
#include <string>
#include "common/Clock.hpp"
#include "common/TokenState.hpp"

using stellar::TimePoint;
using stellar::TokenState;

class TokenStateTest : public ::testing::Test {
protected:
    TokenState state;
    TimePoint t0 {std::chrono::hours {1}};
};

TEST_F(TokenStateTest, StartsUnauthenticated) {
    EXPECT_FALSE(state.isAuthenticated());
    EXPECT_EQ(state.authorizationHeader(), "");
    EXPECT_FALSE(state.refreshToken().has_value());
    EXPECT_FALSE(state.expiry().has_value());
    EXPECT_FALSE(state.needsProactiveRefresh(t0));
}

TEST_F(TokenStateTest, SetTokensStoresAll) {
    state.setTokens("A1", "R1", std::chrono::seconds {900}, t0);
    EXPECT_TRUE(state.isAuthenticated());
    EXPECT_EQ(state.authorizationHeader(), "Bearer A1");
    EXPECT_EQ(state.refreshToken(), std::optional<std::string> {"R1"});
    EXPECT_EQ(state.expiry(), std::optional<TimePoint> {t0 + std::chrono::seconds {900}});
}

TEST_F(TokenStateTest, MissingExpiresInDefaultsToOneHour) {
    state.setTokens("A1", "R1", std::nullopt, t0);
    EXPECT_EQ(state.expiry().value(), t0 + std::chrono::seconds {3600});
}

TEST_F(TokenStateTest, MissingRefreshTokenKeepsPrevious) {
    state.setTokens("A1", "R1", std::nullopt, t0);
    state.setTokens("A2", std::nullopt, std::nullopt, t0);
    EXPECT_EQ(state.authorizationHeader(), "Bearer A2");
    EXPECT_EQ(state.refreshToken().value(), "R1");
}

TEST_F(TokenStateTest, ProactiveRefreshWindow) {
    state.setTokens("A1", "R1", std::chrono::seconds {240}, t0);
    EXPECT_TRUE(state.needsProactiveRefresh(t0));

    state.setTokens("A1", "R1", std::chrono::seconds {600}, t0);
    EXPECT_FALSE(state.needsProactiveRefresh(t0));
    EXPECT_FALSE(state.needsProactiveRefresh(t0 + std::chrono::seconds {299}));
    EXPECT_TRUE(state.needsProactiveRefresh(t0 + std::chrono::seconds {300}));
}

TEST_F(TokenStateTest, CustomLeadTime) {
    state.setTokens("A1", "R1", std::chrono::seconds {600}, t0);
    EXPECT_FALSE(state.needsProactiveRefresh(t0, std::chrono::seconds {60}));
    EXPECT_TRUE(state.needsProactiveRefresh(t0, std::chrono::seconds {600}));
}

TEST_F(TokenStateTest, LifetimeIsClamped) {
    state.setTokens("A1", "R1", std::chrono::seconds::max(), t0);
    EXPECT_EQ(state.expiry().value(), t0 + TokenState::maxExpiresIn);
    EXPECT_FALSE(state.needsProactiveRefresh(t0 + std::chrono::hours {24 * 365}));

    state.setTokens("A1", "R1", std::chrono::seconds {-5}, t0);
    EXPECT_EQ(state.expiry().value(), t0);
    EXPECT_TRUE(state.needsProactiveRefresh(t0));
}

TEST_F(TokenStateTest, ClearIsIdempotent) {
    state.setTokens("A1", "R1", std::chrono::seconds {600}, t0);
    state.clear();
    EXPECT_FALSE(state.isAuthenticated());
    EXPECT_FALSE(state.refreshToken().has_value());
    EXPECT_FALSE(state.expiry().has_value());
    EXPECT_FALSE(state.needsProactiveRefresh(t0 + std::chrono::hours {2}));
    state.clear();
    const auto snapshot = state.snapshot();
    EXPECT_FALSE(snapshot.accessToken.has_value());
    EXPECT_FALSE(snapshot.refreshToken.has_value());
    EXPECT_FALSE(snapshot.expiry.has_value());
}
