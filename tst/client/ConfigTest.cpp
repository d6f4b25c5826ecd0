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
#include <stdexcept>
#include "client/Config.hpp"
#include "common/RetryPolicy.hpp"

using stellar::Config;
using stellar::RetryPolicy;

TEST(ConfigTest, Defaults) {
    const Config config {};
    EXPECT_EQ(config.baseURL, "http://localhost:3000/api/v1");
    EXPECT_EQ(config.requestTimeout, std::chrono::seconds {10});
    EXPECT_EQ(config.policy.maxAttempts, 3);
    EXPECT_EQ(config.defaultHeaders.at("Content-Type"), "application/json");
    EXPECT_EQ(config.defaultHeaders.at("accept"), "application/json");
}

TEST(ConfigTest, TrailingSlashesTrimmed) {
    const Config config {"https://api.example.com/v1//"};
    EXPECT_EQ(config.baseURL, "https://api.example.com/v1");
    EXPECT_EQ(config.url("/health"), "https://api.example.com/v1/health");
    EXPECT_EQ(config.url("users/42"), "https://api.example.com/v1/users/42");
}

TEST(ConfigTest, KeepsPolicy) {
    const RetryPolicy policy {std::chrono::milliseconds {10}, std::chrono::milliseconds {100}, std::chrono::seconds {5}, 2, 4};
    const Config config {"http://localhost:3000/api/v1", policy, std::chrono::milliseconds {250}};
    EXPECT_EQ(config.policy.failureThreshold, 2);
    EXPECT_EQ(config.policy.maxAttempts, 4);
    EXPECT_EQ(config.requestTimeout, std::chrono::milliseconds {250});
}

TEST(ConfigTest, InvalidSchemeThrows) {
    EXPECT_THROW(Config {"ftp://example.com"}, std::invalid_argument);
    EXPECT_THROW(Config {"localhost:3000"}, std::invalid_argument);
    EXPECT_THROW(Config {""}, std::invalid_argument);
}

TEST(ConfigTest, MissingHostThrows) {
    EXPECT_THROW(Config {"http://"}, std::invalid_argument);
    EXPECT_THROW(Config {"https:///"}, std::invalid_argument);
}

TEST(ConfigTest, NonPositiveTimeoutThrows) {
    EXPECT_THROW(Config("http://localhost", RetryPolicy {}, std::chrono::milliseconds {0}), std::invalid_argument);
}
