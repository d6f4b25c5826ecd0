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
#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"

using stellar::ExponentialBackoff;
using stellar::RetryPolicy;

TEST(ExponentialBackoffTest, DoublesFromBase) {
    const RetryPolicy policy {std::chrono::seconds {1}, std::chrono::seconds {30}, std::chrono::seconds {60}, 5, 5};
    const ExponentialBackoff backoff {policy};
    EXPECT_EQ(backoff.delayFor(0), std::chrono::milliseconds {1000});
    EXPECT_EQ(backoff.delayFor(1), std::chrono::milliseconds {2000});
    EXPECT_EQ(backoff.delayFor(2), std::chrono::milliseconds {4000});
    EXPECT_EQ(backoff.delayFor(3), std::chrono::milliseconds {8000});
}

TEST(ExponentialBackoffTest, NoDelayAfterLastAttempt) {
    const RetryPolicy policy {};
    const ExponentialBackoff backoff {policy};
    EXPECT_TRUE(backoff.delayFor(0).has_value());
    EXPECT_TRUE(backoff.delayFor(1).has_value());
    EXPECT_FALSE(backoff.delayFor(2).has_value());
    EXPECT_FALSE(backoff.delayFor(10).has_value());
}

TEST(ExponentialBackoffTest, NegativeAttemptHasNoDelay) {
    const RetryPolicy policy {};
    const ExponentialBackoff backoff {policy};
    EXPECT_FALSE(backoff.delayFor(-1).has_value());
}

TEST(ExponentialBackoffTest, CapsAtMaxDelay) {
    const RetryPolicy policy {std::chrono::seconds {1}, std::chrono::seconds {5}, std::chrono::seconds {60}, 5, 100};
    const ExponentialBackoff backoff {policy};
    EXPECT_EQ(backoff.delayFor(2), std::chrono::milliseconds {4000});
    EXPECT_EQ(backoff.delayFor(3), std::chrono::milliseconds {5000});
    EXPECT_EQ(backoff.delayFor(70), std::chrono::milliseconds {5000});
}

TEST(ExponentialBackoffTest, ZeroBaseStaysZero) {
    const RetryPolicy policy {std::chrono::milliseconds {0}, std::chrono::milliseconds {0}, std::chrono::seconds {60}, 5, 4};
    const ExponentialBackoff backoff {policy};
    EXPECT_EQ(backoff.delayFor(0), std::chrono::milliseconds {0});
    EXPECT_EQ(backoff.delayFor(2), std::chrono::milliseconds {0});
}
