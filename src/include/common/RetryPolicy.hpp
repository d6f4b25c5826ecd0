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
#ifndef STELLAR_RETRY_POLICY_H
#define STELLAR_RETRY_POLICY_H

#include <chrono>
#include <variant>
#include "common/Error.hpp"
#include "common/Outcome.hpp"

namespace stellar {

// Per logical call. Rate-limit waits do not advance number; the budget is RetryPolicy::maxAttempts.
struct RetryAttempt {
    int number {0};
    bool refreshed {false};
};

namespace decision {

struct Retry {
    std::chrono::milliseconds after;
    bool consumesAttempt;
};

struct RefreshThenRetry {};

struct Fail {
    Error error;
};

} // namespace decision

using Decision = std::variant<decision::Retry, decision::RefreshThenRetry, decision::Fail>;

struct RetryPolicy {
    explicit RetryPolicy(
        std::chrono::milliseconds base = std::chrono::seconds {1},
        std::chrono::milliseconds max = std::chrono::hours {24},
        std::chrono::milliseconds recovery = std::chrono::seconds {60},
        int threshold = 5,
        int attempts = 3,
        std::chrono::seconds leadTime = std::chrono::seconds {300},
        std::chrono::seconds retryAfter = std::chrono::seconds {60}
    );
    std::chrono::milliseconds baseDelay;
    std::chrono::milliseconds maxDelay;
    std::chrono::milliseconds recoveryTimeout;
    int failureThreshold;
    int maxAttempts;
    std::chrono::seconds refreshLeadTime;
    std::chrono::seconds defaultRetryAfter;

    [[nodiscard]] RetryAttempt firstAttempt() const;

    // Must not be called with a Success outcome.
    [[nodiscard]] Decision decide(const Outcome& o, const RetryAttempt& attempt, bool refreshAvailable) const;
};

} // namespace stellar

#endif // STELLAR_RETRY_POLICY_H
