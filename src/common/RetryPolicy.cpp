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
#include "common/RetryPolicy.hpp"
#include "common/ExponentialBackoff.hpp"
#include "common/Outcome.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <chrono>
#include <variant>

namespace stellar {

RetryPolicy::RetryPolicy(
    std::chrono::milliseconds base,
    std::chrono::milliseconds max,
    std::chrono::milliseconds recovery,
    int threshold,
    int attempts,
    std::chrono::seconds leadTime,
    std::chrono::seconds retryAfter)
    : baseDelay(base),
      maxDelay(max),
      recoveryTimeout(recovery),
      failureThreshold(threshold),
      maxAttempts(attempts),
      refreshLeadTime(leadTime),
      defaultRetryAfter(retryAfter) {
    if (threshold < 1) {
        throw std::invalid_argument("Failure threshold must be >= one.");
    }
    if (attempts < 1) {
        throw std::invalid_argument("Max attempts must be >= one.");
    }
    if (base < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Base delay must be >= zero.");
    }
    if (max < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Max delay must be >= zero.");
    }
    if (recovery < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Recovery timeout must be >= zero.");
    }
    if (leadTime < std::chrono::seconds::zero()) {
        throw std::invalid_argument("Refresh lead time must be >= zero.");
    }
    if (retryAfter < std::chrono::seconds::zero()) {
        throw std::invalid_argument("Default retry-after must be >= zero.");
    }
    if (max < base) {
        throw std::invalid_argument("Max delay must be >= base delay.");
    }
}

RetryAttempt RetryPolicy::firstAttempt() const {
    return RetryAttempt {0, false};
}

Decision RetryPolicy::decide(const Outcome& o, const RetryAttempt& attempt, bool refreshAvailable) const {
    if (std::holds_alternative<outcome::Success>(o)) {
        throw std::logic_error("A successful outcome is terminal");
    }
    if (const auto* r = std::get_if<outcome::RateLimited>(&o)) {
        return decision::Retry {std::chrono::duration_cast<std::chrono::milliseconds>(r->retryAfter), false};
    }
    if (std::holds_alternative<outcome::Unauthorized>(o)
        && attempt.number == 0
        && !attempt.refreshed
        && refreshAvailable) {
        return decision::RefreshThenRetry {};
    }
    const ExponentialBackoff backoff {*this};
    auto delay = backoff.delayFor(attempt.number);
    if (delay.has_value()) {
        return decision::Retry {delay.value(), true};
    }
    spdlog::debug("RetryPolicy: giving up after {} attempts, last outcome {}", attempt.number + 1, toString(o));
    return decision::Fail {retriesExhausted(attempt.number + 1, toError(o))};
}

} // namespace stellar
