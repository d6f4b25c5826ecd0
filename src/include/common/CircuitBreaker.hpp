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
#ifndef STELLAR_CIRCUIT_BREAKER_H
#define STELLAR_CIRCUIT_BREAKER_H

#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace stellar {

class CircuitBreaker {
public:
    enum class State : char {
        Open,
        Closed,
        HalfOpen
    };
    explicit CircuitBreaker(const RetryPolicy& p);
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Gate for one logical call; Open past the recovery timeout moves to HalfOpen and admits.
    std::expected<std::monostate, Error> admit(TimePoint now);
    void recordSuccess();
    void recordFailure(TimePoint now);

    [[nodiscard]] bool open(TimePoint now);
    [[nodiscard]] State state() const;
    [[nodiscard]] int consecutiveFailures() const;
    [[nodiscard]] std::optional<TimePoint> openedAt() const;
private:
    struct Closed {};
    struct Open {
        TimePoint openedAt;
    };
    struct HalfOpen {};

    void transition(std::variant<Closed, Open, HalfOpen> next);
    [[nodiscard]] State stateLocked() const;

    mutable std::mutex m;
    std::variant<Closed, Open, HalfOpen> current;
    int failures {0};
    const int failureThreshold;
    const std::chrono::milliseconds recoveryTimeout;
};

std::string toString(CircuitBreaker::State state);

} // namespace stellar

#endif // STELLAR_CIRCUIT_BREAKER_H
