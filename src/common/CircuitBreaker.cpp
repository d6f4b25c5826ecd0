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
#include "common/CircuitBreaker.hpp"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace stellar {

CircuitBreaker::CircuitBreaker(const RetryPolicy& p)
    : current {Closed {}},
      failureThreshold {p.failureThreshold},
      recoveryTimeout {p.recoveryTimeout} {}

std::expected<std::monostate, Error> CircuitBreaker::admit(TimePoint now) {
    std::lock_guard lock {m};
    if (const auto* o = std::get_if<Open>(&current)) {
        if (now - o->openedAt <= recoveryTimeout) {
            spdlog::debug("CircuitBreaker rejecting call, breaker is open");
            return std::unexpected {Error {ErrorCode::CircuitOpen, "Circuit breaker is open"}};
        }
        transition(HalfOpen {});
    }
    return {};
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard lock {m};
    if (std::holds_alternative<HalfOpen>(current)) {
        transition(Closed {});
    }
    failures = 0;
}

void CircuitBreaker::recordFailure(TimePoint now) {
    std::lock_guard lock {m};
    ++failures;
    if (std::holds_alternative<HalfOpen>(current)) {
        spdlog::warn("CircuitBreaker trial call failed while half-open");
        transition(Open {now});
    } else if (failures >= failureThreshold) {
        transition(Open {now});
    }
}

bool CircuitBreaker::open(TimePoint now) {
    std::lock_guard lock {m};
    if (const auto* o = std::get_if<Open>(&current)) {
        if (now - o->openedAt > recoveryTimeout) {
            transition(HalfOpen {});
        }
    }
    return std::holds_alternative<Open>(current);
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard lock {m};
    return stateLocked();
}

int CircuitBreaker::consecutiveFailures() const {
    std::lock_guard lock {m};
    return failures;
}

std::optional<TimePoint> CircuitBreaker::openedAt() const {
    std::lock_guard lock {m};
    if (const auto* o = std::get_if<Open>(&current)) {
        return o->openedAt;
    }
    return std::nullopt;
}

void CircuitBreaker::transition(std::variant<Closed, Open, HalfOpen> next) {
    auto from = stateLocked();
    current = std::move(next);
    auto to = stateLocked();
    if (to == State::Closed) {
        failures = 0;
    }
    if (from == State::Open || to == State::Open) {
        spdlog::warn("CircuitBreaker {} -> {} after {} consecutive failures", toString(from), toString(to), failures);
    } else if (from != to) {
        spdlog::info("CircuitBreaker {} -> {}", toString(from), toString(to));
    }
}

CircuitBreaker::State CircuitBreaker::stateLocked() const {
    if (std::holds_alternative<Open>(current)) {
        return State::Open;
    }
    if (std::holds_alternative<HalfOpen>(current)) {
        return State::HalfOpen;
    }
    return State::Closed;
}

std::string toString(CircuitBreaker::State state) {
    switch (state) {
        case CircuitBreaker::State::Open: return "Open";
        case CircuitBreaker::State::Closed: return "Closed";
        case CircuitBreaker::State::HalfOpen: return "HalfOpen";
    }
    std::unreachable();
}

} // namespace stellar
