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
#ifndef STELLAR_EXPONENTIAL_BACKOFF_H
#define STELLAR_EXPONENTIAL_BACKOFF_H

#include "common/RetryPolicy.hpp"
#include <optional>
#include <chrono>

namespace stellar {

class ExponentialBackoff {
public:
    explicit ExponentialBackoff(const RetryPolicy& policy);
    // Delay before the attempt following `attempt` (0-based), nullopt once the last attempt was used.
    [[nodiscard]] std::optional<std::chrono::milliseconds> delayFor(int attempt) const;
private:
    std::chrono::milliseconds baseDelay;
    std::chrono::milliseconds maxDelay;
    int maxAttempts;
};

} // namespace stellar

#endif // STELLAR_EXPONENTIAL_BACKOFF_H
