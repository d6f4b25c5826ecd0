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
#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"

#include <algorithm>
#include <optional>
#include <chrono>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace stellar {

ExponentialBackoff::ExponentialBackoff(const RetryPolicy& p)
    : baseDelay {p.baseDelay},
      maxDelay {p.maxDelay},
      maxAttempts {p.maxAttempts} {}

std::optional<std::chrono::milliseconds> ExponentialBackoff::delayFor(int attempt) const {
    if (attempt < 0 || attempt >= maxAttempts - 1) {
        return std::nullopt;
    }
    auto baseCount = static_cast<uint64_t>(baseDelay.count());
    auto maxCount = static_cast<uint64_t>(maxDelay.count());
    // Past 2^62 the shift overflows; the cap applies long before that.
    auto shift = static_cast<unsigned int>(std::min(attempt, 62));
    auto delay = baseCount > (maxCount >> shift) ? maxCount : baseCount << shift;
    spdlog::debug("ExponentialBackoff: Attempt {}, delay: {}ms, maxDelay: {}ms", attempt, delay, maxCount);
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::min(delay, maxCount)));
}

} // namespace stellar
