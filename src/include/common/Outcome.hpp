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
#ifndef STELLAR_OUTCOME_HPP
#define STELLAR_OUTCOME_HPP

#include <chrono>
#include <expected>
#include <string>
#include <variant>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace stellar {

namespace outcome {

struct Success {
    long status;
    std::string body;
};

struct RateLimited {
    std::chrono::seconds retryAfter;
};

struct Unauthorized {
    std::string body;
};

struct TransportFailure {
    Error cause;
};

struct OtherHttpError {
    long status;
    std::string body;
};

} // namespace outcome

using Outcome = std::variant<
    outcome::Success,
    outcome::RateLimited,
    outcome::Unauthorized,
    outcome::TransportFailure,
    outcome::OtherHttpError
>;

// Classifies the raw result of one attempt.
Outcome classify(const std::expected<HttpResponse, Error>& result, std::chrono::seconds defaultRetryAfter);

// Parses a Retry-After header given in delta-seconds.
std::chrono::seconds parseRetryAfter(const Headers& headers, std::chrono::seconds fallback);

// Error equivalent of a failed outcome. Throws std::logic_error for Success.
Error toError(const Outcome& o);

std::string toString(const Outcome& o);

} // namespace stellar

#endif // STELLAR_OUTCOME_HPP
