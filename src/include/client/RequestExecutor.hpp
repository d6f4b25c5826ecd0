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
#ifndef STELLAR_REQUEST_EXECUTOR_H
#define STELLAR_REQUEST_EXECUTOR_H

#include <chrono>
#include <cstdint>
#include <expected>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include "client/Config.hpp"
#include "client/Transport.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/Outcome.hpp"
#include "common/TokenState.hpp"
#include "common/Types.hpp"

namespace stellar {

using Result = std::expected<Json, Error>;

class RequestExecutor {
public:
    static constexpr const char* refreshPath = "/auth/refresh";

    RequestExecutor(const Config& c, Transport& t, TokenState& tokens, CircuitBreaker& breaker, Clock clock = Clock {});
    RequestExecutor(const RequestExecutor&) = delete;
    RequestExecutor& operator=(const RequestExecutor&) = delete;

    // Runs one logical call: proactive refresh, breaker admission, then attempts
    // until success, a terminal failure, or exhaustion of maxAttempts. The breaker
    // records exactly one success or failure per admitted call.
    [[nodiscard]] Result execute(const Request& request);

    // execute() on a thread of its own. The executor must outlive the future.
    [[nodiscard]] std::future<Result> submit(Request request);

    // At most one refresh is in flight; concurrent callers share its result.
    [[nodiscard]] Result refresh();

    // Stores tokens.accessToken / refreshToken / expiresIn from a login or refresh body.
    [[nodiscard]] std::expected<std::monostate, Error> storeTokens(const Json& body);

    [[nodiscard]] bool available();
    [[nodiscard]] const Clock& clock() const;
private:
    // The attempt loop of one logical call, without breaker accounting.
    std::expected<outcome::Success, Error> runAttempts(const Request& request, const std::string& body);
    // Joins an in-flight refresh, or reuses one that completed after `observed`, or starts one.
    Result refreshSince(std::uint64_t observed);
    [[nodiscard]] std::uint64_t refreshGeneration();
    Result performRefresh();
    // InvalidArg when the payload cannot be encoded, e.g. strings that are not UTF-8.
    [[nodiscard]] static std::expected<std::string, Error> serialize(const Request& request);
    [[nodiscard]] static std::chrono::seconds lifetime(const Json& expiresIn);
    [[nodiscard]] HttpRequest buildHttpRequest(const Request& request, const std::string& body) const;
    [[nodiscard]] Result decode(const outcome::Success& success) const;

    const Config& config;
    Transport& transport;
    TokenState& tokenState;
    CircuitBreaker& circuitBreaker;
    Clock clk;
    std::mutex refreshMutex;
    std::optional<std::shared_future<Result>> inflightRefresh;
    std::optional<Result> lastRefresh;
    std::uint64_t generation {0};
};

} // namespace stellar

#endif // STELLAR_REQUEST_EXECUTOR_H
