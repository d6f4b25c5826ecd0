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
#include "client/RequestExecutor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <expected>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include "common/Error.hpp"
#include "common/Outcome.hpp"
#include "common/RetryPolicy.hpp"

namespace stellar {

RequestExecutor::RequestExecutor(const Config& c, Transport& t, TokenState& tokens, CircuitBreaker& breaker, Clock clock)
    : config {c},
      transport {t},
      tokenState {tokens},
      circuitBreaker {breaker},
      clk {std::move(clock)} {}

Result RequestExecutor::execute(const Request& request) {
    const auto& policy = config.policy;
    auto body = serialize(request);
    if (!body.has_value()) {
        spdlog::error("{} {} not sent: {}", request.method, request.path, body.error().what);
        return std::unexpected {body.error()};
    }

    // Read before the expiry check so a refresh finishing in between is reused, not repeated.
    auto observed = refreshGeneration();
    if (request.allowRefresh
        && tokenState.refreshToken().has_value()
        && tokenState.needsProactiveRefresh(clk.now(), policy.refreshLeadTime)) {
        spdlog::info("Access token expires within {}s, refreshing before {} {}", policy.refreshLeadTime.count(), request.method, request.path);
        auto refreshed = refreshSince(observed);
        if (!refreshed.has_value()) {
            // The request still goes out; a stale token surfaces as 401 and takes the reactive path.
            spdlog::warn("Proactive token refresh failed, continuing: {}", refreshed.error().describe());
        }
    }

    auto admitted = circuitBreaker.admit(clk.now());
    if (!admitted.has_value()) {
        spdlog::warn("{} {} rejected: {}", request.method, request.path, admitted.error().what);
        return std::unexpected {admitted.error()};
    }

    auto answered = runAttempts(request, body.value());
    if (!answered.has_value()) {
        circuitBreaker.recordFailure(clk.now());
        return std::unexpected {answered.error()};
    }
    circuitBreaker.recordSuccess();
    return decode(answered.value());
}

std::expected<outcome::Success, Error> RequestExecutor::runAttempts(const Request& request, const std::string& body) {
    const auto& policy = config.policy;
    auto attempt = policy.firstAttempt();
    while (true) {
        auto observed = refreshGeneration();
        auto raw = transport.send(buildHttpRequest(request, body));
        auto o = classify(raw, policy.defaultRetryAfter);

        if (auto* success = std::get_if<outcome::Success>(&o)) {
            return std::move(*success);
        }

        const bool refreshAvailable = request.allowRefresh && tokenState.refreshToken().has_value();
        auto d = policy.decide(o, attempt, refreshAvailable);

        if (const auto* retry = std::get_if<decision::Retry>(&d)) {
            if (retry->consumesAttempt) {
                spdlog::warn("{} {} failed on attempt {}/{} ({}), retrying in {}ms",
                             request.method, request.path, attempt.number + 1, policy.maxAttempts,
                             toString(o), retry->after.count());
            } else {
                spdlog::warn("Rate limited on {} {}. Waiting {}ms...", request.method, request.path, retry->after.count());
            }
            clk.sleep(retry->after);
            if (retry->consumesAttempt) {
                ++attempt.number;
            }
            continue;
        }

        if (std::holds_alternative<decision::RefreshThenRetry>(d)) {
            spdlog::info("Access token rejected on {} {}, refreshing...", request.method, request.path);
            attempt.refreshed = true;
            auto refreshed = refreshSince(observed);
            if (!refreshed.has_value()) {
                return std::unexpected {refreshed.error()};
            }
            ++attempt.number;
            continue;
        }

        const auto& fail = std::get<decision::Fail>(d);
        spdlog::error("{} {} failed: {}", request.method, request.path, fail.error.describe());
        return std::unexpected {fail.error};
    }
}

std::future<Result> RequestExecutor::submit(Request request) {
    return std::async(std::launch::async, [this, r = std::move(request)] {
        return execute(r);
    });
}

Result RequestExecutor::refresh() {
    return refreshSince(refreshGeneration());
}

std::uint64_t RequestExecutor::refreshGeneration() {
    std::lock_guard lock {refreshMutex};
    return generation;
}

Result RequestExecutor::refreshSince(std::uint64_t observed) {
    std::promise<Result> promise;
    std::shared_future<Result> pending;
    bool leader = false;
    {
        std::lock_guard lock {refreshMutex};
        if (inflightRefresh.has_value()) {
            pending = inflightRefresh.value();
        } else if (generation != observed && lastRefresh.has_value()) {
            spdlog::debug("Token refreshed since the request started, reusing it");
            return lastRefresh.value();
        } else {
            pending = promise.get_future().share();
            inflightRefresh = pending;
            leader = true;
        }
    }
    if (!leader) {
        spdlog::debug("Waiting for in-flight token refresh");
        return pending.get();
    }

    try {
        auto result = performRefresh();
        {
            std::lock_guard lock {refreshMutex};
            inflightRefresh.reset();
            lastRefresh = result;
            ++generation;
        }
        promise.set_value(result);
        return result;
    } catch (...) {
        {
            std::lock_guard lock {refreshMutex};
            inflightRefresh.reset();
            lastRefresh.reset();
            ++generation;
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

Result RequestExecutor::performRefresh() {
    auto token = tokenState.refreshToken();
    if (!token.has_value()) {
        return std::unexpected {Error {ErrorCode::Auth, "No refresh token available"}};
    }
    // Part of the logical call that needed it; the breaker is consulted but not fed.
    if (circuitBreaker.open(clk.now())) {
        return std::unexpected {Error {ErrorCode::CircuitOpen, "Circuit breaker is open"}};
    }
    Request request {"POST", refreshPath, Json {{"refreshToken", token.value()}}};
    request.allowRefresh = false;
    auto payload = serialize(request);
    if (!payload.has_value()) {
        return std::unexpected {payload.error()};
    }
    auto answered = runAttempts(request, payload.value());
    if (!answered.has_value()) {
        return std::unexpected {answered.error()};
    }
    auto body = decode(answered.value());
    if (!body.has_value()) {
        return body;
    }
    auto stored = storeTokens(body.value());
    if (!stored.has_value()) {
        return std::unexpected {stored.error()};
    }
    spdlog::info("Access token refreshed");
    return body;
}

std::expected<std::monostate, Error> RequestExecutor::storeTokens(const Json& body) {
    if (!body.is_object() || !body.contains("tokens") || !body["tokens"].is_object()) {
        return std::unexpected {Error {ErrorCode::InvalidResponse, "Response carries no tokens object"}};
    }
    const auto& tokens = body["tokens"];
    if (!tokens.contains("accessToken") || !tokens["accessToken"].is_string()) {
        return std::unexpected {Error {ErrorCode::InvalidResponse, "Response carries no tokens.accessToken"}};
    }
    std::optional<std::string> refreshToken;
    if (tokens.contains("refreshToken") && tokens["refreshToken"].is_string()) {
        refreshToken = tokens["refreshToken"].get<std::string>();
    }
    std::optional<std::chrono::seconds> expiresIn;
    if (tokens.contains("expiresIn") && tokens["expiresIn"].is_number()) {
        expiresIn = lifetime(tokens["expiresIn"]);
    }
    tokenState.setTokens(tokens["accessToken"].get<std::string>(), refreshToken, expiresIn, clk.now());
    return {};
}

bool RequestExecutor::available() {
    return !circuitBreaker.open(clk.now());
}

const Clock& RequestExecutor::clock() const {
    return clk;
}

std::expected<std::string, Error> RequestExecutor::serialize(const Request& request) {
    if (!request.payload.has_value()) {
        return std::string {};
    }
    try {
        return request.payload->dump();
    } catch (const Json::type_error& e) {
        return std::unexpected {Error {ErrorCode::InvalidArg, std::string {"Request payload is not serializable: "} + e.what()}};
    }
}

std::chrono::seconds RequestExecutor::lifetime(const Json& expiresIn) {
    constexpr auto limit = TokenState::maxExpiresIn.count();
    if (expiresIn.is_number_unsigned()) {
        auto value = expiresIn.get<std::uint64_t>();
        return std::chrono::seconds {value >= static_cast<std::uint64_t>(limit) ? limit : static_cast<std::int64_t>(value)};
    }
    if (expiresIn.is_number_integer()) {
        return std::chrono::seconds {std::clamp<std::int64_t>(expiresIn.get<std::int64_t>(), 0, limit)};
    }
    // Range-checked before the cast.
    auto value = expiresIn.get<double>();
    if (!(value > 0)) {
        return std::chrono::seconds::zero();
    }
    if (value >= static_cast<double>(limit)) {
        return TokenState::maxExpiresIn;
    }
    return std::chrono::seconds {static_cast<std::int64_t>(value)};
}

HttpRequest RequestExecutor::buildHttpRequest(const Request& request, const std::string& body) const {
    HttpRequest out;
    out.method = request.method;
    out.url = config.url(request.path);
    out.headers = config.defaultHeaders;
    // Read per attempt so a refresh between attempts is picked up.
    auto authorization = tokenState.authorizationHeader();
    if (!authorization.empty()) {
        out.headers.insert_or_assign("Authorization", authorization);
    }
    out.body = body;
    return out;
}

Result RequestExecutor::decode(const outcome::Success& success) const {
    if (success.body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Json {};
    }
    auto parsed = Json::parse(success.body, nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected {Error {ErrorCode::InvalidResponse, "Response body is not valid JSON", success.status, success.body}};
    }
    return parsed;
}

} // namespace stellar
