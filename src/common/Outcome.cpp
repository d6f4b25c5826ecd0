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
#include "common/Outcome.hpp"
#include <charconv>
#include <chrono>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace stellar {

std::chrono::seconds parseRetryAfter(const Headers& headers, std::chrono::seconds fallback) {
    auto it = headers.find("retry-after");
    if (it == headers.end()) {
        return fallback;
    }
    std::string_view v {it->second};
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) {
        v.remove_prefix(1);
    }
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) {
        v.remove_suffix(1);
    }
    long long seconds = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), seconds);
    if (ec != std::errc{} || ptr != v.data() + v.size() || seconds < 0) {
        return fallback;
    }
    return std::chrono::seconds {seconds};
}

Outcome classify(const std::expected<HttpResponse, Error>& result, std::chrono::seconds defaultRetryAfter) {
    if (!result.has_value()) {
        return outcome::TransportFailure {result.error()};
    }
    const auto& response = result.value();
    if (response.status == 429) {
        return outcome::RateLimited {parseRetryAfter(response.headers, defaultRetryAfter)};
    }
    if (response.status == 401) {
        return outcome::Unauthorized {response.body};
    }
    if (response.status >= 200 && response.status < 300) {
        return outcome::Success {response.status, response.body};
    }
    return outcome::OtherHttpError {response.status, response.body};
}

Error toError(const Outcome& o) {
    if (std::holds_alternative<outcome::Success>(o)) {
        throw std::logic_error("Cannot convert a successful outcome to an error");
    }
    if (const auto* r = std::get_if<outcome::RateLimited>(&o)) {
        return Error {ErrorCode::RateLimited, "Rate limited, retry after " + std::to_string(r->retryAfter.count()) + "s", 429, ""};
    }
    if (const auto* u = std::get_if<outcome::Unauthorized>(&o)) {
        return Error {ErrorCode::Http, "Unauthorized", 401, u->body};
    }
    if (const auto* t = std::get_if<outcome::TransportFailure>(&o)) {
        return t->cause;
    }
    const auto& h = std::get<outcome::OtherHttpError>(o);
    return Error {ErrorCode::Http, "HTTP error " + std::to_string(h.status), h.status, h.body};
}

std::string toString(const Outcome& o) {
    if (const auto* s = std::get_if<outcome::Success>(&o)) {
        return "Success(" + std::to_string(s->status) + ")";
    }
    if (const auto* r = std::get_if<outcome::RateLimited>(&o)) {
        return "RateLimited(" + std::to_string(r->retryAfter.count()) + "s)";
    }
    if (std::holds_alternative<outcome::Unauthorized>(o)) {
        return "Unauthorized";
    }
    if (const auto* t = std::get_if<outcome::TransportFailure>(&o)) {
        return "TransportFailure(" + t->cause.what + ")";
    }
    return "OtherHttpError(" + std::to_string(std::get<outcome::OtherHttpError>(o).status) + ")";
}

} // namespace stellar
