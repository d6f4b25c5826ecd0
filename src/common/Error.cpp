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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <memory>

namespace stellar {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::Transport: return "Transport";
        case ErrorCode::Http: return "Http";
        case ErrorCode::RateLimited: return "RateLimited";
        case ErrorCode::Auth: return "Auth";
        case ErrorCode::CircuitOpen: return "CircuitOpen";
        case ErrorCode::RetriesExhausted: return "RetriesExhausted";
        case ErrorCode::InvalidResponse: return "InvalidResponse";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

bool isRetriable(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::Transport:
        case ErrorCode::Http:
        case ErrorCode::RateLimited:
            return true;
        default:
            return false;
    }
}

Error::Error(const ErrorCode& c, std::string w, long s, std::string b)
    : code {c}, what {std::move(w)}, status {s}, body {std::move(b)}, attempts {0}, cause {} {}
Error::Error(const ErrorCode& c, std::string w)
    : code {c}, what {std::move(w)}, status {0}, body {}, attempts {0}, cause {} {}
Error::Error(const ErrorCode& c)
    : code {c}, what {toString(c)}, status {0}, body {}, attempts {0}, cause {} {}

std::string Error::describe() const {
    std::string out = toString(code) + ": " + what;
    if (status != 0) {
        out += " (status " + std::to_string(status) + ")";
    }
    if (cause) {
        out += " <- " + cause->describe();
    }
    return out;
}

Error retriesExhausted(int attempts, const Error& lastCause) {
    Error e {ErrorCode::RetriesExhausted,
             "Request failed after " + std::to_string(attempts) + " attempts: " + lastCause.what,
             lastCause.status,
             lastCause.body};
    e.attempts = attempts;
    e.cause = std::make_shared<const Error>(lastCause);
    return e;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << error.describe();
    return os;
}

ApiException::ApiException(Error e)
    : std::runtime_error {e.describe()}, err {std::move(e)} {}

const Error& ApiException::error() const noexcept {
    return err;
}

} // namespace stellar
