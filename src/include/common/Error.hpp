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
#ifndef STELLAR_COMMON_ERROR_HPP
#define STELLAR_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <memory>
#include <stdexcept>

namespace stellar {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    Transport = 2,
    Http = 3,
    RateLimited = 4,
    Auth = 5,
    CircuitOpen = 6,
    RetriesExhausted = 7,
    InvalidResponse = 8,
    Unknown = 128
};

// Transient failures the attempt loop may repeat.
bool isRetriable(const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    long status;
    std::string body;
    int attempts;
    std::shared_ptr<const Error> cause;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, long s, std::string b);
    explicit Error(const ErrorCode& c);

    [[nodiscard]] std::string describe() const;
};

Error retriesExhausted(int attempts, const Error& lastCause);

std::ostream& operator<<(std::ostream& os, const Error& error);

class ApiException : public std::runtime_error {
public:
    explicit ApiException(Error e);
    [[nodiscard]] const Error& error() const noexcept;
private:
    Error err;
};

} // namespace stellar

#endif // STELLAR_COMMON_ERROR_HPP
