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
#ifndef STELLAR_CONFIG_H
#define STELLAR_CONFIG_H

#include <chrono>
#include <string>
#include "common/RetryPolicy.hpp"
#include "common/Types.hpp"

namespace stellar {

class Config {
public:
    static constexpr const char* defaultBaseURL = "http://localhost:3000/api/v1";

    explicit Config(const std::string& base = defaultBaseURL,
                    const RetryPolicy p = RetryPolicy {},
                    std::chrono::milliseconds timeout = std::chrono::seconds {10});
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    [[nodiscard]] std::string url(const std::string& path) const;
    const std::string baseURL;
    const RetryPolicy policy;
    const std::chrono::milliseconds requestTimeout;
    Headers defaultHeaders;
};

} // namespace stellar

#endif // STELLAR_CONFIG_H
