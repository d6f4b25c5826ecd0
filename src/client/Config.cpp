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
#include "client/Config.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include "common/RetryPolicy.hpp"
#include "common/Util.hpp"

namespace stellar {

Config::Config(const std::string& base, const RetryPolicy p, std::chrono::milliseconds timeout)
    : baseURL {trimTrailingSlashes(base)},
      policy {p},
      requestTimeout {timeout},
      defaultHeaders {
          {"Content-Type", "application/json"},
          {"Accept", "application/json"}
      } {
    if (base.rfind("http://", 0) != 0 && base.rfind("https://", 0) != 0) {
        throw std::invalid_argument("Config: base URL must start with http:// or https://");
    }
    if (baseURL.find("://") == std::string::npos || baseURL.ends_with("://")) {
        throw std::invalid_argument("Config: base URL has no host");
    }
    if (timeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Config: request timeout must be > zero");
    }
}

std::string Config::url(const std::string& path) const {
    return joinUrl(baseURL, path);
}

} // namespace stellar
