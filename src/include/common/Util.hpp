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
#ifndef STELLAR_UTIL_H
#define STELLAR_UTIL_H

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stellar {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// RFC 3986 percent-encoding; unreserved characters pass through.
std::string percentEncode(std::string_view s);

// "?a=1&b=2", empty for no parameters.
std::string buildQuery(const QueryParams& params);

// Joins without doubling or dropping the slash between the two parts.
std::string joinUrl(std::string_view base, std::string_view path);

std::string trimTrailingSlashes(std::string s);

} // namespace stellar

#endif // STELLAR_UTIL_H
