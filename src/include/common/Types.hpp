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
#ifndef STELLAR_TYPES_HPP
#define STELLAR_TYPES_HPP

#include <string>
#include <string_view>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace stellar {

using Json = nlohmann::json;

struct CaseInsensitiveLess {
    bool operator()(std::string_view a, std::string_view b) const noexcept;
    using is_transparent = void;
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpRequest {
    std::string method;
    std::string url;
    Headers headers;
    std::string body;
};

struct HttpResponse {
    long status = 0;
    Headers headers;
    std::string body;
};

// One logical call as seen by the executor. The path is appended to the base URL.
struct Request {
    std::string method;
    std::string path;
    std::optional<Json> payload;
    bool allowRefresh = true;

    Request(std::string m, std::string p);
    Request(std::string m, std::string p, Json body);
};

} // namespace stellar

#endif // STELLAR_TYPES_HPP
