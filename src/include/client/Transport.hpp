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
#ifndef STELLAR_TRANSPORT_H
#define STELLAR_TRANSPORT_H

#include <expected>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace stellar {

// One network round trip. Implementations must tolerate concurrent send() calls
// and report every network-level failure as ErrorCode::Transport.
class Transport {
public:
    virtual ~Transport() = default;
    virtual std::expected<HttpResponse, Error> send(const HttpRequest& request) = 0;
};

} // namespace stellar

#endif // STELLAR_TRANSPORT_H
