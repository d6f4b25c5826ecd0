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
#ifndef STELLAR_CLOCK_HPP
#define STELLAR_CLOCK_HPP

#include <chrono>
#include <functional>
#include <thread>

namespace stellar {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

// Time source and sleeper used by the executor; tests substitute both.
struct Clock {
    std::function<TimePoint()> now = SteadyClock::now;
    std::function<void(std::chrono::milliseconds)> sleep = [](std::chrono::milliseconds d) {
        std::this_thread::sleep_for(d);
    };
};

} // namespace stellar

#endif // STELLAR_CLOCK_HPP
