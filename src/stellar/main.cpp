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
#include <cstdlib>
#include <exception>
#include <string>
#include <spdlog/spdlog.h>
#include "client/ApiClient.hpp"
#include "client/AuthSession.hpp"
#include "client/BeastTransport.hpp"
#include "client/Config.hpp"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"

using stellar::ApiClient;
using stellar::AuthSession;
using stellar::BeastTransport;
using stellar::Config;
using stellar::RetryPolicy;
using stellar::ScopedSession;

namespace {

std::string env(const char* name, const std::string& fallback = {}) {
    const char* v = std::getenv(name);
    return v != nullptr ? std::string {v} : fallback;
}

} // namespace

int main(int /*argc*/, char** /*argv*/) {
    spdlog::set_level(env("STELLAR_DEBUG").empty() ? spdlog::level::info : spdlog::level::debug);
    const auto baseURL = env("STELLAR_BASE_URL", Config::defaultBaseURL);
    spdlog::info("Stellar client against {}", baseURL);

    const RetryPolicy policy {};
    const Config config {baseURL, policy};
    BeastTransport transport {config.requestTimeout};
    AuthSession session {config, transport};
    ApiClient client {session};

    auto health = client.checkHealth();
    if (!health.has_value()) {
        spdlog::error("Health check failed: {}", health.error().describe());
        return 1;
    }
    const auto& h = health.value();
    spdlog::info("API status: {}", h.is_object() ? h.value("status", std::string {"unknown"}) : std::string {"unknown"});

    const auto identifier = env("STELLAR_IDENTIFIER");
    const auto password = env("STELLAR_PASSWORD");
    if (identifier.empty() || password.empty()) {
        spdlog::info("STELLAR_IDENTIFIER / STELLAR_PASSWORD not set, skipping authenticated calls");
        return 0;
    }

    try {
        const ScopedSession scope {session, identifier, password};
        auto profile = client.getProfile();
        if (!profile.has_value()) {
            spdlog::error("Fetching profile failed: {}", profile.error().describe());
            return 1;
        }
        spdlog::info("Profile: {}", profile.value().dump(2));
    } catch (const stellar::ApiException& e) {
        spdlog::error("Login failed: {}", e.what());
        return 1;
    }
    spdlog::info("Logged out, authenticated: {}", session.isAuthenticated());
    return 0;
}
