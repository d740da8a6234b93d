/*********************************************************************************
 * Modifications Copyright 2017-2019 eBay Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software distributed
 * under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied. See the License for the
 * specific language governing permissions and limitations under the License.
 *
 *********************************************************************************/
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "textra/auth/oauth_token_client.hpp"
#include "textra/logging/logging.h"
#include "common/http_utils.hpp"

TEXTRA_LOGGING_INIT(auth)

namespace textra {

/******************************** TokenCache *********************************/
std::optional< std::string > TokenCache::get(steady_time_point now) const {
    std::shared_lock< std::shared_mutex > lock(m_mtx);
    if (m_value.empty() || !(now < m_expires_at)) { return std::nullopt; }
    return m_value;
}

void TokenCache::store(std::string value, steady_time_point expires_at) {
    std::unique_lock< std::shared_mutex > lock(m_mtx);
    m_value = std::move(value);
    m_expires_at = expires_at;
}

void TokenCache::clear() {
    std::unique_lock< std::shared_mutex > lock(m_mtx);
    m_value.clear();
    m_expires_at = steady_time_point{};
}

bool TokenCache::empty() const {
    std::shared_lock< std::shared_mutex > lock(m_mtx);
    return m_value.empty();
}

steady_time_point TokenCache::expires_at() const {
    std::shared_lock< std::shared_mutex > lock(m_mtx);
    return m_expires_at;
}

/***************************** OAuthTokenClient ******************************/
static std::optional< std::chrono::seconds > parse_expires_in(const nlohmann::json& j) {
    using rep_t = std::chrono::seconds::rep;
    if (j.is_number_unsigned()) {
        const auto val = j.get< uint64_t >();
        if (val > static_cast< uint64_t >(std::numeric_limits< rep_t >::max())) { return std::chrono::seconds::max(); }
        return std::chrono::seconds{static_cast< rep_t >(val)};
    }
    if (j.is_number_integer()) { return std::chrono::seconds{j.get< int64_t >()}; }
    if (j.is_number_float()) {
        const auto val = j.get< double >();
        if (!std::isfinite(val)) { return std::nullopt; }
        // 2^63 is exactly representable, int64 max is not
        if (val >= static_cast< double >(std::numeric_limits< rep_t >::max())) { return std::chrono::seconds::max(); }
        if (val <= static_cast< double >(std::numeric_limits< rep_t >::min())) { return std::chrono::seconds::min(); }
        return std::chrono::seconds{static_cast< rep_t >(val)};
    }
    if (j.is_string()) {
        const auto& s = j.get_ref< const std::string& >();
        if (s.empty()) { return std::nullopt; }
        char* end{nullptr};
        // saturates at LLONG_MIN/LLONG_MAX on overflow
        const auto val = std::strtoll(s.c_str(), &end, 10);
        if (*end != '\0') { return std::nullopt; }
        return std::chrono::seconds{val};
    }
    return std::nullopt;
}

// Keeps fetch_start + expires_in inside the range of the steady clock
static std::chrono::seconds clamp_expires_in(std::chrono::seconds expires_in, steady_time_point fetch_start) {
    const auto headroom{std::chrono::duration_cast< std::chrono::seconds >(steady_time_point::max() - fetch_start)};
    return std::clamp(expires_in, std::chrono::seconds{0}, headroom);
}

// Renders the RFC 6749 error fields of a failed token response, if it has any
static std::string oauth_error_detail(const std::string& body) {
    const auto j = nlohmann::json::parse(body, nullptr, false /* allow_exceptions */);
    if (j.is_discarded() || !j.is_object() || !j.contains("error") || !j["error"].is_string()) { return ""; }

    auto detail = fmt::format(": {}", j["error"].get< std::string >());
    if (j.contains("error_description") && j["error_description"].is_string()) {
        detail += fmt::format(" ({})", j["error_description"].get< std::string >());
    }
    return detail;
}

OAuthTokenClient::OAuthTokenClient(OAuthCredentials creds, std::shared_ptr< TokenCache > cache, clock_fn_t clock,
                                   uint32_t timeout_ms) :
        m_creds{std::move(creds)},
        m_timeout_ms{timeout_ms},
        m_cache{cache ? std::move(cache) : std::make_shared< TokenCache >()},
        m_clock{std::move(clock)} {}

bool OAuthTokenClient::credentials_configured() const {
    return !(m_creds.api_key.empty() || m_creds.api_secret.empty() || m_creds.token_url.empty());
}

Result< std::string > OAuthTokenClient::get_token() {
    if (!credentials_configured()) {
        LOGERRORMOD(auth, "API Key, Secret, or Token URL is not configured.");
        return make_error(ErrorKind::CONFIGURATION, "API Key, Secret, or Token URL must be configured");
    }

    if (auto token = m_cache->get(m_clock()); token) {
        LOGDEBUGMOD(auth, "Using cached access token");
        return std::move(*token);
    }

    // Not a frequent code path, occurs for the first time or when token expires
    std::unique_lock< std::mutex > lock(m_refresh_mtx);
    const auto fetch_start{m_clock()};
    if (auto token = m_cache->get(fetch_start); token) {
        // refreshed by a concurrent caller while we waited for the lock
        return std::move(*token);
    }

    LOGINFOMOD(auth, "Cached token expired or not found. Fetching new token from {}", m_creds.token_url);
    cpr::Response resp;
    try {
        resp = request_client_credentials();
    } catch (const std::exception& e) { return fetch_failed(e.what()); }

    return handle_token_response(resp, fetch_start);
}

cpr::Response OAuthTokenClient::request_client_credentials() {
    form_fields_t fields;
    fields.emplace_back("grant_type", "client_credentials");
    fields.emplace_back("client_id", m_creds.api_key);
    fields.emplace_back("client_secret", m_creds.api_secret);
    return post_form(m_creds.token_url, fields, m_timeout_ms);
}

Result< std::string > OAuthTokenClient::handle_token_response(const cpr::Response& resp,
                                                              steady_time_point fetch_start) {
    if (resp.error) { return fetch_failed(resp.error.message); }
    if (!is_http_success(resp)) {
        return fetch_failed(
            fmt::format("token endpoint returned status {}{}", resp.status_code, oauth_error_detail(resp.text)));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(resp.text);
    } catch (const nlohmann::json::exception& e) {
        return fetch_failed(fmt::format("malformed token response: {}", e.what()));
    }
    if (!body.is_object()) { return fetch_failed("malformed token response: not a JSON object"); }

    std::string access_token;
    if (auto it = body.find("access_token"); (it != body.end()) && it->is_string()) {
        access_token = it->get< std::string >();
    }
    if (access_token.empty()) {
        LOGERRORMOD(auth, "Failed to retrieve access token from response.");
        return fetch_failed("Failed to retrieve access token from response");
    }

    auto expires_in{default_expires_in};
    if (auto it = body.find("expires_in"); (it != body.end()) && !it->is_null()) {
        const auto parsed = parse_expires_in(*it);
        if (!parsed) { return fetch_failed(fmt::format("invalid expires_in value {}", it->dump())); }
        expires_in = clamp_expires_in(*parsed, fetch_start);
    }

    m_cache->store(access_token, fetch_start + expires_in - expiry_margin);
    LOGINFOMOD(auth, "Successfully obtained new access token, usable for {}s", (expires_in - expiry_margin).count());
    return access_token;
}

Result< std::string > OAuthTokenClient::fetch_failed(std::string cause) {
    m_cache->clear();
    LOGERRORMOD(auth, "Error fetching access token: {}", cause);
    auto msg = fmt::format("Failed to fetch access token: {}", cause);
    return make_error(ErrorKind::AUTHENTICATION, std::move(msg), std::move(cause));
}

} // namespace textra
