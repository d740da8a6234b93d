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
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#undef HTTP_OK // nameclash with cpr/cpr.h header
#include <cpr/cpr.h>

#include "textra/auth/token_client.hpp"

namespace textra {

using steady_time_point = std::chrono::steady_clock::time_point;
using clock_fn_t = std::function< steady_time_point() >;

inline steady_time_point steady_now() { return std::chrono::steady_clock::now(); }

struct OAuthCredentials {
    std::string api_key;
    std::string api_secret;
    std::string token_url;
};

/**
 * Holds one access token and the monotonic instant it stops being served.
 * Value and expiry are always written together under the lock.
 */
class TokenCache {
public:
    TokenCache() = default;
    TokenCache(const TokenCache&) = delete;
    TokenCache& operator=(const TokenCache&) = delete;

    // returns the token only if now < expires_at
    std::optional< std::string > get(steady_time_point now) const;
    void store(std::string value, steady_time_point expires_at);
    void clear();

    bool empty() const;
    steady_time_point expires_at() const;

private:
    mutable std::shared_mutex m_mtx;
    std::string m_value;
    steady_time_point m_expires_at{};
};

/**
 * OAuth2 client-credentials token manager.
 *
 * get_token() serves the cached token while it is valid and otherwise exchanges api_key/api_secret at token_url.
 * Concurrent misses are serialized, so a burst of callers on an empty cache causes a single exchange.
 */
class OAuthTokenClient : public TokenClient {
public:
    static constexpr std::chrono::seconds expiry_margin{60};
    static constexpr std::chrono::seconds default_expires_in{3600};
    static constexpr uint32_t default_timeout_ms{30000};

    explicit OAuthTokenClient(OAuthCredentials creds, std::shared_ptr< TokenCache > cache = nullptr,
                              clock_fn_t clock = steady_now, uint32_t timeout_ms = default_timeout_ms);
    virtual ~OAuthTokenClient() = default;

    Result< std::string > get_token() override;

    const std::shared_ptr< TokenCache >& cache() const { return m_cache; }
    const OAuthCredentials& credentials() const { return m_creds; }

protected:
    // Blocking POST of the client-credentials grant; no interpretation of the response
    virtual cpr::Response request_client_credentials();

    // Validates the exchange response and, on success, stores the token computed against fetch_start
    Result< std::string > handle_token_response(const cpr::Response& resp, steady_time_point fetch_start);

private:
    bool credentials_configured() const;
    Result< std::string > fetch_failed(std::string cause);

protected:
    const OAuthCredentials m_creds;
    const uint32_t m_timeout_ms;

private:
    std::shared_ptr< TokenCache > m_cache;
    clock_fn_t m_clock;
    std::mutex m_refresh_mtx;
};

} // namespace textra
