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
#include <string>
#include <vector>

#undef HTTP_OK // nameclash with cpr/cpr.h header
#include <cpr/cpr.h>

namespace textra {

using form_fields_t = std::vector< cpr::Pair >;

// Blocking application/x-www-form-urlencoded POST. Transport failures are reported through resp.error.
[[maybe_unused]] static cpr::Response post_form(const std::string& url, const form_fields_t& fields,
                                                uint32_t timeout_ms) {
    cpr::Session session;
    session.SetUrl(cpr::Url{url});
    session.SetPayload(cpr::Payload(fields.begin(), fields.end()));
    session.SetHeader(cpr::Header{{"Accept", "application/json"}});
    session.SetTimeout(std::chrono::milliseconds{timeout_ms});
    return session.Post();
}

[[maybe_unused]] static bool is_http_success(const cpr::Response& resp) {
    return (resp.status_code >= 200) && (resp.status_code < 300);
}

} // namespace textra
