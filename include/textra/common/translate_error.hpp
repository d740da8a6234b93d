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

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include <folly/Expected.h>
#include <folly/futures/Future.h>
#include <fmt/format.h>

namespace textra {

enum class ErrorKind : uint8_t { CONFIGURATION, AUTHENTICATION, NETWORK, REMOTE_API, UNEXPECTED };

std::string_view to_string(ErrorKind kind);
inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) { return os << to_string(kind); }

/**
 * The single error type surfaced by the token manager and the translation client.
 *
 * message - human readable text meant for logs; already embeds the cause where the taxonomy asks for it.
 * cause   - text of the underlying failure (transport error, parser error, ...), empty if there is none.
 */
class TranslationError {
public:
    TranslationError(ErrorKind kind, std::string message, std::string cause = "") :
            m_kind{kind}, m_message{std::move(message)}, m_cause{std::move(cause)} {}

    ErrorKind kind() const { return m_kind; }
    const std::string& message() const { return m_message; }
    const std::string& cause() const { return m_cause; }
    bool has_cause() const { return !m_cause.empty(); }

    std::string to_string() const;

private:
    ErrorKind m_kind;
    std::string m_message;
    std::string m_cause;
};

inline std::ostream& operator<<(std::ostream& os, const TranslationError& err) { return os << err.to_string(); }

template < typename T >
using Result = folly::Expected< T, TranslationError >;

template < typename T >
using AsyncResult = folly::SemiFuture< Result< T > >;

inline folly::Unexpected< TranslationError > make_error(ErrorKind kind, std::string message,
                                                        std::string cause = "") {
    return folly::makeUnexpected(TranslationError{kind, std::move(message), std::move(cause)});
}

} // namespace textra
