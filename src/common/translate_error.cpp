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
#include "textra/common/translate_error.hpp"

namespace textra {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::CONFIGURATION:
        return "ConfigurationError";
    case ErrorKind::AUTHENTICATION:
        return "AuthenticationError";
    case ErrorKind::NETWORK:
        return "NetworkError";
    case ErrorKind::REMOTE_API:
        return "RemoteAPIError";
    case ErrorKind::UNEXPECTED:
        return "UnexpectedError";
    }
    return "UnknownError";
}

std::string TranslationError::to_string() const {
    if (m_cause.empty()) { return fmt::format("{}: {}", textra::to_string(m_kind), m_message); }
    return fmt::format("{}: {} [cause: {}]", textra::to_string(m_kind), m_message, m_cause);
}

} // namespace textra
