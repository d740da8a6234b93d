#pragma once
#include <string>

#include "textra/common/translate_error.hpp"

namespace textra {

class TokenClient {
public:
    virtual ~TokenClient() = default;

    virtual Result< std::string > get_token() = 0;
};

} // namespace textra
