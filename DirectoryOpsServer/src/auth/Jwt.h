#pragma once

#include <cstdint>
#include <string>
#include <optional>

namespace auth {

// sub is the operator's principal id as issued by the chat gateway.
struct Claims {
    std::string sub;
    std::string name;
    int64_t iat = 0;
    int64_t exp = 0;
};

std::string create_jwt(const Claims& c, const std::string& secret);

// HS256 only. Expired tokens and tokens issued more than a minute ahead are rejected.
std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret);

// Token from an "Authorization: Bearer <token>" header value.
std::optional<std::string> bearer_token(const std::string& header_value);

}
