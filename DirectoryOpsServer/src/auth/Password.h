#pragma once

#include <cstddef>
#include <string>

namespace auth {

// Active Directory rejects longer passwords.
constexpr std::size_t kMaxPasswordLength = 256;

// Random password with at least one upper, lower, digit and one of "!@#$%^&*".
// Throws std::invalid_argument for length outside [8, 256] and std::runtime_error if the CSPRNG fails.
std::string generate_password(std::size_t length = 12);

// Lowercase hex of `bytes` random bytes.
std::string random_token(std::size_t bytes = 12);

}
