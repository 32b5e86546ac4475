#pragma once

#include <cstddef>
#include <string>

namespace bk::crypto {

constexpr std::size_t SUPERUSER_PASSWORD_LENGTH = 20;

// `length` random bytes from libsodium, base64 encoded and cut back to `length` characters.
std::string generate_secure_password(std::size_t length = SUPERUSER_PASSWORD_LENGTH);

} // namespace bk::crypto
