#include "crypto/PasswordGenerator.hpp"

#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace bk::crypto {

std::string generate_secure_password(const std::size_t length) {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
    if (length == 0) return {};

    std::vector<unsigned char> raw(length);
    randombytes_buf(raw.data(), raw.size());

    std::string encoded(sodium_base64_ENCODED_LEN(raw.size(), sodium_base64_VARIANT_ORIGINAL), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), raw.data(), raw.size(), sodium_base64_VARIANT_ORIGINAL);
    sodium_memzero(raw.data(), raw.size());

    encoded.resize(length);
    return encoded;
}

}
