#ifndef SYMSEAL_CRYPTO_PRIMITIVES_HPP
#define SYMSEAL_CRYPTO_PRIMITIVES_HPP

#include "symseal/types.hpp" // Symseal::byte_vec etc.
#include <string>

namespace Symseal::Crypto {

    // Securely clear memory
    void secure_zero_memory(void* ptr, size_t len);
    void secure_zero_memory(byte_vec& vec);
    void secure_zero_memory(std::string& str);

    // Text of the most recent OpenSSL error on this thread
    std::string last_openssl_error();

    // Generate cryptographically secure random bytes
    byte_vec generate_random_bytes(size_t len);

    // Derive key_len bytes using PBKDF2-HMAC-SHA256
    byte_vec derive_key_pbkdf2(const std::string& password, const byte_vec& salt, size_t key_len);

    // SHA-256 digest
    byte_vec sha256(const byte_vec& data);

    // HMAC-SHA256 of data under key
    byte_vec hmac_sha256(const byte_vec& key, const byte_vec& data);

    // Constant time comparison
    bool constant_time_compare(const byte* a, const byte* b, size_t len);

} // namespace Symseal::Crypto

#endif // SYMSEAL_CRYPTO_PRIMITIVES_HPP
