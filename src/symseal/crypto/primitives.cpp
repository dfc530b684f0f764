#include "primitives.hpp"
#include "symseal/types.hpp" // Provides Symseal::Constants and Symseal exceptions

// OpenSSL headers
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/err.h>
#include <openssl/crypto.h> // For CRYPTO_memcmp, OPENSSL_cleanse

#include <limits>

namespace Symseal::Crypto {

    // --- Public Function Implementations ---

    void secure_zero_memory(void* ptr, size_t len) {
        if (ptr && len > 0) {
            OPENSSL_cleanse(ptr, len);
        }
    }

    void secure_zero_memory(byte_vec& vec) {
        if (!vec.empty()) {
            OPENSSL_cleanse(vec.data(), vec.size());
        }
        vec.clear();
        vec.shrink_to_fit(); // Attempt to release memory
    }

    void secure_zero_memory(std::string& str) {
        if (!str.empty()) {
            OPENSSL_cleanse(&str[0], str.size());
        }
        str.clear();
        str.shrink_to_fit();
    }

    std::string last_openssl_error() {
        unsigned long err_code = ERR_get_error();
        if (err_code == 0) return "no OpenSSL error queued";
        return std::string(ERR_error_string(err_code, nullptr));
    }

    byte_vec generate_random_bytes(size_t len) {
        if (len == 0) return {}; // Handle edge case
        byte_vec bytes(len);
        if (RAND_bytes(bytes.data(), static_cast<int>(len)) != 1) {
            throw InternalError("Failed to generate random bytes (OpenSSL RAND_bytes failed). Error: " +
                                last_openssl_error());
        }
        return bytes;
    }

    byte_vec derive_key_pbkdf2(const std::string& password, const byte_vec& salt, size_t key_len) {
        using namespace Symseal::Constants;

        if (password.empty()) {
            throw ConfigurationError("Password cannot be empty for key derivation.");
        }
        if (key_len == 0) {
            throw InternalError("PBKDF2 internal error: requested key length is zero.");
        }

        byte_vec key(key_len);
        int result = PKCS5_PBKDF2_HMAC(
                password.c_str(),
                static_cast<int>(password.length()),
                salt.data(),
                static_cast<int>(salt.size()),
                static_cast<int>(PBKDF2_ITERATIONS),
                EVP_sha256(), // Use SHA-256
                static_cast<int>(key.size()),
                key.data()
        );

        if (result != 1) {
            throw InternalError("Failed to derive key using PBKDF2 (PKCS5_PBKDF2_HMAC failed). Error: " +
                                last_openssl_error());
        }
        return key;
    }

    byte_vec sha256(const byte_vec& data) {
        byte_vec digest(EVP_MAX_MD_SIZE);
        unsigned int digest_len = 0;
        if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
            throw InternalError("SHA-256 digest failed (EVP_Digest). Error: " + last_openssl_error());
        }
        digest.resize(digest_len);
        return digest;
    }

    byte_vec hmac_sha256(const byte_vec& key, const byte_vec& data) {
        if (key.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            throw InternalError("HMAC key too large.");
        }
        byte_vec mac(EVP_MAX_MD_SIZE);
        unsigned int mac_len = 0;
        if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                  data.data(), data.size(), mac.data(), &mac_len)) {
            throw InternalError("HMAC-SHA256 failed. Error: " + last_openssl_error());
        }
        mac.resize(mac_len);
        return mac;
    }

    bool constant_time_compare(const byte* a, const byte* b, size_t len) {
        if (!a || !b || len == 0) {
            return false;
        }
        return CRYPTO_memcmp(a, b, len) == 0;
    }

} // namespace Symseal::Crypto
