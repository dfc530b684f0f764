#ifndef SYMSEAL_CRYPTO_KEY_MANAGER_HPP
#define SYMSEAL_CRYPTO_KEY_MANAGER_HPP

#include "symseal/types.hpp"              // For PrivateKey, Exceptions
#include "symseal/config/settings.hpp"
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>

namespace Symseal::Crypto {

    /**
     * @brief Produces, derives and caches symmetric keys.
     *
     * The cache holds at most one key per type identity. get_or_create_cached_key() holds a
     * mutex across the lookup and the generation, so concurrent first access from several
     * threads settles on a single key.
     */
    class KeyManager {
    public:
        explicit KeyManager(const Config::Settings& settings);

        KeyManager(const KeyManager&) = delete;
        KeyManager& operator=(const KeyManager&) = delete;

        /** @brief Random key sized for the configured data cipher. */
        PrivateKey generate_key() const;

        /**
         * @brief Random key of strength_bits / 8 bytes.
         * @throws ConfigurationError unless strength_bits is a positive multiple of 8.
         */
        PrivateKey generate_key(size_t strength_bits) const;

        /**
         * @brief Deterministically derives a key for cipher_spec from a password.
         *
         * PBKDF2-HMAC-SHA256 with Constants::PBKDF2_ITERATIONS iterations. The salt is fixed per
         * cipher spec (the first 16 bytes of SHA-256 over a domain label and the upper-cased
         * spec), so equal (password, spec) pairs always give equal keys. The output length is
         * the spec's key length.
         *
         * @throws ConfigurationError if the password is empty or the spec does not resolve.
         */
        PrivateKey derive_key_from_password(const std::string& password, const std::string& cipher_spec) const;

        /** @brief Returns the key cached for type, generating and caching one if absent. */
        PrivateKey get_or_create_cached_key(std::type_index type);

        /**
         * @brief Replaces the key cached for type. Last write wins.
         * @throws ConfigurationError if key is empty.
         */
        void set_cached_key(std::type_index type, const PrivateKey& key);

        /** @brief True if a key is cached for type. */
        bool has_cached_key(std::type_index type) const;

        /** @brief Text form of a key (base64url), suitable for environment variables. */
        static std::string encode_key(const PrivateKey& key);

        /**
         * @brief Parses the text form produced by encode_key.
         * @throws FormatError if the text is not valid base64url or decodes to nothing.
         */
        static PrivateKey decode_key(const std::string& text);

    private:
        Config::Settings settings_;
        mutable std::mutex cache_mutex_;
        std::unordered_map<std::type_index, PrivateKey> cache_;
    };

} // namespace Symseal::Crypto

#endif // SYMSEAL_CRYPTO_KEY_MANAGER_HPP
