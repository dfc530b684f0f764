#ifndef SYMSEAL_CORE_PIPELINE_HPP
#define SYMSEAL_CORE_PIPELINE_HPP

#include "symseal/types.hpp"              // For byte_vec, PrivateKey, Exceptions
#include "symseal/config/settings.hpp"
#include "symseal/crypto/key_manager.hpp"
#include "symseal/data/value.hpp"
#include <string>

namespace Symseal::Core {

    /**
     * @brief Orchestrates serialization, compression, encryption and transport encoding.
     *
     * Encode: serialize -> compress (if enabled) -> encrypt (token header as AAD) -> token -> base64url.
     * Decode runs the mirror path and takes cipher and compression from the token itself, so a
     * token stays readable under settings that differ from the ones it was written with.
     *
     * Every operation either returns a complete result or throws; nothing partial escapes.
     */
    class Pipeline {
    public:
        /**
         * @param settings Snapshot of the settings to use; validated here.
         * @throws ConfigurationError if the settings are invalid.
         */
        explicit Pipeline(const Config::Settings& settings);

        Pipeline(const Pipeline&) = delete;
        Pipeline& operator=(const Pipeline&) = delete;

        const Config::Settings& settings() const { return settings_; }
        Crypto::KeyManager& key_manager() { return key_manager_; }
        const Crypto::KeyManager& key_manager() const { return key_manager_; }

        /**
         * @brief Encrypts a value under a raw key with the data cipher.
         * @throws ConfigurationError if the key length does not fit the data cipher.
         * @throws SerializationError if the value cannot be serialized.
         */
        std::string encrypt_with_key(const Data::Value& value, const PrivateKey& key) const;

        /**
         * @brief Recovers a value from a token produced by encrypt_with_key.
         * @throws FormatError if the token text or layout is malformed.
         * @throws DecryptionError if the key is wrong or the token was altered.
         * @throws SerializationError if the decrypted payload is not a serialized value.
         */
        Data::Value decrypt_with_key(const std::string& token, const PrivateKey& key) const;

        /**
         * @brief Encrypts a value under a key derived from password for the password cipher.
         * @throws ConfigurationError if the password is empty.
         */
        std::string encrypt_with_password(const Data::Value& value, const std::string& password) const;

        /**
         * @brief Recovers a value from a token produced by encrypt_with_password.
         * The key is derived for the cipher named in the token.
         * @throws ConfigurationError if the password is empty.
         * @throws FormatError, DecryptionError, SerializationError as for decrypt_with_key.
         */
        Data::Value decrypt_with_password(const std::string& token, const std::string& password) const;

        /**
         * @brief Password-protects a private key using the private key cipher.
         * @throws ConfigurationError if the password or key is empty.
         */
        std::string encrypt_key_with_password(const PrivateKey& key, const std::string& password) const;

        /**
         * @brief Recovers a private key protected by encrypt_key_with_password.
         * @throws SerializationError if the token holds something other than a key.
         */
        PrivateKey decrypt_key_with_password(const std::string& token, const std::string& password) const;

    private:
        std::string encrypt_payload(const Data::Value& value, const PrivateKey& key,
                                    const std::string& cipher_spec) const;

        Config::Settings settings_;
        Crypto::KeyManager key_manager_;
    };

    /**
     * @brief Process-wide pipeline built from Config::Configuration::settings().
     * The first call freezes the global configuration.
     */
    Pipeline& default_pipeline();

} // namespace Symseal::Core

#endif // SYMSEAL_CORE_PIPELINE_HPP
