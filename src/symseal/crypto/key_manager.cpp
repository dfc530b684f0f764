#include "key_manager.hpp"
#include "cipher.hpp"
#include "primitives.hpp"
#include "symseal/data/transport.hpp"
#include "symseal/log.hpp"

#include <algorithm>
#include <cctype>

namespace Symseal::Crypto {

    namespace {

        const std::string SALT_LABEL = "symseal/password-key/v1:";

        byte_vec salt_for(const std::string& cipher_spec) {
            std::string canonical = cipher_spec;
            std::transform(canonical.begin(), canonical.end(), canonical.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            std::string label = SALT_LABEL + canonical;
            byte_vec digest = sha256(byte_vec(label.begin(), label.end()));
            digest.resize(Constants::PBKDF2_SALT_LEN);
            return digest;
        }

    } // namespace

    KeyManager::KeyManager(const Config::Settings& settings) : settings_(settings) {}

    PrivateKey KeyManager::generate_key() const {
        Cipher data_cipher(settings_.data_cipher);
        return generate_random_bytes(data_cipher.key_length());
    }

    PrivateKey KeyManager::generate_key(size_t strength_bits) const {
        if (strength_bits == 0 || strength_bits % 8 != 0) {
            throw ConfigurationError("Key strength must be a positive multiple of 8 bits, got " +
                                     std::to_string(strength_bits) + ".");
        }
        return generate_random_bytes(strength_bits / 8);
    }

    PrivateKey KeyManager::derive_key_from_password(const std::string& password, const std::string& cipher_spec) const {
        if (password.empty()) {
            throw ConfigurationError("Password cannot be empty for key derivation.");
        }
        Cipher cipher(cipher_spec);
        return derive_key_pbkdf2(password, salt_for(cipher_spec), cipher.key_length());
    }

    PrivateKey KeyManager::get_or_create_cached_key(std::type_index type) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(type);
        if (it != cache_.end()) {
            return it->second;
        }
        PrivateKey key = generate_key();
        cache_.emplace(type, key);
        debug_log(std::string("Generated and cached a new private key for ") + type.name());
        return key;
    }

    void KeyManager::set_cached_key(std::type_index type, const PrivateKey& key) {
        if (key.empty()) {
            throw ConfigurationError("Cannot assign an empty private key.");
        }
        std::lock_guard<std::mutex> lock(cache_mutex_);
        PrivateKey& slot = cache_[type];
        secure_zero_memory(slot);
        slot = key;
    }

    bool KeyManager::has_cached_key(std::type_index type) const {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        return cache_.count(type) != 0;
    }

    std::string KeyManager::encode_key(const PrivateKey& key) {
        return Data::encode_transport(key);
    }

    PrivateKey KeyManager::decode_key(const std::string& text) {
        PrivateKey key = Data::decode_transport(text);
        if (key.empty()) {
            throw FormatError("Encoded private key is empty.");
        }
        return key;
    }

} // namespace Symseal::Crypto
