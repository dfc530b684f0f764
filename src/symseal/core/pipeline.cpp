#include "pipeline.hpp"
#include "symseal/types.hpp"               // Constants, Exceptions
#include "symseal/crypto/cipher.hpp"       // Cipher engine
#include "symseal/crypto/primitives.hpp"   // secure_zero_memory
#include "symseal/data/compressor.hpp"
#include "symseal/data/serializer.hpp"
#include "symseal/data/transport.hpp"
#include "symseal/io/binary_stream.hpp"
#include "symseal/io/token.hpp"
#include "symseal/log.hpp"

#include <utility>

namespace Symseal::Core {

    namespace {

        // Wipes a sensitive buffer on every exit path.
        class WipeOnExit {
        public:
            explicit WipeOnExit(byte_vec& buffer) : buffer_(buffer) {}
            ~WipeOnExit() { Crypto::secure_zero_memory(buffer_); }
            WipeOnExit(const WipeOnExit&) = delete;
            WipeOnExit& operator=(const WipeOnExit&) = delete;
        private:
            byte_vec& buffer_;
        };

        struct ParsedToken {
            IO::Token token;
            Crypto::Cipher cipher;
        };

        Crypto::Cipher resolve_token_cipher(const std::string& cipher_id) {
            try {
                return Crypto::Cipher(cipher_id);
            } catch (const ConfigurationError&) {
                throw FormatError("Token names an unsupported cipher '" + cipher_id + "'.");
            }
        }

        ParsedToken parse_token(const std::string& text) {
            byte_vec raw = Data::decode_transport(text);
            IO::ByteReader in(raw);

            IO::Token token;
            token.read_header(in);
            Crypto::Cipher cipher = resolve_token_cipher(token.cipher_id);
            token.read_body(in, cipher.iv_length(), cipher.tag_length());

            return ParsedToken{std::move(token), std::move(cipher)};
        }

        Data::Value open_token(const ParsedToken& parsed, const PrivateKey& key) {
            byte_vec aad = parsed.token.generate_aad();
            Crypto::CipherParts parts{parsed.token.iv, parsed.token.ciphertext, parsed.token.tag};

            byte_vec envelope = parsed.cipher.decrypt(parts, key, aad);
            WipeOnExit wipe_envelope(envelope);

            if (parsed.token.is_compressed()) {
                byte_vec inflated = Data::decompress(envelope);
                Crypto::secure_zero_memory(envelope);
                envelope = std::move(inflated);
            }
            return Data::deserialize(envelope);
        }

        void require_password(const std::string& password) {
            if (password.empty()) {
                throw ConfigurationError("Password cannot be empty.");
            }
        }

    } // namespace

    Pipeline::Pipeline(const Config::Settings& settings)
            : settings_(settings), key_manager_(settings) {
        settings_.validate();
    }

    std::string Pipeline::encrypt_payload(const Data::Value& value, const PrivateKey& key,
                                          const std::string& cipher_spec) const {
        // Resolve first so an unknown cipher fails before any key material is used.
        Crypto::Cipher cipher(cipher_spec);

        byte_vec envelope = Data::serialize(value);
        WipeOnExit wipe_envelope(envelope);

        const bool compress = settings_.compression_enabled;
        if (compress) {
            byte_vec deflated = Data::compress(envelope, settings_.compression_level);
            Crypto::secure_zero_memory(envelope);
            envelope = std::move(deflated);
        }

        IO::Token token;
        token.initialize_for_encryption(cipher.name(), compress);

        Crypto::CipherParts parts = cipher.encrypt(envelope, key, token.generate_aad());
        token.iv = std::move(parts.iv);
        token.ciphertext = std::move(parts.ciphertext);
        token.tag = std::move(parts.tag);

        return Data::encode_transport(token.write());
    }

    std::string Pipeline::encrypt_with_key(const Data::Value& value, const PrivateKey& key) const {
        return encrypt_payload(value, key, settings_.data_cipher);
    }

    Data::Value Pipeline::decrypt_with_key(const std::string& token, const PrivateKey& key) const {
        ParsedToken parsed = parse_token(token);
        return open_token(parsed, key);
    }

    std::string Pipeline::encrypt_with_password(const Data::Value& value, const std::string& password) const {
        require_password(password);
        PrivateKey key = key_manager_.derive_key_from_password(password, settings_.password_cipher);
        WipeOnExit wipe_key(key);
        return encrypt_payload(value, key, settings_.password_cipher);
    }

    Data::Value Pipeline::decrypt_with_password(const std::string& token, const std::string& password) const {
        require_password(password);
        ParsedToken parsed = parse_token(token);
        PrivateKey key = key_manager_.derive_key_from_password(password, parsed.token.cipher_id);
        WipeOnExit wipe_key(key);
        return open_token(parsed, key);
    }

    std::string Pipeline::encrypt_key_with_password(const PrivateKey& key, const std::string& password) const {
        if (key.empty()) {
            throw ConfigurationError("Cannot protect an empty private key.");
        }
        require_password(password);
        PrivateKey wrapping_key = key_manager_.derive_key_from_password(password, settings_.private_key_cipher);
        WipeOnExit wipe_key(wrapping_key);
        return encrypt_payload(Data::Value(key), wrapping_key, settings_.private_key_cipher);
    }

    PrivateKey Pipeline::decrypt_key_with_password(const std::string& token, const std::string& password) const {
        Data::Value value = decrypt_with_password(token, password);
        PrivateKey key = value.as_bytes();
        if (key.empty()) {
            throw SerializationError("Protected private key is empty.");
        }
        return key;
    }

    Pipeline& default_pipeline() {
        static Pipeline instance(Config::Configuration::settings());
        return instance;
    }

} // namespace Symseal::Core
