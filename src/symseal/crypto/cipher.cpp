#include "cipher.hpp"
#include "primitives.hpp" // For secure_zero_memory, random bytes, HMAC
#include "symseal/types.hpp"

// OpenSSL headers
#include <openssl/evp.h>
#include <openssl/err.h>

#include <limits>

namespace Symseal::Crypto {

    namespace {

        const byte_vec MAC_KEY_LABEL = {'s', 'y', 'm', 's', 'e', 'a', 'l', ' ',
                                        'm', 'a', 'c', ' ', 'k', 'e', 'y'};

        bool supported_mode(int mode, bool aead) {
            switch (mode) {
                case EVP_CIPH_CBC_MODE:
                case EVP_CIPH_CFB_MODE:
                case EVP_CIPH_OFB_MODE:
                case EVP_CIPH_CTR_MODE:
                    return !aead;
                case EVP_CIPH_GCM_MODE:
                    return aead;
                case EVP_CIPH_STREAM_CIPHER:
                    return true; // ChaCha20 (HMAC) and ChaCha20-Poly1305 (AEAD)
                default:
                    return false;
            }
        }

        int checked_int(size_t len) {
            if (len > static_cast<size_t>(std::numeric_limits<int>::max())) {
                throw InternalError("Cipher: buffer too large (" + std::to_string(len) + " bytes).");
            }
            return static_cast<int>(len);
        }

    } // namespace

    // --- EvpCipherCtxDeleter Implementation ---
    void EvpCipherCtxDeleter::operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }

    Cipher::Cipher(const std::string& spec) : name_(spec) {
        if (spec.empty()) {
            throw ConfigurationError("Cipher identifier is empty.");
        }

        EVP_CIPHER* fetched = EVP_CIPHER_fetch(nullptr, spec.c_str(), nullptr);
        if (!fetched) {
            ERR_clear_error();
            throw ConfigurationError("Unsupported cipher '" + spec + "'.");
        }
        cipher_.reset(fetched, [](EVP_CIPHER* c) { EVP_CIPHER_free(c); });

        aead_ = (EVP_CIPHER_get_flags(fetched) & EVP_CIPH_FLAG_AEAD_CIPHER) != 0;
        int mode = EVP_CIPHER_get_mode(fetched);
        key_length_ = static_cast<size_t>(EVP_CIPHER_get_key_length(fetched));
        iv_length_ = static_cast<size_t>(EVP_CIPHER_get_iv_length(fetched));
        block_size_ = static_cast<size_t>(EVP_CIPHER_get_block_size(fetched));

        if (!supported_mode(mode, aead_)) {
            throw ConfigurationError("Cipher '" + spec + "' uses a mode that is not supported.");
        }
        // CTS variants report CBC mode but neither pad nor accept short input.
        if ((EVP_CIPHER_get_flags(fetched) & EVP_CIPH_FLAG_CTS) != 0) {
            throw ConfigurationError("Cipher '" + spec + "' uses ciphertext stealing, which is not supported.");
        }
        if (iv_length_ == 0) {
            throw ConfigurationError("Cipher '" + spec + "' does not take an IV.");
        }
        if (key_length_ == 0) {
            throw ConfigurationError("Cipher '" + spec + "' reports a zero key length.");
        }
    }

    size_t Cipher::tag_length() const {
        return aead_ ? Constants::AEAD_TAG_LEN : Constants::HMAC_TAG_LEN;
    }

    EvpCipherCtxPtr Cipher::initialize_context(const byte_vec& key, const byte_vec& iv, bool encrypt) const {
        EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) throw InternalError("Cipher: Failed to create EVP_CIPHER_CTX.");

        // 1. Initialize cipher type
        int init_result = encrypt
                          ? EVP_EncryptInit_ex(ctx.get(), cipher_.get(), nullptr, nullptr, nullptr)
                          : EVP_DecryptInit_ex(ctx.get(), cipher_.get(), nullptr, nullptr, nullptr);
        if (init_result != 1) {
            throw InternalError("Cipher " + name_ + ": Failed to initialize context. Error: " + last_openssl_error());
        }

        // 2. Set IV length (AEAD specific)
        if (aead_ && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, checked_int(iv.size()), nullptr) != 1) {
            throw InternalError("Cipher " + name_ + ": Failed to set IV length. Error: " + last_openssl_error());
        }

        // 3. Set key and IV
        init_result = encrypt
                      ? EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data())
                      : EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data());
        if (init_result != 1) {
            throw InternalError("Cipher " + name_ + ": Failed to set key and IV. Error: " + last_openssl_error());
        }

        return ctx; // Transfer ownership via unique_ptr
    }

    byte_vec Cipher::compute_mac(const byte_vec& key, const byte_vec& aad,
                                 const byte_vec& iv, const byte_vec& ciphertext) const {
        byte_vec mac_key = hmac_sha256(key, MAC_KEY_LABEL);

        byte_vec mac_input;
        mac_input.reserve(aad.size() + iv.size() + ciphertext.size());
        mac_input.insert(mac_input.end(), aad.begin(), aad.end());
        mac_input.insert(mac_input.end(), iv.begin(), iv.end());
        mac_input.insert(mac_input.end(), ciphertext.begin(), ciphertext.end());

        byte_vec mac = hmac_sha256(mac_key, mac_input);
        secure_zero_memory(mac_key);
        return mac;
    }

    CipherParts Cipher::encrypt(const byte_vec& plaintext, const byte_vec& key, const byte_vec& aad) const {
        if (key.size() != key_length_) {
            throw ConfigurationError("Cipher " + name_ + " requires a " + std::to_string(key_length_) +
                                     "-byte key, got " + std::to_string(key.size()) + " bytes.");
        }

        CipherParts parts;
        parts.iv = generate_random_bytes(iv_length_);

        EvpCipherCtxPtr ctx = initialize_context(key, parts.iv, true);
        int out_len = 0;

        // Provide AAD (AEAD only; other modes bind it through the MAC)
        if (aead_ && !aad.empty()) {
            if (EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), checked_int(aad.size())) != 1) {
                throw InternalError("Cipher " + name_ + ": Failed to provide AAD. Error: " + last_openssl_error());
            }
        }

        // Output buffer needs space for input + one block overhead
        parts.ciphertext.resize(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
        size_t total = 0;
        if (!plaintext.empty()) {
            if (EVP_EncryptUpdate(ctx.get(), parts.ciphertext.data(), &out_len,
                                  plaintext.data(), checked_int(plaintext.size())) != 1) {
                throw InternalError("Cipher " + name_ + ": EVP_EncryptUpdate failed. Error: " + last_openssl_error());
            }
            total = static_cast<size_t>(out_len);
        }

        if (EVP_EncryptFinal_ex(ctx.get(), parts.ciphertext.data() + total, &out_len) != 1) {
            throw InternalError("Cipher " + name_ + ": EVP_EncryptFinal_ex failed. Error: " + last_openssl_error());
        }
        total += static_cast<size_t>(out_len);
        parts.ciphertext.resize(total);

        if (aead_) {
            parts.tag.resize(Constants::AEAD_TAG_LEN);
            if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG,
                                    static_cast<int>(Constants::AEAD_TAG_LEN), parts.tag.data()) != 1) {
                throw InternalError("Cipher " + name_ + ": Failed to get authentication tag. Error: " + last_openssl_error());
            }
        } else {
            parts.tag = compute_mac(key, aad, parts.iv, parts.ciphertext);
        }
        return parts;
    }

    byte_vec Cipher::decrypt(const CipherParts& parts, const byte_vec& key, const byte_vec& aad) const {
        if (key.size() != key_length_ || parts.iv.size() != iv_length_ || parts.tag.size() != tag_length()) {
            throw DecryptionError();
        }

        if (!aead_) {
            // Encrypt-then-MAC: reject before touching the ciphertext.
            byte_vec expected = compute_mac(key, aad, parts.iv, parts.ciphertext);
            bool match = constant_time_compare(expected.data(), parts.tag.data(), expected.size());
            secure_zero_memory(expected);
            if (!match) throw DecryptionError();
        }

        // Block modes always emit at least one padded block.
        if (EVP_CIPHER_get_mode(cipher_.get()) == EVP_CIPH_CBC_MODE &&
            (parts.ciphertext.empty() || parts.ciphertext.size() % block_size_ != 0)) {
            throw DecryptionError();
        }

        EvpCipherCtxPtr ctx = initialize_context(key, parts.iv, false);
        int out_len = 0;

        if (aead_ && !aad.empty()) {
            if (EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), checked_int(aad.size())) != 1) {
                throw DecryptionError();
            }
        }

        byte_vec plaintext(parts.ciphertext.size() + EVP_MAX_BLOCK_LENGTH);
        size_t total = 0;
        if (!parts.ciphertext.empty()) {
            if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len,
                                  parts.ciphertext.data(), checked_int(parts.ciphertext.size())) != 1) {
                secure_zero_memory(plaintext);
                throw DecryptionError();
            }
            total = static_cast<size_t>(out_len);
        }

        if (aead_) {
            // Need a non-const pointer for the OpenSSL API call. Create a temporary copy.
            byte_vec mutable_tag = parts.tag;
            int set_result = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG,
                                                 static_cast<int>(mutable_tag.size()), mutable_tag.data());
            secure_zero_memory(mutable_tag);
            if (set_result != 1) {
                secure_zero_memory(plaintext);
                throw DecryptionError();
            }
        }

        // EVP_DecryptFinal_ex verifies padding, or the tag for AEAD ciphers.
        if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &out_len) != 1) {
            ERR_clear_error();
            secure_zero_memory(plaintext);
            throw DecryptionError();
        }
        total += static_cast<size_t>(out_len);
        plaintext.resize(total);
        return plaintext;
    }

} // namespace Symseal::Crypto
