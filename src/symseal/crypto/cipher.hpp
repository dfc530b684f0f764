#ifndef SYMSEAL_CRYPTO_CIPHER_HPP
#define SYMSEAL_CRYPTO_CIPHER_HPP

#include "symseal/types.hpp" // For Symseal::byte_vec, Exceptions
#include <memory>            // For std::unique_ptr, std::shared_ptr
#include <string>

// Forward declare OpenSSL types from global namespace
typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;
typedef struct evp_cipher_st EVP_CIPHER;

namespace Symseal::Crypto {

    /**
     * @brief RAII wrapper for OpenSSL's EVP_CIPHER_CTX.
     * Ensures the context is freed automatically.
     */
    struct EvpCipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const;
    };
    using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

    /**
     * @brief The three pieces an encryption produces and a decryption consumes.
     */
    struct CipherParts {
        byte_vec iv;
        byte_vec ciphertext;
        byte_vec tag;
    };

    /**
     * @brief A symmetric cipher resolved from an OpenSSL cipher name such as "AES-256-CBC".
     *
     * Supported: CBC, CFB, OFB and CTR modes (authenticated with encrypt-then-MAC,
     * HMAC-SHA256 over aad || iv || ciphertext) and the AEAD ciphers GCM and
     * ChaCha20-Poly1305 (authenticated with their own 16-byte tag over aad and ciphertext).
     * Modes without an IV or with different tag semantics (ECB, XTS, CCM, OCB, SIV, key wrap)
     * are rejected, as are the CBC ciphertext-stealing variants (AES-256-CBC-CTS and similar).
     *
     * Instances are immutable and may be shared between threads.
     */
    class Cipher {
    public:
        /**
         * @brief Resolves a cipher name. No key material is involved.
         * @throws ConfigurationError if the name is unknown or names an unsupported mode.
         */
        explicit Cipher(const std::string& spec);

        const std::string& name() const { return name_; }
        size_t key_length() const { return key_length_; }
        size_t iv_length() const { return iv_length_; }
        size_t block_size() const { return block_size_; }
        size_t tag_length() const;
        bool is_aead() const { return aead_; }

        /**
         * @brief Encrypts plaintext under a fresh random IV.
         * @param plaintext Bytes to encrypt (may be empty).
         * @param key Key of exactly key_length() bytes.
         * @param aad Associated data bound into the tag; not encrypted.
         * @return IV, ciphertext and tag.
         * @throws ConfigurationError if the key has the wrong length.
         * @throws InternalError on OpenSSL failures.
         */
        CipherParts encrypt(const byte_vec& plaintext, const byte_vec& key, const byte_vec& aad) const;

        /**
         * @brief Verifies and decrypts.
         * The tag is checked before any plaintext is released.
         * @throws DecryptionError for a wrong key/IV/tag length, a tag mismatch, truncated
         *         ciphertext or bad padding, without saying which.
         * @throws InternalError if an OpenSSL context cannot be created.
         */
        byte_vec decrypt(const CipherParts& parts, const byte_vec& key, const byte_vec& aad) const;

    private:
        EvpCipherCtxPtr initialize_context(const byte_vec& key, const byte_vec& iv, bool encrypt) const;
        byte_vec compute_mac(const byte_vec& key, const byte_vec& aad,
                             const byte_vec& iv, const byte_vec& ciphertext) const;

        std::string name_;
        std::shared_ptr<EVP_CIPHER> cipher_;
        size_t key_length_ = 0;
        size_t iv_length_ = 0;
        size_t block_size_ = 0;
        bool aead_ = false;
    };

} // namespace Symseal::Crypto

#endif // SYMSEAL_CRYPTO_CIPHER_HPP
