#ifndef SYMSEAL_IO_TOKEN_HPP
#define SYMSEAL_IO_TOKEN_HPP

#include "symseal/types.hpp"            // For Symseal::byte_vec, Constants, Exceptions
#include "symseal/io/binary_stream.hpp" // For ByteReader
#include <string>

namespace Symseal::IO {

    /**
     * @brief Represents the binary layout of an encrypted token (version 1).
     *
     *     version (1) | cipher id length N (1) | cipher id (N) | flags (1) | IV | ciphertext | tag
     *
     * The first four fields form the header, which is authenticated as associated data.
     * IV and tag lengths are not stored; they follow from the cipher the header names.
     */
    class Token {
    public:
        // --- Token Fields ---
        uint8_t version = Symseal::Constants::TOKEN_VERSION;
        std::string cipher_id;
        uint8_t flags = 0;
        Symseal::byte_vec iv;
        Symseal::byte_vec ciphertext;
        Symseal::byte_vec tag;

        /**
         * @brief Populates header fields for an encryption operation.
         * @param cipher The cipher identifier to tag the token with.
         * @param compressed Whether the payload was compressed.
         * @throws FormatError if the cipher id is empty, longer than MAX_CIPHER_ID_LEN or not printable ASCII.
         */
        void initialize_for_encryption(const std::string& cipher, bool compressed);

        bool is_compressed() const { return (flags & Symseal::Constants::FLAG_COMPRESSED) != 0; }

        /**
         * @brief Generates the associated data (the serialized header) for the cipher.
         * Must match exactly between encryption and decryption.
         */
        Symseal::byte_vec generate_aad() const;

        /**
         * @brief Serializes header, IV, ciphertext and tag.
         * @throws FormatError if the header fields are invalid.
         */
        Symseal::byte_vec write() const;

        /**
         * @brief Reads and validates the header fields (version, cipher id, flags).
         * @throws FormatError on truncation, unknown version, bad cipher id or unknown flag bits.
         */
        void read_header(ByteReader& in);

        /**
         * @brief Splits the rest of the input into IV, ciphertext and tag.
         * @throws FormatError if fewer than iv_len + tag_len bytes remain.
         */
        void read_body(ByteReader& in, size_t iv_len, size_t tag_len);

        /** @brief Size of the header in bytes. */
        size_t get_header_size() const;
    };

} // namespace Symseal::IO

#endif // SYMSEAL_IO_TOKEN_HPP
