#include "token.hpp"
#include "binary_stream.hpp"          // Uses IO helpers for read/write
#include "symseal/types.hpp"          // For Constants, Exceptions

namespace Symseal::IO {

    namespace {

        void validate_cipher_id(const std::string& cipher_id) {
            using namespace Symseal::Constants;
            if (cipher_id.empty() || cipher_id.size() > MAX_CIPHER_ID_LEN) {
                throw FormatError("Token cipher id length " + std::to_string(cipher_id.size()) +
                                  " is outside 1.." + std::to_string(MAX_CIPHER_ID_LEN) + ".");
            }
            for (char c : cipher_id) {
                if (c < 0x21 || c > 0x7E) {
                    throw FormatError("Token cipher id contains a non-printable or non-ASCII character.");
                }
            }
        }

    } // namespace

    void Token::initialize_for_encryption(const std::string& cipher, bool compressed) {
        validate_cipher_id(cipher);
        version = Symseal::Constants::TOKEN_VERSION;
        cipher_id = cipher;
        flags = compressed ? Symseal::Constants::FLAG_COMPRESSED : 0;
        iv.clear();
        ciphertext.clear();
        tag.clear();
    }

    Symseal::byte_vec Token::generate_aad() const {
        validate_cipher_id(cipher_id);
        byte_vec aad;
        aad.reserve(get_header_size());
        write_uint8(aad, version);
        write_uint8(aad, static_cast<uint8_t>(cipher_id.size()));
        write_string(aad, cipher_id);
        write_uint8(aad, flags);
        return aad;
    }

    Symseal::byte_vec Token::write() const {
        byte_vec out = generate_aad();
        out.reserve(out.size() + iv.size() + ciphertext.size() + tag.size());
        write_byte_vec(out, iv);
        write_byte_vec(out, ciphertext);
        write_byte_vec(out, tag);
        return out;
    }

    void Token::read_header(ByteReader& in) {
        using namespace Symseal::Constants;

        version = read_uint8(in);
        if (version != TOKEN_VERSION) {
            throw FormatError("Unsupported token version: " + std::to_string(version) +
                              ". Expected: " + std::to_string(TOKEN_VERSION));
        }

        uint8_t id_len = read_uint8(in);
        std::string id = read_string(in, id_len);
        validate_cipher_id(id);
        cipher_id = id;

        flags = read_uint8(in);
        if ((flags & ~KNOWN_FLAGS) != 0) {
            throw FormatError("Token has unknown flag bits set (flags=" + std::to_string(flags) + ").");
        }
    }

    void Token::read_body(ByteReader& in, size_t iv_len, size_t tag_len) {
        if (in.remaining() < iv_len + tag_len) {
            throw FormatError("Token is too short (" + std::to_string(in.remaining()) +
                              " bytes after header) to contain IV (" + std::to_string(iv_len) +
                              " bytes) and tag (" + std::to_string(tag_len) + " bytes).");
        }
        iv = read_exact_bytes(in, iv_len);
        ciphertext = read_exact_bytes(in, in.remaining() - tag_len);
        tag = read_exact_bytes(in, tag_len);
    }

    size_t Token::get_header_size() const {
        return 1 + // version
               1 + // cipher id length
               cipher_id.size() +
               1;  // flags
    }

} // namespace Symseal::IO
