#include "transport.hpp"
#include "symseal/types.hpp"

#include <openssl/evp.h>

#include <limits>

namespace Symseal::Data {

    namespace {

        // Six-bit value of a base64url character, or -1.
        int sextet(char c) {
            if (c >= 'A' && c <= 'Z') return c - 'A';
            if (c >= 'a' && c <= 'z') return c - 'a' + 26;
            if (c >= '0' && c <= '9') return c - '0' + 52;
            if (c == '-') return 62;
            if (c == '_') return 63;
            return -1;
        }

    } // namespace

    std::string encode_transport(const byte_vec& bytes) {
        if (bytes.empty()) return "";
        if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
            throw InternalError("Transport encoding: input too large (" + std::to_string(bytes.size()) + " bytes).");
        }

        std::string text(4 * ((bytes.size() + 2) / 3), '\0');
        int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&text[0]),
                                      bytes.data(), static_cast<int>(bytes.size()));
        if (written < 0 || static_cast<size_t>(written) != text.size()) {
            throw InternalError("Transport encoding: EVP_EncodeBlock produced an unexpected length.");
        }

        for (char& c : text) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
        return text;
    }

    byte_vec decode_transport(const std::string& text) {
        if (text.empty()) return {};
        if (text.size() % 4 != 0) {
            throw FormatError("Transport text length " + std::to_string(text.size()) + " is not a multiple of 4.");
        }
        if (text.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            throw FormatError("Transport text is too large.");
        }

        size_t padding = 0;
        if (text[text.size() - 1] == '=') {
            padding = (text[text.size() - 2] == '=') ? 2 : 1;
        }

        std::string standard(text);
        const size_t data_chars = text.size() - padding;
        for (size_t i = 0; i < standard.size(); ++i) {
            char c = standard[i];
            if (i >= data_chars) {
                if (c != '=') throw FormatError("Transport text has misplaced padding.");
                continue;
            }
            if (sextet(c) < 0) {
                throw FormatError(c == '='
                                  ? "Transport text has misplaced padding."
                                  : "Transport text contains a character outside the base64url alphabet.");
            }
            if (c == '-') standard[i] = '+';
            else if (c == '_') standard[i] = '/';
        }

        // Canonical encodings leave the unused low bits of the final character zero.
        int last = sextet(text[data_chars - 1]);
        if ((padding == 1 && (last & 0x03) != 0) || (padding == 2 && (last & 0x0F) != 0)) {
            throw FormatError("Transport text has non-zero trailing bits.");
        }

        byte_vec bytes(standard.size() / 4 * 3);
        int decoded = EVP_DecodeBlock(bytes.data(),
                                      reinterpret_cast<const unsigned char*>(standard.data()),
                                      static_cast<int>(standard.size()));
        if (decoded < 0 || static_cast<size_t>(decoded) != bytes.size()) {
            throw FormatError("Transport text could not be decoded.");
        }
        // EVP_DecodeBlock counts padding characters as zero bytes.
        bytes.resize(bytes.size() - padding);
        return bytes;
    }

} // namespace Symseal::Data
