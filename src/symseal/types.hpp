#ifndef SYMSEAL_TYPES_HPP
#define SYMSEAL_TYPES_HPP

#include <vector>
#include <string>
#include <stdexcept>
#include <cstdint> // For fixed-width integers
#include <cstddef>

// --- Top-level Symseal Namespace ---
namespace Symseal {

    // --- Type Definitions ---
    using byte = unsigned char;
    using byte_vec = std::vector<byte>;

    // Symmetric key material. Length is dictated by the cipher it is used with.
    using PrivateKey = byte_vec;

    // --- Constants ---
    namespace Constants { // Nested namespace for constants
        constexpr uint8_t TOKEN_VERSION = 0x01;
        constexpr uint8_t SERIAL_FORMAT = 0x01;
        constexpr uint8_t FLAG_COMPRESSED = 0x01;
        constexpr uint8_t KNOWN_FLAGS = FLAG_COMPRESSED;
        constexpr size_t MAX_CIPHER_ID_LEN = 64;

        constexpr size_t AEAD_TAG_LEN = 16;  // GCM / Poly1305 tag (128 bits)
        constexpr size_t HMAC_TAG_LEN = 32;  // HMAC-SHA256 for non-AEAD modes
        constexpr size_t PBKDF2_ITERATIONS = 100000;
        constexpr size_t PBKDF2_SALT_LEN = 16;
        constexpr size_t MAX_NESTING_DEPTH = 128;

        // Default settings
        const std::string DEFAULT_DATA_CIPHER = "AES-256-CBC";
        const std::string DEFAULT_PASSWORD_CIPHER = "AES-128-CBC";
        constexpr bool DEFAULT_COMPRESSION_ENABLED = true;
        constexpr int MIN_COMPRESSION_LEVEL = 0;
        constexpr int MAX_COMPRESSION_LEVEL = 9; // Z_BEST_COMPRESSION

        // Exit codes
        constexpr int EXIT_OK = 0;
        constexpr int EXIT_USAGE_ERROR = 1;
        constexpr int EXIT_CONFIGURATION_ERROR = 2;
        constexpr int EXIT_DECRYPTION_FAILED = 3;
        constexpr int EXIT_INTERNAL_ERROR = 4;
        constexpr int EXIT_FORMAT_ERROR = 5;
        constexpr int EXIT_SERIALIZATION_ERROR = 6;
    } // namespace Constants

    // --- Custom Exception Classes ---
    class SymsealError : public std::runtime_error {
    public:
        SymsealError(const std::string& msg, int code)
                : std::runtime_error(msg), exit_code(code) {}
        int get_exit_code() const { return exit_code; }
    private:
        int exit_code;
    };

    // Bad or missing cipher id, invalid compression level, empty password, bad key size on encrypt.
    class ConfigurationError : public SymsealError {
    public:
        ConfigurationError(const std::string& msg)
                : SymsealError(msg, Constants::EXIT_CONFIGURATION_ERROR) {}
    };

    // Value not representable, or corrupt bytes handed to the deserializer.
    class SerializationError : public SymsealError {
    public:
        SerializationError(const std::string& msg)
                : SymsealError(msg, Constants::EXIT_SERIALIZATION_ERROR) {}
    };

    // Malformed transport text, malformed token layout, unknown version tag.
    class FormatError : public SymsealError {
    public:
        FormatError(const std::string& msg)
                : SymsealError(msg, Constants::EXIT_FORMAT_ERROR) {}
    };

    // Deliberately opaque: callers must not learn which check failed.
    class DecryptionError : public SymsealError {
    public:
        DecryptionError()
                : SymsealError("Decryption failed.", Constants::EXIT_DECRYPTION_FAILED) {}
    };

    class InternalError : public SymsealError {
    public:
        InternalError(const std::string& msg)
                : SymsealError(msg, Constants::EXIT_INTERNAL_ERROR) {}
    };

    class UsageError : public SymsealError {
    public:
        UsageError(const std::string& msg)
                : SymsealError(msg, Constants::EXIT_USAGE_ERROR) {}
    };

} // namespace Symseal

#endif // SYMSEAL_TYPES_HPP
