#ifndef SYMSEAL_DATA_COMPRESSOR_HPP
#define SYMSEAL_DATA_COMPRESSOR_HPP

#include "symseal/types.hpp" // For byte_vec, Exceptions

namespace Symseal::Data {

    /**
     * @brief Validates a zlib compression level.
     * @throws ConfigurationError if level is outside MIN_COMPRESSION_LEVEL..MAX_COMPRESSION_LEVEL.
     */
    void validate_compression_level(int level);

    /**
     * @brief Narrows a buffer length to zlib's 32-bit stream counters.
     * @throws InternalError if len does not fit, so no buffer is ever silently truncated.
     */
    unsigned int checked_zlib_length(size_t len);

    /**
     * @brief Deflates bytes into a zlib stream.
     * @param input The bytes to compress.
     * @param level 0 (stored) .. 9 (best compression).
     * @return A complete zlib stream.
     * @throws ConfigurationError on an invalid level, checked before any work.
     * @throws InternalError if zlib fails or the input exceeds zlib's 32-bit length limit.
     */
    byte_vec compress(const byte_vec& input, int level);

    /**
     * @brief Inflates a complete zlib stream.
     * @throws FormatError if the input is not a single complete zlib stream.
     * @throws InternalError if zlib fails for a reason unrelated to the input.
     */
    byte_vec decompress(const byte_vec& input);

} // namespace Symseal::Data

#endif // SYMSEAL_DATA_COMPRESSOR_HPP
