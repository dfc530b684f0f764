#include "compressor.hpp"
#include "symseal/types.hpp"

#include <zlib.h>

#include <limits>
#include <memory>

namespace Symseal::Data {

    namespace {

        constexpr size_t CHUNK_SIZE = 16384;

        std::string zlib_message(const z_stream& stream, int code) {
            return stream.msg ? std::string(stream.msg) : ("zlib error code " + std::to_string(code));
        }

        // RAII wrappers so every exit path releases the zlib state.
        struct DeflateEnd {
            void operator()(z_stream* s) const { deflateEnd(s); }
        };
        struct InflateEnd {
            void operator()(z_stream* s) const { inflateEnd(s); }
        };

    } // namespace

    void validate_compression_level(int level) {
        using namespace Symseal::Constants;
        if (level < MIN_COMPRESSION_LEVEL || level > MAX_COMPRESSION_LEVEL) {
            throw ConfigurationError("Invalid compression level " + std::to_string(level) +
                                     " (expected " + std::to_string(MIN_COMPRESSION_LEVEL) + ".." +
                                     std::to_string(MAX_COMPRESSION_LEVEL) + ").");
        }
    }

    unsigned int checked_zlib_length(size_t len) {
        if (len > static_cast<size_t>(std::numeric_limits<uInt>::max())) {
            throw InternalError("Compressor: buffer too large for zlib (" + std::to_string(len) + " bytes).");
        }
        return static_cast<uInt>(len);
    }

    byte_vec compress(const byte_vec& input, int level) {
        validate_compression_level(level);
        const uInt input_len = checked_zlib_length(input.size());

        z_stream stream{};
        int rc = deflateInit(&stream, level);
        if (rc != Z_OK) {
            throw InternalError("Compressor: deflateInit failed: " + zlib_message(stream, rc));
        }
        std::unique_ptr<z_stream, DeflateEnd> guard(&stream);

        byte_vec output(deflateBound(&stream, input_len));
        stream.next_in = const_cast<Bytef*>(input.data());
        stream.avail_in = input_len;
        stream.next_out = output.data();
        stream.avail_out = checked_zlib_length(output.size());

        // deflateBound guarantees a single Z_FINISH call is enough.
        rc = deflate(&stream, Z_FINISH);
        if (rc != Z_STREAM_END) {
            throw InternalError("Compressor: deflate did not complete: " + zlib_message(stream, rc));
        }
        output.resize(stream.total_out);
        return output;
    }

    byte_vec decompress(const byte_vec& input) {
        const uInt input_len = checked_zlib_length(input.size());

        z_stream stream{};
        int rc = inflateInit(&stream);
        if (rc != Z_OK) {
            throw InternalError("Compressor: inflateInit failed: " + zlib_message(stream, rc));
        }
        std::unique_ptr<z_stream, InflateEnd> guard(&stream);

        stream.next_in = const_cast<Bytef*>(input.data());
        stream.avail_in = input_len;

        byte_vec output;
        byte chunk[CHUNK_SIZE];
        do {
            stream.next_out = chunk;
            stream.avail_out = CHUNK_SIZE;
            rc = inflate(&stream, Z_NO_FLUSH);
            switch (rc) {
                case Z_OK:
                case Z_STREAM_END:
                    break;
                case Z_BUF_ERROR:
                    // No progress possible: input ended before the stream did.
                    if (stream.avail_in == 0) {
                        throw FormatError("Compressed payload is truncated.");
                    }
                    break;
                case Z_NEED_DICT:
                case Z_DATA_ERROR:
                    throw FormatError("Compressed payload is corrupt: " + zlib_message(stream, rc));
                default:
                    throw InternalError("Compressor: inflate failed: " + zlib_message(stream, rc));
            }
            output.insert(output.end(), chunk, chunk + (CHUNK_SIZE - stream.avail_out));
        } while (rc != Z_STREAM_END);

        if (stream.avail_in != 0) {
            throw FormatError("Unexpected trailing bytes after compressed payload.");
        }
        return output;
    }

} // namespace Symseal::Data
