#include "binary_stream.hpp"
#include "symseal/types.hpp" // For Symseal::FormatError

namespace Symseal::IO {

    void ByteReader::advance(size_t count) {
        if (count > remaining()) {
            throw FormatError("Unexpected end of data: needed " + std::to_string(count) +
                              " bytes at offset " + std::to_string(pos_) +
                              ", only " + std::to_string(remaining()) + " available.");
        }
        pos_ += count;
    }

    // --- Write Operations ---

    void write_bytes(byte_vec& out, const byte* data, size_t size) {
        if (size == 0) return; // Nothing to write
        if (!data) throw InternalError("write_bytes called with null data pointer.");
        out.insert(out.end(), data, data + size);
    }

    void write_byte_vec(byte_vec& out, const byte_vec& data) {
        write_bytes(out, data.data(), data.size());
    }

    void write_uint8(byte_vec& out, uint8_t value) {
        out.push_back(static_cast<byte>(value));
    }

    void write_uint32_network(byte_vec& out, uint32_t value) {
        byte buffer[4];
        for (int i = 0; i < 4; ++i) {
            buffer[i] = static_cast<byte>((value >> (24 - 8 * i)) & 0xFF); // Most significant byte first
        }
        write_bytes(out, buffer, 4);
    }

    void write_uint64_network(byte_vec& out, uint64_t value) {
        byte buffer[8];
        for (int i = 0; i < 8; ++i) {
            // Shift MSB down to current position
            buffer[i] = static_cast<byte>((value >> (56 - 8 * i)) & 0xFF);
        }
        write_bytes(out, buffer, 8);
    }

    void write_string(byte_vec& out, const std::string& str) {
        write_bytes(out, reinterpret_cast<const byte*>(str.data()), str.length());
    }

    // --- Read Operations ---

    byte_vec read_exact_bytes(ByteReader& in, size_t size) {
        const byte* start = in.current();
        in.advance(size); // Throws before anything is copied
        return byte_vec(start, start + size);
    }

    uint8_t read_uint8(ByteReader& in) {
        const byte* start = in.current();
        in.advance(1);
        return static_cast<uint8_t>(start[0]);
    }

    uint32_t read_uint32_network(ByteReader& in) {
        const byte* start = in.current();
        in.advance(4);
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(start[i]) << (24 - 8 * i);
        }
        return value;
    }

    uint64_t read_uint64_network(ByteReader& in) {
        const byte* start = in.current();
        in.advance(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            // Shift byte up to its correct position and OR it in
            value |= static_cast<uint64_t>(start[i]) << (56 - 8 * i);
        }
        return value;
    }

    std::string read_string(ByteReader& in, size_t length) {
        if (length == 0) return "";
        const byte* start = in.current();
        in.advance(length);
        return std::string(reinterpret_cast<const char*>(start), length);
    }

    byte_vec read_remaining(ByteReader& in) {
        return read_exact_bytes(in, in.remaining());
    }

} // namespace Symseal::IO
