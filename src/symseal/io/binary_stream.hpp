#ifndef SYMSEAL_IO_BINARY_STREAM_HPP
#define SYMSEAL_IO_BINARY_STREAM_HPP

#include "symseal/types.hpp" // Symseal::byte_vec etc.
#include <string>             // std::string

namespace Symseal::IO {

    /**
     * @brief Bounds-checked read cursor over an in-memory byte buffer.
     * Does not own the buffer; the buffer must outlive the reader.
     */
    class ByteReader {
    public:
        explicit ByteReader(const byte_vec& buffer) : data_(buffer.data()), size_(buffer.size()) {}

        size_t position() const { return pos_; }
        size_t remaining() const { return size_ - pos_; }
        bool at_end() const { return pos_ == size_; }

        const byte* current() const { return data_ + pos_; }
        void advance(size_t count);

    private:
        const byte* data_;
        size_t size_;
        size_t pos_ = 0;
    };

    /** @brief Appends raw bytes to an output buffer. */
    void write_bytes(byte_vec& out, const byte* data, size_t size);

    /** @brief Appends a byte vector to an output buffer. */
    void write_byte_vec(byte_vec& out, const byte_vec& data);

    /** @brief Appends a single byte (uint8_t) to an output buffer. */
    void write_uint8(byte_vec& out, uint8_t value);

    /** @brief Appends a uint32_t in network byte order (Big Endian). */
    void write_uint32_network(byte_vec& out, uint32_t value);

    /** @brief Appends a uint64_t in network byte order (Big Endian). */
    void write_uint64_network(byte_vec& out, uint64_t value);

    /** @brief Appends the raw bytes of a string. */
    void write_string(byte_vec& out, const std::string& str);

    /** @brief Reads exactly 'size' bytes. Throws FormatError if not enough bytes are available. */
    byte_vec read_exact_bytes(ByteReader& in, size_t size);

    /** @brief Reads a single byte (uint8_t). Throws FormatError at end of buffer. */
    uint8_t read_uint8(ByteReader& in);

    /** @brief Reads a uint32_t in network byte order (Big Endian). Throws FormatError on truncation. */
    uint32_t read_uint32_network(ByteReader& in);

    /** @brief Reads a uint64_t in network byte order (Big Endian). Throws FormatError on truncation. */
    uint64_t read_uint64_network(ByteReader& in);

    /** @brief Reads 'length' raw bytes into a string. Throws FormatError on truncation. */
    std::string read_string(ByteReader& in, size_t length);

    /** @brief Reads everything left in the buffer. */
    byte_vec read_remaining(ByteReader& in);

} // namespace Symseal::IO

#endif // SYMSEAL_IO_BINARY_STREAM_HPP
