#ifndef SYMSEAL_DATA_SERIALIZER_HPP
#define SYMSEAL_DATA_SERIALIZER_HPP

#include "symseal/types.hpp"     // For byte_vec, Exceptions
#include "symseal/data/value.hpp"

namespace Symseal::Data {

    /**
     * @brief Encodes a Value into its canonical binary form.
     *
     * Layout: one format byte (Constants::SERIAL_FORMAT), then the value. Each value is a
     * one-byte Value::Type tag followed by its payload:
     *   - Null: nothing
     *   - Boolean: one byte, 0 or 1
     *   - Integer: 8 bytes, two's complement, big endian
     *   - Float: 8 bytes, IEEE-754 bit pattern, big endian
     *   - String / Bytes: uint32 length, then raw bytes
     *   - Array: uint32 count, then each item
     *   - Map: uint32 count, then (uint32 key length, key bytes, value) in ascending key order
     * The same Value always produces the same bytes.
     *
     * @param value The value to encode.
     * @return The encoded bytes.
     * @throws SerializationError if the value nests deeper than Constants::MAX_NESTING_DEPTH
     *         or a container or string exceeds a 32-bit length.
     */
    byte_vec serialize(const Value& value);

    /**
     * @brief Decodes bytes produced by serialize().
     * Only canonical encodings are accepted: map keys must be strictly ascending and no
     * trailing bytes may follow the value.
     * @param bytes The encoded bytes.
     * @return The reconstructed value.
     * @throws SerializationError if the bytes are not a valid encoding.
     */
    Value deserialize(const byte_vec& bytes);

} // namespace Symseal::Data

#endif // SYMSEAL_DATA_SERIALIZER_HPP
