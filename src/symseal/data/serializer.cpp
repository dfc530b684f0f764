#include "serializer.hpp"
#include "symseal/io/binary_stream.hpp"
#include "symseal/types.hpp"

#include <cstring> // For memcpy
#include <limits>

namespace Symseal::Data {

    namespace {

        using Symseal::Constants::MAX_NESTING_DEPTH;

        uint32_t checked_length(size_t length, const char* what) {
            if (length > std::numeric_limits<uint32_t>::max()) {
                throw SerializationError(std::string(what) + " is too large to serialize (" +
                                         std::to_string(length) + " elements).");
            }
            return static_cast<uint32_t>(length);
        }

        void write_value(byte_vec& out, const Value& value, size_t depth) {
            if (depth > MAX_NESTING_DEPTH) {
                throw SerializationError("Value nesting exceeds the maximum depth of " +
                                         std::to_string(MAX_NESTING_DEPTH) + ".");
            }

            IO::write_uint8(out, static_cast<uint8_t>(value.type()));
            switch (value.type()) {
                case Value::Type::Null:
                    break;
                case Value::Type::Boolean:
                    IO::write_uint8(out, value.as_boolean() ? 1 : 0);
                    break;
                case Value::Type::Integer:
                    IO::write_uint64_network(out, static_cast<uint64_t>(value.as_integer()));
                    break;
                case Value::Type::Float: {
                    double d = value.as_float();
                    uint64_t bits = 0;
                    std::memcpy(&bits, &d, sizeof(bits));
                    IO::write_uint64_network(out, bits);
                    break;
                }
                case Value::Type::String: {
                    const std::string& s = value.as_string();
                    IO::write_uint32_network(out, checked_length(s.size(), "String"));
                    IO::write_string(out, s);
                    break;
                }
                case Value::Type::Bytes: {
                    const byte_vec& b = value.as_bytes();
                    IO::write_uint32_network(out, checked_length(b.size(), "Byte string"));
                    IO::write_byte_vec(out, b);
                    break;
                }
                case Value::Type::Array: {
                    const Value::Array& items = value.as_array();
                    IO::write_uint32_network(out, checked_length(items.size(), "Array"));
                    for (const Value& item : items) {
                        write_value(out, item, depth + 1);
                    }
                    break;
                }
                case Value::Type::Map: {
                    // std::map iterates in ascending key order, which is the canonical order.
                    const Value::Map& entries = value.as_map();
                    IO::write_uint32_network(out, checked_length(entries.size(), "Map"));
                    for (const auto& [key, item] : entries) {
                        IO::write_uint32_network(out, checked_length(key.size(), "Map key"));
                        IO::write_string(out, key);
                        write_value(out, item, depth + 1);
                    }
                    break;
                }
            }
        }

        // Every element takes at least one byte, so a count larger than what is left is corrupt.
        size_t read_length(IO::ByteReader& in, const char* what) {
            uint32_t length = IO::read_uint32_network(in);
            if (length > in.remaining()) {
                throw SerializationError(std::string(what) + " length " + std::to_string(length) +
                                         " exceeds the remaining " + std::to_string(in.remaining()) + " bytes.");
            }
            return length;
        }

        Value read_value(IO::ByteReader& in, size_t depth) {
            if (depth > MAX_NESTING_DEPTH) {
                throw SerializationError("Encoded value nests deeper than " + std::to_string(MAX_NESTING_DEPTH) + " levels.");
            }

            uint8_t tag = IO::read_uint8(in);
            switch (static_cast<Value::Type>(tag)) {
                case Value::Type::Null:
                    return Value();
                case Value::Type::Boolean: {
                    uint8_t b = IO::read_uint8(in);
                    if (b > 1) throw SerializationError("Invalid boolean byte " + std::to_string(b) + ".");
                    return Value(b == 1);
                }
                case Value::Type::Integer:
                    return Value(static_cast<long long>(static_cast<int64_t>(IO::read_uint64_network(in))));
                case Value::Type::Float: {
                    uint64_t bits = IO::read_uint64_network(in);
                    double d = 0.0;
                    std::memcpy(&d, &bits, sizeof(d));
                    return Value(d);
                }
                case Value::Type::String: {
                    size_t length = read_length(in, "String");
                    return Value(IO::read_string(in, length));
                }
                case Value::Type::Bytes: {
                    size_t length = read_length(in, "Byte string");
                    return Value(IO::read_exact_bytes(in, length));
                }
                case Value::Type::Array: {
                    size_t count = read_length(in, "Array");
                    Value::Array items;
                    items.reserve(count);
                    for (size_t i = 0; i < count; ++i) {
                        items.push_back(read_value(in, depth + 1));
                    }
                    return Value(std::move(items));
                }
                case Value::Type::Map: {
                    size_t count = read_length(in, "Map");
                    Value::Map entries;
                    const std::string* previous_key = nullptr;
                    for (size_t i = 0; i < count; ++i) {
                        size_t key_length = read_length(in, "Map key");
                        std::string key = IO::read_string(in, key_length);
                        if (previous_key && !(*previous_key < key)) {
                            throw SerializationError("Map keys are duplicated or not in canonical order.");
                        }
                        auto inserted = entries.emplace_hint(entries.end(), std::move(key), read_value(in, depth + 1));
                        previous_key = &inserted->first;
                    }
                    return Value(std::move(entries));
                }
            }
            throw SerializationError("Unknown value tag " + std::to_string(tag) + ".");
        }

    } // namespace

    byte_vec serialize(const Value& value) {
        byte_vec out;
        IO::write_uint8(out, Constants::SERIAL_FORMAT);
        write_value(out, value, 0);
        return out;
    }

    Value deserialize(const byte_vec& bytes) {
        IO::ByteReader in(bytes);
        try {
            uint8_t format = IO::read_uint8(in);
            if (format != Constants::SERIAL_FORMAT) {
                throw SerializationError("Unsupported serialization format " + std::to_string(format) + ".");
            }
            Value value = read_value(in, 0);
            if (!in.at_end()) {
                throw SerializationError(std::to_string(in.remaining()) + " trailing bytes after serialized value.");
            }
            return value;
        } catch (const FormatError& e) {
            // Truncation inside the byte reader means the encoding itself is corrupt.
            throw SerializationError(std::string("Corrupt serialized value: ") + e.what());
        }
    }

} // namespace Symseal::Data
