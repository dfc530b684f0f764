#ifndef SYMSEAL_DATA_VALUE_HPP
#define SYMSEAL_DATA_VALUE_HPP

#include "symseal/types.hpp" // For byte_vec
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace Symseal::Data {

    /**
     * @brief A dynamically typed value tree: the unit the pipeline encrypts.
     * Integers and floats are kept distinct, as are text strings and byte strings,
     * so a value survives the serializer round trip with its types intact.
     */
    class Value {
    public:
        enum class Type : uint8_t {
            Null = 0x00,
            Boolean = 0x01,
            Integer = 0x02,
            Float = 0x03,
            String = 0x04,
            Bytes = 0x05,
            Array = 0x06,
            Map = 0x07
        };

        using Array = std::vector<Value>;
        using Map = std::map<std::string, Value>;

        Value() : data_(nullptr) {}
        Value(std::nullptr_t) : data_(nullptr) {}
        Value(bool b) : data_(b) {}
        Value(int i) : data_(static_cast<int64_t>(i)) {}
        Value(long i) : data_(static_cast<int64_t>(i)) {}
        Value(long long i) : data_(static_cast<int64_t>(i)) {}
        Value(unsigned int i) : data_(static_cast<int64_t>(i)) {}
        Value(double d) : data_(d) {}
        Value(const char* s) : data_(std::string(s)) {}
        Value(std::string s) : data_(std::move(s)) {}
        Value(byte_vec bytes) : data_(std::move(bytes)) {}
        Value(Array items) : data_(std::move(items)) {}
        Value(Map entries) : data_(std::move(entries)) {}

        Type type() const { return static_cast<Type>(data_.index()); }
        const char* type_name() const;

        bool is_null() const { return type() == Type::Null; }
        bool is_boolean() const { return type() == Type::Boolean; }
        bool is_integer() const { return type() == Type::Integer; }
        bool is_float() const { return type() == Type::Float; }
        bool is_string() const { return type() == Type::String; }
        bool is_bytes() const { return type() == Type::Bytes; }
        bool is_array() const { return type() == Type::Array; }
        bool is_map() const { return type() == Type::Map; }

        // Typed accessors throw SerializationError on a type mismatch.
        bool as_boolean() const;
        int64_t as_integer() const;
        double as_float() const;
        const std::string& as_string() const;
        const byte_vec& as_bytes() const;
        const Array& as_array() const;
        const Map& as_map() const;

        /** @brief Map lookup; throws SerializationError if not a map or the key is absent. */
        const Value& at(const std::string& key) const;
        /** @brief Array lookup; throws SerializationError if not an array or out of range. */
        const Value& at(size_t index) const;

        /** @brief Human-readable rendering for diagnostics and the CLI. */
        std::string inspect() const;

        friend bool operator==(const Value& a, const Value& b) { return a.data_ == b.data_; }
        friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

    private:
        // Alternative order matches Type.
        std::variant<std::nullptr_t, bool, int64_t, double, std::string, byte_vec, Array, Map> data_;
    };

} // namespace Symseal::Data

#endif // SYMSEAL_DATA_VALUE_HPP
