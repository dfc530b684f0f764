#include "value.hpp"
#include "symseal/types.hpp" // For SerializationError

#include <iomanip>
#include <sstream>

namespace Symseal::Data {

    namespace {

        std::string mismatch(const char* wanted, const Value& actual) {
            return std::string("Value type mismatch: expected ") + wanted + ", found " + actual.type_name() + ".";
        }

        void inspect_into(std::ostringstream& out, const Value& value) {
            switch (value.type()) {
                case Value::Type::Null:
                    out << "null";
                    break;
                case Value::Type::Boolean:
                    out << (value.as_boolean() ? "true" : "false");
                    break;
                case Value::Type::Integer:
                    out << value.as_integer();
                    break;
                case Value::Type::Float:
                    out << std::setprecision(17) << value.as_float();
                    break;
                case Value::Type::String:
                    out << std::quoted(value.as_string());
                    break;
                case Value::Type::Bytes: {
                    out << "<bytes:";
                    std::ios_base::fmtflags saved = out.flags();
                    for (byte b : value.as_bytes()) {
                        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
                    }
                    out.flags(saved);
                    out << ">";
                    break;
                }
                case Value::Type::Array: {
                    out << "[";
                    bool first = true;
                    for (const Value& item : value.as_array()) {
                        if (!first) out << ", ";
                        first = false;
                        inspect_into(out, item);
                    }
                    out << "]";
                    break;
                }
                case Value::Type::Map: {
                    out << "{";
                    bool first = true;
                    for (const auto& [key, item] : value.as_map()) {
                        if (!first) out << ", ";
                        first = false;
                        out << std::quoted(key) << ": ";
                        inspect_into(out, item);
                    }
                    out << "}";
                    break;
                }
            }
        }

    } // namespace

    const char* Value::type_name() const {
        switch (type()) {
            case Type::Null: return "null";
            case Type::Boolean: return "boolean";
            case Type::Integer: return "integer";
            case Type::Float: return "float";
            case Type::String: return "string";
            case Type::Bytes: return "bytes";
            case Type::Array: return "array";
            case Type::Map: return "map";
        }
        return "unknown";
    }

    bool Value::as_boolean() const {
        if (!is_boolean()) throw SerializationError(mismatch("boolean", *this));
        return std::get<bool>(data_);
    }

    int64_t Value::as_integer() const {
        if (!is_integer()) throw SerializationError(mismatch("integer", *this));
        return std::get<int64_t>(data_);
    }

    double Value::as_float() const {
        if (!is_float()) throw SerializationError(mismatch("float", *this));
        return std::get<double>(data_);
    }

    const std::string& Value::as_string() const {
        if (!is_string()) throw SerializationError(mismatch("string", *this));
        return std::get<std::string>(data_);
    }

    const byte_vec& Value::as_bytes() const {
        if (!is_bytes()) throw SerializationError(mismatch("bytes", *this));
        return std::get<byte_vec>(data_);
    }

    const Value::Array& Value::as_array() const {
        if (!is_array()) throw SerializationError(mismatch("array", *this));
        return std::get<Array>(data_);
    }

    const Value::Map& Value::as_map() const {
        if (!is_map()) throw SerializationError(mismatch("map", *this));
        return std::get<Map>(data_);
    }

    const Value& Value::at(const std::string& key) const {
        const Map& entries = as_map();
        auto it = entries.find(key);
        if (it == entries.end()) throw SerializationError("Map has no key '" + key + "'.");
        return it->second;
    }

    const Value& Value::at(size_t index) const {
        const Array& items = as_array();
        if (index >= items.size()) {
            throw SerializationError("Array index " + std::to_string(index) +
                                     " out of range (size " + std::to_string(items.size()) + ").");
        }
        return items[index];
    }

    std::string Value::inspect() const {
        std::ostringstream out;
        inspect_into(out, *this);
        return out.str();
    }

} // namespace Symseal::Data
