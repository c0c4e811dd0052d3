#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace sqlkit {

// Signed 128-bit integer, the engine's widest integer type
using WideInt = __int128;

using Blob = std::vector<uint8_t>;

class Value;

// Variable-length list of values
struct ValueList {
    std::vector<Value> items;
};

// Fixed-arity composite as produced by the native driver
struct ValueTuple {
    std::vector<Value> items;
};

// Named fields, in declaration order
struct ValueStruct {
    std::vector<std::pair<std::string, Value>> fields;
};

bool operator==(const ValueList& a, const ValueList& b);
bool operator==(const ValueTuple& a, const ValueTuple& b);
bool operator==(const ValueStruct& a, const ValueStruct& b);

// A single cell value. NULL is the empty (monostate) alternative.
class Value {
public:
    using Storage = std::variant<std::monostate, bool, int64_t, WideInt, double,
                                 std::string, Blob, ValueList, ValueTuple, ValueStruct>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : m_data(v) {}
    // Unsigned values above INT64_MAX are stored as WideInt
    template <typename T,
              typename = std::enable_if_t<std::is_integral<T>::value &&
                                          !std::is_same<T, bool>::value &&
                                          sizeof(T) <= sizeof(int64_t)>>
    Value(T v) : m_data(fromIntegral(v)) {}
    Value(WideInt v) : m_data(v) {}
    Value(double v) : m_data(v) {}
    Value(const char* v) : m_data(std::string(v)) {}
    Value(std::string v) : m_data(std::move(v)) {}
    Value(Blob v) : m_data(std::move(v)) {}
    Value(ValueList v) : m_data(std::move(v)) {}
    Value(ValueTuple v) : m_data(std::move(v)) {}
    Value(ValueStruct v) : m_data(std::move(v)) {}

    bool isNull() const { return std::holds_alternative<std::monostate>(m_data); }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(m_data); }

    template <typename T>
    const T& as() const { return std::get<T>(m_data); }

    template <typename T>
    T& as() { return std::get<T>(m_data); }

    const Storage& storage() const { return m_data; }

    // Short type tag used in error messages ("null", "integer", "tuple", ...)
    const char* typeName() const;

    // Human-readable rendering; NULL renders as an empty string
    std::string toString() const;

    bool operator==(const Value& other) const { return m_data == other.m_data; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    template <typename T>
    static Storage fromIntegral(T v) {
        if (std::is_unsigned<T>::value &&
            static_cast<uint64_t>(v) > static_cast<uint64_t>(INT64_MAX)) {
            return Storage(static_cast<WideInt>(static_cast<uint64_t>(v)));
        }
        return Storage(static_cast<int64_t>(v));
    }

    Storage m_data;
};

using Row = std::vector<Value>;

// Column names plus rows, both in result order
struct QueryResult {
    std::vector<std::string> columns;
    std::vector<Row> rows;
};

// ----- Wide integers -----

// Combines a native (high, low) pair: high * 2^64 + low, low read as unsigned
WideInt wideIntFromParts(int64_t high, int64_t low);

std::string wideIntToString(WideInt value);

bool fitsInInt64(WideInt value);

/**
 * Replaces every two-integer ValueTuple with the WideInt it encodes,
 * recursing into lists, tuples and structs.
 *
 * This is a shape heuristic: a genuine two-integer composite is converted
 * as well. Callers that need such tuples verbatim should not normalize.
 */
Value normalizeWideIntegers(Value value);

void normalizeWideIntegers(std::vector<Row>& rows);

}  // namespace sqlkit
