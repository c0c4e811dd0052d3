#include "Value.hpp"
#include <iomanip>
#include <limits>
#include <sstream>

namespace sqlkit {

// ============================================================================
// Composite Equality
// ============================================================================

bool operator==(const ValueList& a, const ValueList& b) {
    return a.items == b.items;
}

bool operator==(const ValueTuple& a, const ValueTuple& b) {
    return a.items == b.items;
}

bool operator==(const ValueStruct& a, const ValueStruct& b) {
    return a.fields == b.fields;
}

// ============================================================================
// Rendering
// ============================================================================

namespace {

struct TypeNameVisitor {
    const char* operator()(const std::monostate&) const { return "null"; }
    const char* operator()(bool) const { return "boolean"; }
    const char* operator()(int64_t) const { return "integer"; }
    const char* operator()(WideInt) const { return "wide integer"; }
    const char* operator()(double) const { return "double"; }
    const char* operator()(const std::string&) const { return "text"; }
    const char* operator()(const Blob&) const { return "blob"; }
    const char* operator()(const ValueList&) const { return "list"; }
    const char* operator()(const ValueTuple&) const { return "tuple"; }
    const char* operator()(const ValueStruct&) const { return "struct"; }
};

void appendItems(std::ostringstream& out, const std::vector<Value>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out << ", ";
        out << items[i].toString();
    }
}

struct ToStringVisitor {
    std::string operator()(const std::monostate&) const { return ""; }
    std::string operator()(bool v) const { return v ? "true" : "false"; }
    std::string operator()(int64_t v) const { return std::to_string(v); }
    std::string operator()(WideInt v) const { return wideIntToString(v); }

    std::string operator()(double v) const {
        std::ostringstream out;
        out << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
        return out.str();
    }

    std::string operator()(const std::string& v) const { return v; }

    std::string operator()(const Blob& v) const {
        static const char* hex = "0123456789abcdef";
        std::string out = "\\x";
        out.reserve(2 + v.size() * 2);
        for (uint8_t byte : v) {
            out += hex[byte >> 4];
            out += hex[byte & 0x0f];
        }
        return out;
    }

    std::string operator()(const ValueList& v) const {
        std::ostringstream out;
        out << '[';
        appendItems(out, v.items);
        out << ']';
        return out.str();
    }

    std::string operator()(const ValueTuple& v) const {
        std::ostringstream out;
        out << '(';
        appendItems(out, v.items);
        out << ')';
        return out.str();
    }

    std::string operator()(const ValueStruct& v) const {
        std::ostringstream out;
        out << '{';
        for (size_t i = 0; i < v.fields.size(); ++i) {
            if (i > 0) out << ", ";
            out << v.fields[i].first << ": " << v.fields[i].second.toString();
        }
        out << '}';
        return out.str();
    }
};

}  // namespace

const char* Value::typeName() const {
    return std::visit(TypeNameVisitor{}, m_data);
}

std::string Value::toString() const {
    return std::visit(ToStringVisitor{}, m_data);
}

// ============================================================================
// Wide Integers
// ============================================================================

WideInt wideIntFromParts(int64_t high, int64_t low) {
    const WideInt base = static_cast<WideInt>(1) << 64;
    return static_cast<WideInt>(high) * base + static_cast<WideInt>(static_cast<uint64_t>(low));
}

std::string wideIntToString(WideInt value) {
    if (value == 0) return "0";

    bool negative = value < 0;
    // Work on the unsigned magnitude so the minimum value does not overflow
    unsigned __int128 magnitude = negative
        ? static_cast<unsigned __int128>(0) - static_cast<unsigned __int128>(value)
        : static_cast<unsigned __int128>(value);

    std::string digits;
    while (magnitude > 0) {
        digits += static_cast<char>('0' + static_cast<int>(magnitude % 10));
        magnitude /= 10;
    }
    if (negative) digits += '-';
    return std::string(digits.rbegin(), digits.rend());
}

bool fitsInInt64(WideInt value) {
    return value >= static_cast<WideInt>(std::numeric_limits<int64_t>::min()) &&
           value <= static_cast<WideInt>(std::numeric_limits<int64_t>::max());
}

Value normalizeWideIntegers(Value value) {
    if (value.is<ValueTuple>()) {
        auto& items = value.as<ValueTuple>().items;
        if (items.size() == 2 && items[0].is<int64_t>() && items[1].is<int64_t>()) {
            return Value(wideIntFromParts(items[0].as<int64_t>(), items[1].as<int64_t>()));
        }
        for (auto& item : items) {
            item = normalizeWideIntegers(std::move(item));
        }
    } else if (value.is<ValueList>()) {
        for (auto& item : value.as<ValueList>().items) {
            item = normalizeWideIntegers(std::move(item));
        }
    } else if (value.is<ValueStruct>()) {
        for (auto& field : value.as<ValueStruct>().fields) {
            field.second = normalizeWideIntegers(std::move(field.second));
        }
    }
    return value;
}

void normalizeWideIntegers(std::vector<Row>& rows) {
    for (auto& row : rows) {
        for (auto& cell : row) {
            cell = normalizeWideIntegers(std::move(cell));
        }
    }
}

}  // namespace sqlkit
