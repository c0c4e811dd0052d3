#pragma once

#include "Errors.hpp"
#include "QueryOptions.hpp"
#include "Value.hpp"
#include <algorithm>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sqlkit {

// One row as ordered column name -> value
class Record {
public:
    Record() = default;

    // Sets a field, replacing an earlier one with the same name
    void set(const std::string& name, Value value);

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    const Value* find(const std::string& name) const;

    // Throws std::out_of_range for a missing field
    const Value& at(const std::string& name) const;

    const Value& operator[](const std::string& name) const { return at(name); }

    // Throws std::invalid_argument if the value does not convert to T
    template <typename T>
    T get(const std::string& name) const;

    size_t size() const { return m_fields.size(); }
    bool empty() const { return m_fields.empty(); }

    const std::vector<std::pair<std::string, Value>>& fields() const { return m_fields; }

    bool operator==(const Record& other) const { return m_fields == other.m_fields; }
    bool operator!=(const Record& other) const { return !(*this == other); }

private:
    std::vector<std::pair<std::string, Value>> m_fields;
};

// ----- Value conversions -----
//
// Each returns false, leaving out untouched, when the value has no
// conversion to the target type.

bool fromValue(const Value& value, Value& out);
bool fromValue(const Value& value, bool& out);
bool fromValue(const Value& value, int& out);
bool fromValue(const Value& value, int64_t& out);
bool fromValue(const Value& value, WideInt& out);
bool fromValue(const Value& value, double& out);
bool fromValue(const Value& value, std::string& out);
bool fromValue(const Value& value, Blob& out);

// NULL converts to an empty optional
template <typename T>
bool fromValue(const Value& value, std::optional<T>& out) {
    if (value.isNull()) {
        out.reset();
        return true;
    }
    T inner{};
    if (!fromValue(value, inner)) return false;
    out = std::move(inner);
    return true;
}

template <typename T>
T Record::get(const std::string& name) const {
    T out{};
    if (!fromValue(at(name), out)) {
        throw std::invalid_argument("field '" + name + "' holds a " + at(name).typeName());
    }
    return out;
}

/**
 * Declared shape of a typed record: a name plus the list of fields a row may
 * bind to.
 *
 *   struct User { int64_t id; std::string name; int64_t age; };
 *
 *   const RecordType<User> userType("User", {
 *       field("id", &User::id),
 *       field("name", &User::name),
 *       field("age", &User::age),
 *   });
 *
 * Columns bind by exact name. Fields without a column keep their default
 * value.
 */
template <typename T>
class RecordType {
public:
    struct Field {
        std::string name;
        std::function<bool(T&, const Value&)> assign;
    };

    RecordType(std::string name, std::initializer_list<Field> fields)
        : m_name(std::move(name)), m_fields(fields) {
        for (const auto& f : m_fields) {
            m_declared.add(f.name);
        }
    }

    const std::string& name() const { return m_name; }

    const IdentifierSet& fieldNames() const { return m_declared; }

    bool hasField(const std::string& column) const { return m_declared.contains(column); }

    // Throws RecordConstructionError on an undeclared column or a failed conversion
    T construct(const std::vector<std::string>& columns, const Row& row) const {
        T record{};
        size_t count = std::min(columns.size(), row.size());
        for (size_t i = 0; i < count; ++i) {
            const Field* target = fieldFor(columns[i]);
            if (!target) {
                throw RecordConstructionError(m_name, columns[i], "no such field");
            }
            if (!target->assign(record, row[i])) {
                throw RecordConstructionError(m_name, columns[i],
                                              std::string("cannot convert a ") +
                                                  row[i].typeName() + " value");
            }
        }
        return record;
    }

    T construct(const Record& record) const {
        std::vector<std::string> columns;
        Row row;
        for (const auto& f : record.fields()) {
            columns.push_back(f.first);
            row.push_back(f.second);
        }
        return construct(columns, row);
    }

private:
    const Field* fieldFor(const std::string& column) const {
        for (const auto& f : m_fields) {
            if (f.name == column) return &f;
        }
        return nullptr;
    }

    std::string m_name;
    std::vector<Field> m_fields;
    IdentifierSet m_declared;
};

// Declares a typed record field bound to a data member
template <typename T, typename M>
typename RecordType<T>::Field field(std::string name, M T::*member) {
    return {std::move(name), [member](T& record, const Value& value) {
                return fromValue(value, record.*member);
            }};
}

/**
 * Zips column names with each row's values.
 *
 * Unless opts.allowDynamicFieldCreation is set, every column must be in
 * opts.knownColumns; the first one that is not raises UnknownColumnNameError.
 */
std::vector<Record> materialize(const QueryResult& result, const MaterializeOptions& opts = {});

template <typename T>
std::vector<T> materialize(const QueryResult& result, const RecordType<T>& type) {
    for (const auto& column : result.columns) {
        if (!type.hasField(column)) {
            throw RecordConstructionError(type.name(), column, "no such field");
        }
    }

    std::vector<T> records;
    records.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        records.push_back(type.construct(result.columns, row));
    }
    return records;
}

}  // namespace sqlkit
