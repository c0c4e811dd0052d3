#include "Record.hpp"
#include <limits>
#include <stdexcept>

namespace sqlkit {

// ============================================================================
// Record
// ============================================================================

void Record::set(const std::string& name, Value value) {
    for (auto& field : m_fields) {
        if (field.first == name) {
            field.second = std::move(value);
            return;
        }
    }
    m_fields.emplace_back(name, std::move(value));
}

const Value* Record::find(const std::string& name) const {
    for (const auto& field : m_fields) {
        if (field.first == name) return &field.second;
    }
    return nullptr;
}

const Value& Record::at(const std::string& name) const {
    const Value* value = find(name);
    if (!value) {
        throw std::out_of_range("record has no field '" + name + "'");
    }
    return *value;
}

// ============================================================================
// Value Conversions
// ============================================================================

bool fromValue(const Value& value, Value& out) {
    out = value;
    return true;
}

bool fromValue(const Value& value, bool& out) {
    if (value.is<bool>()) {
        out = value.as<bool>();
        return true;
    }
    if (value.is<int64_t>() && (value.as<int64_t>() == 0 || value.as<int64_t>() == 1)) {
        out = value.as<int64_t>() == 1;
        return true;
    }
    return false;
}

bool fromValue(const Value& value, int& out) {
    int64_t wide = 0;
    if (!fromValue(value, wide)) return false;
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(wide);
    return true;
}

bool fromValue(const Value& value, int64_t& out) {
    if (value.is<int64_t>()) {
        out = value.as<int64_t>();
        return true;
    }
    if (value.is<WideInt>() && fitsInInt64(value.as<WideInt>())) {
        out = static_cast<int64_t>(value.as<WideInt>());
        return true;
    }
    return false;
}

bool fromValue(const Value& value, WideInt& out) {
    if (value.is<WideInt>()) {
        out = value.as<WideInt>();
        return true;
    }
    if (value.is<int64_t>()) {
        out = value.as<int64_t>();
        return true;
    }
    return false;
}

bool fromValue(const Value& value, double& out) {
    if (value.is<double>()) {
        out = value.as<double>();
        return true;
    }
    if (value.is<int64_t>()) {
        out = static_cast<double>(value.as<int64_t>());
        return true;
    }
    return false;
}

bool fromValue(const Value& value, std::string& out) {
    if (!value.is<std::string>()) return false;
    out = value.as<std::string>();
    return true;
}

bool fromValue(const Value& value, Blob& out) {
    if (!value.is<Blob>()) return false;
    out = value.as<Blob>();
    return true;
}

// ============================================================================
// Materialization
// ============================================================================

std::vector<Record> materialize(const QueryResult& result, const MaterializeOptions& opts) {
    if (!opts.allowDynamicFieldCreation) {
        for (const auto& column : result.columns) {
            if (!opts.knownColumns.contains(column)) {
                throw UnknownColumnNameError(column);
            }
        }
    }

    std::vector<Record> records;
    records.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        Record record;
        size_t count = std::min(result.columns.size(), row.size());
        for (size_t i = 0; i < count; ++i) {
            record.set(result.columns[i], row[i]);
        }
        records.push_back(std::move(record));
    }
    return records;
}

}  // namespace sqlkit
