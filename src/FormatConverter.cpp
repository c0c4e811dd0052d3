#include "FormatConverter.hpp"
#include <algorithm>
#include <sstream>

namespace sqlkit {

namespace {

struct JsonVisitor {
    json operator()(const std::monostate&) const { return nullptr; }
    json operator()(bool v) const { return v; }
    json operator()(int64_t v) const { return v; }
    json operator()(WideInt v) const { return wideIntToString(v); }
    json operator()(double v) const { return v; }
    json operator()(const std::string& v) const { return v; }
    json operator()(const Blob& v) const { return Value(v).toString(); }

    json operator()(const ValueList& v) const { return items(v.items); }
    json operator()(const ValueTuple& v) const { return items(v.items); }

    json operator()(const ValueStruct& v) const {
        json obj = json::object();
        for (const auto& field : v.fields) {
            obj[field.first] = FormatConverter::valueToJSON(field.second);
        }
        return obj;
    }

    json items(const std::vector<Value>& values) const {
        json arr = json::array();
        for (const auto& item : values) {
            arr.push_back(FormatConverter::valueToJSON(item));
        }
        return arr;
    }
};

}  // namespace

json FormatConverter::valueToJSON(const Value& value) {
    return std::visit(JsonVisitor{}, value.storage());
}

std::string FormatConverter::valueToCSV(const Value& value) {
    return value.toString();
}

std::string FormatConverter::toCSV(const QueryResult& result, const CSVOptions& options) {
    std::ostringstream out;
    auto writeLine = [&](size_t count, auto cell) {
        for (size_t i = 0; i < count; ++i) {
            if (i > 0) out << options.delimiter;
            out << cell(i);
        }
        out << options.lineEnding;
    };

    if (options.includeHeader) {
        writeLine(result.columns.size(),
                  [&](size_t i) { return escapeCSVField(result.columns[i], options); });
    }

    // NULL cells stay empty, even with quoteAll
    for (const auto& row : result.rows) {
        writeLine(row.size(), [&](size_t i) {
            return row[i].isNull() ? std::string() : escapeCSVField(valueToCSV(row[i]), options);
        });
    }

    return out.str();
}

json FormatConverter::rowObject(const std::vector<std::string>& columns, const Row& values,
                                const JSONOptions& options) {
    json obj = json::object();
    size_t count = std::min(columns.size(), values.size());
    for (size_t i = 0; i < count; ++i) {
        if (values[i].isNull() && !options.includeNull) continue;
        obj[columns[i]] = valueToJSON(values[i]);
    }
    return obj;
}

std::string FormatConverter::dump(const json& doc, const JSONOptions& options) {
    return options.pretty ? doc.dump(options.indent) : doc.dump();
}

std::string FormatConverter::toJSON(const QueryResult& result, const JSONOptions& options) {
    json rows = json::array();
    for (const auto& row : result.rows) {
        rows.push_back(rowObject(result.columns, row, options));
    }

    if (options.arrayFormat) {
        return dump(rows, options);
    }
    return dump(json{{"columns", result.columns}, {"rows", std::move(rows)}}, options);
}

std::string FormatConverter::rowToJSON(const std::vector<std::string>& columns, const Row& values,
                                       const JSONOptions& options) {
    return dump(rowObject(columns, values, options), options);
}

std::string FormatConverter::recordToJSON(const Record& record, const JSONOptions& options) {
    std::vector<std::string> columns;
    Row values;
    for (const auto& [key, value] : record.fields()) {
        columns.push_back(key);
        values.push_back(value);
    }
    return rowToJSON(columns, values, options);
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                             const CSVOptions& options) {
    const char special[] = {options.delimiter, options.quote, '\n', '\r', '\0'};
    if (!options.quoteAll && field.find_first_of(special) == std::string::npos) {
        return field;
    }

    std::string quoted(1, options.quote);
    for (char c : field) {
        if (c == options.quote) quoted += options.quote;
        quoted += c;
    }
    quoted += options.quote;
    return quoted;
}

}  // namespace sqlkit
