#pragma once

#include "Record.hpp"
#include "Value.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqlkit {

using json = nlohmann::json;

struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
    bool arrayFormat = true;  // true = array of objects, false = object with rows array
};

// Renders query results for output
class FormatConverter {
public:
    static std::string toCSV(const QueryResult& result, const CSVOptions& options = CSVOptions{});

    static std::string toJSON(const QueryResult& result,
                              const JSONOptions& options = JSONOptions{});

    static std::string rowToJSON(const std::vector<std::string>& columns, const Row& values,
                                 const JSONOptions& options = JSONOptions{});
    static std::string recordToJSON(const Record& record,
                                    const JSONOptions& options = JSONOptions{});

    // Wide integers and blobs become strings; lists and tuples arrays; structs objects
    static json valueToJSON(const Value& value);

    // Text form of a value in a CSV cell; NULL is empty
    static std::string valueToCSV(const Value& value);

    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});

private:
    static json rowObject(const std::vector<std::string>& columns, const Row& values,
                          const JSONOptions& options);

    static std::string dump(const json& doc, const JSONOptions& options);
};

}  // namespace sqlkit
