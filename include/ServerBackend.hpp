#pragma once

#include "QueryOptions.hpp"
#include "Value.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlkit {

// Native result returned by a conventional SQL server
class ServerResult {
public:
    virtual ~ServerResult() = default;

    // Driver-specific name of the result kind ("PGRES_TUPLES_OK", ...)
    virtual std::string shape() const = 0;

    // Columns and rows, or nothing if the result is not a row set or command completion
    virtual std::optional<QueryResult> columnsAndRows() const = 0;
};

// Conventional SQL server reachable through a client library
class ServerBackend {
public:
    virtual ~ServerBackend() = default;

    virtual std::string name() const = 0;

    // Runs one query; throws QueryExecutionError if the server rejects it
    virtual std::unique_ptr<ServerResult> run(const std::string& sql,
                                              const std::vector<Value>& params,
                                              const QueryOptions& opts) = 0;
};

// Extracts (columns, rows); throws UnsupportedResultError for any other shape
QueryResult extractResult(const ServerResult& result);

}  // namespace sqlkit
