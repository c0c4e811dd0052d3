#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace sqlkit {

enum class ErrorCode {
    EngineOpen,
    QueryExecution,
    CheckoutTimeout,
    UnsupportedResult,
    RecordConstruction,
    UnknownColumnName,
    NoResults,
    MultipleResults,
    PoolClosed,
    SqlFile
};

const char* errorCodeName(ErrorCode code);

// Structured description of a failure; only the fields relevant to the code are set
struct Error {
    ErrorCode code = ErrorCode::QueryExecution;
    std::string message;
    std::string sql;
    std::string queryLabel;
    size_t count = 0;
    std::string observedShape;
    std::string column;
    std::string cause;
};

// Base of every exception the library throws
class SqlKitError : public std::runtime_error {
public:
    explicit SqlKitError(Error error);

    const Error& error() const { return m_error; }
    ErrorCode code() const { return m_error.code; }

private:
    Error m_error;
};

// Engine could not be opened (bad path, lock contention, corrupt file)
class EngineOpenError : public SqlKitError {
public:
    explicit EngineOpenError(Error error) : SqlKitError(std::move(error)) {}
    EngineOpenError(const std::string& location, const std::string& cause);
};

class QueryExecutionError : public SqlKitError {
public:
    explicit QueryExecutionError(Error error) : SqlKitError(std::move(error)) {}
    QueryExecutionError(const std::string& sql, const std::string& cause);
};

class CheckoutTimeoutError : public SqlKitError {
public:
    explicit CheckoutTimeoutError(Error error) : SqlKitError(std::move(error)) {}
    CheckoutTimeoutError(const std::string& poolName, std::chrono::milliseconds timeout);
};

// Server result was neither a row set nor a command completion
class UnsupportedResultError : public SqlKitError {
public:
    explicit UnsupportedResultError(Error error) : SqlKitError(std::move(error)) {}
    explicit UnsupportedResultError(const std::string& observedShape);
};

class RecordConstructionError : public SqlKitError {
public:
    explicit RecordConstructionError(Error error) : SqlKitError(std::move(error)) {}
    RecordConstructionError(const std::string& typeName, const std::string& column,
                            const std::string& cause);
};

// Column name outside the declared identifier set
class UnknownColumnNameError : public SqlKitError {
public:
    explicit UnknownColumnNameError(Error error) : SqlKitError(std::move(error)) {}
    explicit UnknownColumnNameError(const std::string& column);
};

class NoResultsError : public SqlKitError {
public:
    explicit NoResultsError(Error error) : SqlKitError(std::move(error)) {}
    explicit NoResultsError(const std::string& queryLabel);
};

class MultipleResultsError : public SqlKitError {
public:
    explicit MultipleResultsError(Error error) : SqlKitError(std::move(error)) {}
    MultipleResultsError(const std::string& queryLabel, size_t count);
};

class PoolClosedError : public SqlKitError {
public:
    explicit PoolClosedError(Error error) : SqlKitError(std::move(error)) {}
    explicit PoolClosedError(const std::string& poolName);
};

class SqlFileError : public SqlKitError {
public:
    explicit SqlFileError(Error error) : SqlKitError(std::move(error)) {}
    SqlFileError(const std::string& filename, const std::string& cause);
};

// Rethrows an Error as the exception type matching its code
[[noreturn]] void throwError(const Error& error);

// Either a value or the Error that prevented producing it
template <typename T>
class Result {
public:
    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : m_data(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return m_data.index() == 0; }
    explicit operator bool() const { return ok(); }

    // Throws the carried error when not ok
    const T& value() const& {
        if (!ok()) throwError(error());
        return std::get<0>(m_data);
    }

    T value() && {
        if (!ok()) throwError(error());
        return std::move(std::get<0>(m_data));
    }

    const Error& error() const { return std::get<1>(m_data); }

private:
    std::variant<T, Error> m_data;
};

// Runs fn, turning a thrown SqlKitError into an error Result
template <typename Fn>
auto capture(Fn&& fn) -> Result<std::invoke_result_t<Fn>> {
    try {
        return std::forward<Fn>(fn)();
    } catch (const SqlKitError& e) {
        return e.error();
    }
}

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    explicit ErrorContext(const std::string& context);
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

}  // namespace sqlkit
