#include "Errors.hpp"

namespace sqlkit {

thread_local std::string ErrorContext::s_currentContext;

namespace {

// Prefixes a message with the active error context, if any
std::string withContext(const std::string& message) {
    std::string context = ErrorContext::current();
    if (context.empty()) {
        return message;
    }
    return "[" + context + "] " + message;
}

Error makeError(ErrorCode code, std::string message) {
    Error error;
    error.code = code;
    error.message = withContext(message);
    return error;
}

}  // namespace

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::EngineOpen:         return "EngineOpenError";
        case ErrorCode::QueryExecution:     return "QueryExecutionError";
        case ErrorCode::CheckoutTimeout:    return "CheckoutTimeoutError";
        case ErrorCode::UnsupportedResult:  return "UnsupportedResultError";
        case ErrorCode::RecordConstruction: return "RecordConstructionError";
        case ErrorCode::UnknownColumnName:  return "UnknownColumnNameError";
        case ErrorCode::NoResults:          return "NoResultsError";
        case ErrorCode::MultipleResults:    return "MultipleResultsError";
        case ErrorCode::PoolClosed:         return "PoolClosedError";
        case ErrorCode::SqlFile:            return "SqlFileError";
    }
    return "SqlKitError";
}

// ============================================================================
// Exception Types
// ============================================================================

SqlKitError::SqlKitError(Error error)
    : std::runtime_error(error.message)
    , m_error(std::move(error)) {
}

EngineOpenError::EngineOpenError(const std::string& location, const std::string& cause)
    : SqlKitError([&] {
          Error e = makeError(ErrorCode::EngineOpen,
                              "failed to open database '" + location + "': " + cause);
          e.cause = cause;
          return e;
      }()) {
}

QueryExecutionError::QueryExecutionError(const std::string& sql, const std::string& cause)
    : SqlKitError([&] {
          Error e = makeError(ErrorCode::QueryExecution, "query failed: " + cause);
          e.sql = sql;
          e.cause = cause;
          return e;
      }()) {
}

CheckoutTimeoutError::CheckoutTimeoutError(const std::string& poolName,
                                           std::chrono::milliseconds timeout)
    : SqlKitError(makeError(ErrorCode::CheckoutTimeout,
                            "timed out after " + std::to_string(timeout.count()) +
                                "ms waiting for a connection from pool '" + poolName + "'")) {
}

UnsupportedResultError::UnsupportedResultError(const std::string& observedShape)
    : SqlKitError([&] {
          Error e = makeError(ErrorCode::UnsupportedResult,
                              "unsupported result shape: " + observedShape);
          e.observedShape = observedShape;
          return e;
      }()) {
}

RecordConstructionError::RecordConstructionError(const std::string& typeName,
                                                 const std::string& column,
                                                 const std::string& cause)
    : SqlKitError([&] {
          Error e = makeError(ErrorCode::RecordConstruction,
                              "cannot build " + typeName + " from column '" + column +
                                  "': " + cause);
          e.column = column;
          e.cause = cause;
          return e;
      }()) {
}

UnknownColumnNameError::UnknownColumnNameError(const std::string& column)
    : SqlKitError([&] {
          Error e = makeError(ErrorCode::UnknownColumnName,
                              "column '" + column + "' is not a known identifier");
          e.column = column;
          return e;
      }()) {
}

NoResultsError::NoResultsError(const std::string& queryLabel)
    : SqlKitError([&] {
          Error e = makeError(ErrorCode::NoResults,
                              "expected at least one result but got none for query: " +
                                  queryLabel);
          e.queryLabel = queryLabel;
          return e;
      }()) {
}

MultipleResultsError::MultipleResultsError(const std::string& queryLabel, size_t count)
    : SqlKitError([&] {
          Error e = makeError(ErrorCode::MultipleResults,
                              "expected at most one result but got " + std::to_string(count) +
                                  " for query: " + queryLabel);
          e.queryLabel = queryLabel;
          e.count = count;
          return e;
      }()) {
}

PoolClosedError::PoolClosedError(const std::string& poolName)
    : SqlKitError(makeError(ErrorCode::PoolClosed, "pool '" + poolName + "' is not running")) {
}

SqlFileError::SqlFileError(const std::string& filename, const std::string& cause)
    : SqlKitError([&] {
          Error e = makeError(ErrorCode::SqlFile,
                              "cannot load SQL file '" + filename + "': " + cause);
          e.cause = cause;
          return e;
      }()) {
}

// ============================================================================
// Error Values
// ============================================================================

void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::EngineOpen:         throw EngineOpenError(error);
        case ErrorCode::QueryExecution:     throw QueryExecutionError(error);
        case ErrorCode::CheckoutTimeout:    throw CheckoutTimeoutError(error);
        case ErrorCode::UnsupportedResult:  throw UnsupportedResultError(error);
        case ErrorCode::RecordConstruction: throw RecordConstructionError(error);
        case ErrorCode::UnknownColumnName:  throw UnknownColumnNameError(error);
        case ErrorCode::NoResults:          throw NoResultsError(error);
        case ErrorCode::MultipleResults:    throw MultipleResultsError(error);
        case ErrorCode::PoolClosed:         throw PoolClosedError(error);
        case ErrorCode::SqlFile:            throw SqlFileError(error);
    }
    throw SqlKitError(error);
}

// ============================================================================
// Error Context
// ============================================================================

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

}  // namespace sqlkit
