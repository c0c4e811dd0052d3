#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Errors.hpp"

using namespace sqlkit;
using ::testing::StartsWith;

class ErrorsTest : public ::testing::Test {
};

// Exception types
TEST_F(ErrorsTest, QueryExecutionErrorCarriesSqlAndCause) {
    QueryExecutionError error("SELECT nope", "no such column: nope");

    EXPECT_EQ(error.code(), ErrorCode::QueryExecution);
    EXPECT_EQ(error.error().sql, "SELECT nope");
    EXPECT_EQ(error.error().cause, "no such column: nope");
    EXPECT_STREQ(error.what(), "query failed: no such column: nope");
}

TEST_F(ErrorsTest, OneRowErrorsNameTheQuery) {
    NoResultsError none("stats.sql");
    MultipleResultsError many("SELECT * FROM users", 3);

    EXPECT_STREQ(none.what(), "expected at least one result but got none for query: stats.sql");
    EXPECT_EQ(none.error().queryLabel, "stats.sql");
    EXPECT_STREQ(many.what(),
                 "expected at most one result but got 3 for query: SELECT * FROM users");
    EXPECT_EQ(many.error().count, 3u);
}

TEST_F(ErrorsTest, StructuredFields) {
    EXPECT_EQ(UnsupportedResultError("PGRES_COPY_OUT").error().observedShape, "PGRES_COPY_OUT");
    EXPECT_EQ(UnknownColumnNameError("secret").error().column, "secret");
    EXPECT_EQ(RecordConstructionError("User", "age", "bad").error().column, "age");
    EXPECT_EQ(EngineOpenError("/x.db", "unable to open").error().cause, "unable to open");
}

TEST_F(ErrorsTest, AllDeriveFromSqlKitError) {
    EXPECT_THROW(throw CheckoutTimeoutError("main", std::chrono::milliseconds(10)), SqlKitError);
    EXPECT_THROW(throw PoolClosedError("main"), std::runtime_error);
    EXPECT_THROW(throw SqlFileError("a.sql", "missing"), SqlKitError);
}

TEST_F(ErrorsTest, ErrorCodeNames) {
    EXPECT_STREQ(errorCodeName(ErrorCode::EngineOpen), "EngineOpenError");
    EXPECT_STREQ(errorCodeName(ErrorCode::MultipleResults), "MultipleResultsError");
    EXPECT_STREQ(errorCodeName(ErrorCode::SqlFile), "SqlFileError");
}

// Error values
TEST_F(ErrorsTest, ThrowErrorRestoresTheExceptionType) {
    Error error = MultipleResultsError("q", 2).error();

    try {
        throwError(error);
        FAIL() << "expected MultipleResultsError";
    } catch (const MultipleResultsError& e) {
        EXPECT_EQ(e.error().count, 2u);
        EXPECT_EQ(e.error().queryLabel, "q");
    }
}

TEST_F(ErrorsTest, CaptureTurnsExceptionIntoResult) {
    Result<int> failed = capture([]() -> int { throw NoResultsError("q"); });
    Result<int> succeeded = capture([] { return 7; });

    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().code, ErrorCode::NoResults);
    ASSERT_TRUE(succeeded);
    EXPECT_EQ(succeeded.value(), 7);
}

TEST_F(ErrorsTest, ResultValueRethrows) {
    Result<int> failed = Error(PoolClosedError("main").error());

    EXPECT_THROW(failed.value(), PoolClosedError);
}

TEST_F(ErrorsTest, CaptureLetsOtherExceptionsThrough) {
    EXPECT_THROW(capture([]() -> int { throw std::logic_error("bug"); }), std::logic_error);
}

// Error context
TEST_F(ErrorsTest, ContextPrefixesMessages) {
    {
        ErrorContext outer("pool main");
        ErrorContext inner("stats.sql");

        EXPECT_EQ(ErrorContext::current(), "pool main > stats.sql");
        EXPECT_STREQ(QueryExecutionError("SELECT", "boom").what(),
                     "[pool main > stats.sql] query failed: boom");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
    EXPECT_THAT(std::string(QueryExecutionError("SELECT", "boom").what()),
                StartsWith("query failed"));
}
