#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Errors.hpp"
#include "SQLiteConnection.hpp"
#include "StatementCache.hpp"

using namespace sqlkit;

class StatementCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        metrics_ = std::make_shared<EngineMetrics>();
        conn_ = SQLiteConnection::open(":memory:", {}, metrics_);
    }

    std::shared_ptr<EngineMetrics> metrics_;
    std::unique_ptr<SQLiteConnection> conn_;
    StatementCache cache_;

    void TearDown() override {
        // Cached statements must go before their session
        cache_.clear();
    }
};

TEST_F(StatementCacheTest, MissPreparesAndHitReuses) {
    SQLiteStatement& first = cache_.lookupOrPrepare(*conn_, "SELECT 1");
    uint64_t prepares = metrics_->prepares.load();
    SQLiteStatement& second = cache_.lookupOrPrepare(*conn_, "SELECT 1");

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(metrics_->prepares.load(), prepares);
    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_TRUE(cache_.contains("SELECT 1"));
}

TEST_F(StatementCacheTest, KeysAreVerbatim) {
    cache_.lookupOrPrepare(*conn_, "SELECT 1");
    cache_.lookupOrPrepare(*conn_, "select 1");
    cache_.lookupOrPrepare(*conn_, "SELECT 1 ");

    EXPECT_EQ(cache_.size(), 3u);
}

TEST_F(StatementCacheTest, HitResetsBindings) {
    SQLiteStatement& stmt = cache_.lookupOrPrepare(*conn_, "SELECT $1");
    stmt.bind({Value(5)});
    ASSERT_TRUE(stmt.step());

    SQLiteStatement& again = cache_.lookupOrPrepare(*conn_, "SELECT $1");
    ASSERT_TRUE(again.step());

    // Bindings were cleared, so the parameter reads as NULL
    EXPECT_TRUE(again.columnValue(0).isNull());
}

TEST_F(StatementCacheTest, PrepareFailureIsNotCached) {
    EXPECT_THROW(cache_.lookupOrPrepare(*conn_, "SELEC 1"), QueryExecutionError);
    EXPECT_THROW(cache_.lookupOrPrepare(*conn_, "SELECT 1; SELECT 2"), QueryExecutionError);

    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(StatementCacheTest, ClearFinalizesEverything) {
    cache_.lookupOrPrepare(*conn_, "SELECT 1");
    cache_.lookupOrPrepare(*conn_, "SELECT 2");

    cache_.clear();

    EXPECT_EQ(cache_.size(), 0u);
    EXPECT_FALSE(cache_.contains("SELECT 1"));
    EXPECT_EQ(sqlite3_next_stmt(conn_->get(), nullptr), nullptr);
}
