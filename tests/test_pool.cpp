#include <gtest/gtest.h>
#include "Errors.hpp"
#include "Pool.hpp"
#include <chrono>
#include <stdexcept>

using namespace sqlkit;
using namespace std::chrono_literals;

class PoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        metrics_ = std::make_shared<EngineMetrics>();
        pool_.emplace(PoolHandle::start("people", ":memory:", 1, EngineConfig{}, metrics_));

        query(*pool_, "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT, age INTEGER)");
        query(*pool_, "INSERT INTO users (name, age) VALUES ('alice', 31), ('bob', 27), ('carol', 44)");
    }

    void TearDown() override {
        if (pool_) pool_->stop();
    }

    std::shared_ptr<EngineMetrics> metrics_;
    std::optional<PoolHandle> pool_;
};

// Query tests

TEST_F(PoolTest, QueryReturnsOrderedRows) {
    QueryResult result = query(*pool_, "SELECT name, age FROM users WHERE age > $1 ORDER BY age",
                               {Value(30)});

    ASSERT_EQ(result.columns, (std::vector<std::string>{"name", "age"}));
    ASSERT_EQ(result.rows.size(), 2u);
    EXPECT_EQ(result.rows[0][0], Value("alice"));
    EXPECT_EQ(result.rows[1][0], Value("carol"));
}

TEST_F(PoolTest, CachedQueryPreparesOnce) {
    uint64_t before = metrics_->prepares.load();
    for (int i = 0; i < 3; ++i) {
        query(*pool_, "SELECT count(*) FROM users");
    }

    EXPECT_EQ(metrics_->prepares.load() - before, 1u);
}

TEST_F(PoolTest, UncachedQueryPreparesEveryTime) {
    QueryOptions opts;
    opts.cache = false;

    uint64_t before = metrics_->prepares.load();
    for (int i = 0; i < 3; ++i) {
        query(*pool_, "SELECT count(*) FROM users", {}, opts);
    }

    EXPECT_EQ(metrics_->prepares.load() - before, 3u);
}

TEST_F(PoolTest, FailedQueryKeepsConnection) {
    EXPECT_THROW(query(*pool_, "SELECT * FROM missing_table"), QueryExecutionError);

    EXPECT_EQ(pool_->supervisor().availableCount(), 1u);
    EXPECT_EQ(query(*pool_, "SELECT count(*) FROM users").rows.size(), 1u);
}

TEST_F(PoolTest, QueryErrorCarriesPoolContext) {
    try {
        query(*pool_, "SELEC 1");
        FAIL() << "expected QueryExecutionError";
    } catch (const QueryExecutionError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("[pool people] ", 0), 0u);
        EXPECT_EQ(e.error().sql, "SELEC 1");
    }
}

TEST_F(PoolTest, StoppedHandleIsClosed) {
    PoolHandle copy = *pool_;
    copy.stop();

    EXPECT_FALSE(pool_->running());
    EXPECT_THROW(query(*pool_, "SELECT 1"), PoolClosedError);
}

TEST_F(PoolTest, TryQueryReturnsRows) {
    Result<QueryResult> result = tryQuery(*pool_, "SELECT name FROM users WHERE id = $1", {Value(2)});

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().rows.size(), 1u);
    EXPECT_EQ(result.value().rows[0][0], Value("bob"));
}

TEST_F(PoolTest, TryQueryCarriesTheError) {
    Result<QueryResult> broken = tryQuery(*pool_, "SELECT * FROM missing_table");

    ASSERT_FALSE(broken.ok());
    EXPECT_EQ(broken.error().code, ErrorCode::QueryExecution);
    EXPECT_EQ(broken.error().sql, "SELECT * FROM missing_table");
    EXPECT_EQ(pool_->supervisor().availableCount(), 1u);

    pool_->stop();
    Result<QueryResult> closed = tryQuery(*pool_, "SELECT 1");
    ASSERT_FALSE(closed.ok());
    EXPECT_EQ(closed.error().code, ErrorCode::PoolClosed);
}

TEST_F(PoolTest, LeaseOutlivesTemporaryHandle) {
    auto metrics = std::make_shared<EngineMetrics>();
    PooledConnection lease = PoolHandle::start("temp", ":memory:", 1, EngineConfig{}, metrics).acquire();

    EXPECT_EQ(metrics->releases.load(), 0u);
    EXPECT_EQ(lease->execute("SELECT 42 AS answer").rows[0][0], Value(int64_t(42)));

    lease.release();
    EXPECT_EQ(metrics->releases.load(), 1u);
}

TEST_F(PoolTest, StartWithZeroPoolSizeFails) {
    EXPECT_THROW(PoolHandle::start("empty", ":memory:", 0), std::invalid_argument);
}

// Connection scope tests

TEST_F(PoolTest, WithConnectionReturnsBodyResult) {
    size_t count = withConnection(*pool_, [](SQLiteConnection& conn) {
        conn.execute("INSERT INTO users (name, age) VALUES ('dave', 19)");
        return conn.execute("SELECT * FROM users").rows.size();
    });

    EXPECT_EQ(count, 4u);
    EXPECT_EQ(pool_->supervisor().inUseCount(), 0u);
}

TEST_F(PoolTest, WithConnectionPropagatesExceptions) {
    EXPECT_THROW(withConnection(*pool_, [](SQLiteConnection&) -> int {
                     throw std::runtime_error("boom");
                 }),
                 std::runtime_error);

    EXPECT_EQ(pool_->supervisor().availableCount(), 1u);
}

TEST_F(PoolTest, CheckoutBodyCanDiscardConnection) {
    int64_t rowid = checkout(*pool_, [](SQLiteConnection& conn) {
        conn.execute("INSERT INTO users (name, age) VALUES ('erin', 52)");
        return Checkout<int64_t>{conn.lastInsertRowId(), Checkin::Discard};
    });

    EXPECT_EQ(rowid, 4);
    EXPECT_EQ(pool_->supervisor().totalCount(), 0u);
    EXPECT_EQ(metrics_->disconnects.load(), 1u);

    // Data lives in the shared database, not the discarded session
    EXPECT_EQ(query(*pool_, "SELECT * FROM users").rows.size(), 4u);
}

TEST_F(PoolTest, ConnectionIsExclusiveWhileCheckedOut) {
    withConnection(*pool_, [this](SQLiteConnection&) {
        QueryOptions opts;
        opts.timeout = 20ms;
        EXPECT_THROW(query(*pool_, "SELECT 1", {}, opts), CheckoutTimeoutError);
        return 0;
    });
}

// Streaming tests

TEST_F(PoolTest, WithStreamDeliversChunks) {
    QueryOptions opts;
    opts.chunkSize = 2;

    std::vector<size_t> sizes = withStream(*pool_, "SELECT name FROM users ORDER BY id", {},
                                           [](ChunkStream& stream) {
                                               std::vector<size_t> out;
                                               while (auto chunk = stream.next()) {
                                                   out.push_back(chunk->size());
                                               }
                                               return out;
                                           },
                                           opts);

    EXPECT_EQ(sizes, (std::vector<size_t>{2, 1}));
    EXPECT_EQ(pool_->supervisor().inUseCount(), 0u);
}

TEST_F(PoolTest, ChunkedQueryReturnsConnectionWhenExhausted) {
    QueryOptions opts;
    opts.chunkSize = 2;

    PooledChunkStream stream = queryChunked(*pool_, "SELECT id, name FROM users ORDER BY id",
                                            {}, opts);
    EXPECT_EQ(stream.columns(), (std::vector<std::string>{"id", "name"}));
    EXPECT_EQ(pool_->supervisor().inUseCount(), 1u);

    auto first = stream.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->size(), 2u);
    EXPECT_EQ((*first)[0][1], Value("alice"));

    auto second = stream.next();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->size(), 1u);

    EXPECT_FALSE(stream.next());
    EXPECT_TRUE(stream.exhausted());
    EXPECT_EQ(pool_->supervisor().inUseCount(), 0u);
    EXPECT_FALSE(stream.next());
}

TEST_F(PoolTest, ClosingChunkedQueryReturnsConnection) {
    QueryOptions opts;
    opts.chunkSize = 1;

    PooledChunkStream stream = queryChunked(*pool_, "SELECT * FROM users", {}, opts);
    ASSERT_TRUE(stream.next());

    stream.close();

    EXPECT_TRUE(stream.exhausted());
    EXPECT_EQ(pool_->supervisor().availableCount(), 1u);
    EXPECT_EQ(query(*pool_, "SELECT count(*) FROM users").rows[0][0], Value(3));
}

TEST_F(PoolTest, DestroyedChunkedQueryReturnsConnection) {
    {
        PooledChunkStream stream = queryChunked(*pool_, "SELECT * FROM users");
    }

    EXPECT_EQ(pool_->supervisor().inUseCount(), 0u);
}

TEST_F(PoolTest, ChunkedQueryOnEmptyResult) {
    PooledChunkStream stream = queryChunked(*pool_, "SELECT * FROM users WHERE age > 100");

    EXPECT_EQ(stream.columns().size(), 3u);
    EXPECT_FALSE(stream.next());
    EXPECT_EQ(pool_->supervisor().inUseCount(), 0u);
}

TEST_F(PoolTest, ChunkedQueryOnStandaloneConnection) {
    auto conn = SQLiteConnection::open(":memory:");
    conn->execute("CREATE TABLE n (x INTEGER)");
    conn->execute("INSERT INTO n VALUES (1), (2), (3), (4), (5)");

    QueryOptions opts;
    opts.chunkSize = 2;
    ChunkStream stream = queryChunked(*conn, "SELECT x FROM n ORDER BY x", {}, opts);

    size_t rows = 0;
    size_t chunks = 0;
    while (auto chunk = stream.next()) {
        rows += chunk->size();
        ++chunks;
    }
    EXPECT_EQ(rows, 5u);
    EXPECT_EQ(chunks, 3u);
}
