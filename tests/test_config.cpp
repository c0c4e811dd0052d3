#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Config.hpp"
#include "SQLiteEngine.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>

using namespace sqlkit;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test files
        tempDir_ = std::filesystem::temp_directory_path() / "sqlkit_config_test";
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;

    void writeConfigFile(const std::string& filename, const std::string& content) {
        std::ofstream file(tempDir_ / filename);
        file << content;
    }

    static Config runnableConfig() {
        Config config;
        config.query = "SELECT 1";
        return config;
    }
};

// Default configuration tests
TEST_F(ConfigTest, DefaultPoolConfig) {
    PoolConfig config;

    EXPECT_EQ(config.database, ":memory:");
    EXPECT_EQ(config.pool_name, "default");
    EXPECT_EQ(config.pool_size, 4u);
    EXPECT_EQ(config.checkout_timeout, 5000ms);
    EXPECT_EQ(config.busy_timeout, 5000ms);
    EXPECT_EQ(config.journal_mode, "WAL");
    EXPECT_FALSE(config.read_only);
    EXPECT_TRUE(config.foreign_keys);
    EXPECT_TRUE(config.statement_cache);
}

TEST_F(ConfigTest, DefaultServerConfig) {
    ServerConfig config;

    EXPECT_EQ(config.host, "localhost");
    EXPECT_EQ(config.port, 5432);
    EXPECT_TRUE(config.user.empty());
    EXPECT_TRUE(config.password.empty());
    EXPECT_FALSE(config.use_ssl);
    EXPECT_EQ(config.connect_timeout, 5000ms);
}

TEST_F(ConfigTest, DefaultConfig) {
    Config config;

    EXPECT_EQ(config.backend, "sqlite");
    EXPECT_EQ(config.sql.root_sql_dir, "sql");
    EXPECT_EQ(config.sql.load_sql, "compiled");
    EXPECT_EQ(config.output.format, "csv");
    EXPECT_EQ(config.chunk_size, 2048u);
    EXPECT_FALSE(config.chunked);
    EXPECT_FALSE(config.debug);
}

// Config file loading tests
TEST_F(ConfigTest, LoadFromValidFile) {
    writeConfigFile("valid.conf", R"(
backend = postgresql

[engine]
database = /var/lib/app/app.db
pool_name = reports
pool_size = 8
checkout_timeout = 250
journal_mode = DELETE
foreign_keys = false

[server]
host = pg.example.com
port = 5433
user = reporter
password = secret
database = warehouse

[sql]
root_sql_dir = /opt/app/sql
load_sql = dynamic

[output]
format = json
pretty_json = false
)");

    auto config = Config::loadFromFile(tempDir_ / "valid.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->backend, "postgresql");
    EXPECT_EQ(config->engine.database, "/var/lib/app/app.db");
    EXPECT_EQ(config->engine.pool_name, "reports");
    EXPECT_EQ(config->engine.pool_size, 8u);
    EXPECT_EQ(config->engine.checkout_timeout, 250ms);
    EXPECT_EQ(config->engine.journal_mode, "DELETE");
    EXPECT_FALSE(config->engine.foreign_keys);
    EXPECT_EQ(config->server.host, "pg.example.com");
    EXPECT_EQ(config->server.port, 5433);
    EXPECT_EQ(config->server.user, "reporter");
    EXPECT_EQ(config->server.password, "secret");
    EXPECT_EQ(config->server.database, "warehouse");
    EXPECT_EQ(config->sql.root_sql_dir, "/opt/app/sql");
    EXPECT_EQ(config->sql.load_sql, "dynamic");
    EXPECT_EQ(config->output.format, "json");
    EXPECT_FALSE(config->output.pretty_json);
}

TEST_F(ConfigTest, LoadFromNonExistentFile) {
    auto config = Config::loadFromFile("/nonexistent/path/config.conf");

    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, LoadFromEmptyFile) {
    writeConfigFile("empty.conf", "");

    auto config = Config::loadFromFile(tempDir_ / "empty.conf");

    // Should still return a config with defaults
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->engine.database, ":memory:");
}

TEST_F(ConfigTest, LoadPartialConfig) {
    writeConfigFile("partial.conf", R"(
[server]
host = custom.host.com
)");

    auto config = Config::loadFromFile(tempDir_ / "partial.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->server.host, "custom.host.com");
    // Other values should be defaults
    EXPECT_EQ(config->server.port, 5432);
}

TEST_F(ConfigTest, LoadConfigWithSSL) {
    writeConfigFile("ssl.conf", R"(
[server]
use_ssl = true
ssl_ca = /path/to/ca.pem
ssl_cert = /path/to/cert.pem
ssl_key = /path/to/key.pem
)");

    auto config = Config::loadFromFile(tempDir_ / "ssl.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->server.use_ssl);
    EXPECT_EQ(config->server.ssl_ca, "/path/to/ca.pem");
    EXPECT_EQ(config->server.ssl_cert, "/path/to/cert.pem");
    EXPECT_EQ(config->server.ssl_key, "/path/to/key.pem");
}

TEST_F(ConfigTest, QuotedValuesAreUnwrapped) {
    writeConfigFile("quoted.conf", R"(
[engine]
database = "/tmp/with space.db"
pool_name = 'quoted'
)");

    auto config = Config::loadFromFile(tempDir_ / "quoted.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->engine.database, "/tmp/with space.db");
    EXPECT_EQ(config->engine.pool_name, "quoted");
}

// Boolean parsing tests
TEST_F(ConfigTest, BooleanParsing) {
    writeConfigFile("booleans.conf", R"(
[engine]
read_only = 1
foreign_keys = no
statement_cache = off

[output]
include_csv_header = false
)");

    auto config = Config::loadFromFile(tempDir_ / "booleans.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->engine.read_only);
    EXPECT_FALSE(config->engine.foreign_keys);
    EXPECT_FALSE(config->engine.statement_cache);
    EXPECT_FALSE(config->output.include_csv_header);
}

// Command line tests
TEST_F(ConfigTest, ParseArgsReadsQueryAndParams) {
    const char* argv[] = {"sqlkit", "-D", "app.db", "-q", "SELECT * FROM t WHERE id = $1",
                          "--param", "7", "--param", "x", "-o", "json"};
    Config config = Config::parseArgs(11, const_cast<char**>(argv));

    EXPECT_EQ(config.engine.database, "app.db");
    EXPECT_EQ(config.query, "SELECT * FROM t WHERE id = $1");
    EXPECT_THAT(config.params, ::testing::ElementsAre("7", "x"));
    EXPECT_EQ(config.output.format, "json");
}

TEST_F(ConfigTest, NoCacheFlagForScripts) {
    const char* argv[] = {"sqlkit", "--no-cache", "-q", "CREATE TABLE t (x); INSERT INTO t VALUES (1)"};
    Config config = Config::parseArgs(4, const_cast<char**>(argv));

    EXPECT_FALSE(config.engine.statement_cache);

    const char* plain[] = {"sqlkit", "-q", "SELECT 1"};
    EXPECT_TRUE(Config::parseArgs(3, const_cast<char**>(plain)).engine.statement_cache);
}

TEST_F(ConfigTest, CommandLineOverridesConfigFile) {
    writeConfigFile("base.conf", R"(
[engine]
database = from_file.db
pool_size = 2

[output]
format = json
)");
    std::string path = (tempDir_ / "base.conf").string();

    const char* argv[] = {"sqlkit", "-c", path.c_str(), "-D", "from_cli.db", "-q", "SELECT 1"};
    Config config = Config::parseArgs(7, const_cast<char**>(argv));

    EXPECT_EQ(config.engine.database, "from_cli.db");
    EXPECT_EQ(config.engine.pool_size, 2u);
    EXPECT_EQ(config.output.format, "json");
    EXPECT_EQ(config.query, "SELECT 1");
}

// Config validation tests
TEST_F(ConfigTest, ValidateDefaultsWithQuery) {
    EXPECT_TRUE(runnableConfig().validate());
}

TEST_F(ConfigTest, ValidateRequiresQueryOrFile) {
    Config config;
    EXPECT_FALSE(config.validate());

    config.query = "SELECT 1";
    config.sql_file = "stats.sql";
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsUnknownBackend) {
    Config config = runnableConfig();
    config.backend = "mysql";

    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsBadEngineSettings) {
    Config config = runnableConfig();
    config.engine.pool_size = 0;
    EXPECT_FALSE(config.validate());

    config = runnableConfig();
    config.engine.journal_mode = "SIDEWAYS";
    EXPECT_FALSE(config.validate());

    config = runnableConfig();
    config.engine.journal_mode = "truncate";
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidatePostgreSQLRequiresDatabase) {
    Config config = runnableConfig();
    config.backend = "postgresql";
    EXPECT_FALSE(config.validate());

    config.server.database = "warehouse";
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsUnknownFormatAndLoadMode) {
    Config config = runnableConfig();
    config.output.format = "xml";
    EXPECT_FALSE(config.validate());

    config = runnableConfig();
    config.sql.load_sql = "lazy";
    EXPECT_FALSE(config.validate());
}

// Password resolution tests
TEST_F(ConfigTest, ResolvePasswordFromEnv) {
    Config config;
    config.server.password = "";

    // Set environment variable
    setenv("PGPASSWORD", "env_password", 1);

    config.resolvePassword();

    EXPECT_EQ(config.server.password, "env_password");

    // Clean up
    unsetenv("PGPASSWORD");
}

TEST_F(ConfigTest, ResolvePasswordKeepsExisting) {
    Config config;
    config.server.password = "existing_password";

    setenv("PGPASSWORD", "env_password", 1);

    config.resolvePassword();

    // Should keep existing password
    EXPECT_EQ(config.server.password, "existing_password");

    unsetenv("PGPASSWORD");
}

TEST_F(ConfigTest, ResolvePasswordNoEnvVar) {
    Config config;
    config.server.password = "";

    unsetenv("PGPASSWORD");

    config.resolvePassword();

    // Should remain empty
    EXPECT_TRUE(config.server.password.empty());
}

// Engine options
TEST_F(ConfigTest, EngineConfigMirrorsEngineSection) {
    Config config;
    config.engine.read_only = true;
    config.engine.busy_timeout = 1500ms;
    config.engine.journal_mode = "TRUNCATE";
    config.engine.foreign_keys = false;

    EngineConfig engine = config.engineConfig();

    EXPECT_TRUE(engine.readOnly);
    EXPECT_EQ(engine.busyTimeout, 1500ms);
    EXPECT_EQ(engine.journalMode, "TRUNCATE");
    EXPECT_FALSE(engine.foreignKeys);
}
