#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sqlkit {

struct EngineConfig;

struct PoolConfig {
    std::string database = ":memory:";
    std::string pool_name = "default";
    size_t pool_size = 4;
    std::chrono::milliseconds checkout_timeout{5000};
    std::chrono::milliseconds busy_timeout{5000};
    std::string journal_mode = "WAL";
    bool read_only = false;
    bool foreign_keys = true;
    bool statement_cache = true;  // cached queries hold a single statement
};

struct ServerConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user;
    std::string password;
    std::string database;
    size_t pool_size = 4;

    // SSL options
    bool use_ssl = false;
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;

    std::chrono::milliseconds connect_timeout{5000};
};

struct SqlConfig {
    std::string root_sql_dir = "sql";
    std::string load_sql = "compiled";  // compiled, dynamic
};

struct OutputConfig {
    std::string format = "csv";  // csv, json
    bool pretty_json = true;
    bool include_csv_header = true;
};

struct Config {
    PoolConfig engine;
    ServerConfig server;
    SqlConfig sql;
    OutputConfig output;

    std::string backend = "sqlite";  // sqlite, postgresql

    // What to run
    std::string query;
    std::string sql_file;
    std::string sql_dirname;
    std::vector<std::string> params;
    bool chunked = false;
    size_t chunk_size = 2048;

    bool debug = false;
    std::string log_file;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();

    // Engine options for the [engine] section
    EngineConfig engineConfig() const;
};

}  // namespace sqlkit
