#include "Config.hpp"
#include "SQLiteEngine.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cctype>
#include <cstdlib>
#include <algorithm>

namespace sqlkit {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::chrono::milliseconds parseMillis(const std::string& value) {
    return std::chrono::milliseconds(std::stol(value));
}

bool isJournalMode(const std::string& mode) {
    static const char* modes[] = {"DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};
    std::string upper = mode;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::find(std::begin(modes), std::end(modes), upper) != std::end(modes);
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Apply to appropriate section
        if (current_section == "engine") {
            if (key == "database") config.engine.database = value;
            else if (key == "pool_name") config.engine.pool_name = value;
            else if (key == "pool_size")
                config.engine.pool_size = static_cast<size_t>(std::stoul(value));
            else if (key == "checkout_timeout") config.engine.checkout_timeout = parseMillis(value);
            else if (key == "busy_timeout") config.engine.busy_timeout = parseMillis(value);
            else if (key == "journal_mode") config.engine.journal_mode = value;
            else if (key == "read_only") config.engine.read_only = parseBool(value);
            else if (key == "foreign_keys") config.engine.foreign_keys = parseBool(value);
            else if (key == "statement_cache") config.engine.statement_cache = parseBool(value);
        }
        else if (current_section == "server") {
            if (key == "host") config.server.host = value;
            else if (key == "port") config.server.port = static_cast<uint16_t>(std::stoi(value));
            else if (key == "user") config.server.user = value;
            else if (key == "password") config.server.password = value;
            else if (key == "database") config.server.database = value;
            else if (key == "pool_size")
                config.server.pool_size = static_cast<size_t>(std::stoul(value));
            else if (key == "use_ssl") config.server.use_ssl = parseBool(value);
            else if (key == "ssl_ca") config.server.ssl_ca = value;
            else if (key == "ssl_cert") config.server.ssl_cert = value;
            else if (key == "ssl_key") config.server.ssl_key = value;
            else if (key == "connect_timeout") config.server.connect_timeout = parseMillis(value);
        }
        else if (current_section == "sql") {
            if (key == "root_sql_dir") config.sql.root_sql_dir = value;
            else if (key == "load_sql") config.sql.load_sql = value;
        }
        else if (current_section == "output") {
            if (key == "format") config.output.format = value;
            else if (key == "pretty_json") config.output.pretty_json = parseBool(value);
            else if (key == "include_csv_header")
                config.output.include_csv_header = parseBool(value);
        }
        else if (current_section.empty()) {
            if (key == "backend") config.backend = value;
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config cli;

    CLI::App app{"sqlkit - run SQL against a pooled SQLite database or a PostgreSQL server"};

    app.add_option("-b,--backend", cli.backend, "Backend (sqlite, postgresql)");

    // What to run
    app.add_option("-q,--query", cli.query, "SQL text to run");
    app.add_option("-f,--file", cli.sql_file, "SQL file to run, relative to the SQL directory");
    app.add_option("--dirname", cli.sql_dirname, "Subdirectory of the SQL root holding --file");
    app.add_option("--sql-dir", cli.sql.root_sql_dir, "Root directory of SQL files");
    app.add_option("--load-sql", cli.sql.load_sql, "SQL file loading (compiled, dynamic)");
    app.add_option("--param", cli.params, "Query parameter, repeatable, bound in order");
    app.add_flag("--chunked", cli.chunked, "Stream rows in chunks");
    app.add_option("--chunk-size", cli.chunk_size, "Rows per chunk when streaming");

    // Engine options
    app.add_option("-D,--database", cli.engine.database, "SQLite database path or :memory:");
    app.add_option("--pool-size", cli.engine.pool_size, "Maximum pooled connections");
    int checkout_timeout = static_cast<int>(cli.engine.checkout_timeout.count());
    app.add_option("--checkout-timeout", checkout_timeout, "Checkout timeout in milliseconds");
    app.add_flag("--read-only", cli.engine.read_only, "Open the database read-only");
    app.add_flag("--no-cache", [&cli](int64_t) { cli.engine.statement_cache = false; },
                 "Skip the statement cache; required for multi-statement scripts, "
                 "since a cached query runs exactly one statement");

    // Server options
    app.add_option("-H,--host", cli.server.host, "PostgreSQL server host");
    app.add_option("-P,--port", cli.server.port, "PostgreSQL server port");
    app.add_option("-u,--user", cli.server.user, "PostgreSQL username");
    app.add_option("-p,--password", cli.server.password, "PostgreSQL password");
    app.add_option("--server-database", cli.server.database, "PostgreSQL database");
    app.add_flag("--ssl", cli.server.use_ssl, "Enable SSL connection");

    // Output options
    app.add_option("-o,--format", cli.output.format, "Output format (csv, json)");
    app.add_flag("--no-header", [&cli](int64_t) { cli.output.include_csv_header = false; },
                 "Omit the CSV header line");
    app.add_flag("--compact", [&cli](int64_t) { cli.output.pretty_json = false; },
                 "Print JSON on one line");

    app.add_flag("-d,--debug", cli.debug, "Enable debug output");
    app.add_option("--log-file", cli.log_file, "Also write logs to this file");

    // Config file
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    cli.engine.checkout_timeout = std::chrono::milliseconds(checkout_timeout);

    if (config_file.empty()) {
        cli.resolvePassword();
        return cli;
    }

    auto file_config = loadFromFile(config_file);
    if (!file_config) {
        spdlog::warn("Could not load config file: {}", config_file);
        cli.resolvePassword();
        return cli;
    }

    // Command line args override file config
    Config config = *file_config;
    auto given = [&app](const char* name) { return app.count(name) > 0; };

    if (given("--backend")) config.backend = cli.backend;
    if (given("--database")) config.engine.database = cli.engine.database;
    if (given("--pool-size")) config.engine.pool_size = cli.engine.pool_size;
    if (given("--checkout-timeout")) config.engine.checkout_timeout = cli.engine.checkout_timeout;
    if (given("--read-only")) config.engine.read_only = cli.engine.read_only;
    if (given("--no-cache")) config.engine.statement_cache = false;
    if (given("--host")) config.server.host = cli.server.host;
    if (given("--port")) config.server.port = cli.server.port;
    if (given("--user")) config.server.user = cli.server.user;
    if (given("--password")) config.server.password = cli.server.password;
    if (given("--server-database")) config.server.database = cli.server.database;
    if (given("--ssl")) config.server.use_ssl = cli.server.use_ssl;
    if (given("--sql-dir")) config.sql.root_sql_dir = cli.sql.root_sql_dir;
    if (given("--load-sql")) config.sql.load_sql = cli.sql.load_sql;
    if (given("--format")) config.output.format = cli.output.format;
    if (given("--no-header")) config.output.include_csv_header = false;
    if (given("--compact")) config.output.pretty_json = false;

    config.query = cli.query;
    config.sql_file = cli.sql_file;
    config.sql_dirname = cli.sql_dirname;
    config.params = cli.params;
    config.chunked = cli.chunked;
    config.chunk_size = cli.chunk_size;
    config.debug = cli.debug;
    config.log_file = cli.log_file;

    // Resolve password from environment if not set
    config.resolvePassword();

    return config;
}

bool Config::validate() const {
    if (backend != "sqlite" && backend != "postgresql") {
        spdlog::error("Unknown backend: {} (use sqlite or postgresql)", backend);
        return false;
    }

    if (query.empty() == sql_file.empty()) {
        spdlog::error("Exactly one of --query and --file is required");
        return false;
    }

    if (output.format != "csv" && output.format != "json") {
        spdlog::error("Unknown output format: {}", output.format);
        return false;
    }

    if (sql.load_sql != "compiled" && sql.load_sql != "dynamic") {
        spdlog::error("Unknown load_sql mode: {}", sql.load_sql);
        return false;
    }

    if (chunk_size == 0) {
        spdlog::error("Chunk size must be positive");
        return false;
    }

    if (backend == "sqlite") {
        if (engine.database.empty()) {
            spdlog::error("SQLite database is required (use -D option)");
            return false;
        }
        if (engine.pool_size == 0) {
            spdlog::error("Pool size must be positive");
            return false;
        }
        if (!engine.journal_mode.empty() && !isJournalMode(engine.journal_mode)) {
            spdlog::error("Unknown journal mode: {}", engine.journal_mode);
            return false;
        }
        return true;
    }

    if (server.database.empty()) {
        spdlog::error("PostgreSQL database is required (use --server-database option)");
        return false;
    }

    if (chunked) {
        spdlog::error("Chunked output is only available for the sqlite backend");
        return false;
    }

    if (server.use_ssl) {
        if (!server.ssl_ca.empty() && !std::filesystem::exists(server.ssl_ca)) {
            spdlog::error("SSL CA file not found: {}", server.ssl_ca);
            return false;
        }
        if (!server.ssl_cert.empty() && !std::filesystem::exists(server.ssl_cert)) {
            spdlog::error("SSL certificate file not found: {}", server.ssl_cert);
            return false;
        }
        if (!server.ssl_key.empty() && !std::filesystem::exists(server.ssl_key)) {
            spdlog::error("SSL key file not found: {}", server.ssl_key);
            return false;
        }
    }

    return true;
}

void Config::resolvePassword() {
    if (server.password.empty()) {
        const char* env_pwd = std::getenv("PGPASSWORD");
        if (env_pwd) {
            server.password = env_pwd;
        }
    }
}

EngineConfig Config::engineConfig() const {
    EngineConfig result;
    result.readOnly = engine.read_only;
    result.busyTimeout = engine.busy_timeout;
    result.journalMode = engine.journal_mode;
    result.foreignKeys = engine.foreign_keys;
    return result;
}

}  // namespace sqlkit
