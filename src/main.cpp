#include "Backend.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "FormatConverter.hpp"
#include "Pool.hpp"
#include "PostgreSQLConnectionPool.hpp"
#include "SQLiteEngine.hpp"
#include "SqlFileStore.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <vector>

using namespace sqlkit;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Results go to stdout, so logs go to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
            file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("sqlkit", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

// "null" is NULL; integers and reals are numbers; anything else is text
Value parseParam(const std::string& text) {
    if (text == "null") return Value();
    if (text.empty()) return Value(text);

    char* end = nullptr;
    errno = 0;
    long long integer = std::strtoll(text.c_str(), &end, 10);
    if (errno == 0 && *end == '\0') return Value(static_cast<int64_t>(integer));

    errno = 0;
    double real = std::strtod(text.c_str(), &end);
    if (errno == 0 && *end == '\0') return Value(real);

    return Value(text);
}

std::string loadSql(const Config& config) {
    if (!config.query.empty()) return config.query;

    SqlFileStore store(config.sql.root_sql_dir, config.sql_dirname, {config.sql_file},
                       parseLoadMode(config.sql.load_sql));
    return store.load(config.sql_file);
}

void printResult(const Config& config, const QueryResult& result) {
    if (config.output.format == "json") {
        JSONOptions options;
        options.pretty = config.output.pretty_json;
        std::cout << FormatConverter::toJSON(result, options) << std::endl;
    } else {
        CSVOptions options;
        options.includeHeader = config.output.include_csv_header;
        std::cout << FormatConverter::toCSV(result, options);
    }
}

// CSV prints chunk by chunk; JSON prints one object per line
size_t printStream(const Config& config, PooledChunkStream& stream) {
    size_t total = 0;
    bool first = true;

    while (auto chunk = stream.next()) {
        total += chunk->size();
        if (config.output.format == "json") {
            JSONOptions options;
            options.pretty = false;
            for (const auto& row : *chunk) {
                std::cout << FormatConverter::rowToJSON(stream.columns(), row, options) << "\n";
            }
        } else {
            CSVOptions options;
            options.includeHeader = first && config.output.include_csv_header;
            std::cout << FormatConverter::toCSV({stream.columns(), std::move(*chunk)}, options);
        }
        first = false;
    }

    std::cout.flush();
    return total;
}

int runSqlite(const Config& config, const std::string& sql, const std::vector<Value>& params,
              const QueryOptions& opts) {
    PoolHandle pool = PoolHandle::start(config.engine.pool_name, config.engine.database,
                                        config.engine.pool_size, config.engineConfig());

    if (config.chunked) {
        PooledChunkStream stream = queryChunked(pool, sql, params, opts);
        size_t rows = printStream(config, stream);
        spdlog::info("Streamed {} rows", rows);
    } else {
        QueryResult result = execute(pool, sql, params, opts);
        spdlog::info("Query returned {} rows", result.rows.size());
        printResult(config, result);
    }

    pool.stop();
    return 0;
}

int runPostgreSQL(const Config& config, const std::string& sql,
                  const std::vector<Value>& params, const QueryOptions& opts) {
    PostgreSQLConnectionPool server(config.server);

    QueryResult result = execute(server, sql, params, opts);
    spdlog::info("Query returned {} rows", result.rows.size());
    printResult(config, result);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-V" || arg == "--version") {
            std::cout << "sqlkit version 1.0.0" << std::endl;
            return 0;
        }
    }

    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.debug, config.log_file);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    std::vector<Value> params;
    for (const auto& text : config.params) {
        params.push_back(parseParam(text));
    }

    QueryOptions opts;
    opts.timeout = config.engine.checkout_timeout;
    opts.chunkSize = config.chunk_size;
    opts.cache = config.engine.statement_cache;
    if (!config.sql_file.empty()) {
        opts.label = config.sql_file;
    }

    try {
        std::string sql = loadSql(config);
        if (config.backend == "postgresql") {
            return runPostgreSQL(config, sql, params, opts);
        }
        return runSqlite(config, sql, params, opts);
    } catch (const SqlKitError& e) {
        spdlog::error("{} ({})", e.what(), errorCodeName(e.code()));
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
