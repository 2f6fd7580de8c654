/**
 * @file duckdb_driver.cpp
 * @brief DuckDB driver over the duckdb C API
 */

#include "dbmanager/drivers.hpp"
#include "dbmanager/dsn.hpp"
#include "dbmanager/exceptions.hpp"

#include <duckdb.h>

namespace dbmanager {

namespace {

class DuckDBConnection : public DriverConnection {
public:
    DuckDBConnection(const std::string& path, bool readOnly)
        : path_(path)
    {
        duckdb_config config = nullptr;
        if (duckdb_create_config(&config) == DuckDBError) {
            throw ConnectionException("Failed to create DuckDB config for '" + path + "'");
        }

        if (duckdb_set_config(config, "access_mode", readOnly ? "READ_ONLY" : "READ_WRITE") == DuckDBError) {
            duckdb_destroy_config(&config);
            throw ConnectionException("Failed to set DuckDB access mode for '" + path + "'");
        }

        const char* file = (path.empty() || path == ":memory:") ? nullptr : path.c_str();
        char* error = nullptr;
        duckdb_state state = duckdb_open_ext(file, &db_, config, &error);
        duckdb_destroy_config(&config);

        if (state == DuckDBError) {
            std::string message = error ? error : "Unknown error";
            duckdb_free(error);
            db_ = nullptr;
            throw ConnectionException("Failed to open database '" + path + "': " + message);
        }

        if (duckdb_connect(db_, &conn_) == DuckDBError) {
            duckdb_close(&db_);
            throw ConnectionException("Failed to connect to database '" + path + "'");
        }
    }

    ~DuckDBConnection() override {
        if (conn_) {
            duckdb_disconnect(&conn_);
        }
        if (db_) {
            duckdb_close(&db_);
        }
    }

    void ping() override {
        try {
            execute("SELECT 1");
        } catch (const QueryException& e) {
            throw ConnectionException("ping of '" + path_ + "' failed: " + e.message());
        }
    }

    void execute(const std::string& sql) override {
        duckdb_result result;
        if (duckdb_query(conn_, sql.c_str(), &result) == DuckDBError) {
            const char* error = duckdb_result_error(&result);
            std::string message = error ? error : "Unknown error";
            duckdb_destroy_result(&result);
            throw QueryException(message, sql);
        }
        duckdb_destroy_result(&result);
    }

private:
    duckdb_database db_ = nullptr;
    duckdb_connection conn_ = nullptr;
    std::string path_;
};

} // namespace

std::unique_ptr<DriverConnection> DuckDBDriver::open(const std::string& dsn) {
    auto parsed = parseFileDsn(dsn);

    bool readOnly = false;
    if (auto mode = parsed.param("access_mode")) {
        if (*mode == "read_only") {
            readOnly = true;
        } else if (*mode != "read_write" && *mode != "automatic") {
            throw ConnectionException("invalid duckdb access_mode '" + *mode + "'");
        }
    }
    return std::make_unique<DuckDBConnection>(parsed.path, readOnly);
}

} // namespace dbmanager
