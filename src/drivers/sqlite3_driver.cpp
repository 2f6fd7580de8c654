/**
 * @file sqlite3_driver.cpp
 * @brief SQLite driver over the sqlite3 C API
 */

#include "dbmanager/drivers.hpp"
#include "dbmanager/dsn.hpp"
#include "dbmanager/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <sqlite3.h>

namespace dbmanager {

namespace {

struct Sqlite3Settings {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    int busyTimeoutMs = 5000;
    std::string journalMode;
    int foreignKeys = -1;  // -1 = leave the engine default

    bool readOnly() const { return (flags & SQLITE_OPEN_READONLY) != 0; }
};

Sqlite3Settings parseSettings(const FileDsn& dsn) {
    Sqlite3Settings settings;

    if (auto mode = dsn.param("mode")) {
        if (*mode == "ro") {
            settings.flags = SQLITE_OPEN_READONLY;
        } else if (*mode == "rw") {
            settings.flags = SQLITE_OPEN_READWRITE;
        } else if (*mode == "rwc") {
            settings.flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        } else if (*mode == "memory") {
            settings.flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
        } else {
            throw ConnectionException("invalid sqlite mode '" + *mode + "'");
        }
    }

    if (auto timeout = dsn.param("_busy_timeout")) {
        settings.busyTimeoutMs = std::atoi(timeout->c_str());
    }
    if (auto journal = dsn.param("_journal_mode")) {
        // The value is spliced into a PRAGMA, so only known modes pass
        std::string upper = *journal;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        static const char* const modes[] = {"DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};
        if (std::find(std::begin(modes), std::end(modes), upper) == std::end(modes)) {
            throw ConnectionException("invalid sqlite journal mode '" + *journal + "'");
        }
        settings.journalMode = upper;
    }
    if (auto fk = dsn.param("_foreign_keys")) {
        settings.foreignKeys = (*fk == "1" || *fk == "true" || *fk == "on") ? 1 : 0;
    }
    return settings;
}

/**
 * @brief One sqlite3* handle, closed on destruction
 */
class Sqlite3Connection : public DriverConnection {
public:
    Sqlite3Connection(const std::string& path, const Sqlite3Settings& settings)
        : path_(path)
    {
        int result = sqlite3_open_v2(path.c_str(), &db_, settings.flags, nullptr);

        if (result != SQLITE_OK) {
            std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
            close();
            throw ConnectionException("Failed to open database '" + path + "': " + error, result);
        }

        try {
            applySettings(settings);
        } catch (const DatabaseException& e) {
            close();
            throw ConnectionException("Failed to configure database '" + path + "': " +
                                      e.message(), e.errorCode());
        }
    }

    ~Sqlite3Connection() override {
        close();
    }

    void ping() override {
        // Reading the schema touches the file header, so a locked or
        // corrupt file fails here rather than on first real use
        try {
            execute("SELECT count(*) FROM sqlite_master");
        } catch (const QueryException& e) {
            throw ConnectionException("ping of '" + path_ + "' failed: " + e.message(), e.errorCode());
        }
    }

    void execute(const std::string& sql) override {
        char* errMsg = nullptr;
        int result = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);

        if (result != SQLITE_OK) {
            std::string error = errMsg ? errMsg : sqlite3_errmsg(db_);
            sqlite3_free(errMsg);
            throw QueryException(error, sql, result);
        }
    }

private:
    void applySettings(const Sqlite3Settings& settings) {
        sqlite3_extended_result_codes(db_, 1);
        sqlite3_busy_timeout(db_, settings.busyTimeoutMs);

        if (settings.foreignKeys >= 0) {
            execute(settings.foreignKeys ? "PRAGMA foreign_keys = ON" : "PRAGMA foreign_keys = OFF");
        }

        // The journal mode is stored in the file; a read-only connection
        // can neither change it nor needs to
        if (!settings.journalMode.empty() && !settings.readOnly()) {
            execute("PRAGMA journal_mode = " + settings.journalMode);
        }
    }

    void close() {
        if (db_) {
            sqlite3_stmt* stmt = nullptr;
            while ((stmt = sqlite3_next_stmt(db_, nullptr)) != nullptr) {
                sqlite3_finalize(stmt);
            }
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace

std::unique_ptr<DriverConnection> Sqlite3Driver::open(const std::string& dsn) {
    auto parsed = parseFileDsn(dsn);
    return std::make_unique<Sqlite3Connection>(parsed.path, parseSettings(parsed));
}

} // namespace dbmanager
