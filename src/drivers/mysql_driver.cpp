/**
 * @file mysql_driver.cpp
 * @brief MySQL / MariaDB driver over libmysqlclient
 */

#include "dbmanager/drivers.hpp"
#include "dbmanager/dsn.hpp"
#include "dbmanager/exceptions.hpp"

#include <mysql.h>

namespace dbmanager {

namespace {

class MySQLConnection : public DriverConnection {
public:
    explicit MySQLConnection(const MySqlDsn& dsn)
        : label_(dsn.user + "@" + (dsn.net == "unix" ? dsn.socket : dsn.host) + "/" + dsn.database)
    {
        handle_ = mysql_init(nullptr);
        if (!handle_) {
            throw ConnectionException("mysql_init failed");
        }

        if (dsn.connectTimeoutSec > 0) {
            unsigned int timeout = dsn.connectTimeoutSec;
            mysql_options(handle_, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
        }

        const bool unixSocket = dsn.net == "unix";
        MYSQL* connected = mysql_real_connect(
            handle_,
            unixSocket ? nullptr : dsn.host.c_str(),
            dsn.user.empty() ? nullptr : dsn.user.c_str(),
            dsn.password.empty() ? nullptr : dsn.password.c_str(),
            dsn.database.empty() ? nullptr : dsn.database.c_str(),
            unixSocket ? 0 : dsn.port,
            unixSocket ? dsn.socket.c_str() : nullptr,
            0);

        if (!connected) {
            std::string error = mysql_error(handle_);
            int code = static_cast<int>(mysql_errno(handle_));
            mysql_close(handle_);
            handle_ = nullptr;
            throw ConnectionException("Failed to connect to '" + label_ + "': " + error, code);
        }
    }

    ~MySQLConnection() override {
        if (handle_) {
            mysql_close(handle_);
        }
    }

    void ping() override {
        if (mysql_ping(handle_) != 0) {
            throw ConnectionException("ping of '" + label_ + "' failed: " + mysql_error(handle_),
                                      static_cast<int>(mysql_errno(handle_)));
        }
    }

    void execute(const std::string& sql) override {
        if (mysql_real_query(handle_, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
            throw QueryException(mysql_error(handle_), sql, static_cast<int>(mysql_errno(handle_)));
        }

        // Drain the result set so the connection is usable for the next call
        MYSQL_RES* result = mysql_store_result(handle_);
        if (result) {
            mysql_free_result(result);
        } else if (mysql_field_count(handle_) != 0) {
            throw QueryException(mysql_error(handle_), sql, static_cast<int>(mysql_errno(handle_)));
        }
    }

private:
    MYSQL* handle_ = nullptr;
    std::string label_;
};

} // namespace

std::unique_ptr<DriverConnection> MySQLDriver::open(const std::string& dsn) {
    return std::make_unique<MySQLConnection>(parseMySqlDsn(dsn));
}

} // namespace dbmanager
