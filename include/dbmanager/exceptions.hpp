/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for opening and using database handles
 *
 * INDUSTRY PRACTICE #1: Custom Exception Hierarchy
 * ================================================
 * Opening a database can fail for very different reasons:
 * - The caller asked for an engine nobody implements (programming error)
 * - No driver for the engine is registered (deployment error)
 * - The file is locked or the server is not up yet (transient)
 * - We retried and gave up (terminal)
 *
 * Each gets its own type so callers can catch at the granularity they need,
 * and all of them derive from DatabaseException for a single catch-all.
 */

#pragma once

#include <exception>
#include <string>

namespace dbmanager {

/**
 * @brief Base exception for all database errors
 */
class DatabaseException : public std::exception {
public:
    explicit DatabaseException(std::string message, int errorCode = 0)
        : message_(std::move(message))
        , errorCode_(errorCode)
    {
        if (errorCode_ != 0) {
            fullMessage_ = message_ + " (driver error code: " + std::to_string(errorCode_) + ")";
        } else {
            fullMessage_ = message_;
        }
    }

    const char* what() const noexcept override {
        return fullMessage_.c_str();
    }

    int errorCode() const noexcept {
        return errorCode_;
    }

    const std::string& message() const noexcept {
        return message_;
    }

protected:
    std::string message_;
    std::string fullMessage_;
    int errorCode_;
};

/**
 * @brief Thrown when a driver fails to open or ping a connection
 *
 * This is the transient failure the openers retry on.
 */
class ConnectionException : public DatabaseException {
public:
    explicit ConnectionException(const std::string& message, int errorCode = 0)
        : DatabaseException("Connection error: " + message, errorCode) {}
};

/**
 * @brief Thrown when a statement fails to execute
 */
class QueryException : public DatabaseException {
public:
    QueryException(const std::string& message, const std::string& sql, int errorCode = 0)
        : DatabaseException("Query error: " + message, errorCode)
        , sql_(sql)
    {
        fullMessage_ += "\nSQL: " + sql_;
    }

    const std::string& sql() const noexcept {
        return sql_;
    }

private:
    std::string sql_;
};

/**
 * @brief Thrown when no opener exists for the requested engine
 */
class UnsupportedEngineException : public DatabaseException {
public:
    explicit UnsupportedEngineException(const std::string& engine)
        : DatabaseException("Unsupported database engine: '" + engine + "'")
        , engine_(engine) {}

    const std::string& engine() const noexcept {
        return engine_;
    }

private:
    std::string engine_;
};

/**
 * @brief Thrown when no registered driver can serve an engine
 */
class DriverNotFoundException : public DatabaseException {
public:
    explicit DriverNotFoundException(const std::string& message)
        : DatabaseException("Driver not found: " + message) {}
};

/**
 * @brief Thrown when every connection attempt failed
 *
 * Carries the path and the number of attempts so logs can tell
 * "never worked" apart from "flaky and gave up".
 */
class RetriesExhaustedException : public DatabaseException {
public:
    RetriesExhaustedException(const std::string& path, int attempts,
                              const std::string& lastError, const std::string& note = "")
        : DatabaseException("Failed to open database '" + path + "' after " +
                            std::to_string(attempts) + " attempts" +
                            (note.empty() ? "" : " " + note) + ": " + lastError)
        , path_(path)
        , attempts_(attempts)
        , lastError_(lastError) {}

    const std::string& path() const noexcept {
        return path_;
    }

    int attempts() const noexcept {
        return attempts_;
    }

    const std::string& lastError() const noexcept {
        return lastError_;
    }

private:
    std::string path_;
    int attempts_;
    std::string lastError_;
};

/**
 * @brief Thrown when the caller's context fires while an open is retrying
 */
class CancelledException : public DatabaseException {
public:
    CancelledException(const std::string& path, int attempts)
        : DatabaseException("Open of '" + path + "' cancelled after " +
                            std::to_string(attempts) + " attempts")
        , path_(path)
        , attempts_(attempts) {}

    const std::string& path() const noexcept {
        return path_;
    }

    int attempts() const noexcept {
        return attempts_;
    }

private:
    std::string path_;
    int attempts_;
};

/**
 * @brief Thrown when a configuration document cannot be loaded
 */
class ConfigException : public DatabaseException {
public:
    explicit ConfigException(const std::string& message)
        : DatabaseException("Config error: " + message) {}
};

} // namespace dbmanager
