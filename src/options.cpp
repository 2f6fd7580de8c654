/**
 * @file options.cpp
 * @brief Engine names and retry policy
 */

#include "dbmanager/options.hpp"
#include "dbmanager/exceptions.hpp"

namespace dbmanager {

const char* engineName(Engine engine) {
    switch (engine) {
        case Engine::Default: return "";
        case Engine::DuckDB:  return "duckdb";
        case Engine::SQLite:  return "sqlite";
        case Engine::MySQL:   return "mysql";
    }
    return "";
}

Engine parseEngine(const std::string& name) {
    if (name.empty()) return Engine::Default;
    if (name == "duckdb") return Engine::DuckDB;
    if (name == "sqlite") return Engine::SQLite;
    if (name == "mysql") return Engine::MySQL;
    throw ConfigException("unknown engine '" + name + "'");
}

const char* accessModeName(AccessMode mode) {
    return mode == AccessMode::ReadOnly ? "read_only" : "read_write";
}

AccessMode parseAccessMode(const std::string& name) {
    if (name == "read_write") return AccessMode::ReadWrite;
    if (name == "read_only") return AccessMode::ReadOnly;
    throw ConfigException("unknown access mode '" + name + "'");
}

RetryPolicy retryPolicy(const OpenOptions& options) {
    RetryPolicy policy;
    if (options.maxRetries > 0) {
        policy.maxRetries = options.maxRetries;
    }
    if (options.retryBaseMs > 0) {
        policy.baseMs = options.retryBaseMs;
    }
    return policy;
}

std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int attempt) {
    return std::chrono::milliseconds(static_cast<long long>(policy.baseMs) * (attempt + 1));
}

} // namespace dbmanager
