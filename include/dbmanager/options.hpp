/**
 * @file options.hpp
 * @brief Engine selection, access modes and per-call open options
 *
 * INDUSTRY PRACTICE #2: Configuration via Options Struct
 * ======================================================
 * Every open call takes one OpenOptions value. Zero means "use the
 * default" for the retry knobs, so callers only set what they care about:
 *   OpenOptions opts;
 *   opts.path = "data/analytics.duckdb";
 *   opts.mode = AccessMode::ReadOnly;
 *   auto db = manager.open(opts);
 */

#pragma once

#include <chrono>
#include <string>

namespace dbmanager {

/**
 * @brief Database engines the manager can dispatch to
 *
 * Default is the "empty" engine: it resolves to the manager's default.
 */
enum class Engine {
    Default,
    DuckDB,
    SQLite,
    MySQL
};

enum class AccessMode {
    ReadWrite,
    ReadOnly
};

/**
 * @brief Stable identifier of an engine ("duckdb", "sqlite", "mysql", "")
 */
const char* engineName(Engine engine);

/**
 * @brief Parse an engine identifier
 * @throws ConfigException for an unknown identifier
 */
Engine parseEngine(const std::string& name);

const char* accessModeName(AccessMode mode);

/**
 * @throws ConfigException for anything but "read_write" / "read_only"
 */
AccessMode parseAccessMode(const std::string& name);

constexpr int DEFAULT_MAX_RETRIES = 8;
constexpr int DEFAULT_RETRY_BASE_MS = 400;

struct OpenOptions {
    Engine engine = Engine::Default;

    // File path for the embedded engines, DSN for MySQL. Passed through as-is.
    std::string path;

    AccessMode mode = AccessMode::ReadWrite;

    // 0 means DEFAULT_MAX_RETRIES
    int maxRetries = 0;

    // 0 means DEFAULT_RETRY_BASE_MS
    int retryBaseMs = 0;
};

struct RetryPolicy {
    int maxRetries = DEFAULT_MAX_RETRIES;
    int baseMs = DEFAULT_RETRY_BASE_MS;
};

/**
 * @brief Resolve the retry knobs of @p options, applying defaults
 */
RetryPolicy retryPolicy(const OpenOptions& options);

/**
 * @brief Sleep before the attempt following @p attempt (0-indexed)
 *
 * Linear backoff: baseMs * (attempt + 1). No jitter.
 */
std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int attempt);

} // namespace dbmanager
