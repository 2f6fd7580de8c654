/**
 * @file manager.cpp
 * @brief Implementation of DBManager
 */

#include "dbmanager/manager.hpp"
#include "dbmanager/exceptions.hpp"

namespace dbmanager {

OpenerTable defaultOpeners(const ManagerHooks& hooks) {
    auto registry = hooks.registry ? hooks.registry : DriverRegistry::global();
    auto sleeper = hooks.sleeper ? hooks.sleeper : contextSleeper();

    auto resolver = hooks.resolver;
    if (!resolver) {
        resolver = registry == DriverRegistry::global()
            ? SQLiteDriverResolver::shared()
            : std::make_shared<SQLiteDriverResolver>(registry);
    }

    OpenerTable table;
    table[Engine::DuckDB] = std::make_shared<DuckDBOpener>(registry, sleeper);
    table[Engine::SQLite] = std::make_shared<SQLiteOpener>(resolver, sleeper);
    table[Engine::MySQL] = std::make_shared<MySQLOpener>(registry, sleeper);
    return table;
}

DBManager::DBManager(Engine defaultEngine, Logger logger)
    : DBManager(defaultEngine, std::move(logger), defaultOpeners())
{
}

DBManager::DBManager(Engine defaultEngine, Logger logger, const ManagerHooks& hooks)
    : DBManager(defaultEngine, std::move(logger), defaultOpeners(hooks))
{
}

DBManager::DBManager(Engine defaultEngine, Logger logger, OpenerTable openers)
    : defaultEngine_(defaultEngine)
    , logger_(logger ? std::move(logger) : noopLogger())
    , openers_(std::move(openers))
{
}

std::unique_ptr<Database> DBManager::open(const OpenOptions& options, const Context& ctx) const {
    OpenOptions resolved = options;
    if (resolved.engine == Engine::Default) {
        resolved.engine = defaultEngine_;
    }

    auto it = openers_.find(resolved.engine);
    if (it == openers_.end() || !it->second) {
        throw UnsupportedEngineException(engineName(resolved.engine));
    }
    return it->second->open(resolved, ctx, logger_);
}

std::unique_ptr<Database> DBManager::openReadOnly(const std::string& path) const {
    OpenOptions options;
    options.path = path;
    options.mode = AccessMode::ReadOnly;
    return open(options);
}

std::unique_ptr<Database> DBManager::openWritable(const std::string& path) const {
    OpenOptions options;
    options.path = path;
    options.mode = AccessMode::ReadWrite;
    return open(options);
}

std::unique_ptr<Database> DBManager::openNew(const std::string& path) const {
    OpenOptions options;
    options.path = path;
    options.mode = AccessMode::ReadWrite;
    options.maxRetries = 1;
    return open(options);
}

} // namespace dbmanager
