/**
 * @file builtin.cpp
 * @brief Registration of the drivers compiled into this build
 */

#include "dbmanager/drivers.hpp"
#include "dbmanager/exceptions.hpp"

#include <functional>
#include <utility>

namespace dbmanager {

namespace {

using DriverFactory = std::function<std::shared_ptr<Driver>()>;

std::vector<std::pair<std::string, DriverFactory>> builtinFactories() {
    std::vector<std::pair<std::string, DriverFactory>> factories;
    factories.emplace_back("sqlite3", [] { return std::make_shared<Sqlite3Driver>(); });
#ifdef DBMANAGER_HAVE_DUCKDB
    factories.emplace_back("duckdb", [] { return std::make_shared<DuckDBDriver>(); });
#endif
#ifdef DBMANAGER_HAVE_MYSQL
    factories.emplace_back("mysql", [] { return std::make_shared<MySQLDriver>(); });
#endif
    return factories;
}

} // namespace

std::vector<std::string> builtinDriverNames() {
    std::vector<std::string> names;
    for (const auto& factory : builtinFactories()) {
        names.push_back(factory.first);
    }
    return names;
}

std::vector<std::string> registerBuiltinDrivers(const std::shared_ptr<DriverRegistry>& registry) {
    if (!registry) {
        throw DatabaseException("registerBuiltinDrivers requires a registry");
    }

    std::vector<std::string> added;
    for (const auto& factory : builtinFactories()) {
        if (registry->registerIfAbsent(factory.first, factory.second())) {
            added.push_back(factory.first);
        }
    }
    return added;
}

} // namespace dbmanager
