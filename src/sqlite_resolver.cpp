/**
 * @file sqlite_resolver.cpp
 * @brief Implementation of SQLiteDriverResolver
 */

#include "dbmanager/sqlite_resolver.hpp"
#include "dbmanager/database.hpp"
#include "dbmanager/exceptions.hpp"

namespace dbmanager {

const std::vector<std::string>& SQLiteDriverResolver::defaultCandidates() {
    static const std::vector<std::string> candidates = {"sqlite", "sqlite3"};
    return candidates;
}

std::shared_ptr<SQLiteDriverResolver> SQLiteDriverResolver::shared() {
    static std::shared_ptr<SQLiteDriverResolver> instance =
        std::make_shared<SQLiteDriverResolver>(DriverRegistry::global());
    return instance;
}

SQLiteDriverResolver::SQLiteDriverResolver(std::shared_ptr<DriverRegistry> registry,
                                           std::vector<std::string> candidates)
    : registry_(std::move(registry))
    , candidates_(std::move(candidates))
{
    if (!registry_) {
        throw DatabaseException("SQLiteDriverResolver requires a registry");
    }
}

std::optional<std::string> SQLiteDriverResolver::resolve() {
    // Held across the probe so concurrent callers wait for one result
    // instead of probing in parallel.
    std::lock_guard<std::mutex> lock(mutex_);
    if (resolved_) {
        return resolved_;
    }

    for (const auto& name : candidates_) {
        if (probe(name)) {
            resolved_ = name;
            return resolved_;
        }
    }
    return std::nullopt;
}

std::optional<std::string> SQLiteDriverResolver::cached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_;
}

bool SQLiteDriverResolver::probe(const std::string& name) const {
    auto driver = registry_->find(name);
    if (!driver) {
        return false;
    }

    try {
        Database db(driver, ":memory:");
        db.ping();
        return true;
    } catch (const DatabaseException&) {
        return false;
    }
}

} // namespace dbmanager
