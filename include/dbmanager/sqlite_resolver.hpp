/**
 * @file sqlite_resolver.hpp
 * @brief Finds which registered name actually serves SQLite
 *
 * Different builds register SQLite under different names. The resolver
 * probes the candidates in order by opening and pinging an in-memory
 * database, and remembers the first one that works. Once a name is found
 * it is never probed again; a failed resolution is not cached, so a driver
 * registered later is still picked up.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "driver.hpp"

namespace dbmanager {

class SQLiteDriverResolver {
public:
    /**
     * @brief Names probed when none are given, in order
     */
    static const std::vector<std::string>& defaultCandidates();

    /**
     * @brief Resolver bound to DriverRegistry::global(), shared by the process
     */
    static std::shared_ptr<SQLiteDriverResolver> shared();

    explicit SQLiteDriverResolver(std::shared_ptr<DriverRegistry> registry,
                                  std::vector<std::string> candidates = defaultCandidates());

    /**
     * @brief Return the working driver name, probing on first use
     * @return std::nullopt if no candidate works
     */
    std::optional<std::string> resolve();

    /**
     * @brief The cached name, without probing
     */
    std::optional<std::string> cached() const;

    std::shared_ptr<DriverRegistry> registry() const { return registry_; }

    const std::vector<std::string>& candidates() const { return candidates_; }

private:
    bool probe(const std::string& name) const;

    std::shared_ptr<DriverRegistry> registry_;
    std::vector<std::string> candidates_;

    mutable std::mutex mutex_;
    std::optional<std::string> resolved_;
};

} // namespace dbmanager
