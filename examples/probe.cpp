/**
 * @file probe.cpp
 * @brief dbmanager-probe: open every configured database and report status
 *
 * Usage:
 *   dbmanager-probe <config.yaml> [name...]
 *
 * Opens each database named on the command line (all of them when none
 * are given) through DBManager, pings it, and prints one line per
 * database. Exits with 1 if any of them could not be opened.
 */

#include <iostream>
#include <vector>
#include "dbmanager/config.hpp"
#include "dbmanager/dbmanager.hpp"
#include "dbmanager/logging.hpp"

using namespace dbmanager;

namespace {

bool probe(const DBManager& manager, const std::string& name, const OpenOptions& options) {
    const char* engine = engineName(options.engine == Engine::Default ? manager.defaultEngine()
                                                                      : options.engine);
    try {
        auto db = manager.open(options);
        db->ping();
        spdlog::info("{}: ok ({}, driver {}, {})", name, engine, db->driverName(),
                     accessModeName(options.mode));
        return true;
    } catch (const DatabaseException& e) {
        spdlog::error("{}: FAILED ({}): {}", name, engine, e.what());
        return false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config.yaml> [name...]\n";
        return 2;
    }

    ManagerConfig config;
    try {
        config = loadManagerConfig(argv[1]);
    } catch (const ConfigException& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    std::shared_ptr<spdlog::logger> log;
    try {
        log = initLogging("dbmanager", parseLogLevel(config.logLevel));
    } catch (const ConfigException& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    auto added = registerBuiltinDrivers();
    for (const auto& name : added) {
        log->debug("registered driver {}", name);
    }

    DBManager manager(config.defaultEngine, spdlogLogger(log, spdlog::level::warn));

    std::vector<std::string> names;
    for (int i = 2; i < argc; ++i) {
        names.emplace_back(argv[i]);
    }
    if (names.empty()) {
        for (const auto& entry : config.databases) {
            names.push_back(entry.first);
        }
    }

    int failed = 0;
    for (const auto& name : names) {
        auto it = config.databases.find(name);
        if (it == config.databases.end()) {
            log->error("{}: not defined in {}", name, argv[1]);
            ++failed;
            continue;
        }
        if (!probe(manager, name, it->second)) {
            ++failed;
        }
    }

    log->info("{} of {} databases reachable", names.size() - failed, names.size());
    spdlog::shutdown();
    return failed > 0 ? 1 : 0;
}
