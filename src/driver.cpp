/**
 * @file driver.cpp
 * @brief Implementation of DriverRegistry
 */

#include "dbmanager/driver.hpp"
#include "dbmanager/exceptions.hpp"

namespace dbmanager {

std::shared_ptr<DriverRegistry> DriverRegistry::global() {
    static std::shared_ptr<DriverRegistry> instance = std::make_shared<DriverRegistry>();
    return instance;
}

void DriverRegistry::registerDriver(const std::string& name, std::shared_ptr<Driver> driver) {
    if (!driver) {
        throw DatabaseException("Cannot register null driver '" + name + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (drivers_.count(name) > 0) {
        throw DatabaseException("Driver '" + name + "' is already registered");
    }
    drivers_.emplace(name, std::move(driver));
}

bool DriverRegistry::registerIfAbsent(const std::string& name, std::shared_ptr<Driver> driver) {
    if (!driver) {
        throw DatabaseException("Cannot register null driver '" + name + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return drivers_.emplace(name, std::move(driver)).second;
}

bool DriverRegistry::unregisterDriver(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return drivers_.erase(name) > 0;
}

std::shared_ptr<Driver> DriverRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drivers_.find(name);
    if (it == drivers_.end()) {
        return nullptr;
    }
    return it->second;
}

bool DriverRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drivers_.count(name) > 0;
}

std::vector<std::string> DriverRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(drivers_.size());
    for (const auto& entry : drivers_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace dbmanager
