/**
 * @file config.cpp
 * @brief YAML loading with yaml-cpp
 */

#include "dbmanager/config.hpp"
#include "dbmanager/exceptions.hpp"

#include <yaml-cpp/yaml.h>

namespace dbmanager {

namespace {

std::string scalar(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        throw ConfigException("'" + key + "' must be a string");
    }
}

int integer(const YAML::Node& node, const std::string& key) {
    try {
        int value = node.as<int>();
        if (value < 0) {
            throw ConfigException("'" + key + "' must not be negative");
        }
        return value;
    } catch (const YAML::Exception&) {
        throw ConfigException("'" + key + "' must be an integer");
    }
}

OpenOptions parseDatabase(const std::string& name, const YAML::Node& node) {
    if (!node.IsMap()) {
        throw ConfigException("database '" + name + "' must be a mapping");
    }

    const std::string prefix = "databases." + name + ".";
    OpenOptions options;

    if (!node["path"]) {
        throw ConfigException("database '" + name + "' has no path");
    }
    options.path = scalar(node["path"], prefix + "path");

    if (node["engine"]) {
        options.engine = parseEngine(scalar(node["engine"], prefix + "engine"));
    }
    if (node["mode"]) {
        options.mode = parseAccessMode(scalar(node["mode"], prefix + "mode"));
    }
    if (node["max_retries"]) {
        options.maxRetries = integer(node["max_retries"], prefix + "max_retries");
    }
    if (node["retry_base_ms"]) {
        options.retryBaseMs = integer(node["retry_base_ms"], prefix + "retry_base_ms");
    }
    return options;
}

ManagerConfig fromNode(const YAML::Node& root) {
    ManagerConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigException("top level must be a mapping");
    }

    if (root["default_engine"]) {
        config.defaultEngine = parseEngine(scalar(root["default_engine"], "default_engine"));
        if (config.defaultEngine == Engine::Default) {
            throw ConfigException("'default_engine' must name an engine");
        }
    }
    if (root["log_level"]) {
        config.logLevel = scalar(root["log_level"], "log_level");
    }

    const YAML::Node databases = root["databases"];
    if (databases) {
        if (!databases.IsMap()) {
            throw ConfigException("'databases' must be a mapping");
        }
        for (auto it = databases.begin(); it != databases.end(); ++it) {
            if (!it->first.IsScalar()) {
                throw ConfigException("database names under 'databases' must be strings");
            }
            auto name = it->first.as<std::string>();
            config.databases[name] = parseDatabase(name, it->second);
        }
    }
    return config;
}

} // namespace

ManagerConfig loadManagerConfig(const std::string& path) {
    try {
        return fromNode(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        throw ConfigException("failed to open config file: " + path);
    } catch (const YAML::ParserException& e) {
        throw ConfigException(std::string("YAML parse error: ") + e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigException("invalid config file " + path + ": " + e.what());
    }
}

ManagerConfig parseManagerConfig(const std::string& yaml) {
    try {
        return fromNode(YAML::Load(yaml));
    } catch (const YAML::ParserException& e) {
        throw ConfigException(std::string("YAML parse error: ") + e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigException(std::string("invalid config: ") + e.what());
    }
}

} // namespace dbmanager
