/**
 * @file dsn.cpp
 * @brief Connection-string parsing
 */

#include "dbmanager/dsn.hpp"
#include "dbmanager/exceptions.hpp"

#include <cstdlib>

namespace dbmanager {

namespace {

DsnParams parseParams(const std::string& query) {
    DsnParams params;
    std::size_t start = 0;
    while (start <= query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        std::string segment = query.substr(start, end - start);
        if (!segment.empty()) {
            auto eq = segment.find('=');
            if (eq == std::string::npos) {
                params.emplace_back(segment, "");
            } else {
                params.emplace_back(segment.substr(0, eq), segment.substr(eq + 1));
            }
        }
        start = end + 1;
    }
    return params;
}

// "5s", "1500ms", "2m" or a bare number of seconds; rounded up to whole seconds
unsigned int parseTimeoutSeconds(const std::string& value) {
    char* end = nullptr;
    double amount = std::strtod(value.c_str(), &end);
    if (end == value.c_str() || amount < 0) {
        throw ConfigException("invalid timeout '" + value + "'");
    }

    std::string unit(end);
    double seconds = 0;
    if (unit.empty() || unit == "s") {
        seconds = amount;
    } else if (unit == "ms") {
        seconds = amount / 1000.0;
    } else if (unit == "m") {
        seconds = amount * 60.0;
    } else {
        throw ConfigException("invalid timeout unit in '" + value + "'");
    }

    auto whole = static_cast<unsigned int>(seconds);
    if (static_cast<double>(whole) < seconds) {
        ++whole;
    }
    return whole;
}

} // namespace

std::optional<std::string> FileDsn::param(const std::string& key) const {
    std::optional<std::string> value;
    for (const auto& entry : params) {
        if (entry.first == key) {
            value = entry.second;
        }
    }
    return value;
}

int FileDsn::count(const std::string& key) const {
    int n = 0;
    for (const auto& entry : params) {
        if (entry.first == key) {
            ++n;
        }
    }
    return n;
}

FileDsn parseFileDsn(const std::string& dsn) {
    FileDsn result;
    auto q = dsn.find('?');
    if (q == std::string::npos) {
        result.path = dsn;
        return result;
    }
    result.path = dsn.substr(0, q);
    result.params = parseParams(dsn.substr(q + 1));
    return result;
}

MySqlDsn parseMySqlDsn(const std::string& dsn) {
    MySqlDsn result;

    // Parameters start at the first '?' after the address part
    auto addrEnd = dsn.rfind(')');
    auto question = dsn.find('?', addrEnd == std::string::npos ? 0 : addrEnd);
    std::string main = dsn.substr(0, question);
    if (question != std::string::npos) {
        result.params = parseParams(dsn.substr(question + 1));
    }

    // A '/' inside unix(/path/to.sock) is not the separator
    auto slash = main.rfind('/');
    if (slash == std::string::npos ||
        (addrEnd != std::string::npos && addrEnd < main.size() && slash < addrEnd)) {
        throw ConfigException("MySQL DSN is missing '/' before the database name: " + dsn);
    }

    std::string prefix = main.substr(0, slash);
    result.database = main.substr(slash + 1);

    // Credentials end at the last '@' so passwords may contain '@'
    std::string address = prefix;
    auto at = prefix.rfind('@');
    if (at != std::string::npos) {
        std::string credentials = prefix.substr(0, at);
        address = prefix.substr(at + 1);
        auto colon = credentials.find(':');
        if (colon == std::string::npos) {
            result.user = credentials;
        } else {
            result.user = credentials.substr(0, colon);
            result.password = credentials.substr(colon + 1);
        }
    }

    if (!address.empty()) {
        auto open = address.find('(');
        std::string addr;
        if (open == std::string::npos) {
            result.net = address;
        } else {
            if (address.back() != ')') {
                throw ConfigException("unterminated address in MySQL DSN: " + dsn);
            }
            result.net = address.substr(0, open);
            addr = address.substr(open + 1, address.size() - open - 2);
        }

        if (result.net == "unix") {
            result.socket = addr;
            result.host = "localhost";
        } else if (result.net == "tcp") {
            if (!addr.empty()) {
                auto colon = addr.rfind(':');
                if (colon == std::string::npos) {
                    result.host = addr;
                } else {
                    result.host = addr.substr(0, colon);
                    std::string port = addr.substr(colon + 1);
                    char* end = nullptr;
                    long value = std::strtol(port.c_str(), &end, 10);
                    if (port.empty() || *end != '\0' || value <= 0 || value > 65535) {
                        throw ConfigException("invalid port in MySQL DSN: " + dsn);
                    }
                    result.port = static_cast<unsigned int>(value);
                }
            }
        } else {
            throw ConfigException("unsupported network '" + result.net + "' in MySQL DSN");
        }
    }

    for (const auto& param : result.params) {
        if (param.first == "timeout") {
            result.connectTimeoutSec = parseTimeoutSeconds(param.second);
        }
    }

    return result;
}

} // namespace dbmanager
