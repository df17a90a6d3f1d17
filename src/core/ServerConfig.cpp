/**
 * @file ServerConfig.cpp
 * @brief Runtime configuration for the listener and passive port pool
 */

#include "ftpcore/ServerConfig.h"
#include "ftpcore/NetErrors.h"

#include <fstream>

namespace FtpCore {

namespace {

    [[noreturn]] void badType(const char* key, const char* expected) {
        throw ConfigurationError(ErrorCodes::CONFIG_PARSE_ERROR,
                                 std::string("\"") + key + "\" must be " + expected);
    }

    int readPortValue(const nlohmann::json& value, const char* key) {
        if (!value.is_number_integer()) {
            badType(key, "an integer");
        }
        const auto v = value.get<int64_t>();
        if (v < 0 || v > MAX_PORT_NUMBER) {
            throw ConfigurationError(ErrorCodes::CONFIG_INVALID_PORT,
                                     std::string("\"") + key + "\" is out of range: " + std::to_string(v));
        }
        return static_cast<int>(v);
    }

    PortSet readPasv(const nlohmann::json& value) {
        if (value.is_null()) {
            return PortSet();
        }
        if (value.is_string()) {
            return PortSet::parse(value.get<std::string>());
        }
        if (value.is_array()) {
            std::vector<int> ports;
            for (const auto& item : value) {
                ports.push_back(readPortValue(item, "pasv[]"));
            }
            return PortSet::list(ports);
        }
        if (value.is_object()) {
            if (!value.contains("min") || !value.contains("max")) {
                badType("pasv", "an object with \"min\" and \"max\"");
            }
            return PortSet::range(readPortValue(value["min"], "pasv.min"), readPortValue(value["max"], "pasv.max"));
        }
        badType("pasv", "a string, an array of ports or {\"min\", \"max\"}");
    }

} // anonymous namespace

void ServerConfig::validate() const {
    if (host.empty() || host.size() > MAX_HOST_LENGTH) {
        throw ConfigurationError(ErrorCodes::CONFIG_INVALID_HOST, "host must be 1-253 characters");
    }
    if (port < 0 || port > MAX_PORT_NUMBER) {
        throw ConfigurationError(ErrorCodes::CONFIG_INVALID_PORT,
                                 "port " + std::to_string(port) + " is out of range (0-65535)");
    }
    if (dataAcceptTimeoutMs == 0) {
        throw ConfigurationError(ErrorCodes::CONFIG_PARSE_ERROR, "data_accept_timeout_ms must be positive");
    }
}

nlohmann::json ServerConfig::toJson() const {
    nlohmann::json out;
    out["host"] = host;
    out["port"] = port;
    out["pasv"] = pasvPorts.toString();
    out["log_level"] = logLevelToString(logLevel);
    out["log_file"] = logFile;
    out["data_accept_timeout_ms"] = dataAcceptTimeoutMs;
    return out;
}

ServerConfig ServerConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError(ErrorCodes::CONFIG_PARSE_ERROR, "configuration root must be a JSON object");
    }

    ServerConfig cfg;

    if (j.contains("host")) {
        if (!j["host"].is_string()) {
            badType("host", "a string");
        }
        cfg.host = j["host"].get<std::string>();
    }

    if (j.contains("port")) {
        cfg.port = readPortValue(j["port"], "port");
    }

    if (j.contains("pasv")) {
        cfg.pasvPorts = readPasv(j["pasv"]);
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            badType("log_level", "a string");
        }
        const auto level = parseLogLevel(j["log_level"].get<std::string>());
        if (!level) {
            throw ConfigurationError(ErrorCodes::CONFIG_PARSE_ERROR,
                                     "unknown log_level \"" + j["log_level"].get<std::string>() + "\"");
        }
        cfg.logLevel = *level;
    }

    if (j.contains("log_file")) {
        if (!j["log_file"].is_string()) {
            badType("log_file", "a string");
        }
        cfg.logFile = j["log_file"].get<std::string>();
    }

    if (j.contains("data_accept_timeout_ms")) {
        const auto& v = j["data_accept_timeout_ms"];
        if (!v.is_number_integer() || v.get<int64_t>() < 0 || v.get<int64_t>() > UINT32_MAX) {
            badType("data_accept_timeout_ms", "an unsigned 32-bit integer");
        }
        cfg.dataAcceptTimeoutMs = static_cast<uint32_t>(v.get<int64_t>());
    }

    cfg.validate();
    return cfg;
}

ServerConfig ServerConfig::loadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError(ErrorCodes::CONFIG_FILE_UNREADABLE, "cannot open " + path.string());
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError(ErrorCodes::CONFIG_PARSE_ERROR, path.string() + ": " + e.what());
    }

    return fromJson(j);
}

}  // namespace FtpCore
