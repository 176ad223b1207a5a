#include "ClientConfig.h"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace config {

namespace json = boost::json;

namespace {

bool readInteger(const json::object& obj, const char* key, std::int64_t min, std::int64_t max,
                 std::optional<std::int64_t>& out, std::string& error) {
    out.reset();
    if (!obj.contains(key)) {
        return true;
    }
    const auto& value = obj.at(key);
    if (!value.is_int64() && !value.is_uint64()) {
        error = std::string(key) + " must be integer";
        return false;
    }
    if (value.is_uint64() && value.as_uint64() > static_cast<std::uint64_t>(max)) {
        error = std::string(key) + " out of range";
        return false;
    }
    const auto n = value.is_int64() ? value.as_int64() : static_cast<std::int64_t>(value.as_uint64());
    if (n < min || n > max) {
        error = std::string(key) + " out of range";
        return false;
    }
    out = n;
    return true;
}

} // namespace

std::string connectionModeToString(ConnectionMode mode) {
    switch (mode) {
        case ConnectionMode::DoNotConnect:
            return "do_not_connect";
        case ConnectionMode::AutoConnectAndKeepConnected:
            return "auto_connect_keep";
        case ConnectionMode::AutoConnectAndDisconnect:
            return "auto_connect_disconnect";
    }
    return "unknown";
}

bool parseConnectionMode(const std::string& name, ConnectionMode& mode) {
    if (name == "do_not_connect") {
        mode = ConnectionMode::DoNotConnect;
        return true;
    }
    if (name == "auto_connect_keep") {
        mode = ConnectionMode::AutoConnectAndKeepConnected;
        return true;
    }
    if (name == "auto_connect_disconnect") {
        mode = ConnectionMode::AutoConnectAndDisconnect;
        return true;
    }
    return false;
}

bool clientConfigFromJson(const json::value& value, ClientConfig& out, std::string& error) {
    if (!value.is_object()) {
        error = "Config must be object";
        return false;
    }
    const auto& obj = value.as_object();
    ClientConfig result = out;

    if (obj.contains("host")) {
        if (!obj.at("host").is_string()) {
            error = "host must be string";
            return false;
        }
        result.host = std::string(obj.at("host").as_string().c_str());
    }

    std::optional<std::int64_t> n;
    if (!readInteger(obj, "port", 1, 0xFFFF, n, error)) {
        return false;
    }
    if (n) {
        result.port = static_cast<std::uint16_t>(*n);
    }

    if (!readInteger(obj, "unit_id", 0, 255, n, error)) {
        return false;
    }
    if (n) {
        result.unitId = static_cast<std::uint8_t>(*n);
    }

    const auto maxMillis = std::numeric_limits<std::int32_t>::max();
    if (!readInteger(obj, "connect_timeout_ms", 1, maxMillis, n, error)) {
        return false;
    }
    if (n) {
        result.connectTimeout = std::chrono::milliseconds(*n);
    }

    if (!readInteger(obj, "response_timeout_ms", 1, maxMillis, n, error)) {
        return false;
    }
    if (n) {
        result.responseTimeout = std::chrono::milliseconds(*n);
    }

    if (obj.contains("delay_after_connect_ms") && obj.at("delay_after_connect_ms").is_null()) {
        result.delayAfterConnect.reset();
    } else {
        if (!readInteger(obj, "delay_after_connect_ms", 0, maxMillis, n, error)) {
            return false;
        }
        if (n) {
            result.delayAfterConnect = std::chrono::milliseconds(*n);
        }
    }

    if (obj.contains("connection_mode")) {
        if (!obj.at("connection_mode").is_string()) {
            error = "connection_mode must be string";
            return false;
        }
        if (!parseConnectionMode(std::string(obj.at("connection_mode").as_string().c_str()), result.connectionMode)) {
            error = "Unknown connection_mode";
            return false;
        }
    }

    out = result;
    return true;
}

json::object clientConfigToJson(const ClientConfig& config) {
    json::object obj;
    obj["host"] = config.host;
    obj["port"] = config.port;
    obj["unit_id"] = config.unitId;
    obj["connect_timeout_ms"] = config.connectTimeout.count();
    obj["response_timeout_ms"] = config.responseTimeout.count();
    if (config.delayAfterConnect) {
        obj["delay_after_connect_ms"] = config.delayAfterConnect->count();
    } else {
        obj["delay_after_connect_ms"] = nullptr;
    }
    obj["connection_mode"] = connectionModeToString(config.connectionMode);
    return obj;
}

ClientConfig loadClientConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config: " + path);
    }
    std::stringstream content;
    content << file.rdbuf();

    boost::system::error_code ec;
    const auto value = json::parse(content.str(), ec);
    if (ec) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + ec.message());
    }

    ClientConfig config;
    std::string error;
    if (!clientConfigFromJson(value, config, error)) {
        throw std::runtime_error("Invalid config " + path + ": " + error);
    }
    return config;
}

} // namespace config
