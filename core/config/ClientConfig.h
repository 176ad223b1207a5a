#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace config {

enum class ConnectionMode {
    DoNotConnect,
    AutoConnectAndKeepConnected,
    AutoConnectAndDisconnect
};

constexpr std::uint16_t kDefaultModbusPort = 502;

struct ClientConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = kDefaultModbusPort;
    std::uint8_t unitId = 1;
    std::chrono::milliseconds connectTimeout{3000};
    std::chrono::milliseconds responseTimeout{3000};
    std::optional<std::chrono::milliseconds> delayAfterConnect;
    ConnectionMode connectionMode = ConnectionMode::AutoConnectAndKeepConnected;
};

std::string connectionModeToString(ConnectionMode mode);
bool parseConnectionMode(const std::string& name, ConnectionMode& mode);

// Applies the keys present in value on top of out. Unknown keys are ignored.
bool clientConfigFromJson(const boost::json::value& value, ClientConfig& out, std::string& error);

boost::json::object clientConfigToJson(const ClientConfig& config);

// Throws std::runtime_error if the file cannot be read, parsed or validated.
ClientConfig loadClientConfig(const std::string& path);

} // namespace config
