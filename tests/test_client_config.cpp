#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

#include "core/config/ClientConfig.h"

namespace json = boost::json;

using config::ClientConfig;
using config::ConnectionMode;

namespace {

std::filesystem::path writeTempFile(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(ClientConfig, Defaults) {
    const ClientConfig cfg;
    EXPECT_EQ("127.0.0.1", cfg.host);
    EXPECT_EQ(502, cfg.port);
    EXPECT_EQ(1, cfg.unitId);
    EXPECT_EQ(std::chrono::milliseconds(3000), cfg.connectTimeout);
    EXPECT_EQ(std::chrono::milliseconds(3000), cfg.responseTimeout);
    EXPECT_FALSE(cfg.delayAfterConnect.has_value());
    EXPECT_EQ(ConnectionMode::AutoConnectAndKeepConnected, cfg.connectionMode);
}

TEST(ClientConfig, JsonOverlaysPresentKeys) {
    ClientConfig cfg;
    cfg.unitId = 9;
    std::string error;

    const auto value = json::parse(R"({"host":"192.168.1.20","port":1502,"response_timeout_ms":250,
                                      "delay_after_connect_ms":50,"connection_mode":"auto_connect_disconnect"})");
    ASSERT_TRUE(config::clientConfigFromJson(value, cfg, error)) << error;

    EXPECT_EQ("192.168.1.20", cfg.host);
    EXPECT_EQ(1502, cfg.port);
    EXPECT_EQ(9, cfg.unitId);
    EXPECT_EQ(std::chrono::milliseconds(3000), cfg.connectTimeout);
    EXPECT_EQ(std::chrono::milliseconds(250), cfg.responseTimeout);
    EXPECT_EQ(std::chrono::milliseconds(50), cfg.delayAfterConnect);
    EXPECT_EQ(ConnectionMode::AutoConnectAndDisconnect, cfg.connectionMode);
}

TEST(ClientConfig, NullDelayClearsDelay) {
    ClientConfig cfg;
    cfg.delayAfterConnect = std::chrono::milliseconds(10);
    std::string error;

    ASSERT_TRUE(config::clientConfigFromJson(json::parse(R"({"delay_after_connect_ms":null})"), cfg, error));
    EXPECT_FALSE(cfg.delayAfterConnect.has_value());
}

TEST(ClientConfig, InvalidValuesLeaveConfigUntouched) {
    ClientConfig cfg;
    std::string error;

    EXPECT_FALSE(config::clientConfigFromJson(json::parse(R"({"host":"h","port":70000})"), cfg, error));
    EXPECT_EQ("port out of range", error);
    EXPECT_EQ("127.0.0.1", cfg.host);

    EXPECT_FALSE(config::clientConfigFromJson(json::parse(R"({"host":5})"), cfg, error));
    EXPECT_EQ("host must be string", error);

    EXPECT_FALSE(config::clientConfigFromJson(json::parse(R"({"unit_id":"one"})"), cfg, error));
    EXPECT_EQ("unit_id must be integer", error);

    EXPECT_FALSE(config::clientConfigFromJson(json::parse(R"({"connection_mode":"sometimes"})"), cfg, error));
    EXPECT_EQ("Unknown connection_mode", error);

    EXPECT_FALSE(config::clientConfigFromJson(json::parse("[1,2]"), cfg, error));
}

TEST(ClientConfig, SerializedConfigReadsBack) {
    ClientConfig cfg;
    cfg.host = "plc.local";
    cfg.port = 5020;
    cfg.unitId = 17;
    cfg.delayAfterConnect = std::chrono::milliseconds(20);
    cfg.connectionMode = ConnectionMode::DoNotConnect;

    ClientConfig restored;
    std::string error;
    ASSERT_TRUE(config::clientConfigFromJson(config::clientConfigToJson(cfg), restored, error)) << error;

    EXPECT_EQ(cfg.host, restored.host);
    EXPECT_EQ(cfg.port, restored.port);
    EXPECT_EQ(cfg.unitId, restored.unitId);
    EXPECT_EQ(cfg.delayAfterConnect, restored.delayAfterConnect);
    EXPECT_EQ(cfg.connectionMode, restored.connectionMode);
}

TEST(ClientConfig, LoadsFromFile) {
    const auto path = writeTempFile("modbuslink_config_ok.json", R"({"host":"10.0.0.7","unit_id":4})");

    const auto cfg = config::loadClientConfig(path.string());

    EXPECT_EQ("10.0.0.7", cfg.host);
    EXPECT_EQ(4, cfg.unitId);
    std::filesystem::remove(path);
}

TEST(ClientConfig, LoadFailuresThrow) {
    EXPECT_THROW(config::loadClientConfig("/nonexistent/modbuslink.json"), std::runtime_error);

    const auto broken = writeTempFile("modbuslink_config_broken.json", "{\"host\":");
    EXPECT_THROW(config::loadClientConfig(broken.string()), std::runtime_error);
    std::filesystem::remove(broken);

    const auto invalid = writeTempFile("modbuslink_config_invalid.json", R"({"port":0})");
    EXPECT_THROW(config::loadClientConfig(invalid.string()), std::runtime_error);
    std::filesystem::remove(invalid);
}

TEST(ClientConfig, ConnectionModeNames) {
    ConnectionMode mode = ConnectionMode::AutoConnectAndKeepConnected;
    ASSERT_TRUE(config::parseConnectionMode("do_not_connect", mode));
    EXPECT_EQ(ConnectionMode::DoNotConnect, mode);
    EXPECT_EQ("auto_connect_keep", config::connectionModeToString(ConnectionMode::AutoConnectAndKeepConnected));
    EXPECT_FALSE(config::parseConnectionMode("AUTO", mode));
}
