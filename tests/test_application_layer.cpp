#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <boost/json.hpp>

#include "infrastructure/transport/InMemoryModbusTransport.h"
#include "layers/application/application_layer.h"
#include "layers/transport/transport_layer.h"
#include "support/FakeModbusServer.h"

namespace json = boost::json;

using application::ApplicationCore;
using transport::InMemoryModbusTransport;

TEST(ApplicationCore, WriteThenReadBack) {
    InMemoryModbusTransport transport;
    ApplicationCore core(transport);
    json::object result;
    std::string error;

    ASSERT_TRUE(core.writeMultipleRegisters(std::nullopt, 10, {1, 2, 3}, result, error)) << error;
    ASSERT_TRUE(core.writeSingleRegister(std::nullopt, 13, 4, result, error)) << error;
    ASSERT_TRUE(core.readRegistersDetailed(std::nullopt, 10, 4, false, result, error)) << error;

    EXPECT_EQ("ok", result.at("status").as_string());
    EXPECT_EQ(json::parse("[1,2,3,4]"), result.at("values"));
    EXPECT_EQ(4, transport.registerValue(13));
}

TEST(ApplicationCore, ValidatesArgumentsBeforeSending) {
    InMemoryModbusTransport transport(config::ConnectionMode::DoNotConnect);
    ApplicationCore core(transport);
    json::object result;
    std::string error;

    EXPECT_FALSE(core.readRegistersDetailed(std::nullopt, 0, 0, false, result, error));
    EXPECT_EQ("count must be in [1..125]", error);
    EXPECT_FALSE(core.writeMultipleRegisters(std::nullopt, 0, {}, result, error));
    EXPECT_EQ("Values are empty", error);
    EXPECT_FALSE(core.writeMultipleRegisters(std::nullopt, 0, std::vector<std::uint16_t>(124, 1), result, error));
    EXPECT_EQ("Too many values", error);
    EXPECT_TRUE(result.empty());
}

TEST(ApplicationCore, ExceptionReplyBecomesErrorResult) {
    InMemoryModbusTransport transport;
    ApplicationCore core(transport);
    json::object result;
    std::string error;

    EXPECT_FALSE(core.readRegistersDetailed(std::nullopt, 0xFFFF, 2, true, result, error));

    EXPECT_EQ("illegal_data_address", error);
    EXPECT_EQ("error", result.at("status").as_string());
    EXPECT_EQ("illegal_data_address", result.at("code").as_string());
}

TEST(ApplicationCore, DoNotConnectNeedsExplicitConnect) {
    InMemoryModbusTransport transport(config::ConnectionMode::DoNotConnect);
    ApplicationCore core(transport);
    json::object result;
    std::string error;

    EXPECT_FALSE(core.readRegistersDetailed(std::nullopt, 0, 1, false, result, error));
    EXPECT_EQ("connection_failed", error);

    ASSERT_TRUE(transport.connect());
    EXPECT_TRUE(core.readRegistersDetailed(std::nullopt, 0, 1, false, result, error)) << error;
}

TEST(ApplicationCore, AutoDisconnectLeavesTransportDisconnected) {
    InMemoryModbusTransport transport(config::ConnectionMode::AutoConnectAndDisconnect);
    ApplicationCore core(transport);
    json::object result;
    std::string error;

    EXPECT_TRUE(core.writeSingleRegister(std::nullopt, 1, 1, result, error)) << error;
    EXPECT_FALSE(transport.isConnected());
}

TEST(ApplicationCore, ExecutesJsonBatch) {
    InMemoryModbusTransport transport;
    transport.setRegister(0x100, 77);
    ApplicationCore core(transport);

    const auto results = core.executeBatch(json::parse(R"([
        {"function":"read_holding","address":"0x100"},
        {"function":"write_single","address":5,"value":9},
        {"function":"bogus","address":1}
    ])").as_array());

    ASSERT_EQ(3u, results.size());
    EXPECT_EQ(json::parse("[77]"), results[0].as_object().at("values"));
    EXPECT_EQ("ok", results[1].as_object().at("status").as_string());
    EXPECT_EQ(9, transport.registerValue(5));
    EXPECT_EQ("invalid_request", results[2].as_object().at("code").as_string());
}

TEST(ApplicationCore, ReadsThroughTcpClient) {
    testsupport::FakeModbusServer server(&testsupport::FakeModbusServer::registerEcho);
    config::ClientConfig cfg;
    cfg.port = server.port();
    transport::TcpClient client(cfg);
    ApplicationCore core(client);

    const auto result = core.executeJson(json::parse(R"({"function":"read_input","address":300,"count":2})"));

    EXPECT_EQ("ok", result.at("status").as_string());
    EXPECT_EQ(json::parse("[300,301]"), result.at("values"));
}
