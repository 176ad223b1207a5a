#include <gtest/gtest.h>

#include <chrono>

#include <boost/asio.hpp>

#include "layers/transport/discovery.h"
#include "support/FakeModbusServer.h"

using testsupport::FakeModbusServer;

using namespace std::chrono_literals;

namespace {

std::uint16_t unusedPort() {
    boost::asio::io_context ioContext;
    boost::asio::ip::tcp::acceptor acceptor(
        ioContext, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

} // namespace

TEST(Discovery, FindsServerAboveStartAddress) {
    FakeModbusServer server(&FakeModbusServer::registerEcho, "127.0.0.253");

    const auto found = transport::discover("127.0.0.250", server.port(), 200ms);

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ("127.0.0.253", *found);
}

TEST(Discovery, StartAddressIsProbedFirst) {
    FakeModbusServer server(&FakeModbusServer::registerEcho, "127.0.0.250");

    const auto found = transport::discover("127.0.0.250", server.port(), 200ms);

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ("127.0.0.250", *found);
}

TEST(Discovery, ReturnsNothingWhenNoServerAnswers) {
    EXPECT_FALSE(transport::discover("127.0.0.250", unusedPort(), 100ms).has_value());
}

TEST(Discovery, RejectsInvalidStartAddress) {
    EXPECT_FALSE(transport::discover("not-an-address", 502, 100ms).has_value());
    EXPECT_FALSE(transport::discover("::1", 502, 100ms).has_value());
}
