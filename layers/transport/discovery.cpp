#include "discovery.h"

#include <vector>

#include <boost/asio.hpp>

#include "core/log/Logger.h"
#include "transport_layer.h"

namespace transport {

namespace {

bool probe(const boost::asio::ip::address_v4& address, std::uint16_t port, std::chrono::milliseconds timeout) {
    boost::asio::io_context ioContext;
    tcp::socket socket(ioContext);
    boost::system::error_code result = boost::asio::error::would_block;

    asyncConnectWithTimeout(socket, {tcp::endpoint(address, port)}, timeout,
                            [&result](const boost::system::error_code& ec) { result = ec; });
    ioContext.run();

    if (result) {
        logging::trace("No Modbus server at " + address.to_string() + ": " + result.message());
        return false;
    }

    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
    return true;
}

} // namespace

std::optional<std::string> discover(const std::string& startAddress,
                                    std::uint16_t port,
                                    std::chrono::milliseconds timeout) {
    boost::system::error_code ec;
    const auto start = boost::asio::ip::make_address_v4(startAddress, ec);
    if (ec) {
        logging::error("Cannot discover from '" + startAddress + "': " + ec.message());
        return std::nullopt;
    }

    auto bytes = start.to_bytes();
    for (unsigned int last = bytes[3]; last <= 0xFF; ++last) {
        bytes[3] = static_cast<unsigned char>(last);
        const boost::asio::ip::address_v4 candidate(bytes);
        if (probe(candidate, port, timeout)) {
            logging::info("Discovered Modbus server at " + candidate.to_string() + ":" + std::to_string(port));
            return candidate.to_string();
        }
    }

    logging::info("No Modbus server found from " + startAddress + " on port " + std::to_string(port));
    return std::nullopt;
}

} // namespace transport
