#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/transport/IModbusTransport.h"
#include "layers/protocol/protocol_layer.h"

namespace application {

// Register-level operations on top of a transport, with JSON results of the form
// {"status":"ok","values":[...]} or {"status":"error","code":"request_timeout",...}.
class ApplicationCore {
public:
    explicit ApplicationCore(transport::IModbusTransport& transport);

    bool readRegistersDetailed(std::optional<std::uint8_t> unitId, std::uint16_t address, std::uint16_t count,
                               bool input, boost::json::object& result, std::string& error);
    bool writeSingleRegister(std::optional<std::uint8_t> unitId, std::uint16_t address, std::uint16_t value,
                             boost::json::object& result, std::string& error);
    bool writeMultipleRegisters(std::optional<std::uint8_t> unitId, std::uint16_t address,
                                const std::vector<std::uint16_t>& values, boost::json::object& result,
                                std::string& error);

    boost::json::object executeJson(const boost::json::value& command);
    boost::json::array executeBatch(const boost::json::array& commands);

private:
    bool execute(protocol::ModbusRequest& request, std::optional<std::uint8_t> unitId,
                 boost::json::object& result, std::string& error);

    transport::IModbusTransport& transport_;
    protocol::ProtocolHandler protocolHandler_;
};

} // namespace application
