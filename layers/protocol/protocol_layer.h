#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <memory>
#include <string>

#include "ModbusRequest.h"
#include "ModbusTypes.h"

namespace protocol {

namespace json = boost::json;

// Converts JSON command objects to requests and resolved requests back to JSON.
//
// Command keys: function (read_holding | read_input | write_single | write_multiple),
// address (integer or "0x..." string), count, value, values, unit_id, timeout_ms.
class ProtocolHandler {
public:
    ProtocolHandler() = default;

    std::unique_ptr<ModbusRequest> jsonToRequest(const json::value& payload, std::string& error) const;

    json::object resultToJson(const ModbusRequest& request, ResponseCode code) const;

    static bool parseFunction(const std::string& name, FunctionCode& code);
    static bool parseUint16Flexible(const json::value& value, std::uint16_t& out);
};

} // namespace protocol
