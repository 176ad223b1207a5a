#include "application_layer.h"

#include <utility>

namespace application {

namespace json = boost::json;

ApplicationCore::ApplicationCore(transport::IModbusTransport& transport)
    : transport_(transport) {}

bool ApplicationCore::readRegistersDetailed(std::optional<std::uint8_t> unitId, std::uint16_t address,
                                            std::uint16_t count, bool input, json::object& result,
                                            std::string& error) {
    if (count == 0 || count > 125) {
        error = "count must be in [1..125]";
        return false;
    }
    protocol::ReadRegistersRequest request(address, count, input);
    return execute(request, unitId, result, error);
}

bool ApplicationCore::writeSingleRegister(std::optional<std::uint8_t> unitId, std::uint16_t address,
                                          std::uint16_t value, json::object& result, std::string& error) {
    protocol::WriteSingleRegisterRequest request(address, value);
    return execute(request, unitId, result, error);
}

bool ApplicationCore::writeMultipleRegisters(std::optional<std::uint8_t> unitId, std::uint16_t address,
                                             const std::vector<std::uint16_t>& values, json::object& result,
                                             std::string& error) {
    if (values.empty()) {
        error = "Values are empty";
        return false;
    }
    if (values.size() > 123) {
        error = "Too many values";
        return false;
    }
    protocol::WriteMultipleRegistersRequest request(address, values);
    return execute(request, unitId, result, error);
}

json::object ApplicationCore::executeJson(const json::value& command) {
    std::string error;
    auto request = protocolHandler_.jsonToRequest(command, error);
    if (!request) {
        json::object invalid;
        invalid["status"] = "error";
        invalid["code"] = "invalid_request";
        invalid["error"] = error;
        return invalid;
    }

    json::object result;
    execute(*request, request->unitId(), result, error);
    return result;
}

json::array ApplicationCore::executeBatch(const json::array& commands) {
    json::array results;
    for (const auto& command : commands) {
        results.push_back(executeJson(command));
    }
    return results;
}

bool ApplicationCore::execute(protocol::ModbusRequest& request, std::optional<std::uint8_t> unitId,
                              json::object& result, std::string& error) {
    request.setUnitId(unitId);
    const auto code = transport_.send(request);
    result = protocolHandler_.resultToJson(request, code);
    if (code != protocol::ResponseCode::RequestSucceed) {
        error = protocol::toString(code);
        result["error"] = error;
        return false;
    }
    return true;
}

} // namespace application
