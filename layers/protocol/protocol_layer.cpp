#include "protocol_layer.h"

#include <charconv>
#include <system_error>
#include <chrono>
#include <vector>

namespace protocol {

namespace {

bool parseValues(const json::object& obj, std::vector<std::uint16_t>& out, std::string& error) {
    out.clear();
    if (!obj.contains("values") || !obj.at("values").is_array()) {
        error = "values must be array";
        return false;
    }
    for (const auto& v : obj.at("values").as_array()) {
        std::uint16_t value = 0;
        if (!ProtocolHandler::parseUint16Flexible(v, value)) {
            error = "values must contain integers in [0..65535]";
            return false;
        }
        out.push_back(value);
    }
    return true;
}

} // namespace

std::unique_ptr<ModbusRequest> ProtocolHandler::jsonToRequest(const json::value& payload, std::string& error) const {
    if (!payload.is_object()) {
        error = "Request must be object";
        return nullptr;
    }

    const auto& obj = payload.as_object();
    if (!obj.contains("function") || !obj.contains("address")) {
        error = "Missing required fields: function, address";
        return nullptr;
    }

    if (!obj.at("function").is_string()) {
        error = "function must be string";
        return nullptr;
    }
    FunctionCode fc;
    if (!parseFunction(std::string(obj.at("function").as_string().c_str()), fc)) {
        error = "Unknown function";
        return nullptr;
    }

    std::uint16_t address = 0;
    if (!parseUint16Flexible(obj.at("address"), address)) {
        error = "address must be integer in [0..65535]";
        return nullptr;
    }

    std::unique_ptr<ModbusRequest> request;
    switch (fc) {
        case FunctionCode::ReadHoldingRegisters:
        case FunctionCode::ReadInputRegisters: {
            std::uint16_t count = 1;
            if (obj.contains("count")) {
                if (!obj.at("count").is_int64() || obj.at("count").as_int64() < 1 || obj.at("count").as_int64() > 125) {
                    error = "count must be integer in [1..125]";
                    return nullptr;
                }
                count = static_cast<std::uint16_t>(obj.at("count").as_int64());
            }
            request = std::make_unique<ReadRegistersRequest>(address, count, fc == FunctionCode::ReadInputRegisters);
            break;
        }
        case FunctionCode::WriteSingleRegister: {
            std::uint16_t value = 0;
            if (!obj.contains("value") || !parseUint16Flexible(obj.at("value"), value)) {
                error = "value must be integer in [0..65535]";
                return nullptr;
            }
            request = std::make_unique<WriteSingleRegisterRequest>(address, value);
            break;
        }
        case FunctionCode::WriteMultipleRegisters: {
            std::vector<std::uint16_t> values;
            if (!parseValues(obj, values, error)) {
                return nullptr;
            }
            if (values.empty() || values.size() > 123) {
                error = "values must contain 1..123 elements";
                return nullptr;
            }
            request = std::make_unique<WriteMultipleRegistersRequest>(address, std::move(values));
            break;
        }
    }

    if (obj.contains("unit_id")) {
        if (!obj.at("unit_id").is_int64() || obj.at("unit_id").as_int64() < 0 || obj.at("unit_id").as_int64() > 255) {
            error = "unit_id must be integer in [0..255]";
            return nullptr;
        }
        request->setUnitId(static_cast<std::uint8_t>(obj.at("unit_id").as_int64()));
    }

    if (obj.contains("timeout_ms")) {
        if (!obj.at("timeout_ms").is_int64() || obj.at("timeout_ms").as_int64() < 1) {
            error = "timeout_ms must be positive integer";
            return nullptr;
        }
        request->setResponseTimeout(std::chrono::milliseconds(obj.at("timeout_ms").as_int64()));
    }

    return request;
}

json::object ProtocolHandler::resultToJson(const ModbusRequest& request, ResponseCode code) const {
    json::object root;
    root["function"] = toString(request.function());

    if (code != ResponseCode::RequestSucceed) {
        root["status"] = "error";
        root["code"] = toString(code);
        root["code_value"] = static_cast<int>(code);
        return root;
    }

    root["status"] = "ok";
    json::array values;
    if (const auto* read = dynamic_cast<const ReadRegistersRequest*>(&request)) {
        root["address"] = read->address();
        for (const auto value : read->values()) {
            values.push_back(value);
        }
    } else if (const auto* single = dynamic_cast<const WriteSingleRegisterRequest*>(&request)) {
        root["address"] = single->address();
        values.push_back(single->value());
    } else if (const auto* multiple = dynamic_cast<const WriteMultipleRegistersRequest*>(&request)) {
        root["address"] = multiple->address();
        for (const auto value : multiple->values()) {
            values.push_back(value);
        }
    }
    root["values"] = values;
    return root;
}

bool ProtocolHandler::parseFunction(const std::string& name, FunctionCode& code) {
    if (name == "read_holding") {
        code = FunctionCode::ReadHoldingRegisters;
        return true;
    }
    if (name == "read_input") {
        code = FunctionCode::ReadInputRegisters;
        return true;
    }
    if (name == "write_single") {
        code = FunctionCode::WriteSingleRegister;
        return true;
    }
    if (name == "write_multiple") {
        code = FunctionCode::WriteMultipleRegisters;
        return true;
    }
    return false;
}

bool ProtocolHandler::parseUint16Flexible(const json::value& value, std::uint16_t& out) {
    if (value.is_int64()) {
        const auto v = value.as_int64();
        if (v < 0 || v > 0xFFFF) {
            return false;
        }
        out = static_cast<std::uint16_t>(v);
        return true;
    }
    if (value.is_uint64()) {
        if (value.as_uint64() > 0xFFFF) {
            return false;
        }
        out = static_cast<std::uint16_t>(value.as_uint64());
        return true;
    }

    if (!value.is_string()) {
        return false;
    }

    std::string text = std::string(value.as_string().c_str());
    int base = 10;
    if (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0) {
        text = text.substr(2);
        base = 16;
    }

    unsigned int parsed = 0;
    const auto* begin = text.data();
    const auto* end = begin + text.size();
    const auto res = std::from_chars(begin, end, parsed, base);
    if (res.ec != std::errc() || res.ptr != end || parsed > 0xFFFF) {
        return false;
    }

    out = static_cast<std::uint16_t>(parsed);
    return true;
}

} // namespace protocol
