#include "ModbusTypes.h"

namespace protocol {

ResponseCode responseCodeFromException(std::uint8_t exceptionCode) {
    switch (exceptionCode) {
        case 0x01:
        case 0x02:
        case 0x03:
        case 0x04:
        case 0x05:
        case 0x06:
        case 0x07:
        case 0x08:
        case 0x0A:
        case 0x0B:
            return static_cast<ResponseCode>(exceptionCode);
        default:
            return ResponseCode::UndefinedErrorCode;
    }
}

std::string toString(ResponseCode code) {
    switch (code) {
        case ResponseCode::RequestSucceed:
            return "request_succeed";
        case ResponseCode::IllegalFunction:
            return "illegal_function";
        case ResponseCode::IllegalDataAddress:
            return "illegal_data_address";
        case ResponseCode::IllegalDataValue:
            return "illegal_data_value";
        case ResponseCode::ServerDeviceFailure:
            return "server_device_failure";
        case ResponseCode::Acknowledge:
            return "acknowledge";
        case ResponseCode::ServerDeviceBusy:
            return "server_device_busy";
        case ResponseCode::NegativeAcknowledge:
            return "negative_acknowledge";
        case ResponseCode::MemoryParityError:
            return "memory_parity_error";
        case ResponseCode::GatewayPathUnavailable:
            return "gateway_path_unavailable";
        case ResponseCode::GatewayTargetFailedToRespond:
            return "gateway_target_failed_to_respond";
        case ResponseCode::ConnectionFailed:
            return "connection_failed";
        case ResponseCode::RequestTimeout:
            return "request_timeout";
        case ResponseCode::RequestTxFailed:
            return "request_tx_failed";
        case ResponseCode::RequestRxFailed:
            return "request_rx_failed";
        case ResponseCode::RequestRxWrongFunctionCode:
            return "request_rx_wrong_function_code";
        case ResponseCode::UndefinedErrorCode:
            return "undefined_error_code";
    }
    return "unknown";
}

std::string toString(FunctionCode code) {
    switch (code) {
        case FunctionCode::ReadHoldingRegisters:
            return "read_holding";
        case FunctionCode::ReadInputRegisters:
            return "read_input";
        case FunctionCode::WriteSingleRegister:
            return "write_single";
        case FunctionCode::WriteMultipleRegisters:
            return "write_multiple";
    }
    return "unknown";
}

} // namespace protocol
