#pragma once

#include <cstdint>
#include <string>

namespace protocol {

enum class FunctionCode : std::uint8_t {
    ReadHoldingRegisters = 0x03,
    ReadInputRegisters = 0x04,
    WriteSingleRegister = 0x06,
    WriteMultipleRegisters = 0x10
};

// Outcome of one exchange. Values below 0x80 mirror Modbus exception codes,
// values from 0xF0 are produced by the client side itself.
enum class ResponseCode : std::uint8_t {
    RequestSucceed = 0x00,
    IllegalFunction = 0x01,
    IllegalDataAddress = 0x02,
    IllegalDataValue = 0x03,
    ServerDeviceFailure = 0x04,
    Acknowledge = 0x05,
    ServerDeviceBusy = 0x06,
    NegativeAcknowledge = 0x07,
    MemoryParityError = 0x08,
    GatewayPathUnavailable = 0x0A,
    GatewayTargetFailedToRespond = 0x0B,
    ConnectionFailed = 0xF0,
    RequestTimeout = 0xF1,
    RequestTxFailed = 0xF2,
    RequestRxFailed = 0xF3,
    RequestRxWrongFunctionCode = 0xF5,
    UndefinedErrorCode = 0xFF
};

// Maps a Modbus exception byte to a code; unknown bytes become UndefinedErrorCode.
ResponseCode responseCodeFromException(std::uint8_t exceptionCode);

std::string toString(ResponseCode code);
std::string toString(FunctionCode code);

} // namespace protocol
