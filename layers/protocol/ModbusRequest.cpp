#include "ModbusRequest.h"

#include <exception>
#include <string>
#include <utility>

#include "core/log/Logger.h"

namespace protocol {

ModbusRequest::ModbusRequest(FunctionCode function)
    : function_(function) {
    future_ = promise_.get_future().share();
}

std::vector<std::uint8_t> ModbusRequest::protocolDataUnit() const {
    std::vector<std::uint8_t> pdu;
    pdu.push_back(static_cast<std::uint8_t>(function_));
    encodeBody(pdu);
    return pdu;
}

void ModbusRequest::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    promise_ = std::promise<ResponseCode>();
    future_ = promise_.get_future().share();
    code_.reset();
    clearResult();
}

bool ModbusRequest::setResponseCode(ResponseCode code) {
    std::promise<ResponseCode> resolved;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (code_) {
            return false;
        }
        code_ = code;
        resolved = std::move(promise_);
    }
    // The waiter may destroy this request as soon as the value is set.
    resolved.set_value(code);
    return true;
}

void ModbusRequest::setFromPduResponse(const std::vector<std::uint8_t>& pdu) {
    if (pdu.empty()) {
        setResponseCode(ResponseCode::RequestRxFailed);
        return;
    }

    const auto expected = static_cast<std::uint8_t>(function_);
    const auto received = pdu[0];
    if (received == (expected | 0x80U)) {
        const std::uint8_t exceptionCode = pdu.size() > 1 ? pdu[1] : 0;
        setResponseCode(responseCodeFromException(exceptionCode));
        return;
    }
    if (received != expected) {
        logging::warning("Unexpected function code in reply: " + std::to_string(received) +
                         " != " + std::to_string(expected));
        setResponseCode(ResponseCode::RequestRxWrongFunctionCode);
        return;
    }

    bool decoded = false;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (code_) {
            return;
        }
        decoded = decodeBody(std::vector<std::uint8_t>(pdu.begin() + 1, pdu.end()));
    } catch (const std::exception& e) {
        logging::error(std::string("Failed to decode reply PDU: ") + e.what());
        decoded = false;
    }
    setResponseCode(decoded ? ResponseCode::RequestSucceed : ResponseCode::RequestRxFailed);
}

ResponseCode ModbusRequest::waitResponseCode() const {
    std::shared_future<ResponseCode> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        future = future_;
    }
    return future.get();
}

std::optional<ResponseCode> ModbusRequest::responseCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return code_;
}

void ModbusRequest::putU16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

std::uint16_t ModbusRequest::getU16(const std::vector<std::uint8_t>& buffer, std::size_t offset) {
    return static_cast<std::uint16_t>((buffer.at(offset) << 8) | buffer.at(offset + 1));
}

ReadRegistersRequest::ReadRegistersRequest(std::uint16_t address, std::uint16_t count, bool input)
    : ModbusRequest(input ? FunctionCode::ReadInputRegisters : FunctionCode::ReadHoldingRegisters),
      address_(address),
      count_(count) {}

void ReadRegistersRequest::encodeBody(std::vector<std::uint8_t>& pdu) const {
    putU16(pdu, address_);
    putU16(pdu, count_);
}

bool ReadRegistersRequest::decodeBody(const std::vector<std::uint8_t>& body) {
    if (body.empty()) {
        return false;
    }
    const std::size_t byteCount = body[0];
    if (byteCount != static_cast<std::size_t>(count_) * 2 || body.size() != 1 + byteCount) {
        return false;
    }

    values_.clear();
    values_.reserve(count_);
    for (std::size_t i = 0; i < count_; ++i) {
        values_.push_back(getU16(body, 1 + i * 2));
    }
    return true;
}

WriteSingleRegisterRequest::WriteSingleRegisterRequest(std::uint16_t address, std::uint16_t value)
    : ModbusRequest(FunctionCode::WriteSingleRegister),
      address_(address),
      value_(value) {}

void WriteSingleRegisterRequest::encodeBody(std::vector<std::uint8_t>& pdu) const {
    putU16(pdu, address_);
    putU16(pdu, value_);
}

bool WriteSingleRegisterRequest::decodeBody(const std::vector<std::uint8_t>& body) {
    return body.size() == 4 && getU16(body, 0) == address_ && getU16(body, 2) == value_;
}

WriteMultipleRegistersRequest::WriteMultipleRegistersRequest(std::uint16_t address, std::vector<std::uint16_t> values)
    : ModbusRequest(FunctionCode::WriteMultipleRegisters),
      address_(address),
      values_(std::move(values)) {}

void WriteMultipleRegistersRequest::encodeBody(std::vector<std::uint8_t>& pdu) const {
    putU16(pdu, address_);
    putU16(pdu, static_cast<std::uint16_t>(values_.size()));
    pdu.push_back(static_cast<std::uint8_t>(values_.size() * 2));
    for (const auto v : values_) {
        putU16(pdu, v);
    }
}

bool WriteMultipleRegistersRequest::decodeBody(const std::vector<std::uint8_t>& body) {
    return body.size() == 4 && getU16(body, 0) == address_ &&
           getU16(body, 2) == static_cast<std::uint16_t>(values_.size());
}

} // namespace protocol
