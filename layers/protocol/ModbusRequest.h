#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <vector>

#include "ModbusTypes.h"

namespace protocol {

// A request owned by the caller and re-armed by the transport before every send.
// The response code is a one-shot cell: after reset() only the first
// setResponseCode() takes effect.
class ModbusRequest {
public:
    explicit ModbusRequest(FunctionCode function);
    virtual ~ModbusRequest() = default;

    ModbusRequest(const ModbusRequest&) = delete;
    ModbusRequest& operator=(const ModbusRequest&) = delete;

    FunctionCode function() const noexcept { return function_; }

    // Function code followed by the function-specific bytes.
    std::vector<std::uint8_t> protocolDataUnit() const;

    std::optional<std::uint8_t> unitId() const noexcept { return unitId_; }
    void setUnitId(std::optional<std::uint8_t> unitId) noexcept { unitId_ = unitId; }

    std::optional<std::chrono::milliseconds> responseTimeout() const noexcept { return responseTimeout_; }
    void setResponseTimeout(std::optional<std::chrono::milliseconds> timeout) noexcept { responseTimeout_ = timeout; }

    void reset();

    // Returns false when the request was already resolved.
    bool setResponseCode(ResponseCode code);

    // Decodes a reply PDU and resolves the request with the outcome.
    void setFromPduResponse(const std::vector<std::uint8_t>& pdu);

    // Blocks until the request is resolved.
    ResponseCode waitResponseCode() const;

    std::optional<ResponseCode> responseCode() const;

protected:
    virtual void encodeBody(std::vector<std::uint8_t>& pdu) const = 0;

    // pdu excludes the function code byte. Returns false on a malformed body.
    virtual bool decodeBody(const std::vector<std::uint8_t>& body) = 0;

    virtual void clearResult() {}

    static void putU16(std::vector<std::uint8_t>& buffer, std::uint16_t value);
    static std::uint16_t getU16(const std::vector<std::uint8_t>& buffer, std::size_t offset);

private:
    FunctionCode function_;
    std::optional<std::uint8_t> unitId_;
    std::optional<std::chrono::milliseconds> responseTimeout_;

    mutable std::mutex mutex_;
    std::promise<ResponseCode> promise_;
    std::shared_future<ResponseCode> future_;
    std::optional<ResponseCode> code_;
};

class ReadRegistersRequest final : public ModbusRequest {
public:
    ReadRegistersRequest(std::uint16_t address, std::uint16_t count, bool input = false);

    std::uint16_t address() const noexcept { return address_; }
    std::uint16_t count() const noexcept { return count_; }
    const std::vector<std::uint16_t>& values() const noexcept { return values_; }

protected:
    void encodeBody(std::vector<std::uint8_t>& pdu) const override;
    bool decodeBody(const std::vector<std::uint8_t>& body) override;
    void clearResult() override { values_.clear(); }

private:
    std::uint16_t address_;
    std::uint16_t count_;
    std::vector<std::uint16_t> values_;
};

class WriteSingleRegisterRequest final : public ModbusRequest {
public:
    WriteSingleRegisterRequest(std::uint16_t address, std::uint16_t value);

    std::uint16_t address() const noexcept { return address_; }
    std::uint16_t value() const noexcept { return value_; }

protected:
    void encodeBody(std::vector<std::uint8_t>& pdu) const override;
    bool decodeBody(const std::vector<std::uint8_t>& body) override;

private:
    std::uint16_t address_;
    std::uint16_t value_;
};

class WriteMultipleRegistersRequest final : public ModbusRequest {
public:
    WriteMultipleRegistersRequest(std::uint16_t address, std::vector<std::uint16_t> values);

    std::uint16_t address() const noexcept { return address_; }
    const std::vector<std::uint16_t>& values() const noexcept { return values_; }

protected:
    void encodeBody(std::vector<std::uint8_t>& pdu) const override;
    bool decodeBody(const std::vector<std::uint8_t>& body) override;

private:
    std::uint16_t address_;
    std::vector<std::uint16_t> values_;
};

} // namespace protocol
