#pragma once

#include <chrono>
#include <cstdint>

#include "core/config/ClientConfig.h"
#include "layers/protocol/ModbusRequest.h"

namespace transport {

// Client side of a Modbus link. send() never throws: every outcome, including
// connection problems, is reported as a response code and stored in the request.
class IModbusTransport
{
public:
    virtual ~IModbusTransport() = default;

    virtual protocol::ResponseCode send(protocol::ModbusRequest& request) = 0;

    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
};

inline std::chrono::milliseconds responseTimeoutFor(const config::ClientConfig& config,
                                                    const protocol::ModbusRequest& request)
{
    return request.responseTimeout().value_or(config.responseTimeout);
}

inline std::uint8_t unitIdFor(const config::ClientConfig& config, const protocol::ModbusRequest& request)
{
    return request.unitId().value_or(config.unitId);
}

} // namespace transport
