#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "core/config/ClientConfig.h"
#include "core/transport/IModbusTransport.h"

namespace transport {

// Serves requests from an in-process register table instead of a socket.
// Holding and input registers share one address space.
class InMemoryModbusTransport final : public IModbusTransport
{
public:
    explicit InMemoryModbusTransport(
        config::ConnectionMode mode = config::ConnectionMode::AutoConnectAndKeepConnected);

    protocol::ResponseCode send(protocol::ModbusRequest& request) override;

    bool connect() override;
    void disconnect() override;
    bool isConnected() const override;

    void setRegister(std::uint16_t address, std::uint16_t value);
    std::uint16_t registerValue(std::uint16_t address) const;

private:
    std::vector<std::uint8_t> readRegisters(const std::vector<std::uint8_t>& pdu) const;
    std::vector<std::uint8_t> writeSingleRegister(const std::vector<std::uint8_t>& pdu);
    std::vector<std::uint8_t> writeMultipleRegisters(const std::vector<std::uint8_t>& pdu);

    static std::vector<std::uint8_t> exceptionReply(std::uint8_t function, std::uint8_t code);

    const config::ConnectionMode m_mode;
    mutable std::mutex m_mutex;
    bool m_connected = false;
    std::unordered_map<std::uint16_t, std::uint16_t> m_registers;
};

} // namespace transport
