#include "InMemoryModbusTransport.h"

namespace transport {

namespace {

constexpr std::uint8_t kIllegalFunction = 0x01;
constexpr std::uint8_t kIllegalDataAddress = 0x02;
constexpr std::uint8_t kIllegalDataValue = 0x03;

std::uint16_t readU16(const std::vector<std::uint8_t>& pdu, std::size_t offset)
{
    return static_cast<std::uint16_t>((pdu[offset] << 8) | pdu[offset + 1]);
}

void putU16(std::vector<std::uint8_t>& pdu, std::uint16_t value)
{
    pdu.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    pdu.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

} // namespace

InMemoryModbusTransport::InMemoryModbusTransport(config::ConnectionMode mode)
    : m_mode(mode)
{
}

protocol::ResponseCode InMemoryModbusTransport::send(protocol::ModbusRequest& request)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    request.reset();

    if (m_mode != config::ConnectionMode::DoNotConnect) {
        m_connected = true;
    }
    if (!m_connected) {
        request.setResponseCode(protocol::ResponseCode::ConnectionFailed);
        return protocol::ResponseCode::ConnectionFailed;
    }

    const auto pdu = request.protocolDataUnit();
    std::vector<std::uint8_t> reply;
    switch (static_cast<protocol::FunctionCode>(pdu.at(0))) {
    case protocol::FunctionCode::ReadHoldingRegisters:
    case protocol::FunctionCode::ReadInputRegisters:
        reply = readRegisters(pdu);
        break;
    case protocol::FunctionCode::WriteSingleRegister:
        reply = writeSingleRegister(pdu);
        break;
    case protocol::FunctionCode::WriteMultipleRegisters:
        reply = writeMultipleRegisters(pdu);
        break;
    default:
        reply = exceptionReply(pdu.at(0), kIllegalFunction);
        break;
    }

    if (m_mode == config::ConnectionMode::AutoConnectAndDisconnect) {
        m_connected = false;
    }

    request.setFromPduResponse(reply);
    return request.waitResponseCode();
}

bool InMemoryModbusTransport::connect()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connected = true;
    return true;
}

void InMemoryModbusTransport::disconnect()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connected = false;
}

bool InMemoryModbusTransport::isConnected() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connected;
}

void InMemoryModbusTransport::setRegister(std::uint16_t address, std::uint16_t value)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_registers[address] = value;
}

std::uint16_t InMemoryModbusTransport::registerValue(std::uint16_t address) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_registers.find(address);
    return it == m_registers.end() ? 0 : it->second;
}

std::vector<std::uint8_t> InMemoryModbusTransport::readRegisters(const std::vector<std::uint8_t>& pdu) const
{
    if (pdu.size() != 5) {
        return exceptionReply(pdu[0], kIllegalDataValue);
    }
    const auto address = readU16(pdu, 1);
    const auto count = readU16(pdu, 3);
    if (count == 0 || count > 125) {
        return exceptionReply(pdu[0], kIllegalDataValue);
    }
    if (static_cast<std::uint32_t>(address) + count > 0x10000) {
        return exceptionReply(pdu[0], kIllegalDataAddress);
    }

    std::vector<std::uint8_t> reply{pdu[0], static_cast<std::uint8_t>(count * 2)};
    for (std::uint32_t offset = 0; offset < count; ++offset) {
        const auto it = m_registers.find(static_cast<std::uint16_t>(address + offset));
        putU16(reply, it == m_registers.end() ? 0 : it->second);
    }
    return reply;
}

std::vector<std::uint8_t> InMemoryModbusTransport::writeSingleRegister(const std::vector<std::uint8_t>& pdu)
{
    if (pdu.size() != 5) {
        return exceptionReply(pdu[0], kIllegalDataValue);
    }
    m_registers[readU16(pdu, 1)] = readU16(pdu, 3);
    return pdu;
}

std::vector<std::uint8_t> InMemoryModbusTransport::writeMultipleRegisters(const std::vector<std::uint8_t>& pdu)
{
    if (pdu.size() < 6) {
        return exceptionReply(pdu[0], kIllegalDataValue);
    }
    const auto address = readU16(pdu, 1);
    const auto count = readU16(pdu, 3);
    const std::size_t byteCount = pdu[5];
    if (count == 0 || byteCount != static_cast<std::size_t>(count) * 2 || pdu.size() != 6 + byteCount) {
        return exceptionReply(pdu[0], kIllegalDataValue);
    }
    if (static_cast<std::uint32_t>(address) + count > 0x10000) {
        return exceptionReply(pdu[0], kIllegalDataAddress);
    }

    for (std::uint32_t offset = 0; offset < count; ++offset) {
        m_registers[static_cast<std::uint16_t>(address + offset)] = readU16(pdu, 6 + offset * 2);
    }
    return {pdu[0], pdu[1], pdu[2], pdu[3], pdu[4]};
}

std::vector<std::uint8_t> InMemoryModbusTransport::exceptionReply(std::uint8_t function, std::uint8_t code)
{
    return {static_cast<std::uint8_t>(function | 0x80U), code};
}

} // namespace transport
