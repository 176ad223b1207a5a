#include "tcp_frame.h"

#include <stdexcept>
#include <string>

namespace protocol {

namespace {

void putU16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

std::uint16_t readU16(const std::uint8_t* data) {
    return static_cast<std::uint16_t>((data[0] << 8) | data[1]);
}

} // namespace

std::vector<std::uint8_t> encodeTcpFrame(std::uint16_t transactionId, std::uint8_t unitId,
                                         const std::vector<std::uint8_t>& pdu) {
    if (pdu.size() > kMaxPduSize) {
        throw std::length_error("PDU too long for MBAP length field: " + std::to_string(pdu.size()));
    }

    std::vector<std::uint8_t> frame;
    frame.reserve(kMbapHeaderSize + pdu.size());
    putU16(frame, transactionId);
    putU16(frame, kModbusProtocolId);
    putU16(frame, static_cast<std::uint16_t>(pdu.size() + 1));
    frame.push_back(unitId);
    frame.insert(frame.end(), pdu.begin(), pdu.end());
    return frame;
}

std::optional<MbapHeader> parseMbapPrefix(const std::uint8_t* data, std::size_t size) {
    if (data == nullptr || size < kMbapPrefixSize) {
        return std::nullopt;
    }

    MbapHeader header;
    header.transactionId = readU16(data);
    header.protocolId = readU16(data + 2);
    header.length = readU16(data + 4);
    return header;
}

} // namespace protocol
