#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace protocol {

// MBAP header: transaction id, protocol id, length, unit id (big-endian).
constexpr std::size_t kMbapPrefixSize = 6;  // up to and including the length field
constexpr std::size_t kMbapHeaderSize = 7;  // prefix + unit id
constexpr std::uint16_t kModbusProtocolId = 0;
constexpr std::size_t kMaxPduSize = 0xFFFF - 1;

struct MbapHeader {
    std::uint16_t transactionId = 0;
    std::uint16_t protocolId = 0;
    std::uint16_t length = 0;  // unit id byte + PDU
};

// Throws std::length_error when the PDU does not fit the length field.
std::vector<std::uint8_t> encodeTcpFrame(std::uint16_t transactionId, std::uint8_t unitId,
                                         const std::vector<std::uint8_t>& pdu);

// Parses the first kMbapPrefixSize bytes; nullopt while fewer are available.
std::optional<MbapHeader> parseMbapPrefix(const std::uint8_t* data, std::size_t size);

// Total number of bytes the frame described by header occupies on the wire.
inline std::size_t tcpFrameSize(const MbapHeader& header) {
    return kMbapPrefixSize + header.length;
}

} // namespace protocol
