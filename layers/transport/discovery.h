#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "core/config/ClientConfig.h"

namespace transport {

// Probes startAddress and the following IPv4 addresses (last octet only, up to
// .255) one at a time and returns the first one accepting a TCP connection.
std::optional<std::string> discover(const std::string& startAddress,
                                    std::uint16_t port = config::kDefaultModbusPort,
                                    std::chrono::milliseconds timeout = std::chrono::milliseconds(200));

} // namespace transport
