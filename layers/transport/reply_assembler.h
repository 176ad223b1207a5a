#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include <boost/asio.hpp>

#include "layers/protocol/ModbusRequest.h"

namespace transport {

// Collects the reply bytes of one pending exchange and resolves its request
// exactly once: with the decoded payload, a framing error, or a timeout.
class ReplyAssembler : public std::enable_shared_from_this<ReplyAssembler> {
public:
    enum class State {
        AwaitingHeader,
        AwaitingBody,
        Resolved
    };

    ReplyAssembler(boost::asio::io_context& ioContext,
                   protocol::ModbusRequest& request,
                   std::uint16_t transactionId,
                   std::chrono::milliseconds timeout);

    ReplyAssembler(const ReplyAssembler&) = delete;
    ReplyAssembler& operator=(const ReplyAssembler&) = delete;

    // Arms the response timer. Call once, after construction.
    void start();

    // Accepts any chunking. Ignored once the exchange is resolved.
    void addResponseData(const std::uint8_t* data, std::size_t size);

    // Resolves with code unless already resolved. Returns true if this call won.
    bool fail(protocol::ResponseCode code);

    State state() const;
    std::uint16_t transactionId() const noexcept { return transactionId_; }

private:
    void onTimeout(const boost::system::error_code& ec);
    bool resolveLocked(protocol::ResponseCode code);

    protocol::ModbusRequest& request_;
    const std::uint16_t transactionId_;
    const std::chrono::milliseconds timeout_;

    mutable std::mutex mutex_;
    boost::asio::steady_timer timer_;
    std::vector<std::uint8_t> buffer_;
    std::size_t frameSize_ = 0;
    State state_ = State::AwaitingHeader;
};

} // namespace transport
