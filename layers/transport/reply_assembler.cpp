#include "reply_assembler.h"

#include <string>

#include "core/log/Logger.h"
#include "layers/protocol/tcp_frame.h"

namespace transport {

ReplyAssembler::ReplyAssembler(boost::asio::io_context& ioContext,
                               protocol::ModbusRequest& request,
                               std::uint16_t transactionId,
                               std::chrono::milliseconds timeout)
    : request_(request),
      transactionId_(transactionId),
      timeout_(timeout),
      timer_(ioContext) {}

void ReplyAssembler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Resolved) {
        return;
    }

    auto self = shared_from_this();
    timer_.expires_after(timeout_);
    timer_.async_wait([self](const boost::system::error_code& ec) { self->onTimeout(ec); });
}

void ReplyAssembler::addResponseData(const std::uint8_t* data, std::size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Resolved) {
        logging::debug("Dropping " + std::to_string(size) + " bytes for resolved transaction " +
                       std::to_string(transactionId_));
        return;
    }

    buffer_.insert(buffer_.end(), data, data + size);

    if (state_ == State::AwaitingHeader) {
        const auto header = protocol::parseMbapPrefix(buffer_.data(), buffer_.size());
        if (!header) {
            return;
        }
        if (header->transactionId != transactionId_) {
            logging::warning("Invalid TCP transaction id: expected " + std::to_string(transactionId_) +
                             ", received " + std::to_string(header->transactionId));
            resolveLocked(protocol::ResponseCode::RequestRxFailed);
            return;
        }
        if (header->protocolId != protocol::kModbusProtocolId) {
            logging::warning("Invalid TCP protocol id: expected 0, received " +
                             std::to_string(header->protocolId));
            resolveLocked(protocol::ResponseCode::RequestRxFailed);
            return;
        }
        if (header->length == 0) {
            logging::warning("Invalid TCP length 0 for transaction " + std::to_string(transactionId_));
            resolveLocked(protocol::ResponseCode::RequestRxFailed);
            return;
        }
        frameSize_ = protocol::tcpFrameSize(*header);
        state_ = State::AwaitingBody;
    }

    if (buffer_.size() < frameSize_) {
        return;
    }

    state_ = State::Resolved;
    timer_.cancel();
    const std::vector<std::uint8_t> pdu(buffer_.begin() + static_cast<std::ptrdiff_t>(protocol::kMbapHeaderSize),
                                        buffer_.begin() + static_cast<std::ptrdiff_t>(frameSize_));
    buffer_.clear();
    request_.setFromPduResponse(pdu);
}

bool ReplyAssembler::fail(protocol::ResponseCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolveLocked(code);
}

ReplyAssembler::State ReplyAssembler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ReplyAssembler::onTimeout(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Resolved) {
        return;
    }
    logging::debug("Response timeout for transaction " + std::to_string(transactionId_));
    resolveLocked(protocol::ResponseCode::RequestTimeout);
}

bool ReplyAssembler::resolveLocked(protocol::ResponseCode code) {
    if (state_ == State::Resolved) {
        return false;
    }
    state_ = State::Resolved;
    timer_.cancel();
    buffer_.clear();
    return request_.setResponseCode(code);
}

} // namespace transport
