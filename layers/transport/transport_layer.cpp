#include "transport_layer.h"

#include <exception>
#include <future>
#include <string>

#include "core/log/Logger.h"
#include "layers/protocol/tcp_frame.h"

namespace transport {

namespace {

struct ConnectAttempt {
    explicit ConnectAttempt(const tcp::socket::executor_type& executor)
        : timer(executor) {}

    boost::asio::steady_timer timer;
    bool finished = false;
    bool timedOut = false;
};

std::string endpointName(const config::ClientConfig& config) {
    return config.host + ":" + std::to_string(config.port);
}

} // namespace

Session::Session(std::uint64_t id, tcp::socket socket)
    : id_(id), socket_(std::move(socket)) {}

std::uint64_t Session::id() const noexcept { return id_; }

bool Session::isOpen() const noexcept { return !closed_; }

void Session::start(DataCallback onData, ErrorCallback onError) {
    onData_ = std::move(onData);
    onError_ = std::move(onError);
    doRead();
}

void Session::send(std::vector<std::uint8_t> data, WriteCallback onWritten) {
    if (data.empty()) {
        return;
    }

    auto self = shared_from_this();
    boost::asio::post(socket_.get_executor(),
        [this, self, payload = std::move(data), onWritten = std::move(onWritten)]() mutable {
            if (closed_) {
                if (onWritten) {
                    onWritten(boost::asio::error::not_connected);
                }
                return;
            }
            const bool writeInProgress = !writeQueue_.empty();
            writeQueue_.push_back(PendingWrite{std::move(payload), std::move(onWritten)});
            if (!writeInProgress) {
                doWrite();
            }
        });
}

void Session::close() {
    closed_ = true;
    auto self = shared_from_this();
    boost::asio::post(socket_.get_executor(), [this, self]() {
        if (!socket_.is_open()) {
            return;
        }
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.cancel(ec);
        socket_.close(ec);
        failWrites(boost::asio::error::operation_aborted);
    });
}

void Session::doRead() {
    if (closed_) {
        return;
    }

    auto self = shared_from_this();
    socket_.async_read_some(
        boost::asio::buffer(readBuffer_),
        [this, self](const boost::system::error_code& ec, std::size_t bytesRead) {
            if (ec) {
                closed_ = true;
                if (ec != boost::asio::error::operation_aborted && onError_) {
                    onError_(ec, self);
                }
                return;
            }

            const std::vector<std::uint8_t> data(readBuffer_.begin(),
                                                 readBuffer_.begin() + static_cast<std::ptrdiff_t>(bytesRead));
            if (onData_) {
                onData_(data, self);
            }
            doRead();
        });
}

void Session::doWrite() {
    if (writeQueue_.empty() || closed_) {
        return;
    }

    auto self = shared_from_this();
    boost::asio::async_write(
        socket_,
        boost::asio::buffer(writeQueue_.front().payload),
        [this, self](const boost::system::error_code& ec, std::size_t) {
            if (writeQueue_.empty()) {
                return;
            }
            auto onWritten = std::move(writeQueue_.front().onWritten);
            writeQueue_.pop_front();
            if (onWritten) {
                onWritten(ec);
            }

            if (ec) {
                closed_ = true;
                failWrites(ec);
                return;
            }
            doWrite();
        });
}

void Session::failWrites(const boost::system::error_code& ec) {
    auto pending = std::move(writeQueue_);
    writeQueue_.clear();
    for (auto& write : pending) {
        if (write.onWritten) {
            write.onWritten(ec);
        }
    }
}

void asyncConnectWithTimeout(tcp::socket& socket,
                             std::vector<tcp::endpoint> endpoints,
                             std::chrono::milliseconds timeout,
                             ConnectCallback handler) {
    auto attempt = std::make_shared<ConnectAttempt>(socket.get_executor());

    attempt->timer.expires_after(timeout);
    attempt->timer.async_wait([&socket, attempt](const boost::system::error_code& ec) {
        if (ec || attempt->finished) {
            return;
        }
        attempt->timedOut = true;
        boost::system::error_code ignored;
        socket.close(ignored);
    });

    boost::asio::async_connect(
        socket, std::move(endpoints),
        [attempt, handler = std::move(handler)](const boost::system::error_code& ec, const tcp::endpoint&) {
            attempt->finished = true;
            attempt->timer.cancel();
            if (attempt->timedOut) {
                handler(boost::asio::error::timed_out);
                return;
            }
            handler(ec);
        });
}

TcpClient::TcpClient(config::ClientConfig config)
    : config_(std::move(config)),
      workGuard_(boost::asio::make_work_guard(ioContext_)),
      ioThread_([this]() { ioContext_.run(); }) {}

TcpClient::~TcpClient() {
    disconnect();
    workGuard_.reset();
    ioContext_.stop();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }
}

protocol::ResponseCode TcpClient::send(protocol::ModbusRequest& request) {
    std::lock_guard<std::mutex> lock(exchangeMutex_);
    const auto result = exchange(request);

    if (config_.connectionMode == config::ConnectionMode::AutoConnectAndDisconnect) {
        disconnect();
    }
    return result;
}

protocol::ResponseCode TcpClient::exchange(protocol::ModbusRequest& request) {
    if (config_.connectionMode != config::ConnectionMode::DoNotConnect) {
        connect();
    }

    const auto session = currentSession();
    if (!session) {
        request.reset();
        request.setResponseCode(protocol::ResponseCode::ConnectionFailed);
        return protocol::ResponseCode::ConnectionFailed;
    }

    const auto transactionId = transactions_.next();
    request.reset();

    std::vector<std::uint8_t> frame;
    try {
        frame = protocol::encodeTcpFrame(transactionId, unitIdFor(config_, request), request.protocolDataUnit());
    } catch (const std::exception& e) {
        logging::error(std::string("Cannot encode TCP frame: ") + e.what());
        request.setResponseCode(protocol::ResponseCode::RequestTxFailed);
        return protocol::ResponseCode::RequestTxFailed;
    }

    auto pending = std::make_shared<ReplyAssembler>(ioContext_, request, transactionId,
                                                    responseTimeoutFor(config_, request));
    setPendingExchange(pending);
    pending->start();

    std::weak_ptr<ReplyAssembler> weakPending = pending;
    std::weak_ptr<Session> weakSession = session;
    session->send(std::move(frame), [this, weakPending, weakSession](const boost::system::error_code& ec) {
        if (!ec) {
            return;
        }
        logging::error("Failed to write TCP frame: " + ec.message());
        if (auto exchange = weakPending.lock()) {
            exchange->fail(protocol::ResponseCode::RequestTxFailed);
        }
        if (auto failed = weakSession.lock()) {
            disconnectSession(failed);
        }
    });

    const auto code = request.waitResponseCode();
    clearPendingExchange(pending);
    return code;
}

bool TcpClient::connect() {
    std::lock_guard<std::mutex> connectLock(connectMutex_);
    if (isConnected()) {
        return true;
    }

    logging::debug("Connecting TCP socket to " + endpointName(config_) + "...");
    try {
        auto session = std::make_shared<Session>(nextSessionId_++, openSocket());
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            session_ = session;
        }
        boost::asio::post(ioContext_, [this, session]() {
            session->start(
                [this](const std::vector<std::uint8_t>& data, const SessionPtr& source) { onSessionData(data, source); },
                [this](const boost::system::error_code& ec, const SessionPtr& source) { onSessionError(ec, source); });
        });
    } catch (const std::exception& e) {
        logging::error("Unexpected exception connecting TCP socket to " + endpointName(config_) + ": " + e.what());
        return false;
    }

    if (config_.delayAfterConnect) {
        std::this_thread::sleep_for(*config_.delayAfterConnect);
    }

    const bool connected = isConnected();
    logging::debug(std::string("TCP socket ") + (connected ? "" : "not ") + "connected to " + endpointName(config_));
    return connected;
}

void TcpClient::disconnect() {
    disconnectSession(nullptr);
}

bool TcpClient::isConnected() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return session_ != nullptr;
}

tcp::socket TcpClient::openSocket() {
    tcp::resolver resolver(ioContext_);
    const auto results = resolver.resolve(config_.host, std::to_string(config_.port));

    std::vector<tcp::endpoint> endpoints;
    for (const auto& entry : results) {
        endpoints.push_back(entry.endpoint());
    }

    tcp::socket socket(ioContext_);
    std::promise<boost::system::error_code> connected;
    auto result = connected.get_future();
    boost::asio::post(ioContext_, [&socket, &connected, endpoints = std::move(endpoints), this]() mutable {
        asyncConnectWithTimeout(socket, std::move(endpoints), config_.connectTimeout,
                                [&connected](const boost::system::error_code& ec) { connected.set_value(ec); });
    });

    const auto ec = result.get();
    if (ec) {
        throw boost::system::system_error(ec, "connect to " + endpointName(config_));
    }
    return socket;
}

SessionPtr TcpClient::currentSession() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return session_;
}

void TcpClient::setPendingExchange(std::shared_ptr<ReplyAssembler> pending) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    pending_ = std::move(pending);
}

void TcpClient::clearPendingExchange(const std::shared_ptr<ReplyAssembler>& pending) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (pending_ == pending) {
        pending_.reset();
    }
}

void TcpClient::onSessionData(const std::vector<std::uint8_t>& data, const SessionPtr& session) {
    std::shared_ptr<ReplyAssembler> pending;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (session_ != session) {
            logging::debug("Ignoring " + std::to_string(data.size()) + " bytes from closed session " +
                           std::to_string(session->id()));
            return;
        }
        pending = pending_;
    }
    if (!pending) {
        logging::debug("Ignoring " + std::to_string(data.size()) + " bytes received with no pending exchange");
        return;
    }
    pending->addResponseData(data.data(), data.size());
}

void TcpClient::onSessionError(const boost::system::error_code& ec, const SessionPtr& session) {
    if (ec == boost::asio::error::eof) {
        logging::debug("TCP socket closed by " + endpointName(config_));
    } else {
        logging::error("Unexpected error from TCP socket: " + ec.message());
    }
    disconnectSession(session);
}

void TcpClient::disconnectSession(const SessionPtr& session) {
    SessionPtr closing;
    std::shared_ptr<ReplyAssembler> pending;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!session_ || (session && session_ != session)) {
            return;
        }
        closing = std::move(session_);
        session_.reset();
        pending = pending_;
    }

    logging::debug("Disconnecting TCP socket from " + endpointName(config_) + "...");
    // No reply can arrive on a closed connection.
    if (pending) {
        pending->fail(protocol::ResponseCode::RequestRxFailed);
    }
    closing->close();
}

} // namespace transport
