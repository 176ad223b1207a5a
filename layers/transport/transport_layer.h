#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include "core/config/ClientConfig.h"
#include "core/transport/IModbusTransport.h"
#include "reply_assembler.h"
#include "transaction_counter.h"

namespace transport {

using boost::asio::ip::tcp;

class Session;
using SessionPtr = std::shared_ptr<Session>;
using DataCallback = std::function<void(const std::vector<std::uint8_t>&, const SessionPtr&)>;
using ErrorCallback = std::function<void(const boost::system::error_code&, const SessionPtr&)>;
using WriteCallback = std::function<void(const boost::system::error_code&)>;
using ConnectCallback = std::function<void(const boost::system::error_code&)>;

// One TCP connection. Reads run continuously once started; writes are queued
// and performed on the socket's executor.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(std::uint64_t id, tcp::socket socket);

    std::uint64_t id() const noexcept;
    bool isOpen() const noexcept;

    void start(DataCallback onData, ErrorCallback onError);
    void send(std::vector<std::uint8_t> data, WriteCallback onWritten);
    void close();

private:
    struct PendingWrite {
        std::vector<std::uint8_t> payload;
        WriteCallback onWritten;
    };

    void doRead();
    void doWrite();
    void failWrites(const boost::system::error_code& ec);

    std::uint64_t id_;
    tcp::socket socket_;
    std::array<std::uint8_t, 2048> readBuffer_{};
    std::deque<PendingWrite> writeQueue_;
    DataCallback onData_;
    ErrorCallback onError_;
    std::atomic<bool> closed_{false};
};

// Connects socket to the first reachable endpoint; the attempt is abandoned
// with boost::asio::error::timed_out after timeout. handler runs on the
// socket's executor.
void asyncConnectWithTimeout(tcp::socket& socket,
                             std::vector<tcp::endpoint> endpoints,
                             std::chrono::milliseconds timeout,
                             ConnectCallback handler);

// Modbus/TCP client. At most one exchange is in flight; concurrent send()
// calls wait for each other.
class TcpClient final : public IModbusTransport {
public:
    explicit TcpClient(config::ClientConfig config);
    ~TcpClient() override;

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    protocol::ResponseCode send(protocol::ModbusRequest& request) override;

    bool connect() override;
    void disconnect() override;
    bool isConnected() const override;

    const config::ClientConfig& config() const noexcept { return config_; }

private:
    protocol::ResponseCode exchange(protocol::ModbusRequest& request);
    tcp::socket openSocket();

    SessionPtr currentSession() const;
    void setPendingExchange(std::shared_ptr<ReplyAssembler> pending);
    void clearPendingExchange(const std::shared_ptr<ReplyAssembler>& pending);

    void onSessionData(const std::vector<std::uint8_t>& data, const SessionPtr& session);
    void onSessionError(const boost::system::error_code& ec, const SessionPtr& session);
    void disconnectSession(const SessionPtr& session);

    const config::ClientConfig config_;

    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    std::thread ioThread_;

    std::mutex exchangeMutex_;
    std::mutex connectMutex_;
    mutable std::mutex stateMutex_;
    SessionPtr session_;
    std::shared_ptr<ReplyAssembler> pending_;

    TransactionCounter transactions_;
    std::atomic<std::uint64_t> nextSessionId_{1};
};

} // namespace transport
