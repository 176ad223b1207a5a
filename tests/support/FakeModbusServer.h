#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

namespace testsupport {

using boost::asio::ip::tcp;

// Loopback Modbus/TCP server driven by a scripted handler. Every complete
// request frame (MBAP header + PDU) is recorded and passed to the handler; the
// handler decides what goes back on the wire.
class FakeModbusServer {
public:
    struct Reply {
        std::vector<std::uint8_t> bytes;
        std::size_t chunkSize = 0;  // 0 sends the reply in one write
        std::chrono::milliseconds delay{0};
        bool closeAfter = false;
    };

    using Handler = std::function<std::optional<Reply>(const std::vector<std::uint8_t>& frame)>;

    explicit FakeModbusServer(Handler handler, const std::string& address = "127.0.0.1", std::uint16_t port = 0)
        : handler_(std::move(handler)),
          workGuard_(boost::asio::make_work_guard(ioContext_)),
          acceptor_(ioContext_) {
        const tcp::endpoint endpoint(boost::asio::ip::make_address(address), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();
        doAccept();
        ioThread_ = std::thread([this]() { ioContext_.run(); });
    }

    ~FakeModbusServer() {
        boost::asio::post(ioContext_, [this]() {
            boost::system::error_code ec;
            acceptor_.close(ec);
            for (auto& weak : connections_) {
                if (auto connection = weak.lock()) {
                    connection->socket.close(ec);
                }
            }
        });
        workGuard_.reset();
        ioContext_.stop();
        if (ioThread_.joinable()) {
            ioThread_.join();
        }
    }

    FakeModbusServer(const FakeModbusServer&) = delete;
    FakeModbusServer& operator=(const FakeModbusServer&) = delete;

    std::uint16_t port() const { return port_; }

    std::vector<std::vector<std::uint8_t>> frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

    std::size_t acceptedConnections() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accepted_;
    }

    // Builds a reply frame that echoes the request's transaction and unit id.
    static std::vector<std::uint8_t> replyFrame(const std::vector<std::uint8_t>& request,
                                                const std::vector<std::uint8_t>& pdu) {
        const auto length = static_cast<std::uint16_t>(pdu.size() + 1);
        std::vector<std::uint8_t> frame{request.at(0), request.at(1), 0x00, 0x00,
                                        static_cast<std::uint8_t>(length >> 8),
                                        static_cast<std::uint8_t>(length & 0xFF), request.at(6)};
        frame.insert(frame.end(), pdu.begin(), pdu.end());
        return frame;
    }

    static std::uint16_t transactionId(const std::vector<std::uint8_t>& frame) {
        return static_cast<std::uint16_t>((frame.at(0) << 8) | frame.at(1));
    }

    // Answers function 0x03/0x04 with registers whose value equals their address,
    // and echoes the request for writes.
    static std::optional<Reply> registerEcho(const std::vector<std::uint8_t>& request) {
        const std::vector<std::uint8_t> pdu(request.begin() + 7, request.end());
        const auto function = pdu.at(0);
        if (function == 0x03 || function == 0x04) {
            const auto address = static_cast<std::uint16_t>((pdu.at(1) << 8) | pdu.at(2));
            const auto count = static_cast<std::uint16_t>((pdu.at(3) << 8) | pdu.at(4));
            std::vector<std::uint8_t> reply{function, static_cast<std::uint8_t>(count * 2)};
            for (std::uint16_t i = 0; i < count; ++i) {
                const auto value = static_cast<std::uint16_t>(address + i);
                reply.push_back(static_cast<std::uint8_t>(value >> 8));
                reply.push_back(static_cast<std::uint8_t>(value & 0xFF));
            }
            return Reply{replyFrame(request, reply)};
        }
        if (function == 0x10) {
            return Reply{replyFrame(request, std::vector<std::uint8_t>(pdu.begin(), pdu.begin() + 5))};
        }
        return Reply{replyFrame(request, pdu)};
    }

private:
    struct Connection {
        explicit Connection(tcp::socket s) : socket(std::move(s)), timer(socket.get_executor()) {}

        tcp::socket socket;
        boost::asio::steady_timer timer;
        std::vector<std::uint8_t> header = std::vector<std::uint8_t>(6);
        std::vector<std::uint8_t> body;
    };
    using ConnectionPtr = std::shared_ptr<Connection>;

    void doAccept() {
        acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                return;
            }
            boost::system::error_code ignored;
            socket.set_option(tcp::no_delay(true), ignored);
            auto connection = std::make_shared<Connection>(std::move(socket));
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++accepted_;
            }
            connections_.push_back(connection);
            readHeader(connection);
            doAccept();
        });
    }

    void readHeader(const ConnectionPtr& connection) {
        boost::asio::async_read(connection->socket, boost::asio::buffer(connection->header),
            [this, connection](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    return;
                }
                const std::size_t length = (connection->header[4] << 8) | connection->header[5];
                connection->body.assign(length, 0);
                readBody(connection);
            });
    }

    void readBody(const ConnectionPtr& connection) {
        boost::asio::async_read(connection->socket, boost::asio::buffer(connection->body),
            [this, connection](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    return;
                }
                std::vector<std::uint8_t> frame = connection->header;
                frame.insert(frame.end(), connection->body.begin(), connection->body.end());
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    frames_.push_back(frame);
                }

                std::optional<Reply> reply;
                if (handler_) {
                    reply = handler_(frame);
                }
                if (!reply) {
                    readHeader(connection);
                    return;
                }
                auto pending = std::make_shared<Reply>(std::move(*reply));
                connection->timer.expires_after(pending->delay);
                connection->timer.async_wait([this, connection, pending](const boost::system::error_code& waitEc) {
                    if (waitEc) {
                        return;
                    }
                    writeChunk(connection, pending, 0);
                });
            });
    }

    void writeChunk(const ConnectionPtr& connection, const std::shared_ptr<Reply>& reply, std::size_t offset) {
        if (offset >= reply->bytes.size()) {
            if (reply->closeAfter) {
                boost::system::error_code ignored;
                connection->socket.shutdown(tcp::socket::shutdown_both, ignored);
                connection->socket.close(ignored);
                return;
            }
            readHeader(connection);
            return;
        }

        const auto remaining = reply->bytes.size() - offset;
        const auto size = reply->chunkSize == 0 ? remaining : std::min(reply->chunkSize, remaining);
        boost::asio::async_write(connection->socket, boost::asio::buffer(reply->bytes.data() + offset, size),
            [this, connection, reply, offset, size](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    return;
                }
                if (reply->chunkSize == 0) {
                    writeChunk(connection, reply, offset + size);
                    return;
                }
                connection->timer.expires_after(std::chrono::milliseconds(2));
                connection->timer.async_wait([this, connection, reply, offset, size](const boost::system::error_code& waitEc) {
                    if (waitEc) {
                        return;
                    }
                    writeChunk(connection, reply, offset + size);
                });
            });
    }

    Handler handler_;
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    tcp::acceptor acceptor_;
    std::thread ioThread_;
    std::uint16_t port_ = 0;

    std::vector<std::weak_ptr<Connection>> connections_;
    mutable std::mutex mutex_;
    std::vector<std::vector<std::uint8_t>> frames_;
    std::size_t accepted_ = 0;
};

} // namespace testsupport
