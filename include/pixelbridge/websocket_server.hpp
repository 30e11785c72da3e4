#pragma once
/**
 * @file websocket_server.hpp
 * @brief Boost.Beast WebSocket front door: accept loop + per-connection channel.
 *
 * @details
 * The server accepts TCP connections on one endpoint, completes the WebSocket
 * upgrade for each, and hands the resulting channel to a callback that starts
 * a session loop. Everything runs on one io_context thread; a slow client
 * only ever suspends its own handlers.
 *
 * One text frame per request and per response. Binary frames are accepted
 * and their bytes treated as text.
 */

#include "pixelbridge/message_channel.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

namespace pixelbridge {

class WebSocketChannel : public MessageChannel,
                         public std::enable_shared_from_this<WebSocketChannel> {
public:
    explicit WebSocketChannel(boost::asio::ip::tcp::socket socket);

    /// Complete the HTTP upgrade. @p done(ok, err) runs on the loop.
    void async_handshake(std::function<void(bool ok, const std::string& err)> done);

    void async_receive(ReceiveHandler done) override;
    void async_send(std::string message, SendHandler done) override;
    void close() noexcept override;
    std::string peer() const override { return peer_; }

private:
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::string outgoing_;
    std::string peer_;
    bool closing_{false};
    bool writing_{false};
};

class WebSocketServer : public std::enable_shared_from_this<WebSocketServer> {
public:
    using ChannelHandler = std::function<void(std::shared_ptr<MessageChannel>)>;

    WebSocketServer(boost::asio::io_context& io, ChannelHandler on_channel);

    /// Resolve, open, bind and listen. false + @p err on failure.
    bool listen(const std::string& host, uint16_t port, std::string& err);

    /// Start the accept loop (after a successful listen()).
    void start();

    /// Stop accepting. Existing sessions keep running until they end.
    void stop() noexcept;

    uint16_t port() const { return port_; }

private:
    void accept_next();

    boost::asio::io_context&       io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    ChannelHandler                 on_channel_;
    uint16_t                       port_{0};
};

} // namespace pixelbridge
