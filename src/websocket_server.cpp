// ============================================================================
// websocket_server.cpp: implementation for websocket_server.hpp
// ============================================================================

#include "pixelbridge/websocket_server.hpp"
#include "pixelbridge/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

namespace pixelbridge {

namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

// ---------------------------------------------------------------------------
// Map Beast/Asio errors to what the session loop cares about: did the peer
// go away (Closed) or did something else break (Error).
// ---------------------------------------------------------------------------
static ChannelStatus classify(const boost::system::error_code& ec) {
    if (!ec) return ChannelStatus::Ok;
    if (ec == websocket::error::closed ||
        ec == boost::asio::error::eof ||
        ec == boost::asio::error::connection_reset ||
        ec == boost::asio::error::broken_pipe ||
        ec == boost::asio::error::operation_aborted ||
        ec == beast::error::timeout)
        return ChannelStatus::Closed;
    return ChannelStatus::Error;
}

static std::string endpoint_string(const tcp::socket& s) {
    boost::system::error_code ec;
    auto ep = s.remote_endpoint(ec);
    if (ec) return "unknown";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

// ============================================================================
// WebSocketChannel
// ============================================================================

WebSocketChannel::WebSocketChannel(tcp::socket socket)
    : ws_(std::move(socket)) {
    peer_ = endpoint_string(beast::get_lowest_layer(ws_).socket());
}

void WebSocketChannel::async_handshake(std::function<void(bool, const std::string&)> done) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, "pixelbridge");
    }));

    auto self = shared_from_this();
    ws_.async_accept([self, done](beast::error_code ec) {
        if (ec) {
            done(false, ec.message());
            return;
        }
        self->ws_.text(true);
        done(true, {});
    });
}

void WebSocketChannel::async_receive(ReceiveHandler done) {
    auto self = shared_from_this();
    buffer_.clear();
    ws_.async_read(buffer_, [self, done](beast::error_code ec, std::size_t) {
        const ChannelStatus st = classify(ec);
        if (st != ChannelStatus::Ok) {
            if (st == ChannelStatus::Error)
                log_warn("ws_read_failed", {{"peer", self->peer_}, {"reason", ec.message()}});
            done(st, {});
            return;
        }
        std::string msg = beast::buffers_to_string(self->buffer_.data());
        self->buffer_.consume(self->buffer_.size());
        done(ChannelStatus::Ok, std::move(msg));
    });
}

void WebSocketChannel::async_send(std::string message, SendHandler done) {
    auto self = shared_from_this();
    outgoing_ = std::move(message);
    writing_ = true;
    ws_.async_write(boost::asio::buffer(outgoing_), [self, done](beast::error_code ec, std::size_t) {
        self->writing_ = false;
        const ChannelStatus st = classify(ec);
        if (st == ChannelStatus::Error)
            log_warn("ws_write_failed", {{"peer", self->peer_}, {"reason", ec.message()}});
        done(st);
    });
}

void WebSocketChannel::close() noexcept {
    if (closing_) return;
    closing_ = true;

    // a close frame may not overlap a pending write; drop the socket instead
    if (ws_.is_open() && !writing_) {
        auto self = shared_from_this();
        ws_.async_close(websocket::close_code::normal, [self](beast::error_code) {
            // peer may already be gone; nothing left to do either way
        });
        return;
    }
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().close(ec);
}

// ============================================================================
// WebSocketServer
// ============================================================================

WebSocketServer::WebSocketServer(boost::asio::io_context& io, ChannelHandler on_channel)
    : io_(io), acceptor_(io), on_channel_(std::move(on_channel)) {}

bool WebSocketServer::listen(const std::string& host, uint16_t port, std::string& err) {
    boost::system::error_code ec;
    tcp::resolver resolver(io_);
    auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec || results.empty()) {
        err = "resolve_failed host=" + host + (ec ? " " + ec.message() : "");
        return false;
    }

    const tcp::endpoint ep = results.begin()->endpoint();

    acceptor_.open(ep.protocol(), ec);
    if (!ec) acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(ep, ec);
    if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        err = "listen_failed " + ep.address().to_string() + ":" + std::to_string(port)
            + " " + ec.message();
        boost::system::error_code ignore;
        acceptor_.close(ignore);
        return false;
    }

    port_ = acceptor_.local_endpoint(ec).port();
    return true;
}

void WebSocketServer::start() {
    accept_next();
}

void WebSocketServer::stop() noexcept {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void WebSocketServer::accept_next() {
    auto self = shared_from_this();
    acceptor_.async_accept(
        [self](boost::system::error_code ec, tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted) return;   // stop()
            if (ec) {
                log_warn("ws_accept_failed", {{"reason", ec.message()}});
            } else {
                auto channel = std::make_shared<WebSocketChannel>(std::move(socket));
                channel->async_handshake([self, channel](bool ok, const std::string& err) {
                    if (!ok) {
                        log_warn("ws_handshake_failed", {{"peer", channel->peer()}, {"reason", err}});
                        return;
                    }
                    log_info("client_connected", {{"peer", channel->peer()}});
                    self->on_channel_(channel);
                });
            }
            self->accept_next();
        });
}

} // namespace pixelbridge
