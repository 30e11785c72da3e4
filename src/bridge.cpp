// ============================================================================
// bridge.cpp: implementation for bridge.hpp
// ============================================================================

#include "pixelbridge/bridge.hpp"
#include "pixelbridge/att_link.hpp"
#include "pixelbridge/device_session.hpp"
#include "pixelbridge/dispatcher.hpp"
#include "pixelbridge/envelope.hpp"
#include "pixelbridge/log.hpp"
#include "pixelbridge/scheduler.hpp"
#include "pixelbridge/session_loop.hpp"
#include "pixelbridge/websocket_server.hpp"

#include <csignal>
#include <map>
#include <memory>
#include <ostream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

namespace pixelbridge {

static AttLink::Options link_options(const BridgeConfig& cfg) {
    AttLink::Options o;
    o.address         = cfg.address;
    o.random_address  = (cfg.address_type == "random");
    o.connect_timeout = cfg.connect_timeout;
    return o;
}

int run_server(const BridgeConfig& cfg, const CommandRegistry& registry, std::ostream& out) {
    boost::asio::io_context io;
    AsioScheduler scheduler(io);
    Dispatcher dispatcher(registry);
    const LinkFactory links = make_att_link_factory(io, link_options(cfg));

    // live sessions, so shutdown can release every device link
    std::map<ClientSession*, std::shared_ptr<ClientSession>> sessions;

    auto server = std::make_shared<WebSocketServer>(io,
        [&](std::shared_ptr<MessageChannel> channel) {
            auto device = DeviceSession::create(cfg.address, links, scheduler, cfg.retry,
                                                cfg.characteristic);
            auto key = std::make_shared<ClientSession*>(nullptr);
            auto session = ClientSession::create(channel, device, dispatcher, scheduler,
                                                 cfg.max_recoveries,
                [&sessions, key](const std::string&) { sessions.erase(*key); });
            *key = session.get();
            sessions.emplace(*key, session);
            session->start();
        });

    std::string err;
    if (!server->listen(cfg.host, (uint16_t)cfg.port, err)) {
        log_error("server_listen_failed", {{"reason", err}});
        return 1;
    }
    server->start();
    out << "WebSocket server started on ws://" << cfg.host << ":" << server->port() << std::endl;
    log_info("server_listening", {{"url", "ws://" + cfg.host + ":" + std::to_string(server->port())},
             {"addr", cfg.address}});

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        log_info("server_stopping", {{"signal", std::to_string(signo)}});
        server->stop();
        auto live = sessions;              // stop() erases from the map
        for (auto& kv : live) kv.second->stop();
        io.stop();
    });

    io.run();
    return 0;
}

int run_one_shot(const BridgeConfig& cfg, const CommandRegistry& registry,
                 const std::string& command, const std::vector<std::string>& params,
                 std::ostream& out, std::ostream& err) {
    boost::asio::io_context io;
    AsioScheduler scheduler(io);
    Dispatcher dispatcher(registry);

    auto device = DeviceSession::create(cfg.address, make_att_link_factory(io, link_options(cfg)),
                                        scheduler, cfg.retry, cfg.characteristic);
    auto shot = OneShot::create(device, dispatcher, scheduler, out, err);

    int code = OneShot::EXIT_UNAVAILABLE;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;                    // cancelled: the command finished
        log_warn("one_shot_interrupted", {{"command", command}});
        device->release();
        io.stop();
    });

    shot->run(make_envelope(command, params), [&](int c) {
        code = c;
        signals.cancel();
    });

    io.run();
    return code;
}

} // namespace pixelbridge
