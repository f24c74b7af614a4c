#pragma once

#include <cstdint>

#include <boost/asio/io_context.hpp>

#include "command_gateway.hpp"
#include "command_router.hpp"
#include "device_registry.hpp"
#include "experiment_catalog.hpp"
#include "port_resolver.hpp"
#include "util/config_loader.hpp"
#include "ws_server.hpp"

namespace academy::control {

class ControlServerApp {
public:
    ControlServerApp(boost::asio::io_context& io_context,
                     ControlServerConfig config,
                     CommandRouter::WorkerFactory worker_factory = {});

    void start();
    void stop();

    std::uint16_t port() const { return ws_server_.port(); }
    CommandRouter& router() { return router_; }

private:
    boost::asio::io_context& io_context_;
    ControlServerConfig config_;
    DeviceRegistry registry_;
    ExperimentCatalog catalog_;
    PortResolver ports_;
    WsServer ws_server_;
    CommandRouter router_;
    CommandGateway command_gateway_;
    bool stopped_{false};
};

int run(ControlServerConfig config);

}  // namespace academy::control
