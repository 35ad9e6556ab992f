#include "GatewayServer.hpp"

namespace tg {
namespace {
const chrono::seconds SHUTDOWN_GRACE(2);
}

GatewayServer::GatewayServer(asio::io_context& _io,
                             shared_ptr<GatewayContext> _context,
                             shared_ptr<Multiplexer> _multiplexer,
                             shared_ptr<BridgeFactory> _bridgeFactory,
                             shared_ptr<LayoutStore> _layoutStore,
                             shared_ptr<ActivityReporter> _activityReporter)
    : io(_io),
      context(_context),
      multiplexer(_multiplexer),
      registry(new SessionRegistry()),
      acceptor(_io),
      signals(_io),
      shutdownTimer(_io),
      stopping(false) {
  const GatewayConfig& config = context->getConfig();
  modeEnforcer.reset(new ModeEnforcer(io, multiplexer, config));

  if (!_bridgeFactory) {
    if (config.echoMode) {
      _bridgeFactory.reset(new EchoBridgeFactory(io, config));
    } else {
      _bridgeFactory.reset(
          new PtyBridgeFactory(io, multiplexer, modeEnforcer, config));
    }
  }
  if (!_layoutStore) {
    _layoutStore.reset(new FileLayoutStore(config.layoutDirectory));
  }
  if (!_activityReporter) {
    _activityReporter.reset(new LoggingActivityReporter(context));
  }

  components.services.context = context;
  components.services.bridgeFactory = _bridgeFactory;
  components.services.multiplexer = multiplexer;
  components.services.registry = registry;
  components.services.activityReporter = _activityReporter;
  components.layoutStore = _layoutStore;
  components.sessionAdmin.reset(
      new SessionAdmin(multiplexer, modeEnforcer, config));
}

void GatewayServer::start() {
  const GatewayConfig& config = context->getConfig();
  modeEnforcer->warmup();

  boost::system::error_code ec;
  auto address = asio::ip::make_address(config.bindIp, ec);
  if (ec) {
    throw runtime_error("Invalid bind address " + config.bindIp + ": " +
                        ec.message());
  }
  tcp::endpoint endpoint(address, (unsigned short)config.port);
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor.set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    throw runtime_error("Could not listen on " + config.bindIp + ":" +
                        to_string(config.port) + ": " + ec.message());
  }
  LOG(INFO) << "Terminal server listening on " << config.bindIp << ":"
            << getPort() << " (mode: " << (config.echoMode ? "echo" : "pty")
            << ")";
  doAccept();
}

void GatewayServer::handleSignals() {
  signals.add(SIGINT);
  signals.add(SIGTERM);
  signals.async_wait([this](const boost::system::error_code& ec, int signo) {
    if (ec) {
      return;
    }
    LOG(INFO) << "Got signal " << signo << ", shutting down";
    stop();
  });
}

void GatewayServer::stop() {
  if (stopping) {
    return;
  }
  stopping = true;
  boost::system::error_code ec;
  acceptor.close(ec);
  signals.cancel(ec);
  registry->closeAll();
  shutdownTimer.expires_after(SHUTDOWN_GRACE);
  shutdownTimer.async_wait([this](const boost::system::error_code& timerEc) {
    if (!timerEc) {
      io.stop();
    }
  });
}

int GatewayServer::getPort() const {
  boost::system::error_code ec;
  auto endpoint = acceptor.local_endpoint(ec);
  if (ec) {
    return -1;
  }
  return endpoint.port();
}

void GatewayServer::doAccept() {
  acceptor.async_accept(
      [this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
          if (ec != asio::error::operation_aborted) {
            LOG(ERROR) << "Accept failed: " << ec.message();
          }
          if (stopping || !acceptor.is_open()) {
            return;
          }
        } else {
          boost::system::error_code endpointEc;
          auto remote = socket.remote_endpoint(endpointEc);
          if (!endpointEc) {
            VLOG(1) << "Accepted connection from " << remote;
          }
          make_shared<HttpSession>(std::move(socket), io, components)->run();
        }
        doAccept();
      });
}
}  // namespace tg
