#ifndef __TG_GATEWAY_SERVER__
#define __TG_GATEWAY_SERVER__

#include "ActivityReporter.hpp"
#include "BridgeFactory.hpp"
#include "GatewayContext.hpp"
#include "Headers.hpp"
#include "HttpSession.hpp"
#include "LayoutStore.hpp"
#include "ModeEnforcer.hpp"
#include "Multiplexer.hpp"
#include "SessionAdmin.hpp"
#include "SessionRegistry.hpp"

namespace tg {
/**
 * @brief The listening gateway: owns the shared components, runs warmup and
 * accepts HTTP/WebSocket connections on one port.
 *
 * Everything runs on the io_context passed in, on a single thread.
 */
class GatewayServer {
 public:
  /**
   * @param _bridgeFactory When null, an EchoBridgeFactory (echo mode) or a
   * PtyBridgeFactory is created.
   * @param _layoutStore When null, a FileLayoutStore in the configured layout
   * directory is used.
   * @param _activityReporter When null, a LoggingActivityReporter is used.
   */
  GatewayServer(asio::io_context& _io, shared_ptr<GatewayContext> _context,
                shared_ptr<Multiplexer> _multiplexer,
                shared_ptr<BridgeFactory> _bridgeFactory = nullptr,
                shared_ptr<LayoutStore> _layoutStore = nullptr,
                shared_ptr<ActivityReporter> _activityReporter = nullptr);

  /**
   * @brief Runs warmup, binds the listen endpoint and starts accepting.
   * @throws std::runtime_error when the endpoint cannot be bound.
   */
  void start();

  /** @brief Calls stop() on SIGINT or SIGTERM. */
  void handleSignals();

  /**
   * @brief Stops accepting and closes every connection, then stops the event
   * loop after a short grace period.  tmux sessions are left running.
   */
  void stop();

  /** @brief The bound port (useful when configured with port 0). */
  int getPort() const;

  inline shared_ptr<SessionRegistry> getRegistry() const { return registry; }
  inline shared_ptr<ModeEnforcer> getModeEnforcer() const {
    return modeEnforcer;
  }

 protected:
  asio::io_context& io;
  shared_ptr<GatewayContext> context;
  shared_ptr<Multiplexer> multiplexer;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<ModeEnforcer> modeEnforcer;
  GatewayComponents components;
  tcp::acceptor acceptor;
  asio::signal_set signals;
  asio::steady_timer shutdownTimer;
  bool stopping;

  void doAccept();
};
}  // namespace tg

#endif  // __TG_GATEWAY_SERVER__
