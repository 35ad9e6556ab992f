#ifndef __TG_BRIDGE_FACTORY__
#define __TG_BRIDGE_FACTORY__

#include "Bridge.hpp"
#include "GatewayConfig.hpp"
#include "Headers.hpp"
#include "ModeEnforcer.hpp"
#include "Multiplexer.hpp"

namespace tg {
/**
 * @brief Creates the Bridge for a new connection.
 */
class BridgeFactory {
 public:
  virtual ~BridgeFactory() {}

  /**
   * @brief Creates a Bridge attached to the session for `sessionId`.
   * @return nullptr when nothing could be spawned.
   */
  virtual shared_ptr<Bridge> create(const string& sessionId) = 0;
};

/**
 * @brief Hands out in-memory EchoBridges (echo mode).
 */
class EchoBridgeFactory : public BridgeFactory {
 public:
  EchoBridgeFactory(asio::io_context& _io, const GatewayConfig& _config)
      : io(_io), config(_config) {}

  shared_ptr<Bridge> create(const string& sessionId) override;

 protected:
  asio::io_context& io;
  GatewayConfig config;
};

/**
 * @brief Spawns a PtyBridge running `tmux attach` or `tmux new-session` for
 * the session, or a plain login shell when tmux is unavailable.
 */
class PtyBridgeFactory : public BridgeFactory {
 public:
  PtyBridgeFactory(asio::io_context& _io, shared_ptr<Multiplexer> _multiplexer,
                   shared_ptr<ModeEnforcer> _modeEnforcer,
                   const GatewayConfig& _config)
      : io(_io),
        multiplexer(_multiplexer),
        modeEnforcer(_modeEnforcer),
        config(_config) {}

  shared_ptr<Bridge> create(const string& sessionId) override;

 protected:
  asio::io_context& io;
  shared_ptr<Multiplexer> multiplexer;
  shared_ptr<ModeEnforcer> modeEnforcer;
  GatewayConfig config;
};
}  // namespace tg

#endif  // __TG_BRIDGE_FACTORY__
