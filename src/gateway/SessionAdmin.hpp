#ifndef __TG_SESSION_ADMIN__
#define __TG_SESSION_ADMIN__

#include "GatewayConfig.hpp"
#include "Headers.hpp"
#include "ModeEnforcer.hpp"
#include "Multiplexer.hpp"

namespace tg {
/**
 * @brief Administrative operations over all of this host's sessions.
 */
class SessionAdmin {
 public:
  SessionAdmin(shared_ptr<Multiplexer> _multiplexer,
               shared_ptr<ModeEnforcer> _modeEnforcer,
               const GatewayConfig& _config)
      : multiplexer(_multiplexer),
        modeEnforcer(_modeEnforcer),
        config(_config) {}

  /** @brief Live Session Identifiers, in tmux's order. */
  vector<string> listSessions();

  /**
   * @brief Kills every prefixed session, then recreates the default one.
   * Open connections see their terminals exit.
   * @return How many sessions were killed.
   */
  int restartAll();

 protected:
  shared_ptr<Multiplexer> multiplexer;
  shared_ptr<ModeEnforcer> modeEnforcer;
  GatewayConfig config;
};
}  // namespace tg

#endif  // __TG_SESSION_ADMIN__
