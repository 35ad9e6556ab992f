#ifndef __TG_GATEWAY_CONTEXT__
#define __TG_GATEWAY_CONTEXT__

#include "GatewayConfig.hpp"
#include "Headers.hpp"

namespace tg {
/**
 * @brief Process-wide state that lives from startup to shutdown.
 *
 * Holds the configuration and the throttle timestamps that components share.
 * Only touched from the event loop thread.
 */
class GatewayContext {
 public:
  explicit GatewayContext(const GatewayConfig& _config)
      : config(_config), activityReported(false) {}

  inline const GatewayConfig& getConfig() const { return config; }

  /**
   * @brief Claims the activity-report slot if the heartbeat interval has
   * elapsed since the last claim.
   * @return true when the caller should report now.
   */
  bool claimActivitySlot(chrono::steady_clock::time_point now) {
    if (activityReported &&
        now - lastActivityReport < config.heartbeatInterval) {
      return false;
    }
    activityReported = true;
    lastActivityReport = now;
    return true;
  }

 protected:
  GatewayConfig config;
  /** @brief False until the first activity report. */
  bool activityReported;
  chrono::steady_clock::time_point lastActivityReport;
};
}  // namespace tg

#endif  // __TG_GATEWAY_CONTEXT__
