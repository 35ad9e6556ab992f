#ifndef __TG_MODE_ENFORCER__
#define __TG_MODE_ENFORCER__

#include "GatewayConfig.hpp"
#include "Headers.hpp"
#include "Multiplexer.hpp"

namespace tg {
/**
 * @brief Keeps the default session alive and the interaction mode (tmux
 * `mouse on`) enabled.
 *
 * tmux's server may not accept option changes right after a session is
 * created, and global options only apply to sessions created afterwards.  So
 * the mode is set both globally and on each existing session, retrying on
 * event loop timers.  Failures are logged and never reach a client.
 */
class ModeEnforcer : public enable_shared_from_this<ModeEnforcer> {
 public:
  ModeEnforcer(asio::io_context& _io, shared_ptr<Multiplexer> _multiplexer,
               const GatewayConfig& _config);

  /**
   * @brief Ensures the default session exists, then enables the mode
   * globally and on every existing prefixed session.
   */
  void warmup();

  /**
   * @brief Enables the mode on `name` after the post-spawn delay, retrying on
   * failure.
   */
  void scheduleSessionMode(const string& name);

  /**
   * @brief Sets the mode on `target` (global when empty), retrying up to the
   * configured attempt count.
   * @param onDone Called once with the final outcome.  May be empty.
   */
  void applyWithRetry(const string& target,
                      function<void(bool)> onDone = function<void(bool)>());

 protected:
  asio::io_context& io;
  shared_ptr<Multiplexer> multiplexer;
  GatewayConfig config;

  void attempt(const string& target, int attemptNumber,
               function<void(bool)> onDone);
  static string describe(const string& target);
};
}  // namespace tg

#endif  // __TG_MODE_ENFORCER__
