#ifndef __TG_MULTIPLEXER__
#define __TG_MULTIPLEXER__

#include "Headers.hpp"

namespace tg {
/**
 * @brief Program and arguments that attach a pty to a multiplexed session.
 */
struct SpawnCommand {
  string program;
  vector<string> args;
  /** @brief True when running the command creates the session. */
  bool createsSession = false;
};

/**
 * @brief Named, detachable terminal sessions that keep running while nothing
 * is attached.
 *
 * None of these calls throw.  Control calls are synchronous and short; they
 * run on the event loop thread.
 */
class Multiplexer {
 public:
  virtual ~Multiplexer() {}

  /** @brief Whether the multiplexer can be used on this host at all. */
  virtual bool isAvailable() = 0;

  /**
   * @brief Whether a session named `name` exists.  An unreachable
   * multiplexer counts as "no".
   */
  virtual bool exists(const string& name) = 0;

  /**
   * @brief Starts a detached session unless one already exists.
   * @return false if the session does not exist afterwards.
   */
  virtual bool createDetached(const string& name) = 0;

  /**
   * @brief Picks attach (session exists) or create (it does not).  The check
   * and the later spawn are not atomic.
   */
  virtual SpawnCommand attachOrCreate(const string& name) = 0;

  /** @brief Kills a session; a missing session is not an error. */
  virtual void kill(const string& name) = 0;

  /**
   * @brief Session names that start with `prefix`, prefix removed, in the
   * multiplexer's order.  Empty when nothing is running.
   */
  virtual vector<string> list(const string& prefix) = 0;

  /**
   * @brief Sets a display option on session `target`, or globally when
   * `target` is empty.
   * @return false on failure (e.g. the server is still starting).
   */
  virtual bool setOption(const string& target, const string& option,
                         const string& value) = 0;
};
}  // namespace tg

#endif  // __TG_MULTIPLEXER__
