#ifndef __TG_BRIDGE__
#define __TG_BRIDGE__

#include "Headers.hpp"

namespace tg {
/**
 * @brief Terminal geometry in character cells.
 */
struct TerminalSize {
  int cols = 0;
  int rows = 0;
};

/**
 * @brief One live attachment to a terminal session, as seen by a connection.
 *
 * Output is delivered through a single data subscriber in the order it was
 * produced.  The exit subscriber fires exactly once, whatever ended the
 * bridge.
 */
class Bridge {
 public:
  typedef function<void(const string&)> DataCallback;
  typedef function<void()> ExitCallback;

  virtual ~Bridge() {}

  /** @brief Forwards bytes verbatim to the terminal's input. */
  virtual void write(const string& data) = 0;
  /** @brief Applies a new geometry.  Failures are logged, never thrown. */
  virtual void resize(int cols, int rows) = 0;
  /** @brief Ends the attachment.  Safe to call after the bridge exited. */
  virtual void kill() = 0;
  virtual TerminalSize getSize() const = 0;

  inline bool isRunning() const { return !exited; }

  /** @brief Replaces the output subscriber. */
  void onData(DataCallback callback) { dataCallback = std::move(callback); }

  /**
   * @brief Replaces the exit subscriber.  If the bridge already exited and
   * nobody was told yet, the new subscriber fires immediately.
   */
  void onExit(ExitCallback callback) {
    exitCallback = std::move(callback);
    if (exited && !exitDelivered && exitCallback) {
      exitDelivered = true;
      auto cb = exitCallback;
      cb();
    }
  }

 protected:
  DataCallback dataCallback;
  ExitCallback exitCallback;
  bool exited = false;
  bool exitDelivered = false;

  void emitData(const string& data) {
    if (!exited && dataCallback && !data.empty()) {
      dataCallback(data);
    }
  }

  void emitExit() {
    if (exited) {
      return;
    }
    exited = true;
    if (exitCallback) {
      exitDelivered = true;
      // Copy first: the callback may drop the last reference to the owner.
      auto cb = exitCallback;
      cb();
    }
  }
};
}  // namespace tg

#endif  // __TG_BRIDGE__
