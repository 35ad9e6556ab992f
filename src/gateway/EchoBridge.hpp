#ifndef __TG_ECHO_BRIDGE__
#define __TG_ECHO_BRIDGE__

#include "Bridge.hpp"
#include "Headers.hpp"

namespace tg {
/**
 * @brief A tiny line-editing command interpreter that stands in for a real
 * shell on hosts without pty or tmux support.
 *
 * Understands help, echo, clear, date, whoami, tput cols, tput lines,
 * stty size and exit.
 */
class EchoBridge : public Bridge, public enable_shared_from_this<EchoBridge> {
 public:
  EchoBridge(asio::io_context& io, int cols, int rows);

  /** @brief Schedules the initial prompt. */
  void start(chrono::milliseconds promptDelay = chrono::milliseconds(100));

  void write(const string& data) override;
  void resize(int cols, int rows) override;
  void kill() override;
  TerminalSize getSize() const override { return size; }

  static const string PROMPT;

 protected:
  asio::steady_timer promptTimer;
  TerminalSize size;
  /** @brief The line being typed. */
  string buffer;

  void handleCommand();
};
}  // namespace tg

#endif  // __TG_ECHO_BRIDGE__
