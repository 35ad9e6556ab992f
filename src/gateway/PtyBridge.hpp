#ifndef __TG_PTY_BRIDGE__
#define __TG_PTY_BRIDGE__

#include "Bridge.hpp"
#include "Headers.hpp"
#include "Utf8Assembler.hpp"

namespace tg {
/**
 * @brief How to start the process behind a `PtyBridge`.
 */
struct PtySpawnOptions {
  string program;
  vector<string> args;
  int cols = 80;
  int rows = 24;
  /** @brief The child chdirs here before exec (the user's home). */
  string workingDirectory;
  /** @brief Environment variables whose names start with any of these are
   * not inherited. */
  vector<string> strippedEnvPrefixes;
  /** @brief Set (or overridden) in the child's environment. */
  vector<pair<string, string>> extraEnvironment = {
      {"TERM", "xterm-256color"}, {"COLORTERM", "truecolor"}};
};

/**
 * @brief Runs a process on a pseudo-terminal and relays it through the event
 * loop.
 *
 * Output is read asynchronously from the master side.  When the read fails
 * the child is gone (or going): exit fires and the child is reaped in the
 * background.
 */
class PtyBridge : public Bridge, public enable_shared_from_this<PtyBridge> {
 public:
  /**
   * @brief Forks `options.program` on a new pty.
   * @return nullptr if the program cannot be found or the pty cannot be
   * created.
   */
  static shared_ptr<PtyBridge> spawn(asio::io_context& io,
                                     const PtySpawnOptions& options);

  /**
   * @brief Builds the child's environment from `environment` (a
   * NULL-terminated `NAME=value` array).
   */
  static vector<string> buildEnvironment(
      char** environment, const vector<string>& strippedPrefixes,
      const vector<pair<string, string>>& extraEnvironment);

  virtual ~PtyBridge();

  void write(const string& data) override;
  void resize(int cols, int rows) override;
  /** @brief Hangs up the terminal (SIGHUP), like closing a terminal window.
   */
  void kill() override;
  TerminalSize getSize() const override { return size; }

  inline pid_t getPid() const { return childPid; }

 protected:
  PtyBridge(asio::io_context& io, int masterFd, pid_t _childPid,
            TerminalSize _size);

  void readSome();
  /** @brief Writes the front of `writeQueue`, one write in flight at a time.
   */
  void doWrite();
  /** @brief Runs once when the pty stops producing output. */
  void handleTerminalEnd(const boost::system::error_code& ec);
  void reapChild(int attempt);

  asio::io_context& io;
  asio::posix::stream_descriptor master;
  asio::steady_timer reapTimer;
  pid_t childPid;
  TerminalSize size;
  std::array<char, 16 * 1024> readBuffer;
  deque<string> writeQueue;
  Utf8Assembler utf8;
};
}  // namespace tg

#endif  // __TG_PTY_BRIDGE__
