#include "PtyBridge.hpp"

#include "SubprocessUtils.hpp"

extern char** environ;

namespace tg {
namespace {
// How many times the child is polled (50ms apart) after the pty closes
// before it is SIGKILLed.
const int MAX_REAP_ATTEMPTS = 20;
}  // namespace

vector<string> PtyBridge::buildEnvironment(
    char** environment, const vector<string>& strippedPrefixes,
    const vector<pair<string, string>>& extraEnvironment) {
  vector<string> result;
  for (char** it = environment; it && *it; it++) {
    string entry(*it);
    string name = entry.substr(0, entry.find('='));
    bool keep = true;
    for (const auto& prefix : strippedPrefixes) {
      if (startsWith(name, prefix)) {
        keep = false;
        break;
      }
    }
    for (const auto& extra : extraEnvironment) {
      if (name == extra.first) {
        keep = false;
        break;
      }
    }
    if (keep) {
      result.push_back(entry);
    }
  }
  for (const auto& extra : extraEnvironment) {
    result.push_back(extra.first + "=" + extra.second);
  }
  return result;
}

shared_ptr<PtyBridge> PtyBridge::spawn(asio::io_context& io,
                                       const PtySpawnOptions& options) {
  SubprocessUtils resolver;
  auto executable = resolver.findExecutable(options.program);
  if (!executable) {
    LOG(ERROR) << "Failed to spawn PTY: " << options.program
               << " not found in PATH";
    return nullptr;
  }

  // Everything the child needs is built before forking.
  vector<string> envStrings = buildEnvironment(
      environ, options.strippedEnvPrefixes, options.extraEnvironment);
  vector<char*> envp;
  for (auto& it : envStrings) {
    envp.push_back(&it[0]);
  }
  envp.push_back(NULL);
  vector<char*> argv;
  argv.push_back(const_cast<char*>(options.program.c_str()));
  for (const auto& arg : options.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = options.cols;
  win.ws_row = options.rows;

  int masterFd = -1;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &win);
  switch (pid) {
    case -1:
      LOG(ERROR) << "Failed to spawn PTY: forkpty: " << strerror(errno);
      return nullptr;
    case 0: {
      if (!options.workingDirectory.empty() &&
          chdir(options.workingDirectory.c_str()) == -1 && chdir("/") == -1) {
        _exit(126);
      }
      // The gateway ignores SIGPIPE and may have other dispositions that a
      // login shell must not inherit (see the SIGCHLD notes in bash's trap
      // documentation).
      signal(SIGCHLD, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      signal(SIGINT, SIG_DFL);
      signal(SIGTERM, SIG_DFL);
      signal(SIGHUP, SIG_DFL);
      sigset_t mask;
      sigemptyset(&mask);
      sigprocmask(SIG_SETMASK, &mask, NULL);
      CloseInheritedDescriptors();
      execve(executable->c_str(), argv.data(), envp.data());
      // only get here if exec fails
      _exit(127);
    }
    default:
      break;
  }

  // parent
  FATAL_FAIL(fcntl(masterFd, F_SETFD, FD_CLOEXEC));
  VLOG(1) << "pty opened " << masterFd << " for pid " << pid;
  TerminalSize size;
  size.cols = options.cols;
  size.rows = options.rows;
  shared_ptr<PtyBridge> bridge(new PtyBridge(io, masterFd, pid, size));
  bridge->readSome();
  return bridge;
}

PtyBridge::PtyBridge(asio::io_context& _io, int masterFd, pid_t _childPid,
                     TerminalSize _size)
    : io(_io),
      master(_io, masterFd),
      reapTimer(_io),
      childPid(_childPid),
      size(_size) {}

PtyBridge::~PtyBridge() {
  if (childPid > 0) {
    // Still not reaped: do not leave a zombie behind.
    ::kill(childPid, SIGKILL);
    waitpid(childPid, NULL, WNOHANG);
  }
}

void PtyBridge::readSome() {
  auto self = shared_from_this();
  master.async_read_some(
      asio::buffer(readBuffer),
      [self](const boost::system::error_code& ec, std::size_t length) {
        if (ec) {
          self->handleTerminalEnd(ec);
          return;
        }
        VLOG(4) << "Read " << length << " bytes from terminal";
        self->emitData(
            self->utf8.append(string(self->readBuffer.data(), length)));
        self->readSome();
      });
}

void PtyBridge::handleTerminalEnd(const boost::system::error_code& ec) {
  if (exited) {
    return;
  }
  // EIO is how Linux reports that the slave side has been closed.
  if (ec == asio::error::operation_aborted) {
    VLOG(1) << "Terminal read cancelled";
  } else {
    LOG(INFO) << "Terminal session ended: " << ec.message();
  }
  emitData(utf8.flush());
  if (!writeQueue.empty()) {
    VLOG(1) << "Dropping " << writeQueue.size()
            << " pending writes to an exited terminal";
    writeQueue.clear();
  }
  boost::system::error_code closeEc;
  master.close(closeEc);
  emitExit();
  reapChild(0);
}

void PtyBridge::reapChild(int attempt) {
  if (childPid <= 0) {
    return;
  }
  int status = 0;
  pid_t rc = waitpid(childPid, &status, WNOHANG);
  if (rc == childPid || (rc == -1 && errno == ECHILD)) {
    if (rc == childPid && WIFEXITED(status)) {
      VLOG(1) << "Child " << childPid << " exited with "
              << WEXITSTATUS(status);
    } else if (rc == childPid && WIFSIGNALED(status)) {
      VLOG(1) << "Child " << childPid << " killed by signal "
              << WTERMSIG(status);
    }
    childPid = -1;
    return;
  }
  if (attempt >= MAX_REAP_ATTEMPTS) {
    LOG(INFO) << "Child " << childPid << " did not exit after hangup, killing";
    ::kill(childPid, SIGKILL);
    waitpid(childPid, &status, 0);
    childPid = -1;
    return;
  }
  auto self = shared_from_this();
  reapTimer.expires_after(chrono::milliseconds(50));
  reapTimer.async_wait([self, attempt](const boost::system::error_code& ec) {
    if (!ec) {
      self->reapChild(attempt + 1);
    }
  });
}

void PtyBridge::write(const string& data) {
  if (exited || !master.is_open()) {
    VLOG(1) << "Dropping write to a terminal that has exited";
    return;
  }
  if (data.empty()) {
    return;
  }
  writeQueue.push_back(data);
  if (writeQueue.size() == 1) {
    doWrite();
  }
}

void PtyBridge::doWrite() {
  auto self = shared_from_this();
  asio::async_write(
      master, asio::buffer(writeQueue.front()),
      [self](const boost::system::error_code& ec, std::size_t) {
        if (self->writeQueue.empty()) {
          // Cleared when the terminal ended.
          return;
        }
        if (ec) {
          if (ec != asio::error::operation_aborted) {
            LOG(ERROR) << "Write to terminal failed: " << ec.message();
          }
          self->writeQueue.clear();
          return;
        }
        self->writeQueue.pop_front();
        if (!self->writeQueue.empty() && !self->exited &&
            self->master.is_open()) {
          self->doWrite();
        }
      });
}

void PtyBridge::resize(int cols, int rows) {
  if (exited || !master.is_open()) {
    LOG(ERROR) << "Resize error: terminal has exited";
    return;
  }
  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(tmpwin));
  tmpwin.ws_col = cols;
  tmpwin.ws_row = rows;
  if (ioctl(master.native_handle(), TIOCSWINSZ, &tmpwin) == -1) {
    LOG(ERROR) << "Resize error: " << strerror(errno);
    return;
  }
  size.cols = cols;
  size.rows = rows;
}

void PtyBridge::kill() {
  if (exited || childPid <= 0) {
    return;
  }
  VLOG(1) << "Hanging up terminal child " << childPid;
  ::kill(childPid, SIGHUP);
  // Cancels the pending read; handleTerminalEnd does the rest.
  boost::system::error_code ec;
  master.cancel(ec);
}
}  // namespace tg
