#include "EchoBridge.hpp"

namespace tg {
const string EchoBridge::PROMPT = "\x1b[32mecho-terminal\x1b[0m $ ";

EchoBridge::EchoBridge(asio::io_context& io, int cols, int rows)
    : promptTimer(io) {
  size.cols = cols;
  size.rows = rows;
}

void EchoBridge::start(chrono::milliseconds promptDelay) {
  weak_ptr<EchoBridge> weakSelf = shared_from_this();
  promptTimer.expires_after(promptDelay);
  promptTimer.async_wait([weakSelf](const boost::system::error_code& ec) {
    auto self = weakSelf.lock();
    if (ec || !self) {
      return;
    }
    self->emitData("\r\n" + PROMPT);
  });
}

void EchoBridge::write(const string& data) {
  // Exit subscribers may release their reference to us.
  auto self = shared_from_this();
  for (char c : data) {
    if (exited) {
      return;
    }
    unsigned char uc = (unsigned char)c;
    if (c == '\r' || c == '\n') {
      handleCommand();
    } else if (c == '\x7f' || c == '\b') {
      if (!buffer.empty()) {
        buffer.pop_back();
        emitData("\b \b");
      }
    } else if (c == '\x03') {
      // Ctrl+C
      buffer.clear();
      emitData("^C\r\n" + PROMPT);
    } else if (c == '\x04') {
      // Ctrl+D
      emitData("\r\nexit\r\n");
      emitExit();
    } else if (c == '\x0c') {
      // Ctrl+L
      emitData("\x1b[2J\x1b[H" + PROMPT + buffer);
    } else if (uc >= ' ') {
      buffer.push_back(c);
      emitData(string(1, c));
    }
  }
}

void EchoBridge::handleCommand() {
  string cmd = trim(buffer);
  buffer.clear();
  emitData("\r\n");

  if (cmd == "help") {
    emitData(
        "Available commands: help, echo, clear, date, whoami, tput cols, "
        "tput lines, stty size, exit\r\n");
  } else if (startsWith(cmd, "echo ")) {
    emitData(cmd.substr(5) + "\r\n");
  } else if (cmd == "echo") {
    emitData("\r\n");
  } else if (cmd == "clear") {
    emitData("\x1b[2J\x1b[H");
  } else if (cmd == "date") {
    char timeBuf[128];
    time_t now = time(NULL);
    struct tm localTime;
    localtime_r(&now, &localTime);
    strftime(timeBuf, sizeof(timeBuf), "%a %b %d %Y %H:%M:%S GMT%z",
             &localTime);
    emitData(string(timeBuf) + "\r\n");
  } else if (cmd == "whoami") {
    emitData("echo-user\r\n");
  } else if (cmd == "tput cols") {
    emitData(to_string(size.cols) + "\r\n");
  } else if (cmd == "tput lines") {
    emitData(to_string(size.rows) + "\r\n");
  } else if (cmd == "stty size") {
    emitData(to_string(size.rows) + " " + to_string(size.cols) + "\r\n");
  } else if (cmd == "exit") {
    emitData("Goodbye!\r\n");
    emitExit();
    return;
  } else if (!cmd.empty()) {
    emitData("\x1b[33mecho-terminal:\x1b[0m command not found: " + cmd +
             "\r\n");
  }

  emitData(PROMPT);
}

void EchoBridge::resize(int cols, int rows) {
  size.cols = cols;
  size.rows = rows;
}

void EchoBridge::kill() {
  auto self = shared_from_this();
  promptTimer.cancel();
  emitExit();
}
}  // namespace tg
