#ifndef __TG_HEADERS__
#define __TG_HEADERS__

#if __APPLE__
#include <sys/ucred.h>
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#include <sys/socket.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#else
#include <pty.h>
#endif

#include <arpa/inet.h>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <grp.h>
#include <netdb.h>
#include <netinet/in.h>
#include <paths.h>
#include <pwd.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include <boost/asio.hpp>

#include "easylogging++.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;

namespace fs = std::filesystem;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef TG_VERSION
#define TG_VERSION "unknown"
#endif

namespace tg {
namespace asio = boost::asio;

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline string trim(const string &s) {
  const char *whitespace = " \t\r\n";
  auto start = s.find_first_not_of(whitespace);
  if (start == string::npos) {
    return string();
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(start, end - start + 1);
}

inline bool startsWith(const string &s, const string &prefix) {
  return s.size() >= prefix.size() &&
         s.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Splits a comma separated list, trimming entries and dropping empty
 * ones.
 */
inline vector<string> splitList(const string &s) {
  vector<string> result;
  for (const auto &it : split(s, ',')) {
    string entry = trim(it);
    if (!entry.empty()) {
      result.push_back(entry);
    }
  }
  return result;
}

inline string GetTempDirectory() {
  const char *tmpdir = ::getenv("TMPDIR");
  string tmpDir = tmpdir ? string(tmpdir) : string(_PATH_TMP);
  if (tmpDir.empty() || tmpDir.back() != '/') {
    tmpDir.push_back('/');
  }
  return tmpDir;
}

/**
 * @brief Returns the user's home directory, preferring $HOME over the passwd
 * database.
 */
inline string GetHomeDirectory() {
  const char *home = ::getenv("HOME");
  if (home && *home) {
    return string(home);
  }
  passwd *pwd = getpwuid(getuid());
  if (pwd && pwd->pw_dir) {
    return string(pwd->pw_dir);
  }
  return string("/");
}

/**
 * @brief Closes every descriptor above stderr.  Called in forked children
 * before exec so sockets and pty masters owned by the gateway do not leak
 * into shells or the tmux server.
 *
 * Uses close_range(2) when the kernel has it, then the open descriptors
 * listed in /proc/self/fd, and only then every possible descriptor number.
 */
inline void CloseInheritedDescriptors() {
#ifdef SYS_close_range
  if (::syscall(SYS_close_range, STDERR_FILENO + 1, ~0U, 0) == 0) {
    return;
  }
#endif
  DIR *dir = ::opendir("/proc/self/fd");
  if (dir != NULL) {
    int dirFd = ::dirfd(dir);
    vector<int> fds;
    for (dirent *entry = ::readdir(dir); entry != NULL;
         entry = ::readdir(dir)) {
      int fd = atoi(entry->d_name);
      if (fd > STDERR_FILENO && fd != dirFd) {
        fds.push_back(fd);
      }
    }
    ::closedir(dir);
    for (int fd : fds) {
      ::close(fd);
    }
    return;
  }
  long maxFd = sysconf(_SC_OPEN_MAX);
  if (maxFd < 0) {
    maxFd = 1024;
  }
  for (int fd = STDERR_FILENO + 1; fd < maxFd; fd++) {
    ::close(fd);
  }
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace tg

#endif
