#include "SubprocessUtils.hpp"

namespace tg {
SubprocessResult SubprocessUtils::run(const string& command,
                                      const vector<string>& args) {
  SubprocessResult result;
  int link[2];
  if (pipe(link) == -1) {
    LOG(ERROR) << "pipe() failed for " << command << ": " << strerror(errno);
    return result;
  }

  // Build argv before forking so the child only has to exec.
  vector<char*> argv;
  argv.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    int devNull = ::open("/dev/null", O_RDWR);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
      dup2(devNull, STDERR_FILENO);
      close(devNull);
    }
    dup2(link[1], STDOUT_FILENO);
    CloseInheritedDescriptors();
    execvp(command.c_str(), argv.data());
    _exit(127);
  } else if (pid < 0) {
    LOG(ERROR) << "Failed to fork for " << command << ": " << strerror(errno);
    close(link[0]);
    close(link[1]);
    return result;
  }

  // parent process
  close(link[1]);
  char buf[4096];
  while (true) {
    ssize_t nbytes = read(link[0], buf, sizeof(buf));
    if (nbytes < 0 && errno == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    result.output.append(buf, nbytes);
  }
  close(link[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      LOG(ERROR) << "waitpid failed for " << command << ": " << strerror(errno);
      return result;
    }
  }
  if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  }
  VLOG(2) << "Subprocess " << command << " exited with " << result.exitCode;
  return result;
}

optional<string> SubprocessUtils::findExecutable(const string& command) {
  if (command.empty()) {
    return nullopt;
  }
  if (command.find('/') != string::npos) {
    if (::access(command.c_str(), X_OK) == 0) {
      return command;
    }
    return nullopt;
  }
  const char* pathEnv = ::getenv("PATH");
  string path = pathEnv ? string(pathEnv) : string("/usr/bin:/bin");
  for (const auto& dir : split(path, ':')) {
    string candidate = (dir.empty() ? string(".") : dir) + "/" + command;
    struct stat st;
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return nullopt;
}

}  // namespace tg
