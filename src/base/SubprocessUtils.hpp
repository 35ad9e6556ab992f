#ifndef __TG_SUBPROCESS_UTILS__
#define __TG_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace tg {
/**
 * @brief Exit status and captured stdout of a finished subprocess.
 */
struct SubprocessResult {
  /** @brief Exit code, or -1 when the process could not be run or was killed
   * by a signal. */
  int exitCode = -1;
  string output;

  inline bool succeeded() const { return exitCode == 0; }
};

/**
 * @brief Utility class for executing subprocesses and capturing output.
 *
 * Methods are virtual so tests can substitute canned results.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs `command` with `args` (no shell), waits for it, and captures
   * stdout.  stdin and stderr are bound to /dev/null.
   */
  virtual SubprocessResult run(const string& command,
                               const vector<string>& args);

  /**
   * @brief Resolves `command` against $PATH the way execvp would.
   * @return The absolute path, or nullopt when nothing executable is found.
   */
  virtual optional<string> findExecutable(const string& command);
};
}  // namespace tg

#endif  // __TG_SUBPROCESS_UTILS__
