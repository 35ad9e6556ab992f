#ifndef __TG_LOG_HANDLER__
#define __TG_LOG_HANDLER__

#include "Headers.hpp"

namespace tg {
/**
 * @brief Where and how the gateway writes its logs.
 */
struct LogOptions {
  /** @brief Directory that receives the log files. */
  string directory;
  /** @brief Log file names start with this prefix. */
  string filenamePrefix = "tgserver";
  bool logToStdout = false;
  bool redirectStderrToFile = false;
  bool appendPid = false;
  /** @brief Disables the default logger entirely. */
  bool silent = false;
  int verboseLevel = 0;
  string maxLogSize = "20971520";
};

/**
 * @brief Configures easylogging++ so TermGate can control log files.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Applies `options` to `defaultConf` and reconfigures the default
   * logger with it.
   * @return The full path of the log file that was created.
   */
  static string configure(el::Configurations *defaultConf,
                          const LogOptions &options);

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace tg
#endif  // __TG_LOG_HANDLER__
