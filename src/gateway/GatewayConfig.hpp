#ifndef __TG_GATEWAY_CONFIG__
#define __TG_GATEWAY_CONFIG__

#include "Headers.hpp"

namespace tg {
/**
 * @brief Every tunable of the gateway.
 *
 * Values start at the defaults below and are overridden, in order, by the
 * environment, an INI config file, and the command line (see
 * GatewayServerMain.cpp).
 */
struct GatewayConfig {
  // Networking
  int port = 3001;
  string bindIp = "0.0.0.0";

  // Gateway
  /** @brief Substitutes EchoBridge for the real pty/tmux bridge. */
  bool echoMode = false;
  /** @brief Host identity; only used for health output and activity reports.
   */
  string sandboxId;
  string endpointPath = "/ws/terminal";
  string defaultSessionId = "default";
  /** @brief Multiplexer session name = sessionPrefix + session identifier. */
  string sessionPrefix = "sandbox-";
  vector<string> allowedOrigins = {
      "https://moltshell.sh", "https://sandbox-launcher.terui.workers.dev"};
  string layoutDirectory;

  // Multiplexer
  string tmuxBinary = "tmux";
  /** @brief When set, every tmux call uses `-L tmuxSocket`. */
  string tmuxSocket;
  string modeOption = "mouse";
  string modeValue = "on";
  int modeAttempts = 3;
  chrono::milliseconds modeRetryInterval = chrono::milliseconds(200);
  chrono::milliseconds postSpawnModeDelay = chrono::milliseconds(200);

  // Terminal
  vector<string> strippedEnvPrefixes = {"CLAUDE"};
  int defaultCols = 80;
  int defaultRows = 24;

  // Debug
  chrono::seconds heartbeatInterval = chrono::seconds(60);
  int verboseLevel = 0;
  bool silent = false;
  string maxLogSize = "20971520";
  bool logToStdout = false;
  string logDirectory;

  /** @brief Derives the multiplexer-side name for a session identifier. */
  inline string multiplexerSessionName(const string& sessionId) const {
    return sessionPrefix + sessionId;
  }

  /**
   * @brief Applies PORT, TERMINAL_MODE, SANDBOX_ID and HOME.
   * @param lookup Returns the variable's value or NULL; defaults to getenv.
   * @throws std::invalid_argument on an unparseable PORT.
   */
  void applyEnvironment(
      const function<const char*(const char*)>& lookup = ::getenv);

  /**
   * @brief Loads an INI file and applies every key it sets.
   * @throws std::runtime_error when the file cannot be read.
   * @throws std::invalid_argument on unparseable numbers.
   */
  void applyIniFile(const string& filename);

  /** @brief Applies already-loaded INI contents (see applyIniFile). */
  void applyIniString(const string& contents);

  /**
   * @brief Checks cross-field constraints.
   * @throws std::invalid_argument describing the first problem found.
   */
  void validate() const;
};

/**
 * @brief Checks whether a client supplied session identifier can be turned
 * into a multiplexer session name.
 *
 * tmux rewrites ':' and '.' in session names, so those (and whitespace,
 * control characters and very long names) are rejected at the handshake.
 */
bool isValidSessionId(const string& sessionId);
}  // namespace tg

#endif  // __TG_GATEWAY_CONFIG__
