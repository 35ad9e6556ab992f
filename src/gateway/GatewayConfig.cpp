#include "GatewayConfig.hpp"

#include "SimpleIni.h"

namespace tg {
namespace {
int parseInt(const string& name, const string& value) {
  string trimmed = trim(value);
  try {
    size_t consumed = 0;
    int rv = stoi(trimmed, &consumed);
    if (consumed != trimmed.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return rv;
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Invalid value for " + name + ": " + value);
  }
}

bool parseBool(const string& value) {
  string lowered = value;
  transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
  return lowered == "1" || lowered == "true" || lowered == "yes" ||
         lowered == "on";
}

void applyIni(GatewayConfig* config, const CSimpleIniA& ini) {
  const char* value;

  if ((value = ini.GetValue("Networking", "port", NULL))) {
    config->port = parseInt("port", value);
  }
  if ((value = ini.GetValue("Networking", "bind_ip", NULL))) {
    config->bindIp = value;
  }

  if ((value = ini.GetValue("Terminal", "mode", NULL))) {
    config->echoMode = (string(value) == "echo");
  }
  if ((value = ini.GetValue("Terminal", "strip_env_prefixes", NULL))) {
    config->strippedEnvPrefixes = splitList(value);
  }
  if ((value = ini.GetValue("Terminal", "cols", NULL))) {
    config->defaultCols = parseInt("cols", value);
  }
  if ((value = ini.GetValue("Terminal", "rows", NULL))) {
    config->defaultRows = parseInt("rows", value);
  }

  if ((value = ini.GetValue("Gateway", "sandbox_id", NULL))) {
    config->sandboxId = value;
  }
  if ((value = ini.GetValue("Gateway", "endpoint_path", NULL))) {
    config->endpointPath = value;
  }
  if ((value = ini.GetValue("Gateway", "default_session", NULL))) {
    config->defaultSessionId = value;
  }
  if ((value = ini.GetValue("Gateway", "session_prefix", NULL))) {
    config->sessionPrefix = value;
  }
  if ((value = ini.GetValue("Gateway", "allowed_origins", NULL))) {
    config->allowedOrigins = splitList(value);
  }
  if ((value = ini.GetValue("Gateway", "layout_dir", NULL))) {
    config->layoutDirectory = value;
  }

  if ((value = ini.GetValue("Multiplexer", "tmux", NULL))) {
    config->tmuxBinary = value;
  }
  if ((value = ini.GetValue("Multiplexer", "socket", NULL))) {
    config->tmuxSocket = value;
  }
  if ((value = ini.GetValue("Multiplexer", "mode_option", NULL))) {
    config->modeOption = value;
  }
  if ((value = ini.GetValue("Multiplexer", "mode_value", NULL))) {
    config->modeValue = value;
  }
  if ((value = ini.GetValue("Multiplexer", "mode_attempts", NULL))) {
    config->modeAttempts = parseInt("mode_attempts", value);
  }
  if ((value = ini.GetValue("Multiplexer", "mode_retry_ms", NULL))) {
    config->modeRetryInterval =
        chrono::milliseconds(parseInt("mode_retry_ms", value));
  }
  if ((value = ini.GetValue("Multiplexer", "post_spawn_mode_ms", NULL))) {
    config->postSpawnModeDelay =
        chrono::milliseconds(parseInt("post_spawn_mode_ms", value));
  }

  if ((value = ini.GetValue("Debug", "heartbeat_seconds", NULL))) {
    config->heartbeatInterval =
        chrono::seconds(parseInt("heartbeat_seconds", value));
  }
  if ((value = ini.GetValue("Debug", "verbose", NULL))) {
    config->verboseLevel = parseInt("verbose", value);
  }
  if ((value = ini.GetValue("Debug", "silent", NULL))) {
    config->silent = parseBool(value);
  }
  if ((value = ini.GetValue("Debug", "logsize", NULL))) {
    // make sure maxLogSize is a string of int value
    if (parseInt("logsize", value) > 0) {
      config->maxLogSize = value;
    }
  }
  if ((value = ini.GetValue("Debug", "log_dir", NULL))) {
    config->logDirectory = value;
  }
}
}  // namespace

void GatewayConfig::applyEnvironment(
    const function<const char*(const char*)>& lookup) {
  const char* value;
  if ((value = lookup("PORT")) && *value) {
    port = parseInt("PORT", value);
  }
  if ((value = lookup("TERMINAL_MODE"))) {
    echoMode = (string(value) == "echo");
  }
  if ((value = lookup("SANDBOX_ID"))) {
    sandboxId = value;
  }
  if ((value = lookup("HOME")) && *value) {
    layoutDirectory = string(value) + "/.termgate";
  }
}

void GatewayConfig::applyIniFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }
  applyIni(this, ini);
}

void GatewayConfig::applyIniString(const string& contents) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(contents.c_str(), contents.size());
  if (rc < 0) {
    throw std::runtime_error("Invalid config data");
  }
  applyIni(this, ini);
}

void GatewayConfig::validate() const {
  if (port < 0 || port > 65535) {
    throw std::invalid_argument("port out of range: " + to_string(port));
  }
  if (endpointPath.empty() || endpointPath[0] != '/') {
    throw std::invalid_argument("endpoint path must start with '/': " +
                                endpointPath);
  }
  if (!isValidSessionId(defaultSessionId)) {
    throw std::invalid_argument("invalid default session: " +
                                defaultSessionId);
  }
  if (modeAttempts < 1) {
    throw std::invalid_argument("mode_attempts must be at least 1");
  }
  if (modeRetryInterval.count() < 0 || postSpawnModeDelay.count() < 0) {
    throw std::invalid_argument("mode delays must not be negative");
  }
  if (defaultCols <= 0 || defaultRows <= 0 || defaultCols > 65535 ||
      defaultRows > 65535) {
    throw std::invalid_argument("default geometry out of range");
  }
}

bool isValidSessionId(const string& sessionId) {
  if (sessionId.empty() || sessionId.size() > 128) {
    return false;
  }
  for (char c : sessionId) {
    unsigned char uc = (unsigned char)c;
    if (uc < 0x20 || uc == 0x7f || c == ' ' || c == ':' || c == '.') {
      return false;
    }
  }
  return true;
}
}  // namespace tg
