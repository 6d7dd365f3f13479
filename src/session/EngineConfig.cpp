#include "EngineConfig.hpp"

#include "SimpleIni.h"

extern char** environ;

namespace ft {
namespace {
int parseInt(const char* value, int fallback, const char* name) {
  if (!value || !*value) {
    return fallback;
  }
  char* end = nullptr;
  long parsed = strtol(value, &end, 10);
  if (end == value || *end != '\0') {
    LOG(WARNING) << "Ignoring non-numeric value for " << name << ": "
                 << value;
    return fallback;
  }
  return int(parsed);
}

// Sizes and counts: a value below `minimum` would disable a cap.
int parseAtLeast(const char* value, int fallback, int minimum,
                 const char* name) {
  int parsed = parseInt(value, fallback, name);
  if (parsed < minimum) {
    LOG(WARNING) << "Ignoring " << name << " below " << minimum << ": "
                 << parsed;
    return fallback;
  }
  return parsed;
}
}  // namespace

EngineConfig::EngineConfig()
    : maxSessions(32),
      outputBufferBytes(2000000),
      maxWriteBytes(64000),
      cols(80),
      rows(30),
      hiddenEchoWindow(8192),
      killGraceMs(2000),
      portBase(4100),
      portSpan(4000),
      portHost("127.0.0.1"),
      sandboxMode("off"),
      networkGuard("off"),
      verbose(0),
      logToStdout(false) {}

bool EngineConfig::loadIniFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    STERROR << "Invalid config file: " << path;
    return false;
  }
  applyIni(ini);
  return true;
}

bool EngineConfig::loadIniData(const string& data) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(data);
  if (rc < 0) {
    return false;
  }
  applyIni(ini);
  return true;
}

template <typename Ini>
void EngineConfig::applyIni(const Ini& ini) {
  maxSessions = parseAtLeast(ini.GetValue("Sessions", "max_sessions", NULL),
                             maxSessions, 1, "max_sessions");
  outputBufferBytes = size_t(
      parseAtLeast(ini.GetValue("Sessions", "output_buffer_bytes", NULL),
                   int(outputBufferBytes), 1, "output_buffer_bytes"));
  maxWriteBytes =
      size_t(parseAtLeast(ini.GetValue("Sessions", "max_write_bytes", NULL),
                          int(maxWriteBytes), 1, "max_write_bytes"));
  const char* shellValue = ini.GetValue("Sessions", "shell", NULL);
  if (shellValue) {
    shell = string(shellValue);
  }
  cols = parseAtLeast(ini.GetValue("Sessions", "cols", NULL), cols, 1, "cols");
  rows = parseAtLeast(ini.GetValue("Sessions", "rows", NULL), rows, 1, "rows");
  hiddenEchoWindow = size_t(
      parseAtLeast(ini.GetValue("Sessions", "hidden_echo_window", NULL),
                   int(hiddenEchoWindow), 1, "hidden_echo_window"));
  killGraceMs = parseAtLeast(ini.GetValue("Sessions", "kill_grace_ms", NULL),
                             killGraceMs, 0, "kill_grace_ms");

  portBase =
      parseInt(ini.GetValue("Ports", "base", NULL), portBase, "Ports.base");
  portSpan =
      parseInt(ini.GetValue("Ports", "span", NULL), portSpan, "Ports.span");
  const char* hostValue = ini.GetValue("Ports", "host", NULL);
  if (hostValue && *hostValue) {
    portHost = string(hostValue);
  }

  const char* modeValue = ini.GetValue("Sandbox", "mode", NULL);
  if (modeValue && *modeValue) {
    sandboxMode = string(modeValue);
  }
  const char* guardValue = ini.GetValue("Sandbox", "network_guard", NULL);
  if (guardValue && *guardValue) {
    networkGuard = string(guardValue);
  }

  CSimpleIniA::TNamesDepend keys;
  ini.GetAllKeys("DependencyEnv", keys);
  for (const auto& key : keys) {
    const char* value = ini.GetValue("DependencyEnv", key.pItem, "");
    dependencyEnv[string(key.pItem)] = string(value);
  }

  verbose = parseInt(ini.GetValue("Debug", "verbose", NULL), verbose,
                     "verbose");
  const char* logToStdoutValue = ini.GetValue("Debug", "logtostdout", NULL);
  if (logToStdoutValue) {
    logToStdout = atoi(logToStdoutValue) != 0;
  }
  const char* logDirValue = ini.GetValue("Debug", "logdir", NULL);
  if (logDirValue && *logDirValue) {
    logDir = string(logDirValue);
  }
}

void EngineConfig::applyEnvironment(const map<string, string>& env) {
  auto get = [&env](const string& key) -> const char* {
    auto it = env.find(key);
    return it == env.end() ? NULL : it->second.c_str();
  };
  maxSessions = parseAtLeast(get("FLEETTERM_MAX_SESSIONS"), maxSessions, 1,
                             "FLEETTERM_MAX_SESSIONS");
  portBase =
      parseInt(get("FLEETTERM_PORT_BASE"), portBase, "FLEETTERM_PORT_BASE");
  portSpan =
      parseInt(get("FLEETTERM_PORT_SPAN"), portSpan, "FLEETTERM_PORT_SPAN");
  const char* mode = get("FLEETTERM_SANDBOX_MODE");
  if (mode && *mode) {
    sandboxMode = string(mode);
  }
  const char* guard = get("FLEETTERM_NETWORK_GUARD");
  if (guard && *guard) {
    networkGuard = string(guard);
  }
}

map<string, string> EngineConfig::processEnvironment() {
  map<string, string> env;
  for (char** entry = environ; entry && *entry; entry++) {
    string kv(*entry);
    auto eq = kv.find('=');
    if (eq == string::npos || eq == 0) {
      continue;
    }
    env[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  return env;
}
}  // namespace ft
