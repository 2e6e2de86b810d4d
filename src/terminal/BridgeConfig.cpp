#include "BridgeConfig.hpp"

#include "SimpleIni.h"

namespace tb {
namespace {
string homeDirectory() {
  const char *home = ::getenv("HOME");
  if (home != NULL && home[0] != '\0') {
    return string(home);
  }
  passwd *pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_dir != NULL) {
    return string(pwd->pw_dir);
  }
  return GetTempDirectory();
}

string loginShell() {
  const char *shell = ::getenv("SHELL");
  if (shell != NULL && shell[0] != '\0') {
    return string(shell);
  }
  passwd *pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_shell != NULL && pwd->pw_shell[0] != '\0') {
    return string(pwd->pw_shell);
  }
  return "/bin/sh";
}

void readString(const CSimpleIniA &ini, const char *section, const char *key,
                string *out) {
  const char *value = ini.GetValue(section, key, NULL);
  if (value) {
    *out = string(value);
  }
}

void readInt(const CSimpleIniA &ini, const char *section, const char *key,
             int minimum, int maximum, int *out) {
  const char *value = ini.GetValue(section, key, NULL);
  if (!value) {
    return;
  }
  int parsed;
  try {
    size_t used = 0;
    parsed = stoi(value, &used);
    if (used != strlen(value)) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error &) {
    throw std::invalid_argument(string("[") + section + "] " + key +
                                " is not a number: " + value);
  }
  if (parsed < minimum || parsed > maximum) {
    throw std::invalid_argument(string("[") + section + "] " + key +
                                " is out of range: " + value);
  }
  *out = parsed;
}
}  // namespace

PtyOptions BridgeConfig::ptyOptions() const {
  PtyOptions options;
  options.initialRows = initialRows;
  options.initialCols = initialCols;
  options.termType = termType;
  options.terminateTimeoutMs = terminateTimeoutMs;
  return options;
}

SshOptions BridgeConfig::sshOptions() const {
  SshOptions options;
  options.initialRows = initialRows;
  options.initialCols = initialCols;
  options.termType = termType;
  options.connectTimeoutMs = connectTimeoutMs;
  options.terminateTimeoutMs = terminateTimeoutMs;
  options.hostKeyPolicy = hostKeyPolicy;
  options.knownHostsFile = knownHostsFile.empty()
                               ? homeDirectory() + "/.termbridge/known_hosts"
                               : knownHostsFile;
  return options;
}

ConnectRequest BridgeConfig::connectDefaults() const {
  ConnectRequest defaults;
  defaults.host = defaultHost;
  defaults.port = defaultPort;
  defaults.username = defaultUser.empty() ? GetOsUserName() : defaultUser;
  return defaults;
}

vector<string> BridgeConfig::commandLine() const {
  vector<string> words;
  for (const string &word : split(command, ' ')) {
    if (!word.empty()) {
      words.push_back(word);
    }
  }
  if (words.empty()) {
    words.push_back(loginShell());
    words.push_back("-l");
  }
  return words;
}

void BridgeConfig::loadFile(const string &path, BridgeConfig *config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Cannot read config file " + path);
  }

  readInt(ini, "Networking", "port", 0, 65535, &config->port);
  readString(ini, "Networking", "bind_ip", &config->bindIp);
  readString(ini, "Networking", "ws_path", &config->wsPath);
  if (config->wsPath.empty() || config->wsPath[0] != '/') {
    throw std::invalid_argument("[Networking] ws_path must start with '/'");
  }

  const char *mode = ini.GetValue("Session", "mode", NULL);
  if (mode) {
    config->mode = parseMode(mode);
  }
  readString(ini, "Session", "command", &config->command);
  readInt(ini, "Session", "poll_interval_ms", 1, 1000,
          &config->pollIntervalMs);
  readInt(ini, "Session", "terminate_timeout_ms", 0, 60000,
          &config->terminateTimeoutMs);
  readInt(ini, "Session", "initial_rows", 1, 65535, &config->initialRows);
  readInt(ini, "Session", "initial_cols", 1, 65535, &config->initialCols);
  readString(ini, "Session", "term_type", &config->termType);

  readString(ini, "Ssh", "default_host", &config->defaultHost);
  readInt(ini, "Ssh", "default_port", 1, 65535, &config->defaultPort);
  readString(ini, "Ssh", "default_user", &config->defaultUser);
  readInt(ini, "Ssh", "connect_timeout_ms", 1, 600000,
          &config->connectTimeoutMs);
  const char *policy = ini.GetValue("Ssh", "host_key_policy", NULL);
  if (policy) {
    config->hostKeyPolicy = parseHostKeyPolicy(policy);
  }
  readString(ini, "Ssh", "known_hosts_file", &config->knownHostsFile);

  readInt(ini, "Debug", "verbose", 0, 9, &config->verbose);
  const char *silent = ini.GetValue("Debug", "silent", NULL);
  if (silent) {
    config->silent = atoi(silent) != 0;
  }
  const char *logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // keep it a string of an int value, easylogging parses it itself
    config->maxLogSize = to_string(atoi(logsize));
  }
}

BridgeMode BridgeConfig::parseMode(const string &s) {
  if (s == "pty") {
    return BridgeMode::PTY;
  }
  if (s == "ssh") {
    return BridgeMode::SSH;
  }
  throw std::invalid_argument("Unknown mode '" + s + "', use pty or ssh");
}

HostKeyPolicy BridgeConfig::parseHostKeyPolicy(const string &s) {
  if (s == "accept-new") {
    return HostKeyPolicy::ACCEPT_NEW;
  }
  if (s == "accept-any") {
    return HostKeyPolicy::ACCEPT_ANY;
  }
  if (s == "strict") {
    return HostKeyPolicy::STRICT;
  }
  throw std::invalid_argument("Unknown host key policy '" + s +
                              "', use accept-new, accept-any or strict");
}
}  // namespace tb
