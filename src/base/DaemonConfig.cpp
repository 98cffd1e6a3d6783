#include "DaemonConfig.hpp"

#include "DaemonError.hpp"
#include "SimpleIni.h"

namespace ptykeep {
namespace {
const char* CONFIG_SECTION = "Daemon";

long long parseNumber(const char* key, const char* value) {
  try {
    size_t consumed = 0;
    long long n = stoll(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument("trailing characters");
    }
    return n;
  } catch (const std::logic_error&) {
    throw DaemonError::configInvalid(string(key) + " is not a number: " +
                                     value);
  }
}

template <typename T>
void readNumber(const CSimpleIniA& ini, const char* key, T* out) {
  const char* value = ini.GetValue(CONFIG_SECTION, key, NULL);
  if (!value) {
    return;
  }
  long long n = parseNumber(key, value);
  if (n < 0 || n > (long long)std::numeric_limits<T>::max()) {
    throw DaemonError::configInvalid(string(key) + " is out of range: " +
                                     value);
  }
  *out = T(n);
}

void readString(const CSimpleIniA& ini, const char* key, string* out) {
  const char* value = ini.GetValue(CONFIG_SECTION, key, NULL);
  if (value && strlen(value)) {
    *out = value;
  }
}

void applyIni(const CSimpleIniA& ini, DaemonConfig* config) {
  readString(ini, "socket_path", &config->socketPath);
  readString(ini, "pid_path", &config->pidPath);
  readString(ini, "log_dir", &config->logDir);
  readNumber(ini, "scrollback_buffer_size", &config->scrollbackBufferSize);
  readNumber(ini, "broadcast_capacity", &config->broadcastCapacity);
  readNumber(ini, "default_rows", &config->defaultRows);
  readNumber(ini, "default_cols", &config->defaultCols);
  readNumber(ini, "shutdown_timeout_secs", &config->shutdownTimeoutSecs);
  readNumber(ini, "verbose", &config->verbose);
  const char* logsize = ini.GetValue(CONFIG_SECTION, "logsize", NULL);
  if (logsize && parseNumber("logsize", logsize) > 0) {
    config->maxLogSize = logsize;
  }
}
}  // namespace

void DaemonConfig::loadIniFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw DaemonError::configInvalid("cannot load config file " + filename);
  }
  applyIni(ini, this);
}

void DaemonConfig::loadIniString(const string& contents) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(contents.c_str(), contents.size());
  if (rc < 0) {
    throw DaemonError::configInvalid("cannot parse config data");
  }
  applyIni(ini, this);
}

void DaemonConfig::validate() const {
  if (socketPath.empty()) {
    throw DaemonError::configInvalid("socket_path must not be empty");
  }
  if (socketPath.size() >= sizeof(sockaddr_un::sun_path)) {
    throw DaemonError::configInvalid("socket_path is too long: " + socketPath);
  }
  if (scrollbackBufferSize == 0) {
    throw DaemonError::configInvalid("scrollback_buffer_size must be > 0");
  }
  if (broadcastCapacity == 0) {
    throw DaemonError::configInvalid("broadcast_capacity must be > 0");
  }
  if (defaultRows == 0 || defaultCols == 0) {
    throw DaemonError::configInvalid("default_rows and default_cols must be > 0");
  }
  if (shutdownTimeoutSecs <= 0) {
    throw DaemonError::configInvalid("shutdown_timeout_secs must be > 0");
  }
}
}  // namespace ptykeep
