#include "WorkspaceConfig.hpp"

#include "SimpleIni.h"

namespace pmx {
WorkspaceConfig::WorkspaceConfig()
    : idleThresholdMs(3000),
      maxSameDirectionPanes(4),
      idlePollIntervalMs(1000),
      idleWaitCeilingMs(120 * 1000),
      handleWaitCeilingMs(3000),
      defaultRows(24),
      defaultCols(80),
      scrollbackBytes(128 * 1024),
      logDir(GetTempDirectory()),
      verbose(0) {
  const char* shellEnv = ::getenv("SHELL");
  shell = (shellEnv && *shellEnv) ? string(shellEnv) : string("/bin/sh");
}

int64_t WorkspaceConfig::parsePositive(const string& key,
                                       const string& value,
                                       int64_t maxValue) {
  size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Invalid number for " + key + ": " + value);
  }
  if (consumed != value.length()) {
    throw std::invalid_argument("Invalid number for " + key + ": " + value);
  }
  if (parsed <= 0) {
    throw std::invalid_argument(key + " must be positive: " + value);
  }
  if (parsed > maxValue) {
    throw std::invalid_argument(key + " is too large: " + value);
  }
  return parsed;
}

void WorkspaceConfig::loadFromFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  auto readNumber = [&ini](const char* section, const char* key,
                           int64_t* target) {
    const char* value = ini.GetValue(section, key, NULL);
    if (value) {
      *target = parsePositive(key, trim(value));
    }
  };
  auto readInt = [&ini](const char* section, const char* key, int* target) {
    const char* value = ini.GetValue(section, key, NULL);
    if (value) {
      *target = int(parsePositive(key, trim(value),
                                  std::numeric_limits<int>::max()));
    }
  };

  readNumber("Workspace", "idle_threshold_ms", &idleThresholdMs);
  readNumber("Workspace", "idle_poll_interval_ms", &idlePollIntervalMs);
  readNumber("Workspace", "idle_wait_ceiling_ms", &idleWaitCeilingMs);
  readNumber("Workspace", "handle_wait_ceiling_ms", &handleWaitCeilingMs);

  readInt("Workspace", "max_same_direction_panes", &maxSameDirectionPanes);
  readInt("Terminal", "rows", &defaultRows);
  readInt("Terminal", "cols", &defaultCols);
  int64_t number = int64_t(scrollbackBytes);
  readNumber("Terminal", "scrollback_bytes", &number);
  scrollbackBytes = size_t(number);

  const char* shellValue = ini.GetValue("Terminal", "shell", NULL);
  if (shellValue && trim(shellValue).length()) {
    shell = trim(shellValue);
  }

  const char* logDirValue = ini.GetValue("Debug", "logdir", NULL);
  if (logDirValue && trim(logDirValue).length()) {
    logDir = trim(logDirValue);
  }
  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = atoi(vlevel);
  }

  validate();
  LOG(INFO) << "Loaded config from " << path;
}

void WorkspaceConfig::validate() const {
  if (idleThresholdMs <= 0 || idlePollIntervalMs <= 0 ||
      idleWaitCeilingMs <= 0 || handleWaitCeilingMs <= 0) {
    throw std::invalid_argument("Timing values must be positive");
  }
  if (maxSameDirectionPanes < 2) {
    throw std::invalid_argument(
        "max_same_direction_panes must allow at least two panes");
  }
  if (defaultRows <= 0 || defaultCols <= 0) {
    throw std::invalid_argument("Terminal size must be positive");
  }
  if (shell.empty()) {
    throw std::invalid_argument("Shell must not be empty");
  }
}
}  // namespace pmx
