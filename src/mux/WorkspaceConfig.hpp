#ifndef __PMX_WORKSPACE_CONFIG__
#define __PMX_WORKSPACE_CONFIG__

#include "Headers.hpp"

namespace pmx {
/**
 * @brief Tunables for the workspace, the registry and the driver.
 *
 * Values come from an INI file (see `loadFromFile`) and are then overridden
 * by command-line flags.
 */
struct WorkspaceConfig {
  int64_t idleThresholdMs;
  int maxSameDirectionPanes;
  int64_t idlePollIntervalMs;
  int64_t idleWaitCeilingMs;
  int64_t handleWaitCeilingMs;
  int defaultRows;
  int defaultCols;
  size_t scrollbackBytes;
  string shell;
  string logDir;
  int verbose;

  WorkspaceConfig();

  /**
   * @brief Reads `[Workspace]`, `[Terminal]` and `[Debug]` keys from an INI
   * file.  Missing keys keep their current value.
   *
   * @throws std::runtime_error if the file cannot be loaded.
   * @throws std::invalid_argument on a malformed or out-of-range value.
   */
  void loadFromFile(const string& path);

  /** @brief Throws std::invalid_argument when a value is out of range. */
  void validate() const;

  /**
   * @brief Parses a whole-string integer in [1, maxValue].  Throws
   * std::invalid_argument otherwise.
   */
  static int64_t parsePositive(
      const string& key, const string& value,
      int64_t maxValue = std::numeric_limits<int64_t>::max());
};
}  // namespace pmx

#endif  // __PMX_WORKSPACE_CONFIG__
