#ifndef __PMX_LOG_HANDLER__
#define __PMX_LOG_HANDLER__

#include "Headers.hpp"

namespace pmx {
/**
 * @brief Configures easylogging++ for the multiplexer and its tests.
 */
class LogHandler {
 public:
  /** @brief A log file is dropped and started over past this size. */
  static constexpr size_t MAX_LOG_FILE_BYTES = 20 * 1024 * 1024;

  /** @brief The format and flushing shared by every panemux logger. */
  static el::Configurations setupLogHandler();

  /**
   * @brief Points `conf` at a new `<prefix>-<date>-<time>-<pid>.log` inside
   * `dir`, creating the directory if needed.
   *
   * With `captureStderr` the process's stderr goes to a sibling `.stderr`
   * file, so stray writes never land on the terminal the panes are drawn on.
   *
   * @return The path of the log file.
   */
  static string setupLogFiles(el::Configurations *conf, const string &dir,
                              const string &prefix, bool logToStdout,
                              bool captureStderr);

  static void setVerbosity(int level);

  /** @brief The `stdout` logger prints bare messages for the user. */
  static void setupStdoutLogger();

 private:
  static string logFileStem(const string &prefix);
  static string createLogFile(const string &dir, const string &filename);
  static void removeRolledFile(const char *filename, std::size_t size);
};
}  // namespace pmx
#endif  // __PMX_LOG_HANDLER__
