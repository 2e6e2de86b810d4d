#ifndef __TB_LOG_HANDLER__
#define __TB_LOG_HANDLER__

#include "Headers.hpp"

namespace tb {
/**
 * @brief easylogging++ setup shared by `tbserver` and `tbtest`.
 *
 * Everything goes to the `default` logger; text meant for the person running
 * the binary goes to the `stdout` logger, which prints bare messages.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging++ and returns the base configuration.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points `conf` at a fresh, timestamped log file in `directory`.
   * @param redirectStderr Also sends stderr (and so child diagnostics
   * printed before exec) to a sibling file.
   * @param maxLogSize Bytes after which the file is rolled over.
   * @return The path of the new log file.
   */
  static string setupLogFiles(el::Configurations *conf, const string &directory,
                              const string &prefix, bool logToStdout,
                              bool redirectStderr,
                              const string &maxLogSize = "20971520");

  /**
   * @brief Applies the verbosity level and the silent switch, then
   * reconfigures the default logger with `conf`.
   */
  static void applyVerbosity(el::Configurations *conf, int verboseLevel,
                             bool silent);

  /**
   * @brief Keeps one rolled-over generation as `<file>.1`.
   * Installed as the pre-rollout callback; it must not log.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Makes the `stdout` logger print bare messages to stdout. */
  static void setupStdoutLogger();

 private:
  /** @brief Creates `directory` and an empty, private file inside it. */
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace tb
#endif  // __TB_LOG_HANDLER__
