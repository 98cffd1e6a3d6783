#ifndef __PTYKEEP_LOG_HANDLER__
#define __PTYKEEP_LOG_HANDLER__

#include "Headers.hpp"

namespace ptykeep {
/**
 * @brief Configures easylogging++ for the daemon and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default logger at a fresh, timestamped file in `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param maxlogsize Size in bytes at which the file is rolled over.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Applies `defaultConf` to the default logger, names the calling
   * thread and installs the rollout callback.
   */
  static void installConfiguration(const el::Configurations &defaultConf,
                                   const string &threadName, int verbose);

  /**
   * @brief Deletes all but the newest `keep` files in `path` whose names
   * start with `filenamePrefix-`.
   * @return The number of files removed.
   */
  static int pruneOldLogs(const string &path, const string &filenamePrefix,
                          size_t keep);

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace ptykeep
#endif  // __PTYKEEP_LOG_HANDLER__
