#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace ptykeep {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts/the config file rather than easylogging's own
  // argument parsing, see installConfiguration()
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &path, const string &filenamePrefix,
                               bool logToStdout, bool redirectStderrToFile,
                               string maxlogsize) {
  time_t rawtime;
  struct tm timeinfo;
  char buffer[80];
  time(&rawtime);
  localtime_r(&rawtime, &timeinfo);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);
  string currentTime(buffer);
  string pid = std::to_string(getpid());
  string logFilename = filenamePrefix + "-" + currentTime + "_" + pid + ".log";
  // Every daemon start opens new files, keep the directory bounded
  pruneOldLogs(path, filenamePrefix,
               MAX_LOG_FILES_PER_PREFIX - (redirectStderrToFile ? 2 : 1));
  string fullFname = createLogFile(path, logFilename);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(path, filenamePrefix + "-stderr-" + currentTime + "_" + pid +
                           ".log");
  }
}

void LogHandler::installConfiguration(const el::Configurations &defaultConf,
                                      const string &threadName, int verbose) {
  el::Loggers::reconfigureLogger("default", defaultConf);
  el::Loggers::setVerboseLevel(verbose);
  el::Helpers::setThreadName(threadName);
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
}

int LogHandler::pruneOldLogs(const string &path, const string &filenamePrefix,
                             size_t keep) {
  std::error_code ec;
  if (!fs::is_directory(path, ec)) {
    return 0;
  }
  // The timestamp in the name sorts in creation order
  vector<fs::path> logs;
  for (const auto &entry : fs::directory_iterator(path, ec)) {
    string name = entry.path().filename().string();
    if (entry.is_regular_file(ec) && name.rfind(filenamePrefix + "-", 0) == 0 &&
        name.length() > 4 && name.compare(name.length() - 4, 4, ".log") == 0) {
      logs.push_back(entry.path());
    }
  }
  if (logs.size() <= keep) {
    return 0;
  }
  sort(logs.begin(), logs.end(), [](const fs::path &a, const fs::path &b) {
    return a.filename().string() < b.filename().string();
  });
  int removed = 0;
  for (size_t i = 0; i < logs.size() - keep; i++) {
    if (fs::remove(logs[i], ec)) {
      removed++;
    }
  }
  return removed;
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // SHOULD NOT LOG ANYTHING HERE BECAUSE LOG FILE IS CLOSED!
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  string fullFname = path + "/" + filename;
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory: " << fse.what()
                          << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string fullFname = createLogFile(path, stderrFilename);
  FILE *stderr_stream = freopen(fullFname.c_str(), "w", stderr);
  if (!stderr_stream) {
    STFATAL << "Invalid filename " << stderrFilename;
  }
  setvbuf(stderr_stream, NULL, _IOLBF, BUFSIZ);  // set to line buffering
}

}  // namespace ptykeep
