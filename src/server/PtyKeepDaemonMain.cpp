#include <cxxopts.hpp>

#include "DaemonConfig.hpp"
#include "DaemonContext.hpp"
#include "DaemonCreator.hpp"
#include "DaemonError.hpp"
#include "DaemonPaths.hpp"
#include "DaemonServer.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"

using namespace ptykeep;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ptykeep::HandleTerminate();

  cxxopts::Options options("ptykeepd",
                           "Keeps terminal sessions alive across clients");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("socket", "Path of the listening unix socket",
         cxxopts::value<std::string>())  //
        ("pidfile", "Location of the pid file",
         cxxopts::value<std::string>())  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>())  //
        ("daemon", "Detach from the terminal and run in the background")  //
        ("logtostdout", "log to stdout")                                   //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "ptykeepd version " << PTYKEEP_VERSION << endl;
      exit(0);
    }

    DaemonConfig config;
    try {
      DaemonPaths paths;
      config.socketPath = paths.getSocketPath();
      config.pidPath = paths.getPidPath();
      config.logDir = paths.getLogDir();

      if (!result["cfgfile"].as<string>().empty()) {
        config.loadIniFile(result["cfgfile"].as<string>());
      }
      if (result.count("socket")) {
        config.socketPath = result["socket"].as<string>();
      }
      if (result.count("pidfile")) {
        config.pidPath = result["pidfile"].as<string>();
      }
      if (result.count("logdir")) {
        config.logDir = result["logdir"].as<string>();
      }
      // prioritize command line option over cfgfile
      if (result.count("verbose")) {
        config.verbose = result["verbose"].as<int>();
      }
      config.validate();

      paths.createDirectoriesIfRequired();
      if (config.socketPath != paths.getSocketPath()) {
        DaemonPaths::ensurePrivateDirectory(
            fs::path(config.socketPath).parent_path().string());
      }
    } catch (const DaemonError &de) {
      CLOG(INFO, "stdout") << "Error: " << de.what() << endl;
      exit(1);
    }

    if (result.count("daemon")) {
      try {
        DaemonCreator::detach();
      } catch (const DaemonError &de) {
        CLOG(INFO, "stdout") << "Error: " << de.what() << endl;
        exit(1);
      }
    }

    bool logToStdout = result.count("logtostdout") > 0;
    LogHandler::setupLogFiles(&defaultConf, config.logDir, "ptykeepd",
                              logToStdout, !logToStdout, config.maxLogSize);
    LogHandler::installConfiguration(defaultConf, "ptykeepd-main",
                                     config.verbose);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    DaemonServer::installSignalHandlers();

    shared_ptr<DaemonContext> context(new DaemonContext(config));
    shared_ptr<SocketHandler> pipeSocketHandler(new PipeSocketHandler());
    DaemonServer server(context, pipeSocketHandler);
    try {
      server.listen();
    } catch (const DaemonError &de) {
      LOG(ERROR) << de.what();
      CLOG(INFO, "stdout") << "Error: " << de.what() << endl;
      exit(1);
    }
    server.run();
  } catch (const cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
