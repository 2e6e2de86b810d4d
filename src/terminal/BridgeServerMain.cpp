#include <cxxopts.hpp>

#include "BridgeConfig.hpp"
#include "BridgeServer.hpp"
#include "DaemonCreator.hpp"
#include "LogHandler.hpp"

using namespace tb;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tb::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tb::InterruptSignalHandler);
  // A client vanishing mid-write must not kill the server
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tbserver", "Terminal sessions for the browser");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on",
         cxxopts::value<int>()->default_value("8765"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value("0.0.0.0"))  //
        ("mode", "Shell for each session: pty or ssh",
         cxxopts::value<string>()->default_value("pty"))  //
        ("command", "Command line to run on the pty (default: login shell)",
         cxxopts::value<string>()->default_value(""))  //
        ("daemon", "Daemonize the server")             //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("pidfile", "Location of the pid file",
         cxxopts::value<std::string>()->default_value(
             "/var/run/tbserver.pid"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tbserver version " << TB_VERSION << endl;
      exit(0);
    }

    BridgeConfig config;
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      string cfgfilename = result["cfgfile"].as<string>();
      try {
        BridgeConfig::loadFile(cfgfilename, &config);
      } catch (const std::runtime_error &re) {
        STFATAL << "Invalid config file " << cfgfilename << ": " << re.what();
      } catch (const std::invalid_argument &ia) {
        STFATAL << "Invalid config file " << cfgfilename << ": " << ia.what();
      }
    }

    // Command line options win over the config file
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("mode")) {
      try {
        config.mode = BridgeConfig::parseMode(result["mode"].as<string>());
      } catch (const std::invalid_argument &ia) {
        CLOG(INFO, "stdout") << ia.what() << "\n" << endl;
        CLOG(INFO, "stdout") << options.help({}) << endl;
        exit(1);
      }
    }
    if (result.count("command")) {
      config.command = result["command"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }

    if (result.count("daemon")) {
      if (DaemonCreator::create(result["pidfile"].as<string>()) == -1) {
        STFATAL << "Error creating daemon: " << strerror(GetErrno());
      }
    }

    bool logToStdout = result.count("logtostdout") > 0;
    string logFile = LogHandler::setupLogFiles(
        &defaultConf, GetTempDirectory() + "tbserver", "tbserver", logToStdout,
        !logToStdout, config.maxLogSize);
    LogHandler::applyVerbosity(&defaultConf, config.verbose, config.silent);
    // set thread name
    el::Helpers::setThreadName("tbserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    LOG(INFO) << "Logging to " << logFile;

    shared_ptr<SessionRegistry> registry(new SessionRegistry());
    shared_ptr<BridgeServer> server;
    try {
      server.reset(new BridgeServer(config, registry));
    } catch (const boost::system::system_error &se) {
      STFATAL << "Cannot listen on " << config.bindIp << ":" << config.port
              << ": " << se.what();
    }

    CLOG(INFO, "stdout") << "tbserver " << TB_VERSION << " serving "
                         << (config.mode == BridgeMode::SSH ? "ssh" : "pty")
                         << " sessions on ws://" << config.bindIp << ":"
                         << server->getPort() << config.wsPath << endl;
    LOG(INFO) << "Server started, mode "
              << (config.mode == BridgeMode::SSH ? "ssh" : "pty");
    server->run();

  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
}
