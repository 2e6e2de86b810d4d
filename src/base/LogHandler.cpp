#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace tb {
namespace {
string logTimestamp() {
  time_t now = time(NULL);
  tm local;
  localtime_r(&now, &local);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", &local);
  return string(buffer) + "-" + to_string(getpid());
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // %thread prints the name set with el::Helpers::setThreadName, which is
  // the session id on session threads
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  return conf;
}

string LogHandler::setupLogFiles(el::Configurations *conf,
                                 const string &directory, const string &prefix,
                                 bool logToStdout, bool redirectStderr,
                                 const string &maxLogSize) {
  string stamp = logTimestamp();
  string logFile = createLogFile(directory, prefix + "-" + stamp + ".log");

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::Filename, logFile);
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxLogSize);
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    logToStdout ? "true" : "false");

  if (redirectStderr) {
    string stderrFile =
        createLogFile(directory, prefix + "-stderr-" + stamp + ".log");
    FILE *stream = freopen(stderrFile.c_str(), "w", stderr);
    if (stream == NULL) {
      STFATAL << "Cannot redirect stderr to " << stderrFile;
    }
    setvbuf(stream, NULL, _IOLBF, BUFSIZ);
  }
  return logFile;
}

void LogHandler::applyVerbosity(el::Configurations *conf, int verboseLevel,
                                bool silent) {
  el::Loggers::setVerboseLevel(verboseLevel);
  if (silent) {
    conf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
  el::Loggers::reconfigureLogger("default", *conf);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed while this runs, so nothing may be logged here
  string previous = string(filename) + ".1";
  ::remove(previous.c_str());
  if (::rename(filename, previous.c_str()) != 0) {
    ::remove(filename);
  }
}

void LogHandler::setupStdoutLogger() {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "%msg");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), conf);
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << directory
                          << ": " << ec.message() << endl;
    exit(1);
  }
  string path = directory + "/" + filename;
  int fd = ::open(path.c_str(), O_WRONLY | O_NOFOLLOW | O_EXCL | O_CREAT,
                  0600);
  FATAL_FAIL(fd);
  FATAL_FAIL(::close(fd));
  return path;
}
}  // namespace tb
